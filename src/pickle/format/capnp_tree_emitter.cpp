/* Flow-Pickle: Structural Pickling
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "pickle/format/capnp_tree_emitter.hpp"
#include "pickle/format/util.hpp"
#include "pickle/format/error.hpp"
#include <flow/error/error.hpp>
#include <capnp/serialize.h>
#include <kj/std/iostream.h>
#include <kj/exception.h>
#include <cassert>
#include <type_traits>

namespace pickle::format
{

namespace
{

/**
 * Copies a primitive array into a freshly initialized capnp list of the same length.
 *
 * @param list
 *        The list builder.
 * @param vec
 *        Source.
 */
/**
 * Wraps a string for a capnp `Text` setter, length included (not up to the first NUL).
 *
 * @param str
 *        Source.  `std::string` guarantees the terminating NUL that `Text::Reader` requires.
 * @return See above.
 */
::capnp::Text::Reader to_text(const std::string& str)
{
  return ::capnp::Text::Reader(str.data(), str.size());
}

template<typename List_builder, typename Vec>
void fill_list(List_builder list, const Vec& vec)
{
  for (size_t idx = 0; idx != vec.size(); ++idx)
  {
    list.set(idx, vec[idx]);
  }
}

} // namespace (anon)

// Implementations.

Capnp_tree_emitter::Capnp_tree_emitter(const Config& config) :
  flow::log::Log_context(config.m_logger_ptr, Log_component::S_EMITTER),
  m_builder(config.m_logger_ptr, config.m_segment_sz),
  m_sink(config.m_sink_ptr),
  m_root(m_builder.initRoot<schema::Pickle>()),
  m_n_flushes(0)
{
  FLOW_LOG_TRACE("Capnp_tree_emitter [" << *this << "]: Created; segment size [" << m_builder.segment_sz() << "]; "
                 "sink present? [" << bool(m_sink) << "].");
}

Capnp_tree_emitter::~Capnp_tree_emitter()
{
  FLOW_LOG_TRACE("Capnp_tree_emitter [" << *this << "]: Destroyed after [" << m_n_flushes << "] flushes; "
                 "[" << m_pending.size() << "] entries never flushed; "
                 "[" << m_builder.n_segments() << "] segments freed.");
}

void Capnp_tree_emitter::begin_entry(const Type_tag& tag, bool tag_elided)
{
  auto orphan = m_builder.getOrphanage().newOrphan<schema::Entry>();
  auto entry = orphan.get();
  if (!tag_elided)
  {
    entry.setTag(to_text(tag.key()));
  }
  entry.setTagElided(tag_elided);

  m_nodes.push_back(Node{ std::move(orphan), Resolution::S_NONE, {}, {}, {} });
}

void Capnp_tree_emitter::put_primitive(const Primitive& val)
{
  assert(!m_nodes.empty());
  auto& node = m_nodes.back();
  node.m_resolution = Resolution::S_PRIMITIVE;
  auto entry = node.m_entry.get();

  std::visit([&](const auto& payload)
  {
    using Payload = std::decay_t<decltype(payload)>;

    if constexpr(std::is_same_v<Payload, Nothing>)
    {
      entry.setNothing();
    }
    else if constexpr(std::is_same_v<Payload, Null>)
    {
      entry.setNil();
    }
    else if constexpr(std::is_same_v<Payload, Unit>)
    {
      entry.setUnit();
    }
    else if constexpr(std::is_same_v<Payload, int8_t>)
    {
      entry.setByteVal(payload);
    }
    else if constexpr(std::is_same_v<Payload, char16_t>)
    {
      entry.setCharVal(static_cast<uint16_t>(payload));
    }
    else if constexpr(std::is_same_v<Payload, std::string>)
    {
      entry.setStringVal(to_text(payload));
    }
    else if constexpr(std::is_same_v<Payload, int16_t>)
    {
      entry.setShortVal(payload);
    }
    else if constexpr(std::is_same_v<Payload, int32_t>)
    {
      entry.setIntVal(payload);
    }
    else if constexpr(std::is_same_v<Payload, int64_t>)
    {
      entry.setLongVal(payload);
    }
    else if constexpr(std::is_same_v<Payload, float>)
    {
      entry.setFloatVal(payload);
    }
    else if constexpr(std::is_same_v<Payload, double>)
    {
      entry.setDoubleVal(payload);
    }
    else if constexpr(std::is_same_v<Payload, Ref>)
    {
      entry.setRef(payload.m_id);
    }
    else if constexpr(std::is_same_v<Payload, std::vector<int8_t>>)
    {
      fill_list(entry.initByteArray(payload.size()), payload);
    }
    else if constexpr(std::is_same_v<Payload, std::vector<int16_t>>)
    {
      fill_list(entry.initShortArray(payload.size()), payload);
    }
    else if constexpr(std::is_same_v<Payload, std::vector<char16_t>>)
    {
      fill_list(entry.initCharArray(payload.size()), payload);
    }
    else if constexpr(std::is_same_v<Payload, std::vector<int32_t>>)
    {
      fill_list(entry.initIntArray(payload.size()), payload);
    }
    else if constexpr(std::is_same_v<Payload, std::vector<int64_t>>)
    {
      fill_list(entry.initLongArray(payload.size()), payload);
    }
    else if constexpr(std::is_same_v<Payload, std::vector<bool>>)
    {
      fill_list(entry.initBooleanArray(payload.size()), payload);
    }
    else if constexpr(std::is_same_v<Payload, std::vector<float>>)
    {
      fill_list(entry.initFloatArray(payload.size()), payload);
    }
    else
    {
      static_assert(std::is_same_v<Payload, std::vector<double>>, "Primitive alternative not handled.");
      fill_list(entry.initDoubleArray(payload.size()), payload);
    }
  }, val);
} // Capnp_tree_emitter::put_primitive()

void Capnp_tree_emitter::begin_structure()
{
  assert(!m_nodes.empty());
  m_nodes.back().m_resolution = Resolution::S_STRUCTURE;
}

void Capnp_tree_emitter::end_structure()
{
  // The fields are adopted when the entry ends.
}

void Capnp_tree_emitter::begin_field(util::String_view name)
{
  assert((!m_nodes.empty()) && (m_nodes.back().m_resolution == Resolution::S_STRUCTURE));
  m_nodes.back().m_open_field_name.assign(name.data(), name.size());
}

void Capnp_tree_emitter::end_field()
{
  // The field's value was adopted when it ended.
}

void Capnp_tree_emitter::begin_collection(size_t length)
{
  assert(!m_nodes.empty());
  auto& node = m_nodes.back();
  node.m_resolution = Resolution::S_COLLECTION;
  node.m_elements.reserve(length);
}

void Capnp_tree_emitter::end_collection()
{
  // The elements are adopted when the entry ends.
}

void Capnp_tree_emitter::end_entry()
{
  assert(!m_nodes.empty());
  Node node = std::move(m_nodes.back());
  m_nodes.pop_back();

  finalize(&node);

  if (m_nodes.empty())
  {
    m_pending.push_back(std::move(node.m_entry));
    return;
  }
  // else

  auto& parent = m_nodes.back();
  if (parent.m_resolution == Resolution::S_COLLECTION)
  {
    parent.m_elements.push_back(std::move(node.m_entry));
  }
  else
  {
    assert(parent.m_resolution == Resolution::S_STRUCTURE);
    parent.m_fields.emplace_back(std::move(parent.m_open_field_name), std::move(node.m_entry));
    parent.m_open_field_name.clear();
  }
} // Capnp_tree_emitter::end_entry()

void Capnp_tree_emitter::finalize(Node* node_ptr) // Static.
{
  auto& node = *node_ptr;
  auto entry = node.m_entry.get();

  switch (node.m_resolution)
  {
  case Resolution::S_NONE:
    assert(false && "Protocol_writer resolves every entry before ending it.");
    return;

  case Resolution::S_PRIMITIVE:
    return; // Set in put_primitive().

  case Resolution::S_STRUCTURE:
  {
    auto fields = entry.initStructure(node.m_fields.size());
    for (size_t idx = 0; idx != node.m_fields.size(); ++idx)
    {
      auto field = fields[idx];
      field.setName(to_text(node.m_fields[idx].first));
      field.adoptValue(std::move(node.m_fields[idx].second));
    }
    return;
  }

  case Resolution::S_COLLECTION:
  {
    auto elements = entry.initCollection(node.m_elements.size());
    for (size_t idx = 0; idx != node.m_elements.size(); ++idx)
    {
      elements.adoptWithCaveats(idx, std::move(node.m_elements[idx]));
    }
    return;
  }
  }
  assert(false);
} // Capnp_tree_emitter::finalize()

void Capnp_tree_emitter::flush(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { flush(actual_err_code); },
         err_code, "Capnp_tree_emitter::flush()"))
  {
    return;
  }
  // If got here: err_code is not null.

  assert(m_nodes.empty() && "Protocol_writer forwards flushes only at the top level.");
  err_code->clear();

  ++m_n_flushes;
  if (!m_pending.empty())
  {
    /* capnp lists cannot grow; so build the longer list anew, copying the old entries and adopting the new ones.
     * The old list's space in the message is not reclaimed. */
    const auto old_entries = m_root.asReader().getEntries();
    const size_t n_old = old_entries.size();

    auto entries_orphan = m_builder.getOrphanage().newOrphan<::capnp::List<schema::Entry>>(n_old + m_pending.size());
    auto entries = entries_orphan.get();
    for (size_t idx = 0; idx != n_old; ++idx)
    {
      entries.setWithCaveats(idx, old_entries[idx]);
    }
    for (size_t idx = 0; idx != m_pending.size(); ++idx)
    {
      entries.adoptWithCaveats(n_old + idx, std::move(m_pending[idx]));
    }
    m_root.adoptEntries(std::move(entries_orphan));

    FLOW_LOG_TRACE("Capnp_tree_emitter [" << *this << "]: Flush [" << m_n_flushes << "]: "
                   "[" << m_pending.size() << "] entries appended to [" << n_old << "] existing.  "
                   "Root now: [" << ostreamable_pickle_brief(m_root.asReader()) << "].");
    m_pending.clear();
  }

  if (!m_sink)
  {
    return;
  }
  // else

  if (m_sink->good())
  {
    // kj's stream adapter may itself insist on a good stream; if so it reports via kj::Exception.
    try
    {
      kj::std::StdOutputStream sink_stream(*m_sink);
      ::capnp::writeMessage(sink_stream, m_builder);
      m_sink->flush();
    }
    catch (const kj::Exception& exc)
    {
      FLOW_LOG_WARNING("Capnp_tree_emitter [" << *this << "]: Flush [" << m_n_flushes << "]: writing to sink "
                       "raised [" << exc.getDescription().cStr() << "].");
      m_sink->setstate(std::ios::badbit);
    }
  }

  if (!m_sink->good())
  {
    FLOW_LOG_WARNING("Capnp_tree_emitter [" << *this << "]: Flush [" << m_n_flushes << "]: sink stream reported "
                     "failure while writing the message.");
    *err_code = error::Code::S_EMITTER_SINK_WRITE_FAILED;
    return;
  }
  // else

  FLOW_LOG_TRACE("Capnp_tree_emitter [" << *this << "]: Flush [" << m_n_flushes << "]: message written to sink.");
} // Capnp_tree_emitter::flush()

void Capnp_tree_emitter::emit_serialization(Segment_ptrs* target_blob_ptrs, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { emit_serialization(target_blob_ptrs, actual_err_code); },
         err_code, "Capnp_tree_emitter::emit_serialization()"))
  {
    return;
  }
  // If got here: err_code is not null.

  err_code->clear();

  Segment_ptrs segs;
  m_builder.emit_segment_blobs(&segs);

  size_t total_sz = 0;
  for (const auto seg : segs)
  {
    if (seg->size() > m_builder.segment_sz())
    {
      FLOW_LOG_WARNING("Capnp_tree_emitter [" << *this << "]: A segment of size [" << seg->size() << "] exceeds "
                       "the configured segment size [" << m_builder.segment_sz() << "]: some datum is too big.");
      *err_code = error::Code::S_EMITTER_SEGMENT_TOO_BIG;
      return;
    }
    // else
    total_sz += seg->size();
  }

  FLOW_LOG_TRACE("Capnp_tree_emitter [" << *this << "]: Emitting [" << segs.size() << "] segments totaling "
                 "[" << total_sz << "] bytes.");
  target_blob_ptrs->insert(target_blob_ptrs->end(), segs.begin(), segs.end());
} // Capnp_tree_emitter::emit_serialization()

schema::Pickle::Reader Capnp_tree_emitter::root() const
{
  return m_root.asReader();
}

size_t Capnp_tree_emitter::n_pending_entries() const
{
  return m_pending.size();
}

std::ostream& operator<<(std::ostream& os, const Capnp_tree_emitter& val)
{
  return os << '@' << &val;
}

} // namespace pickle::format
