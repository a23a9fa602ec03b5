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
#include "pickle/format/protocol_writer.hpp"
#include <flow/error/error.hpp>
#include <cassert>

namespace pickle::format
{

// Implementations.

Protocol_writer::Protocol_writer(const Config& config, const Tag_registry& registry, Emitter* emitter,
                                 Reference_tracker* tracker) :
  flow::log::Log_context(config.m_logger_ptr, Log_component::S_FORMAT),
  m_mode(config.m_mode),
  m_max_depth(config.m_max_depth),
  m_registry(registry),
  m_emitter(emitter),
  m_tracker(tracker),
  m_entry_depth(0),
  m_last_serial(0),
  m_n_top_level_entries(0)
{
  assert(m_emitter);

  FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Started in mode [" << m_mode << "]; "
                 "max depth [" << m_max_depth << "] (0 = unlimited); "
                 "reference tracking [" << (m_tracker ? "on" : "off") << "].");
}

Protocol_writer::~Protocol_writer()
{
  FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Being destroyed: "
                 "[" << m_n_top_level_entries << "] top-level entries completed; "
                 "[" << m_frames.size() << "] frames still open; broken? [" << m_broken_err_code << "].");
}

Entry_token Protocol_writer::begin_entry(Object_identity picklee, const Type_tag& tag, Error_code* err_code)
{
  Entry_token token{ 0, 0 };
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { token = begin_entry(picklee, tag, actual_err_code); },
         err_code, "Protocol_writer::begin_entry()"))
  {
    return token;
  }
  // If got here: err_code is not null.

  err_code->clear();
  return begin_entry_impl(picklee, tag, false, err_code);
}

Entry_token Protocol_writer::begin_entry_impl(Object_identity picklee, const Type_tag& tag,
                                              bool structural_path_supplied, Error_code* err_code)
{
  if (!check_usable(err_code))
  {
    return Entry_token{ 0, 0 };
  }
  // else

  if (!entry_may_begin())
  {
    fail(error::Code::S_ENTRY_OUTSIDE_VALUE_SLOT, "begin_entry", err_code);
    return Entry_token{ 0, 0 };
  }
  // else

  auto canonical = m_registry.canonicalize(tag);
  if ((!structural_path_supplied) && (!m_registry.is_known(canonical)))
  {
    FLOW_LOG_WARNING("Protocol_writer [" << *this << "]: Tag " << tag << " (canonically " << canonical << ") "
                     "is unknown, and no structural write path was supplied.");
    fail(error::Code::S_UNKNOWN_TAG, "begin_entry", err_code);
    return Entry_token{ 0, 0 };
  }
  // else

  if ((m_max_depth != 0) && (m_entry_depth >= m_max_depth))
  {
    fail(error::Code::S_MAX_DEPTH_EXCEEDED, "begin_entry", err_code);
    return Entry_token{ 0, 0 };
  }
  // else

  // Legal.  Fill the slot we're in (if any), and see whether its static type makes our tag redundant.
  bool tag_elided = false;
  if (!m_frames.empty())
  {
    auto& slot = m_frames.back();
    assert(slot.m_kind == Frame_kind::S_VALUE_SLOT);
    slot.m_filled = true;
    tag_elided = m_registry.can_elide(canonical,
                                      Elision_context{ slot.m_static_tag ? &(*slot.m_static_tag) : nullptr });
  }

  Frame frame{};
  frame.m_kind = Frame_kind::S_ENTRY;
  frame.m_serial = ++m_last_serial;
  frame.m_entry_state = Entry_state::S_IN_ENTRY;
  frame.m_primitive_kind = m_registry.primitive_kind(canonical);
  frame.m_tag = std::move(canonical);
  m_frames.push_back(std::move(frame));
  ++m_entry_depth;

  const Entry_token token{ m_frames.back().m_serial, m_entry_depth };
  FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Entry [" << token << "] for object @[" << picklee << "] "
                 "begun with tag " << m_frames.back().m_tag << " (elided? [" << tag_elided << "]).");

  m_emitter->begin_entry(m_frames.back().m_tag, tag_elided);
  return token;
} // Protocol_writer::begin_entry_impl()

void Protocol_writer::end_entry(const Entry_token& token, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { end_entry(token, actual_err_code); },
         err_code, "Protocol_writer::end_entry()"))
  {
    return;
  }
  // If got here: err_code is not null.

  err_code->clear();
  if (!check_usable(err_code))
  {
    return;
  }
  // else

  if (m_frames.empty()
      || (m_frames.back().m_kind != Frame_kind::S_ENTRY) || (m_frames.back().m_serial != token.m_serial))
  {
    FLOW_LOG_WARNING("Protocol_writer [" << *this << "]: Asked to end entry [" << token << "], but the innermost "
                     "open frame is not that entry.");
    fail(error::Code::S_END_ENTRY_MISMATCH, "end_entry", err_code);
    return;
  }
  // else

  const auto entry_state = m_frames.back().m_entry_state;
  FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Entry [" << token << "] with tag " << m_frames.back().m_tag <<
                 " ends.");

  m_frames.pop_back();
  --m_entry_depth;
  if (m_frames.empty())
  {
    ++m_n_top_level_entries;
  }

  // Nothing written into it: an empty structure.  Either way close the structure framing before the entry.
  if (entry_state == Entry_state::S_IN_ENTRY)
  {
    m_emitter->begin_structure();
  }
  if ((entry_state == Entry_state::S_IN_ENTRY) || (entry_state == Entry_state::S_IN_STRUCTURE))
  {
    m_emitter->end_structure();
  }
  m_emitter->end_entry();
} // Protocol_writer::end_entry()

void Protocol_writer::put_structure(Object_identity picklee, const Type_tag& tag, const Structure_func& work,
                                    Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { put_structure(picklee, tag, work, actual_err_code); },
         err_code, "Protocol_writer::put_structure()"))
  {
    return;
  }
  // If got here: err_code is not null.

  err_code->clear();
  if (!check_usable(err_code))
  {
    return;
  }
  // else

  /* Don't let the tracker record an object that we then fail to write; though in practice it wouldn't matter, as
   * a failure breaks *this anyway. */
  if (!entry_may_begin())
  {
    fail(error::Code::S_ENTRY_OUTSIDE_VALUE_SLOT, "put_structure", err_code);
    return;
  }
  // else

  if (picklee && m_tracker)
  {
    const auto observation = m_tracker->observe(picklee);
    if (observation.m_outcome == Reference_tracker::Outcome::S_ALREADY_SEEN)
    {
      FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Object @[" << picklee << "] with tag " << tag << " "
                     "was pickled before as #[" << observation.m_id << "]; writing reference marker instead.");

      const auto ref_token = begin_entry_impl(nullptr, Type_tag::of(Primitive_tag::S_REF), false, err_code);
      if (*err_code)
      {
        return;
      }
      // else
      put_primitive(Ref{ observation.m_id }, Primitive_tag::S_REF, err_code);
      if (*err_code)
      {
        return;
      }
      // else
      end_entry(ref_token, err_code);
      return;
    }
    // else: First sight; pickle it in full.
  }

  const auto token = begin_entry_impl(picklee, tag, true, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  // Resolved as a structure up-front, even if `work` writes no fields.
  m_frames.back().m_entry_state = Entry_state::S_IN_STRUCTURE;
  m_emitter->begin_structure();

  try
  {
    work(*this);
  }
  catch (...)
  {
    abandon("put_structure");
    throw;
  }

  if (!check_usable(err_code))
  {
    return; // work() broke us, and reported it already (via whatever err_code it used); report it to our caller too.
  }
  // else

  if (m_frames.back().m_serial != token.m_serial)
  {
    fail(error::Code::S_CALLBACK_LEFT_FRAMES_OPEN, "put_structure", err_code);
    return;
  }
  // else

  end_entry(token, err_code);
} // Protocol_writer::put_structure()

void Protocol_writer::put_primitive(const Primitive& val, Primitive_tag tag, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { put_primitive(val, tag, actual_err_code); },
         err_code, "Protocol_writer::put_primitive()"))
  {
    return;
  }
  // If got here: err_code is not null.

  err_code->clear();
  if (!check_usable(err_code))
  {
    return;
  }
  // else

  if (m_frames.empty() || (m_frames.back().m_kind != Frame_kind::S_ENTRY))
  {
    fail(error::Code::S_PRIMITIVE_OUTSIDE_ENTRY, "put_primitive", err_code);
    return;
  }
  // else

  auto& entry = m_frames.back();
  const auto conflict = resolution_conflict(entry.m_entry_state);
  if (conflict != error::Code::S_END_SENTINEL)
  {
    fail(conflict, "put_primitive", err_code);
    return;
  }
  // else

  const auto actual_tag = tag_of(val);
  if ((actual_tag != tag) || (entry.m_primitive_kind && (*entry.m_primitive_kind != tag)))
  {
    FLOW_LOG_WARNING("Protocol_writer [" << *this << "]: Primitive declared as [" << tag << "] is actually "
                     "[" << actual_tag << "]; its entry's tag is " << entry.m_tag << ".");
    fail(error::Code::S_PRIMITIVE_TAG_MISMATCH, "put_primitive", err_code);
    return;
  }
  // else

  entry.m_entry_state = Entry_state::S_PRIMITIVE_WRITTEN;
  FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Entry #[" << entry.m_serial << "] resolved as "
                 "primitive [" << val << "].");

  m_emitter->put_primitive(val);
} // Protocol_writer::put_primitive()

Collection_token Protocol_writer::begin_collection(size_t length, const Type_tag* element_tag, Error_code* err_code)
{
  Collection_token token{ 0, 0 };
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { token = begin_collection(length, element_tag, actual_err_code); },
         err_code, "Protocol_writer::begin_collection()"))
  {
    return token;
  }
  // If got here: err_code is not null.

  err_code->clear();
  if (!check_usable(err_code))
  {
    return token;
  }
  // else

  if (m_frames.empty() || (m_frames.back().m_kind != Frame_kind::S_ENTRY))
  {
    fail(error::Code::S_COLLECTION_OUTSIDE_ENTRY, "begin_collection", err_code);
    return token;
  }
  // else

  auto& entry = m_frames.back();
  const auto conflict = resolution_conflict(entry.m_entry_state);
  if (conflict != error::Code::S_END_SENTINEL)
  {
    fail(conflict, "begin_collection", err_code);
    return token;
  }
  // else

  entry.m_entry_state = Entry_state::S_IN_COLLECTION;

  Frame frame{};
  frame.m_kind = Frame_kind::S_COLLECTION;
  frame.m_serial = ++m_last_serial;
  frame.m_length = length;
  frame.m_n_elements = 0;
  if (element_tag)
  {
    frame.m_static_tag = m_registry.canonicalize(*element_tag);
  }
  m_frames.push_back(std::move(frame)); // Note: `entry` reference may now be invalid.

  token = Collection_token{ m_frames.back().m_serial, length };
  FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Collection [" << token << "] begun; "
                 "element type hint present? [" << bool(element_tag) << "].");

  m_emitter->begin_collection(length);
  return token;
} // Protocol_writer::begin_collection()

void Protocol_writer::put_collection(size_t length, const Type_tag* element_tag, const Collection_func& work,
                                     Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { put_collection(length, element_tag, work, actual_err_code); },
         err_code, "Protocol_writer::put_collection()"))
  {
    return;
  }
  // If got here: err_code is not null.

  const auto token = begin_collection(length, element_tag, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  try
  {
    work(*this);
  }
  catch (...)
  {
    abandon("put_collection");
    throw;
  }

  if (!check_usable(err_code))
  {
    return;
  }
  // else

  if (m_frames.back().m_serial != token.m_serial)
  {
    fail(error::Code::S_CALLBACK_LEFT_FRAMES_OPEN, "put_collection", err_code);
    return;
  }
  // else

  end_collection(token, err_code);
} // Protocol_writer::put_collection()

Pickle_collection_writer& Protocol_writer::put_element(const Writer_func& pickler, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { put_element(pickler, actual_err_code); },
         err_code, "Protocol_writer::put_element()"))
  {
    return *this;
  }
  // If got here: err_code is not null.

  err_code->clear();
  if (!check_usable(err_code))
  {
    return *this;
  }
  // else

  if (m_frames.empty() || (m_frames.back().m_kind != Frame_kind::S_COLLECTION))
  {
    fail(error::Code::S_ELEMENT_OUTSIDE_COLLECTION, "put_element", err_code);
    return *this;
  }
  // else

  const auto collection_idx = m_frames.size() - 1;
  {
    auto& collection = m_frames.back();
    if (collection.m_n_elements == collection.m_length)
    {
      FLOW_LOG_WARNING("Protocol_writer [" << *this << "]: Collection #[" << collection.m_serial << "] was declared "
                       "with length [" << collection.m_length << "], and that many elements were already put.");
      fail(error::Code::S_COLLECTION_LENGTH_EXCEEDED, "put_element", err_code);
      return *this;
    }
    // else

    ++collection.m_n_elements;
    FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Collection #[" << collection.m_serial << "]: "
                   "element [" << collection.m_n_elements << "] of [" << collection.m_length << "] begins.");
  }

  // The callback may grow m_frames; so copy the hint rather than refer to it.
  run_value_slot(pickler, std::optional<Type_tag>(m_frames[collection_idx].m_static_tag), "put_element", err_code);
  return *this;
} // Protocol_writer::put_element()

void Protocol_writer::end_collection(const Collection_token& token, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { end_collection(token, actual_err_code); },
         err_code, "Protocol_writer::end_collection()"))
  {
    return;
  }
  // If got here: err_code is not null.

  err_code->clear();
  if (!check_usable(err_code))
  {
    return;
  }
  // else

  if (m_frames.empty()
      || (m_frames.back().m_kind != Frame_kind::S_COLLECTION) || (m_frames.back().m_serial != token.m_serial))
  {
    FLOW_LOG_WARNING("Protocol_writer [" << *this << "]: Asked to end collection [" << token << "], but the "
                     "innermost open frame is not that collection.");
    fail(error::Code::S_END_COLLECTION_MISMATCH, "end_collection", err_code);
    return;
  }
  // else

  const auto& collection = m_frames.back();
  if (collection.m_n_elements != collection.m_length)
  {
    FLOW_LOG_WARNING("Protocol_writer [" << *this << "]: Collection [" << token << "] ended after "
                     "[" << collection.m_n_elements << "] elements.");
    fail(error::Code::S_COLLECTION_LENGTH_MISMATCH, "end_collection", err_code);
    return;
  }
  // else

  FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Collection [" << token << "] ends.");

  m_frames.pop_back();
  assert((!m_frames.empty()) && (m_frames.back().m_kind == Frame_kind::S_ENTRY));
  m_frames.back().m_entry_state = Entry_state::S_COLLECTION_WRITTEN;

  m_emitter->end_collection();
} // Protocol_writer::end_collection()

Pickle_structure_writer& Protocol_writer::put_field(util::String_view name, const Writer_func& pickler,
                                                    const Type_tag* static_tag, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { put_field(name, pickler, static_tag, actual_err_code); },
         err_code, "Protocol_writer::put_field()"))
  {
    return *this;
  }
  // If got here: err_code is not null.

  err_code->clear();
  if (!check_usable(err_code))
  {
    return *this;
  }
  // else

  if (m_frames.empty() || (m_frames.back().m_kind != Frame_kind::S_ENTRY))
  {
    fail(error::Code::S_FIELD_OUTSIDE_ENTRY, "put_field", err_code);
    return *this;
  }
  // else

  auto& entry = m_frames.back();
  if (entry.m_entry_state != Entry_state::S_IN_STRUCTURE)
  {
    const auto conflict = resolution_conflict(entry.m_entry_state);
    if (conflict != error::Code::S_END_SENTINEL)
    {
      fail(conflict, "put_field", err_code);
      return *this;
    }
    // else
    entry.m_entry_state = Entry_state::S_IN_STRUCTURE;
    m_emitter->begin_structure();
  }

  FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Entry #[" << entry.m_serial << "] with tag " << entry.m_tag <<
                 ": field [" << name << "] begins.");

  m_emitter->begin_field(name);

  std::optional<Type_tag> canonical_static_tag;
  if (static_tag)
  {
    canonical_static_tag = m_registry.canonicalize(*static_tag);
  }
  if (!run_value_slot(pickler, std::move(canonical_static_tag), "put_field", err_code))
  {
    return *this;
  }
  // else

  m_emitter->end_field();
  return *this;
} // Protocol_writer::put_field()

void Protocol_writer::flush(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { flush(actual_err_code); },
         err_code, "Protocol_writer::flush()"))
  {
    return;
  }
  // If got here: err_code is not null.

  err_code->clear();
  if (!check_usable(err_code))
  {
    return;
  }
  // else

  if (!m_frames.empty())
  {
    fail(error::Code::S_FLUSH_WITH_OPEN_FRAMES, "flush", err_code);
    return;
  }
  // else

  if (m_mode == Mode::S_DRY_RUN)
  {
    FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Flush requested in dry-run mode; not forwarding.");
    return;
  }
  // else

  FLOW_LOG_TRACE("Protocol_writer [" << *this << "]: Flushing emitter.");
  m_emitter->flush(err_code); // Backend errors go to the caller as-is; they do not break *this.
}

Pickle_structure_writer& Protocol_writer::structure_writer()
{
  return *this;
}

Pickle_collection_writer& Protocol_writer::collection_writer()
{
  return *this;
}

bool Protocol_writer::run_value_slot(const Writer_func& pickler, std::optional<Type_tag>&& static_tag,
                                     util::String_view op, Error_code* err_code)
{
  Frame slot{};
  slot.m_kind = Frame_kind::S_VALUE_SLOT;
  slot.m_serial = ++m_last_serial;
  slot.m_static_tag = std::move(static_tag);
  slot.m_filled = false;
  m_frames.push_back(std::move(slot));

  const auto slot_idx = m_frames.size() - 1;
  const auto slot_serial = m_frames.back().m_serial;

  try
  {
    pickler(*this);
  }
  catch (...)
  {
    abandon(op);
    throw;
  }

  if (!check_usable(err_code))
  {
    return false;
  }
  // else

  assert((m_frames.size() > slot_idx) && (m_frames[slot_idx].m_serial == slot_serial)
         && "A close mismatched with our slot should have broken *this.");

  if (m_frames.size() != (slot_idx + 1))
  {
    fail(error::Code::S_CALLBACK_LEFT_FRAMES_OPEN, op, err_code);
    return false;
  }
  // else
  if (!m_frames.back().m_filled)
  {
    fail(error::Code::S_CALLBACK_WROTE_NO_ENTRY, op, err_code);
    return false;
  }
  // else

  m_frames.pop_back();
  return true;
} // Protocol_writer::run_value_slot()

bool Protocol_writer::entry_may_begin() const
{
  return m_frames.empty()
         || ((m_frames.back().m_kind == Frame_kind::S_VALUE_SLOT) && (!m_frames.back().m_filled));
}

error::Code Protocol_writer::resolution_conflict(Entry_state state) // Static.
{
  switch (state)
  {
  case Entry_state::S_IN_ENTRY:
    return error::Code::S_END_SENTINEL;
  case Entry_state::S_IN_STRUCTURE:
    return error::Code::S_ENTRY_ALREADY_STRUCTURE;
  case Entry_state::S_PRIMITIVE_WRITTEN:
    return error::Code::S_ENTRY_ALREADY_PRIMITIVE;
  case Entry_state::S_IN_COLLECTION:
  case Entry_state::S_COLLECTION_WRITTEN:
    return error::Code::S_ENTRY_ALREADY_COLLECTION;
  }
  assert(false);
  return error::Code::S_END_SENTINEL;
}

bool Protocol_writer::check_usable(Error_code* err_code) const
{
  if (m_broken_err_code)
  {
    *err_code = m_broken_err_code;
    return false;
  }
  // else
  return true;
}

void Protocol_writer::fail(error::Code code, util::String_view op, Error_code* err_code)
{
  FLOW_LOG_WARNING("Protocol_writer [" << *this << "]: Protocol violation in [" << op << "()]: "
                   "[" << code << "] with [" << m_frames.size() << "] frames open "
                   "(entry depth [" << m_entry_depth << "]).  The writer is now unusable.");
  assert(!m_broken_err_code);
  m_broken_err_code = code;
  *err_code = m_broken_err_code;
}

void Protocol_writer::abandon(util::String_view op)
{
  if (m_broken_err_code)
  {
    return; // Already broken; most likely the exception is a Runtime_error carrying that very code.
  }
  // else

  FLOW_LOG_WARNING("Protocol_writer [" << *this << "]: A callback invoked by [" << op << "()] exited via "
                   "exception with [" << m_frames.size() << "] frames open.  The writer is now unusable.");
  m_broken_err_code = error::Code::S_WRITER_ABANDONED;
}

bool Protocol_writer::idle() const
{
  return m_frames.empty();
}

size_t Protocol_writer::n_open_frames() const
{
  return m_frames.size();
}

size_t Protocol_writer::n_top_level_entries() const
{
  return m_n_top_level_entries;
}

const Error_code& Protocol_writer::broken_err_code() const
{
  return m_broken_err_code;
}

Mode Protocol_writer::mode() const
{
  return m_mode;
}

std::ostream& operator<<(std::ostream& os, const Protocol_writer& val)
{
  return os << '@' << &val;
}

} // namespace pickle::format
