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
#include "pickle/format/detail/heap_segment_builder.hpp"
#include <algorithm>
#include <cassert>
#include <cstring>

namespace pickle::format::detail
{

// Implementations.

Heap_segment_builder::Heap_segment_builder(flow::log::Logger* logger_for_blobs, size_t segment_sz) :
  m_logger_for_blobs(logger_for_blobs),
  // capnp wants word-multiples; and a 0-word default segment makes no sense.
  m_segment_sz(std::max(segment_sz / sizeof(::capnp::word), size_t(1)) * sizeof(::capnp::word))
{
  // That's it.
}

void Heap_segment_builder::emit_segment_blobs(Segment_ptrs* target_blob_ptrs_ptr)
{
  auto& target_blob_ptrs = *target_blob_ptrs_ptr;

  assert((!m_segments.empty()) && "Root must be initialized before emitting; hence 1+ segments.");
  target_blob_ptrs.reserve(target_blob_ptrs.size() + m_segments.size()); // Appending.

  const auto capnp_segs = getSegmentsForOutput();
  assert((capnp_segs.size() == n_segments())
         && "Somehow our MessageBuilder created fewer or more segments than allocateSegment() was called?!");

  for (size_t idx = 0; idx != capnp_segs.size(); ++idx)
  {
    const auto capnp_seg = capnp_segs[idx].asBytes();
    auto& blob = *(m_segments[idx]);

    assert((capnp_seg.begin() == blob.begin())
           && "Somehow capnp-returned segments are out of order to allocateSegment() calls?");
    assert((capnp_seg.size() <= blob.capacity()) && "capnp somehow overflowed the area we gave it.");

    /* Pull up end() to immediately follow the serialization so far.  capnp may keep writing past it (e.g., on a later
     * Capnp_tree_emitter::flush()); that's fine: it's within capacity(), and a later call resizes again. */
    blob.resize(capnp_seg.size());
    target_blob_ptrs.push_back(&blob);
  }
} // Heap_segment_builder::emit_segment_blobs()

kj::ArrayPtr<::capnp::word> Heap_segment_builder::allocateSegment(unsigned int min_sz) // Virtual.
{
  using Word = ::capnp::word;
  using Capnp_word_buf = kj::ArrayPtr<Word>;
  using flow::util::Blob;
  using std::memset;
  constexpr size_t WORD_SZ = sizeof(Word);

  const size_t seg_sz = std::max(size_t(min_sz) * WORD_SZ, m_segment_sz); // Note: min_sz is in words.

  m_segments.emplace_back(new Blob(m_logger_for_blobs));
  auto& blob = *(m_segments.back());
  blob.resize(seg_sz);
  assert(blob.size() != 0);
  memset(blob.begin(), 0, blob.size());

  return Capnp_word_buf(reinterpret_cast<Word*>(blob.begin()),
                        reinterpret_cast<Word*>(blob.end()));
}

size_t Heap_segment_builder::n_segments() const
{
  return m_segments.size();
}

size_t Heap_segment_builder::segment_sz() const
{
  return m_segment_sz;
}

} // namespace pickle::format::detail
