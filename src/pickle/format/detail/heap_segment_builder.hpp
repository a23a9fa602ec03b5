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
#pragma once

#include "pickle/format/format_fwd.hpp"
#include <boost/move/unique_ptr.hpp>
#include <capnp/message.h>

namespace pickle::format::detail
{

// Types.

/**
 * A `capnp::MessageBuilder` that allocates each segment as a separate heap-allocated flow::util::Blob of a
 * configured size, or larger if capnp demands more for one datum.  Capacity is never shared or reused across
 * segments.  Used by Capnp_tree_emitter; emit_segment_blobs() exposes the result in place, without copying.
 *
 * Segments are zeroed on allocation, as capnp requires.
 */
class Heap_segment_builder :
  public ::capnp::MessageBuilder
{
public:
  // Constructors/destructor.

  /**
   * Constructs builder with no segments yet.
   *
   * @param logger_for_blobs
   *        Logger for the `Blob`s (they log at TRACE); may be null.
   * @param segment_sz
   *        Size of each segment; rounded down to a multiple of the capnp word size.  A datum needing more gets a
   *        segment of its own, exactly as large as needed.
   */
  explicit Heap_segment_builder(flow::log::Logger* logger_for_blobs, size_t segment_sz);

  // Methods.

  /**
   * Appends to the given vector pointers to the segments, each sized to the serialization within it (and no
   * further).  The `Blob`s remain owned by `*this`; they and the pointers are valid until `*this` is destroyed.
   * Not to be called before the root has been initialized.
   *
   * @param target_blob_ptrs
   *        Target vector; appended to (not replaced).
   */
  void emit_segment_blobs(Segment_ptrs* target_blob_ptrs);

  /**
   * Number of segments allocated so far.
   *
   * @return See above.
   */
  size_t n_segments() const;

  /**
   * The configured segment size (after rounding).
   *
   * @return See above.
   */
  size_t segment_sz() const;

  /**
   * Implements `capnp::MessageBuilder` API: allocates a new zeroed segment of at least `min_sz` words.
   *
   * @param min_sz
   *        Minimum size, in capnp words.
   * @return See above.
   */
  kj::ArrayPtr<::capnp::word> allocateSegment(unsigned int min_sz) override;

private:
  // Data.

  /// See ctor.
  flow::log::Logger* const m_logger_for_blobs;

  /// See ctor.
  const size_t m_segment_sz;

  /// The segments, in the order capnp asked for them.
  std::vector<boost::movelib::unique_ptr<flow::util::Blob>> m_segments;
}; // class Heap_segment_builder

} // namespace pickle::format::detail
