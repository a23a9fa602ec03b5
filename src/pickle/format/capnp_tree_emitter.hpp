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

#include "pickle/format/emitter.hpp"
#include "pickle/format/detail/heap_segment_builder.hpp"
#include "pickle/format/schema/pickle.capnp.h"
#include <capnp/orphan.h>
#include <ostream>
#include <utility>
#include <vector>

namespace pickle::format
{

// Types.

/**
 * Emitter that renders the protocol call sequence into a Cap'n Proto tree, per the schema in `pickle.capnp`:
 * one `schema::Entry` per entry, its value a union of the primitive kinds, `structure` (a list of named fields)
 * and `collection` (a list of entries).  The message is allocated by a detail::Heap_segment_builder, in
 * flow::util::Blob segments of Config::m_segment_sz bytes.
 *
 * While an entry is open it is built as a capnp orphan; when it ends, it is adopted into its parent (field or
 * element) or, if top-level, queued.  flush() appends the queued top-level entries to the root
 * `schema::Pickle.entries` list and, if Config::m_sink_ptr is set, writes the entire message so far to that stream
 * in standard capnp stream framing (`capnp::writeMessage()`).  Hence a sink receives one message per flush, each a
 * snapshot superseding the preceding one.
 *
 * ### Cost of flushing ###
 * capnp lists cannot grow in place, so each flush() that has new entries builds a new root `entries` list: it
 * copies every earlier entry (deep) and adopts the new ones.  The replaced list's space in the message is not
 * reclaimed.  Hence with F flushes of E entries each, the work and the message size grow as O(F^2 * E).  Flush
 * at coarse boundaries (typically once, after the last top-level entry); for an unbounded stream of entries use
 * one Capnp_tree_emitter per batch.
 *
 * A structure with no fields is rendered as an empty `structure` list.  Strings, tags and field names are copied
 * with their length, so embedded NUL characters survive.
 *
 * ### Error reporting ###
 * The protocol calls cannot fail: they trust Protocol_writer (see Emitter).  flush() and emit_serialization()
 * follow the `Error_code*` convention.
 */
class Capnp_tree_emitter :
  public flow::log::Log_context,
  public Emitter
{
public:
  // Types.

  /// Knobs.  Aggregate; cheaply copyable.
  struct Config
  {
    // Data.

    /// Logger to use for `*this` and the segment `Blob`s; may be null.
    flow::log::Logger* m_logger_ptr;
    /// Segment size in bytes (see detail::Heap_segment_builder).
    size_t m_segment_sz;
    /**
     * If not null, flush() writes the whole message so far here, every time.  Must outlive `*this`.
     * See "Cost of flushing" in the class doc header.
     */
    std::ostream* m_sink_ptr;
  }; // struct Config

  // Constructors/destructor.

  /**
   * Constructs emitter with an empty root (no entries).
   *
   * @param config
   *        See Config.
   */
  explicit Capnp_tree_emitter(const Config& config);

  /// Logs and destroys the tree along with its segments.
  ~Capnp_tree_emitter() override;

  // Methods.

  /**
   * Implements Emitter API.
   *
   * @param tag
   *        See Emitter.
   * @param tag_elided
   *        See Emitter.  If `true` the `tag` field is left empty.
   */
  void begin_entry(const Type_tag& tag, bool tag_elided) override;

  /**
   * Implements Emitter API.
   *
   * @param val
   *        See Emitter.
   */
  void put_primitive(const Primitive& val) override;

  /// Implements Emitter API.
  void begin_structure() override;

  /// Implements Emitter API.
  void end_structure() override;

  /**
   * Implements Emitter API.
   *
   * @param name
   *        See Emitter.
   */
  void begin_field(util::String_view name) override;

  /// Implements Emitter API.
  void end_field() override;

  /**
   * Implements Emitter API.
   *
   * @param length
   *        See Emitter.
   */
  void begin_collection(size_t length) override;

  /// Implements Emitter API.
  void end_collection() override;

  /// Implements Emitter API.
  void end_entry() override;

  /**
   * Implements Emitter API: moves completed top-level entries into the root; writes the message to the sink
   * (if any).
   *
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  Error_code generated:
   *        error::Code::S_EMITTER_SINK_WRITE_FAILED.
   */
  void flush(Error_code* err_code = 0) override;

  /**
   * Appends pointers to the message's segments to the given vector; see
   * detail::Heap_segment_builder::emit_segment_blobs().  Only flushed entries are in the message.
   *
   * @param target_blob_ptrs
   *        Target vector; appended to (not replaced).  Untouched on error.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  Error_code generated:
   *        error::Code::S_EMITTER_SEGMENT_TOO_BIG (some datum required a segment beyond Config::m_segment_sz).
   */
  void emit_serialization(Segment_ptrs* target_blob_ptrs, Error_code* err_code = 0);

  /**
   * The root of the tree: what has been flushed so far.  Valid until `*this` is destroyed or flushed again.
   *
   * @return See above.
   */
  schema::Pickle::Reader root() const;

  /**
   * Number of top-level entries completed but not yet flushed.
   *
   * @return See above.
   */
  size_t n_pending_entries() const;

private:
  // Types.

  /// How an open entry has been resolved so far.
  enum class Resolution
  {
    /// Nothing written yet.
    S_NONE,
    /// Primitive written.
    S_PRIMITIVE,
    /// Structure begun.
    S_STRUCTURE,
    /// Collection begun.
    S_COLLECTION
  };

  /// An open entry.
  struct Node
  {
    // Data.

    /// The entry being built.
    ::capnp::Orphan<schema::Entry> m_entry;
    /// See Resolution.
    Resolution m_resolution;
    /// If #m_resolution is `S_STRUCTURE`: name of the field now open, if any.
    std::string m_open_field_name;
    /// If #m_resolution is `S_STRUCTURE`: completed fields, in order.
    std::vector<std::pair<std::string, ::capnp::Orphan<schema::Entry>>> m_fields;
    /// If #m_resolution is `S_COLLECTION`: completed elements, in order.
    std::vector<::capnp::Orphan<schema::Entry>> m_elements;
  }; // struct Node

  // Methods.

  /**
   * Given an ended Node, sets its `structure` or `collection` from its completed children.
   *
   * @param node
   *        The node; its children are moved-from.
   */
  static void finalize(Node* node);

  // Data.

  /// The message.  Must be declared before the orphans and builders pointing into it.
  detail::Heap_segment_builder m_builder;

  /// See Config.
  std::ostream* const m_sink;

  /// Root of #m_builder.
  schema::Pickle::Builder m_root;

  /// Open entries, outermost first.
  std::vector<Node> m_nodes;

  /// Completed top-level entries awaiting flush().
  std::vector<::capnp::Orphan<schema::Entry>> m_pending;

  /// Number of flush() calls, for logging.
  unsigned int m_n_flushes;
}; // class Capnp_tree_emitter

} // namespace pickle::format
