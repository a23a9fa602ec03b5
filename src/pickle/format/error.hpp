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

#include "pickle/common.hpp"
#include <boost/system/error_code.hpp>
#include <istream>
#include <ostream>

/**
 * Errors emitted by pickle::format.  Error-emitting APIs follow the Flow convention: a trailing
 * `Error_code* err_code = 0` argument; if null, failure throws `flow::error::Runtime_error` wrapping the code;
 * else the code is placed in `*err_code`, and the API returns normally.
 *
 * There are three families:
 *   - *Protocol violations*: a call was made outside the legal call sequence.  These are programming errors in
 *     the driver (or whatever generated its per-type callbacks), not data errors.  They are fatal to the
 *     writer on which they occurred: every subsequent call on it reports the same code.
 *     is_protocol_violation() identifies them.
 *   - Code::S_UNKNOWN_TAG: an entry's tag is in neither the primitive nor the registered-structure universe,
 *     and no structural-write path was supplied.  Also fatal.  So is Code::S_WRITER_ABANDONED, which means a
 *     producer callback threw; the exception itself propagates to the caller unchanged.
 *   - Backend (Emitter) failures.  The protocol core passes these through unchanged; the ones listed here are
 *     emitted by the reference emitters in this project.
 */
namespace pickle::format::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/// All possible errors returned (via `Error_code` arguments) by pickle::format functions/methods.
enum class Code
{
  /**
   * Protocol violation: an entry was begun where no value is expected: not at the top level, and not as the one value
   * of the current field or element (e.g., the previous entry at the same depth was never closed, or a field/element
   * callback began a second entry).
   */
  S_ENTRY_OUTSIDE_VALUE_SLOT = S_CODE_LOWEST_INT_VALUE,

  /// Protocol violation: end-entry token does not match the innermost open entry (unbalanced or out-of-order close).
  S_END_ENTRY_MISMATCH,

  /// Protocol violation: collection begun outside an open, not-yet-resolved entry.
  S_COLLECTION_OUTSIDE_ENTRY,

  /// Protocol violation: field, primitive, or collection issued on an entry already resolved as a primitive.
  S_ENTRY_ALREADY_PRIMITIVE,

  /// Protocol violation: primitive or collection issued on an entry already resolved as a structure.
  S_ENTRY_ALREADY_STRUCTURE,

  /// Protocol violation: field, primitive, or a second collection issued on an entry already resolved as a collection.
  S_ENTRY_ALREADY_COLLECTION,

  /// Protocol violation: element put while no collection is open in the innermost frame.
  S_ELEMENT_OUTSIDE_COLLECTION,

  /// Protocol violation: field put while no entry is open in the innermost frame.
  S_FIELD_OUTSIDE_ENTRY,

  /// Protocol violation: primitive put while no entry is open in the innermost frame.
  S_PRIMITIVE_OUTSIDE_ENTRY,

  /// Protocol violation: end-collection token does not match the innermost open collection.
  S_END_COLLECTION_MISMATCH,

  /// Protocol violation: more elements put than the length declared when the collection was begun.
  S_COLLECTION_LENGTH_EXCEEDED,

  /// Protocol violation: collection ended with fewer elements put than the length declared when it was begun.
  S_COLLECTION_LENGTH_MISMATCH,

  /// Protocol violation: a field/element callback returned without writing its one entry.
  S_CALLBACK_WROTE_NO_ENTRY,

  /// Protocol violation: a field/element callback returned leaving entries or collections it had begun still open.
  S_CALLBACK_LEFT_FRAMES_OPEN,

  /**
   * Protocol violation: primitive's tag differs from its value's actual kind, or from the primitive tag with which
   * its entry was begun.
   */
  S_PRIMITIVE_TAG_MISMATCH,

  /// Protocol violation: flush requested while entries or collections are open.
  S_FLUSH_WITH_OPEN_FRAMES,

  /// Protocol violation: nesting of entries exceeded the configured maximum depth.
  S_MAX_DEPTH_EXCEEDED,

  /// Protocol violation: the producer of a session pass returned leaving entries or collections open.
  S_SESSION_LEFT_FRAMES_OPEN,

  /// Protocol violation: a session (one root object graph) may be committed only once.
  S_SESSION_ALREADY_COMMITTED,

  /// Entry's tag is not a known primitive or registered structure, and no structural write path was supplied.
  S_UNKNOWN_TAG,

  /// Writer abandoned: a producer callback exited via exception; the writer is no longer usable.
  S_WRITER_ABANDONED,

  /// Emitter: the configured output stream reported failure while writing the serialization.
  S_EMITTER_SINK_WRITE_FAILED,

  /**
   * Emitter: a leaf datum (e.g., a string or array) is so large as to require a segment exceeding the configured
   * segment size.
   */
  S_EMITTER_SEGMENT_TOO_BIG,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` enum value, returns a matching `Error_code`, of the pickle::format category.
 * Used by boost.system to make `Code`s implicitly convertible to `Error_code`.
 *
 * @param err_code
 *        Value to convert.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Returns `true` if and only if the given code is of this category and is a protocol violation
 * (see namespace doc header).
 *
 * @param err_code
 *        Code to classify.  Falsy (success) yields `false`.
 * @return See above.
 */
bool is_protocol_violation(const Error_code& err_code);

/**
 * Deserializes a `Code` from a standard input stream: reads a token and tries to match it to the
 * `ostream<<` output of a `Code`, case-insensitively; or interprets it as the number itself.
 * On failure `val` is set to `Code::S_END_SENTINEL`.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a `Code` to a standard output stream, as its symbolic name (without the `S_` prefix).
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace pickle::format::error

namespace boost::system
{

// Types.

/**
 * Specializing this `struct` tells boost.system that `enum` `Code` may be used as an `Error_code`.
 * The non-specialized version sets `value` to `false`, so that arbitrary `enum`s can't just be used as
 * `Error_code`s.
 */
template<>
struct is_error_code_enum<::pickle::format::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
