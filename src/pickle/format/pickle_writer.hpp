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

#include "pickle/format/tag_registry.hpp"

namespace pickle::format
{

// Types.

/**
 * Returned by Pickle_writer::begin_entry(); must be passed to the matching Pickle_writer::end_entry(), which thus
 * detects unbalanced and out-of-order closes.  Opaque to the user, other than for printing.
 */
struct Entry_token
{
  // Data.

  /// Serial number of the frame, unique within its Protocol_writer.  0 is never issued.
  uint64_t m_serial;
  /// Nesting depth of the entry: 1 for a top-level entry.
  size_t m_depth;
};

/// Analogous to Entry_token but for Pickle_writer::begin_collection() and Pickle_collection_writer::end_collection().
struct Collection_token
{
  // Data.

  /// Serial number of the frame, unique within its Protocol_writer.  0 is never issued.
  uint64_t m_serial;
  /// Declared length.
  size_t m_length;
};

/**
 * Writes one value into the pickle: a callback given to Pickle_structure_writer::put_field() (for the field's
 * value) or Pickle_collection_writer::put_element() (for the element).  It must perform exactly one complete
 * Pickle_writer::begin_entry() ... Pickle_writer::end_entry() cycle (possibly via a convenience like
 * Pickle_writer::put_structure() or write_primitive()); anything else is a protocol violation.
 *
 * It may be invoked more than once for the same value (see Mode), so it should not assume its side effects occur
 * exactly once.
 */
using Writer_func = flow::Function<void (Pickle_writer&)>;

/// Writes the fields of a structure; given to Pickle_writer::put_structure().
using Structure_func = flow::Function<void (Pickle_structure_writer&)>;

/// Writes the elements of a collection; given to Pickle_writer::put_collection().
using Collection_func = flow::Function<void (Pickle_collection_writer&)>;

/**
 * The entry role of the pickling protocol: the interface through which one value, and the collection framing
 * of a collection value, are written.  See namespace pickle::format doc header for the protocol in brief.
 *
 * The three roles -- Pickle_writer, Pickle_structure_writer, Pickle_collection_writer -- are separate interfaces
 * with no shared base, as their operations do not overlap; they are connected only through nesting.
 * Protocol_writer implements all three.
 *
 * All methods follow the `Error_code*` convention (null => throw `flow::error::Runtime_error`).  Any error
 * listed in error::Code as a protocol violation, as well as error::Code::S_UNKNOWN_TAG, is fatal: every
 * subsequent call on the same writer fails with the same code.
 */
class Pickle_writer
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Pickle_writer();

  // Methods.

  /**
   * Begins an entry: one value being pickled.  Legal at the top level (no entry open) or as the one value of the
   * current field or element callback.
   *
   * @param picklee
   *        The value's identity; opaque (never dereferenced).  May be null.
   * @param tag
   *        Its tag.  Must be known to the Tag_registry in effect (else error::Code::S_UNKNOWN_TAG).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_ENTRY_OUTSIDE_VALUE_SLOT, error::Code::S_UNKNOWN_TAG,
   *        error::Code::S_MAX_DEPTH_EXCEEDED, or the code that earlier broke the writer.
   * @return Token to pass to end_entry().  Meaningless on error.
   */
  virtual Entry_token begin_entry(Object_identity picklee, const Type_tag& tag, Error_code* err_code = 0) = 0;

  /**
   * Ends the entry opened by the begin_entry() that returned `token`, which must be the innermost open frame.
   * An entry with nothing written into it is an empty structure.
   *
   * @param token
   *        See above.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_END_ENTRY_MISMATCH, or the code that earlier broke the writer.
   */
  virtual void end_entry(const Entry_token& token, Error_code* err_code = 0) = 0;

  /**
   * Writes one complete structure entry, or -- if `picklee` has been written already in this session -- one
   * complete Ref entry referring to it.  Specifically: if `picklee` is not null, it is observed by the session's
   * Reference_tracker; if already seen, a `pickle.Ref` entry carrying its id is written, and `work` is not invoked;
   * otherwise begin_entry(), `work(structure_writer())`, end_entry().  The entry is resolved as a structure before
   * `work` runs (so it may write fields only: no primitive, no collection), and is an empty structure if `work` writes
   * no fields.
   *
   * Since `work` is the structural write path, `tag` need not be registered in the Tag_registry.
   *
   * @param picklee
   *        The value's identity.  If null it is not tracked (always written in full).
   * @param tag
   *        Its tag.
   * @param work
   *        Writes the fields.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        any protocol violation, by this method or by `work`.
   */
  virtual void put_structure(Object_identity picklee, const Type_tag& tag, const Structure_func& work,
                             Error_code* err_code = 0) = 0;

  /**
   * Resolves the current entry as the given primitive.  Legal only once, and only in an entry without fields
   * or a collection.
   *
   * @param val
   *        Value.
   * @param tag
   *        Its kind: must equal `tag_of(val)`; and if the entry was begun with a primitive tag, must equal that.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_PRIMITIVE_OUTSIDE_ENTRY, error::Code::S_ENTRY_ALREADY_PRIMITIVE,
   *        error::Code::S_ENTRY_ALREADY_STRUCTURE, error::Code::S_ENTRY_ALREADY_COLLECTION,
   *        error::Code::S_PRIMITIVE_TAG_MISMATCH, or the code that earlier broke the writer.
   */
  virtual void put_primitive(const Primitive& val, Primitive_tag tag, Error_code* err_code = 0) = 0;

  /**
   * Resolves the current entry as a collection of exactly `length` elements, to be written via
   * collection_writer() (Pickle_collection_writer::put_element() and then Pickle_collection_writer::end_collection()).
   * Legal only once, and only in an entry without fields or a primitive.
   *
   * @param length
   *        Element count, known up-front for the sake of backends needing a size header.  0 is fine.
   * @param element_tag
   *        If not null, the static type of every element; elements with this tag may then have it elided
   *        (see Tag_registry::can_elide()).  Need only be valid until this method returns.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_COLLECTION_OUTSIDE_ENTRY, error::Code::S_ENTRY_ALREADY_PRIMITIVE,
   *        error::Code::S_ENTRY_ALREADY_STRUCTURE, error::Code::S_ENTRY_ALREADY_COLLECTION,
   *        or the code that earlier broke the writer.
   * @return Token to pass to end_collection().  Meaningless on error.
   */
  virtual Collection_token begin_collection(size_t length, const Type_tag* element_tag = 0,
                                            Error_code* err_code = 0) = 0;

  /**
   * Convenience: begin_collection(), `work(collection_writer())`, Pickle_collection_writer::end_collection().
   *
   * @param length
   *        See begin_collection().
   * @param element_tag
   *        See begin_collection().
   * @param work
   *        Writes exactly `length` elements; must not end the collection itself.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        any protocol violation, by this method or by `work`.
   */
  virtual void put_collection(size_t length, const Type_tag* element_tag, const Collection_func& work,
                              Error_code* err_code = 0) = 0;

  /**
   * The structure role of the same writer, for writing fields into the current entry.
   *
   * @return See above.
   */
  virtual Pickle_structure_writer& structure_writer() = 0;

  /**
   * The collection role of the same writer, for writing elements into the current collection.
   *
   * @return See above.
   */
  virtual Pickle_collection_writer& collection_writer() = 0;

  /**
   * Flushes any pending writes down to the backend.  Legal only at a top-level boundary (nothing open).
   * Backend errors are reported unchanged.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_FLUSH_WITH_OPEN_FRAMES, the code that earlier broke the writer,
   *        or whatever the backend emits.
   */
  virtual void flush(Error_code* err_code = 0) = 0;
}; // class Pickle_writer

/// The structure role of the pickling protocol: writes named fields, in order.  See Pickle_writer.
class Pickle_structure_writer
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Pickle_structure_writer();

  // Methods.

  /**
   * Writes a field of the current entry (resolving it as a structure, if not already).  `pickler` is invoked
   * synchronously with the entry role of the same writer; it must write the field's value as exactly one entry.
   *
   * Field order is preserved exactly as issued: it is the one ordering contract an unpickler may rely on.
   * Field name uniqueness is not enforced.
   *
   * @param name
   *        Field name.
   * @param pickler
   *        Writes the value.
   * @param static_tag
   *        If not null, the static type of the field; a value with this tag may then have it elided
   *        (see Tag_registry::can_elide()).  Need only be valid until this method returns.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_FIELD_OUTSIDE_ENTRY, error::Code::S_ENTRY_ALREADY_PRIMITIVE,
   *        error::Code::S_ENTRY_ALREADY_COLLECTION, error::Code::S_CALLBACK_WROTE_NO_ENTRY,
   *        error::Code::S_CALLBACK_LEFT_FRAMES_OPEN, anything `pickler` caused,
   *        or the code that earlier broke the writer.
   * @return `*this`, for chaining.
   */
  virtual Pickle_structure_writer& put_field(util::String_view name, const Writer_func& pickler,
                                             const Type_tag* static_tag = 0, Error_code* err_code = 0) = 0;
}; // class Pickle_structure_writer

/// The collection role of the pickling protocol: writes unnamed elements, in order.  See Pickle_writer.
class Pickle_collection_writer
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Pickle_collection_writer();

  // Methods.

  /**
   * Writes the next element of the current collection.  `pickler` is invoked synchronously with the entry role of
   * the same writer; it must write the element as exactly one entry.
   *
   * @param pickler
   *        Writes the element.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_ELEMENT_OUTSIDE_COLLECTION, error::Code::S_COLLECTION_LENGTH_EXCEEDED,
   *        error::Code::S_CALLBACK_WROTE_NO_ENTRY, error::Code::S_CALLBACK_LEFT_FRAMES_OPEN,
   *        anything `pickler` caused, or the code that earlier broke the writer.
   * @return `*this`, for chaining.
   */
  virtual Pickle_collection_writer& put_element(const Writer_func& pickler, Error_code* err_code = 0) = 0;

  /**
   * Ends the collection opened by the Pickle_writer::begin_collection() that returned `token`, which must be the
   * innermost open frame, after exactly the declared number of elements.
   *
   * @param token
   *        See above.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_END_COLLECTION_MISMATCH, error::Code::S_COLLECTION_LENGTH_MISMATCH,
   *        or the code that earlier broke the writer.
   */
  virtual void end_collection(const Collection_token& token, Error_code* err_code = 0) = 0;
}; // class Pickle_collection_writer

// Free functions.

/**
 * Writes one complete primitive entry: begin_entry() with the primitive's own tag, Pickle_writer::put_primitive(),
 * Pickle_writer::end_entry().  Typically used inside a Writer_func.
 *
 * @param writer
 *        Writer.
 * @param val
 *        Value.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
 *        whatever the individual calls emit.
 */
void write_primitive(Pickle_writer& writer, const Primitive& val, Error_code* err_code = 0);

} // namespace pickle::format
