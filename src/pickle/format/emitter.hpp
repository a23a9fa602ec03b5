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
 * The format-specific backend that a Protocol_writer drives: it renders a call sequence into bytes, text,
 * an in-memory tree, a size estimate -- whatever.  The protocol core never assumes anything about the encoding.
 *
 * ### What the implementer may rely on ###
 * Protocol_writer forwards a call only once it has validated it; so an Emitter sees only well-formed sequences:
 *   - begin_entry() and end_entry() are balanced and properly nested.
 *   - Between begin_entry() and its end_entry() there is exactly one of:
 *     - one put_primitive();
 *     - one begin_structure() ... end_structure() pair enclosing 0+ begin_field() ... end_field() pairs, each
 *       enclosing exactly one complete entry (the field's value);
 *     - one begin_collection() ... end_collection() pair enclosing exactly as many complete entries (the
 *       elements) as the length given to begin_collection().
 *   - A top-level entry is one not enclosed in any field or collection; there may be several in sequence.
 *   - flush() is only called with no entry open.
 *
 * Nothing is promised beyond that.  In particular field names are not deduplicated (duplicates are the format's
 * problem), and the same logical value may be rendered more than once if the driver runs more than one pass
 * (see Mode).
 *
 * ### Errors ###
 * Only flush() reports errors in-band; it follows the usual `Error_code*` convention.  Other failures (say,
 * allocation) may be thrown as exceptions; Protocol_writer lets them propagate unchanged.
 */
class Emitter
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Emitter();

  // Methods.

  /**
   * An entry (one value) begins.
   *
   * @param tag
   *        Its tag, already canonicalized (see Tag_registry::canonicalize()).
   * @param tag_elided
   *        If `true` the surrounding structure statically determines the tag; so the emitter should not
   *        serialize it (it may if the format has no way not to).
   */
  virtual void begin_entry(const Type_tag& tag, bool tag_elided) = 0;

  /**
   * The current entry is a primitive with the given value.
   *
   * @param val
   *        Value.
   */
  virtual void put_primitive(const Primitive& val) = 0;

  /**
   * The current entry is a structure; its fields (possibly none) follow, then end_structure().  Called before the
   * first field, so a backend needing a structure header or opening delimiter can write it here.
   *
   * An entry that ends with nothing written into it is an empty structure: it gets begin_structure() and
   * end_structure() back to back, just before end_entry().
   */
  virtual void begin_structure() = 0;

  /// The structure begun by the last unmatched begin_structure() ends; no more fields follow.
  virtual void end_structure() = 0;

  /**
   * A field of the current structure begins; its value (one entry) follows.
   *
   * @param name
   *        Field name.  Valid only until this method returns.
   */
  virtual void begin_field(util::String_view name) = 0;

  /// The field begun by the last unmatched begin_field() ends.
  virtual void end_field() = 0;

  /**
   * The current entry is a collection of the given length; that many entries (the elements) follow.
   *
   * @param length
   *        Element count.
   */
  virtual void begin_collection(size_t length) = 0;

  /// The collection begun by the last unmatched begin_collection() ends.
  virtual void end_collection() = 0;

  /// The entry begun by the last unmatched begin_entry() ends.
  virtual void end_entry() = 0;

  /**
   * Pushes any buffered output to wherever it goes.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Format-specific.
   */
  virtual void flush(Error_code* err_code = 0) = 0;
}; // class Emitter

} // namespace pickle::format
