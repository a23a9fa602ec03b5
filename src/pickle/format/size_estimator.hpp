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

namespace pickle::format
{

// Types.

/**
 * Emitter that writes nothing but totals an estimate of the bytes a compact binary rendering of the call sequence
 * would take: each entry costs its tag (length-prefixed) or 1 byte if elided; primitives cost their payload
 * (length-prefixed for strings and arrays); structures a field-count header; fields their name (length-prefixed);
 * collections a length header.
 * It is not tied to any particular backend's format; it is meant for capacity planning and for sizing
 * buffers ahead of a commit pass, via Pickle_session::estimate_size().
 */
class Size_estimator :
  public Emitter
{
public:
  // Constants.

  /// Bytes charged for each length prefix (of a tag, string, array, field name, structure, or collection).
  static constexpr size_t S_LENGTH_PREFIX_SZ = 4;

  // Constructors/destructor.

  /// Starts at 0 bytes.
  Size_estimator();

  // Methods.

  /**
   * Implements Emitter API.
   *
   * @param tag
   *        See Emitter.
   * @param tag_elided
   *        See Emitter.
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
   * Implements Emitter API.  No-op.
   *
   * @param err_code
   *        Cleared, if not null.
   */
  void flush(Error_code* err_code = 0) override;

  /**
   * The estimate so far.
   *
   * @return See above.
   */
  size_t size_estimate() const;

private:
  // Data.

  /// See size_estimate().
  size_t m_size_estimate;
}; // class Size_estimator

} // namespace pickle::format
