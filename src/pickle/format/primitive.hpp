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
#include <string>
#include <variant>
#include <vector>

namespace pickle::format
{

// Types.

/**
 * The closed set of "leaf" kinds every Emitter must support directly.  No other primitive kinds exist; anything
 * else is a structure or a collection.
 *
 * The order of these is significant: it matches the order of alternatives in #Primitive, so that
 * tag_of() is simply the variant index.
 */
enum class Primitive_tag
{
  /// Absence of value.
  S_NOTHING = 0,
  /// Null.
  S_NULL,
  /// The unit value.
  S_UNIT,
  /// Signed 8-bit integer.
  S_BYTE,
  /// UTF-16 code unit.
  S_CHAR,
  /// UTF-8 string.
  S_STRING,
  /// Signed 16-bit integer.
  S_SHORT,
  /// Signed 32-bit integer.
  S_INT,
  /// Signed 64-bit integer.
  S_LONG,
  /// 32-bit IEEE 754 floating point.
  S_FLOAT,
  /// 64-bit IEEE 754 floating point.
  S_DOUBLE,
  /// Back-reference marker: the only primitive whose payload is an identifier rather than data.  See Ref.
  S_REF,
  /// Homogeneous array of #S_BYTE.
  S_ARRAY_BYTE,
  /// Homogeneous array of #S_SHORT.
  S_ARRAY_SHORT,
  /// Homogeneous array of #S_CHAR.
  S_ARRAY_CHAR,
  /// Homogeneous array of #S_INT.
  S_ARRAY_INT,
  /// Homogeneous array of #S_LONG.
  S_ARRAY_LONG,
  /// Homogeneous array of booleans.
  S_ARRAY_BOOLEAN,
  /// Homogeneous array of #S_FLOAT.
  S_ARRAY_FLOAT,
  /// Homogeneous array of #S_DOUBLE.
  S_ARRAY_DOUBLE,
  /// SENTINEL: Not a tag.  Must be last.
  S_END_SENTINEL
}; // enum class Primitive_tag

/// Payload of Primitive_tag::S_NOTHING.
struct Nothing {};

/// Payload of Primitive_tag::S_NULL.
struct Null {};

/// Payload of Primitive_tag::S_UNIT.
struct Unit {};

/**
 * Payload of Primitive_tag::S_REF: stands in for an object already pickled earlier in the same session.
 * @see Reference_tracker, which assigns #m_id.
 */
struct Ref
{
  // Data.

  /// Id assigned to the referred-to object at first sight.
  pickle_id_t m_id;
};

/**
 * A primitive value: one alternative per Primitive_tag, in the same order.
 *
 * Strings are UTF-8 in `std::string`.  `Char` is a UTF-16 code unit; hence `char16_t`.
 */
using Primitive = std::variant<Nothing,
                               Null,
                               Unit,
                               int8_t,
                               char16_t,
                               std::string,
                               int16_t,
                               int32_t,
                               int64_t,
                               float,
                               double,
                               Ref,
                               std::vector<int8_t>,
                               std::vector<int16_t>,
                               std::vector<char16_t>,
                               std::vector<int32_t>,
                               std::vector<int64_t>,
                               std::vector<bool>,
                               std::vector<float>,
                               std::vector<double>>;

static_assert(std::variant_size_v<Primitive> == size_t(Primitive_tag::S_END_SENTINEL),
              "Primitive alternatives and Primitive_tag values must correspond 1-1, in order.");

// Free functions.

/**
 * Returns the kind of the given primitive value.
 *
 * @param val
 *        Value.
 * @return See above.
 */
Primitive_tag tag_of(const Primitive& val);

/**
 * Returns `true` if and only if the given kind is one of the `S_ARRAY_*` ones.
 *
 * @param tag
 *        Kind.
 * @return See above.
 */
bool is_array(Primitive_tag tag);

/**
 * Returns the short name of the given kind, e.g., `"Int"` or `"Array[Double]"`.  The canonical Type_tag key of the
 * kind is this name prefixed with `"pickle."`.
 *
 * @param tag
 *        Kind; must not be `S_END_SENTINEL`.
 * @return See above.
 */
util::String_view primitive_tag_name(Primitive_tag tag);

/**
 * Prints the short name of the given kind; see primitive_tag_name().
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Primitive_tag val);

/**
 * Prints a brief representation of the given primitive value: its kind, followed by its value if scalar or its
 * size if an array or string.  Suitable for logging.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Primitive& val);

} // namespace pickle::format
