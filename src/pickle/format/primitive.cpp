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
#include "pickle/format/primitive.hpp"
#include <cassert>
#include <type_traits>

namespace pickle::format
{

// Implementations.

Primitive_tag tag_of(const Primitive& val)
{
  assert(!val.valueless_by_exception());
  return Primitive_tag(val.index());
}

bool is_array(Primitive_tag tag)
{
  return (tag >= Primitive_tag::S_ARRAY_BYTE) && (tag < Primitive_tag::S_END_SENTINEL);
}

util::String_view primitive_tag_name(Primitive_tag tag)
{
  switch (tag)
  {
  case Primitive_tag::S_NOTHING: return "Nothing";
  case Primitive_tag::S_NULL: return "Null";
  case Primitive_tag::S_UNIT: return "Unit";
  case Primitive_tag::S_BYTE: return "Byte";
  case Primitive_tag::S_CHAR: return "Char";
  case Primitive_tag::S_STRING: return "String";
  case Primitive_tag::S_SHORT: return "Short";
  case Primitive_tag::S_INT: return "Int";
  case Primitive_tag::S_LONG: return "Long";
  case Primitive_tag::S_FLOAT: return "Float";
  case Primitive_tag::S_DOUBLE: return "Double";
  case Primitive_tag::S_REF: return "Ref";
  case Primitive_tag::S_ARRAY_BYTE: return "Array[Byte]";
  case Primitive_tag::S_ARRAY_SHORT: return "Array[Short]";
  case Primitive_tag::S_ARRAY_CHAR: return "Array[Char]";
  case Primitive_tag::S_ARRAY_INT: return "Array[Int]";
  case Primitive_tag::S_ARRAY_LONG: return "Array[Long]";
  case Primitive_tag::S_ARRAY_BOOLEAN: return "Array[Boolean]";
  case Primitive_tag::S_ARRAY_FLOAT: return "Array[Float]";
  case Primitive_tag::S_ARRAY_DOUBLE: return "Array[Double]";

  case Primitive_tag::S_END_SENTINEL:
    assert(false && "SENTINEL: Not a tag.");
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Primitive_tag val)
{
  return os << primitive_tag_name(val);
}

std::ostream& operator<<(std::ostream& os, const Primitive& val)
{
  os << tag_of(val);

  std::visit([&](const auto& payload)
  {
    using Payload = std::decay_t<decltype(payload)>;

    if constexpr(std::is_same_v<Payload, Nothing> || std::is_same_v<Payload, Null> || std::is_same_v<Payload, Unit>)
    {
      return;
    }
    else if constexpr(std::is_same_v<Payload, Ref>)
    {
      os << "(#" << payload.m_id << ')';
    }
    else if constexpr(std::is_same_v<Payload, std::string>)
    {
      os << "(sz=" << payload.size() << ')';
    }
    else if constexpr(std::is_same_v<Payload, int8_t> || std::is_same_v<Payload, char16_t>)
    {
      os << '(' << int(payload) << ')'; // Else it'd print as a character (or not compile, for char16_t).
    }
    else if constexpr(std::is_arithmetic_v<Payload>)
    {
      os << '(' << payload << ')';
    }
    else // One of the arrays.
    {
      os << "(sz=" << payload.size() << ')';
    }
  }, val);

  return os;
}

} // namespace pickle::format
