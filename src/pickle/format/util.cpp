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
#include "pickle/format/util.hpp"
#include "pickle/format/primitive.hpp"
#include <capnp/pretty-print.h>
#include <cassert>

namespace pickle::format
{

namespace
{

/**
 * Prints a capnp `Text` including any embedded NULs.
 *
 * @param os
 *        Stream.
 * @param text
 *        Text.
 */
void print_text(std::ostream& os, ::capnp::Text::Reader text)
{
  os << util::String_view(text.begin(), text.size());
}

/**
 * Prints `<kind>(sz=<n>)` for a string or array.
 *
 * @param os
 *        Stream.
 * @param kind
 *        Its primitive kind.
 * @param size
 *        Its element count.
 */
void print_sized(std::ostream& os, Primitive_tag kind, size_t size)
{
  os << kind << "(sz=" << size << ')';
}

/**
 * Prints one entry, recursively, in the brief form; see Ostreamable_pickle_brief.
 *
 * @param os
 *        Stream.
 * @param entry
 *        Entry.
 * @param depth_left
 *        Nesting levels that may yet be expanded.
 */
void print_entry_brief(std::ostream& os, schema::Entry::Reader entry, size_t depth_left)
{
  using Which = schema::Entry::Which;

  if (!entry.getTagElided())
  {
    print_text(os, entry.getTag());
    os << ' ';
  }

  switch (entry.which())
  {
  case Which::NOTHING:
    os << Primitive_tag::S_NOTHING;
    return;
  case Which::NIL:
    os << Primitive_tag::S_NULL;
    return;
  case Which::UNIT:
    os << Primitive_tag::S_UNIT;
    return;
  case Which::BYTE_VAL:
    os << Primitive_tag::S_BYTE << '(' << int(entry.getByteVal()) << ')';
    return;
  case Which::CHAR_VAL:
    os << Primitive_tag::S_CHAR << '(' << entry.getCharVal() << ')';
    return;
  case Which::STRING_VAL:
    print_sized(os, Primitive_tag::S_STRING, entry.getStringVal().size());
    return;
  case Which::SHORT_VAL:
    os << Primitive_tag::S_SHORT << '(' << entry.getShortVal() << ')';
    return;
  case Which::INT_VAL:
    os << Primitive_tag::S_INT << '(' << entry.getIntVal() << ')';
    return;
  case Which::LONG_VAL:
    os << Primitive_tag::S_LONG << '(' << entry.getLongVal() << ')';
    return;
  case Which::FLOAT_VAL:
    os << Primitive_tag::S_FLOAT << '(' << entry.getFloatVal() << ')';
    return;
  case Which::DOUBLE_VAL:
    os << Primitive_tag::S_DOUBLE << '(' << entry.getDoubleVal() << ')';
    return;
  case Which::REF:
    os << Primitive_tag::S_REF << "(#" << entry.getRef() << ')';
    return;
  case Which::BYTE_ARRAY:
    print_sized(os, Primitive_tag::S_ARRAY_BYTE, entry.getByteArray().size());
    return;
  case Which::SHORT_ARRAY:
    print_sized(os, Primitive_tag::S_ARRAY_SHORT, entry.getShortArray().size());
    return;
  case Which::CHAR_ARRAY:
    print_sized(os, Primitive_tag::S_ARRAY_CHAR, entry.getCharArray().size());
    return;
  case Which::INT_ARRAY:
    print_sized(os, Primitive_tag::S_ARRAY_INT, entry.getIntArray().size());
    return;
  case Which::LONG_ARRAY:
    print_sized(os, Primitive_tag::S_ARRAY_LONG, entry.getLongArray().size());
    return;
  case Which::BOOLEAN_ARRAY:
    print_sized(os, Primitive_tag::S_ARRAY_BOOLEAN, entry.getBooleanArray().size());
    return;
  case Which::FLOAT_ARRAY:
    print_sized(os, Primitive_tag::S_ARRAY_FLOAT, entry.getFloatArray().size());
    return;
  case Which::DOUBLE_ARRAY:
    print_sized(os, Primitive_tag::S_ARRAY_DOUBLE, entry.getDoubleArray().size());
    return;

  case Which::STRUCTURE:
  {
    const auto fields = entry.getStructure();
    if (fields.size() == 0)
    {
      os << "{}";
      return;
    }
    // else
    if (depth_left == 0)
    {
      os << "{...}";
      return;
    }
    // else

    os << "{ ";
    for (size_t idx = 0; idx != fields.size(); ++idx)
    {
      if (idx != 0)
      {
        os << ", ";
      }
      print_text(os, fields[idx].getName());
      os << ": ";
      print_entry_brief(os, fields[idx].getValue(), depth_left - 1);
    }
    os << " }";
    return;
  }

  case Which::COLLECTION:
  {
    const auto elements = entry.getCollection();
    if (elements.size() == 0)
    {
      os << "[]";
      return;
    }
    // else
    if (depth_left == 0)
    {
      os << "[...]";
      return;
    }
    // else

    os << "[ ";
    for (size_t idx = 0; idx != elements.size(); ++idx)
    {
      if (idx != 0)
      {
        os << ", ";
      }
      print_entry_brief(os, elements[idx], depth_left - 1);
    }
    os << " ]";
    return;
  }
  } // switch (entry.which())

  os << "?"; // A newer schema's union member.
} // print_entry_brief()

} // namespace (anon)

// Implementations.

Ostreamable_pickle_brief ostreamable_pickle_brief(schema::Pickle::Reader pickle, size_t max_depth)
{
  return Ostreamable_pickle_brief{ pickle, max_depth };
}

Ostreamable_pickle_full ostreamable_pickle_full(schema::Pickle::Reader pickle)
{
  return Ostreamable_pickle_full{ pickle };
}

std::ostream& operator<<(std::ostream& os, const Ostreamable_pickle_brief& val)
{
  const auto entries = val.m_pickle.getEntries();
  os << "pickle[" << entries.size() << ']';
  for (const auto entry : entries)
  {
    os << "; ";
    print_entry_brief(os, entry, val.m_max_depth);
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, const Ostreamable_pickle_full& val)
{
  return os << ::capnp::prettyPrint(val.m_pickle).flatten().cStr();
}

} // namespace pickle::format
