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
#include "pickle/format/pickle_writer.hpp"
#include "pickle/format/emitter.hpp"
#include <flow/error/error.hpp>

namespace pickle::format
{

// Implementations.

Emitter::~Emitter() = default;

Pickle_writer::~Pickle_writer() = default;

Pickle_structure_writer::~Pickle_structure_writer() = default;

Pickle_collection_writer::~Pickle_collection_writer() = default;

void write_primitive(Pickle_writer& writer, const Primitive& val, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write_primitive(writer, val, actual_err_code); },
         err_code, "pickle::format::write_primitive()"))
  {
    return;
  }
  // If got here: err_code is not null.

  const auto kind = tag_of(val);
  const auto token = writer.begin_entry(nullptr, Type_tag::of(kind), err_code);
  if (*err_code)
  {
    return;
  }
  // else

  writer.put_primitive(val, kind, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  writer.end_entry(token, err_code);
}

std::ostream& operator<<(std::ostream& os, const Entry_token& val)
{
  return os << "entry#" << val.m_serial << "@depth=" << val.m_depth;
}

std::ostream& operator<<(std::ostream& os, const Collection_token& val)
{
  return os << "collection#" << val.m_serial << "[len=" << val.m_length << ']';
}

std::ostream& operator<<(std::ostream& os, Mode val)
{
  return os << ((val == Mode::S_DRY_RUN) ? "DRY_RUN" : "COMMIT");
}

} // namespace pickle::format
