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
#include "pickle/test/recording_emitter.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <iterator>
#include <sstream>

namespace pickle::test
{

// Implementations.

void Recording_emitter::begin_entry(const format::Type_tag& tag, bool tag_elided)
{
  m_events.push_back("entry:" + tag.key() + (tag_elided ? ":elided" : ""));
}

void Recording_emitter::put_primitive(const format::Primitive& val)
{
  std::ostringstream os;
  os << "prim:" << val;
  m_events.push_back(os.str());
}

void Recording_emitter::begin_structure()
{
  m_events.push_back("struct");
}

void Recording_emitter::end_structure()
{
  m_events.push_back("/struct");
}

void Recording_emitter::begin_field(util::String_view name)
{
  m_events.push_back("field:" + std::string(name));
}

void Recording_emitter::end_field()
{
  m_events.push_back("/field");
}

void Recording_emitter::begin_collection(size_t length)
{
  m_events.push_back("coll:" + std::to_string(length));
}

void Recording_emitter::end_collection()
{
  m_events.push_back("/coll");
}

void Recording_emitter::end_entry()
{
  m_events.push_back("/entry");
}

void Recording_emitter::flush(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { flush(actual_err_code); },
         err_code, "Recording_emitter::flush()"))
  {
    return;
  }
  // If got here: err_code is not null.

  m_events.push_back("flush");
  *err_code = m_flush_err_code;
}

void Recording_emitter::fail_flushes_with(const Error_code& err_code)
{
  m_flush_err_code = err_code;
}

const Recording_emitter::Events& Recording_emitter::events() const
{
  return m_events;
}

Recording_emitter::Events Recording_emitter::events_sans_flushes() const
{
  Events result;
  std::copy_if(m_events.begin(), m_events.end(), std::back_inserter(result),
               [](const std::string& event) { return event != "flush"; });
  return result;
}

size_t Recording_emitter::count(const std::string& event) const
{
  return std::count(m_events.begin(), m_events.end(), event);
}

} // namespace pickle::test
