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
#include "pickle/format/size_estimator.hpp"
#include <type_traits>

namespace pickle::format
{

// Implementations.

Size_estimator::Size_estimator() :
  m_size_estimate(0)
{
  // That's it.
}

void Size_estimator::begin_entry(const Type_tag& tag, bool tag_elided)
{
  m_size_estimate += tag_elided ? 1 : (S_LENGTH_PREFIX_SZ + tag.key().size());
}

void Size_estimator::put_primitive(const Primitive& val)
{
  m_size_estimate += std::visit([](const auto& payload) -> size_t
  {
    using Payload = std::decay_t<decltype(payload)>;

    if constexpr(std::is_same_v<Payload, Nothing> || std::is_same_v<Payload, Null> || std::is_same_v<Payload, Unit>)
    {
      return 0;
    }
    else if constexpr(std::is_same_v<Payload, Ref>)
    {
      return sizeof(payload.m_id);
    }
    else if constexpr(std::is_same_v<Payload, std::string>)
    {
      return S_LENGTH_PREFIX_SZ + payload.size();
    }
    else if constexpr(std::is_same_v<Payload, std::vector<bool>>)
    {
      return S_LENGTH_PREFIX_SZ + ((payload.size() + 7) / 8);
    }
    else if constexpr(std::is_arithmetic_v<Payload>)
    {
      return sizeof(Payload);
    }
    else
    {
      return S_LENGTH_PREFIX_SZ + (payload.size() * sizeof(typename Payload::value_type));
    }
  }, val);
}

void Size_estimator::begin_structure()
{
  m_size_estimate += S_LENGTH_PREFIX_SZ;
}

void Size_estimator::end_structure()
{
  // Nothing to add.
}

void Size_estimator::begin_field(util::String_view name)
{
  m_size_estimate += S_LENGTH_PREFIX_SZ + name.size();
}

void Size_estimator::end_field()
{
  // Nothing to add.
}

void Size_estimator::begin_collection(size_t)
{
  m_size_estimate += S_LENGTH_PREFIX_SZ;
}

void Size_estimator::end_collection()
{
  // Nothing to add.
}

void Size_estimator::end_entry()
{
  // Nothing to add.
}

void Size_estimator::flush(Error_code* err_code)
{
  if (err_code)
  {
    err_code->clear();
  }
}

size_t Size_estimator::size_estimate() const
{
  return m_size_estimate;
}

} // namespace pickle::format
