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
#include "pickle/format/reference_tracker.hpp"
#include <cassert>

namespace pickle::format
{

// Implementations.

Reference_tracker::Reference_tracker(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_FORMAT)
{
  // Nothing else.
}

Reference_tracker::Observation Reference_tracker::observe(Object_identity identity)
{
  assert(identity && "Null identities are not trackable; caller should not have asked.");

  const auto new_id = pickle_id_t(m_identities.size());
  const auto result = m_ids.emplace(identity, new_id);
  if (!result.second)
  {
    const auto id = result.first->second;
    FLOW_LOG_TRACE("Reference_tracker [" << this << "]: Object @[" << identity << "] already seen; "
                   "it is #[" << id << "].");
    return Observation{ Outcome::S_ALREADY_SEEN, id };
  }
  // else

  m_identities.push_back(identity);
  FLOW_LOG_TRACE("Reference_tracker [" << this << "]: Object @[" << identity << "] first seen; "
                 "assigned #[" << new_id << "].");
  return Observation{ Outcome::S_FIRST_SEEN, new_id };
}

std::optional<pickle_id_t> Reference_tracker::lookup(Object_identity identity) const
{
  const auto it = m_ids.find(identity);
  if (it == m_ids.end())
  {
    return std::nullopt;
  }
  // else
  return it->second;
}

Object_identity Reference_tracker::identity_of(pickle_id_t id) const
{
  return (id < m_identities.size()) ? m_identities[id] : nullptr;
}

size_t Reference_tracker::size() const
{
  return m_identities.size();
}

} // namespace pickle::format
