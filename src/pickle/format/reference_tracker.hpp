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
#include <boost/unordered_map.hpp>
#include <optional>
#include <vector>

namespace pickle::format
{

// Types.

/**
 * Detects and records previously-visited objects of one object graph, so that an object reachable more than
 * once (shared, or part of a cycle) is pickled in full only the first time; and as a Ref primitive carrying its id
 * each subsequent time.  This is what makes pickling of cyclic graphs terminate.
 *
 * Objects are keyed by *identity* (Object_identity, i.e., address), never by value: two distinct but equal objects
 * are both pickled in full.
 *
 * ### Lifecycle ###
 * One tracker per top-level pickling session (one root object graph); see Pickle_session, which owns it.
 * There is no sharing of ids across sessions.  A dry-run pass (Mode::S_DRY_RUN) must not disturb the session's
 * tracker, so it works on a copy; hence this type is copyable.
 *
 * ### Internals ###
 * Ids are indices into an arena (#m_identities) of identities in order of first sight; an index keyed by identity
 * maps back.  So ids are dense, starting at 0, and stable for the life of the tracker.
 *
 * ### Thread safety ###
 * None: a session has one producer at a time.
 */
class Reference_tracker :
  public flow::log::Log_context
{
public:
  // Types.

  /// Result of observe().
  enum class Outcome
  {
    /// Never seen before; it now has an id, and the caller shall pickle the object in full.
    S_FIRST_SEEN,
    /// Seen before; the caller shall pickle a Ref carrying the id instead of walking the object again.
    S_ALREADY_SEEN
  };

  /// Full result of observe().
  struct Observation
  {
    // Data.

    /// See Outcome.
    Outcome m_outcome;
    /// The object's id: new if Outcome::S_FIRST_SEEN, else the one assigned at first sight.
    pickle_id_t m_id;
  };

  // Constructors/destructor.

  /**
   * Constructs empty tracker.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Reference_tracker(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Records that the given object is about to be pickled (if it has not been seen) and reports whether it has been.
   *
   * @param identity
   *        The object.  Must not be null.
   * @return See Observation.
   */
  Observation observe(Object_identity identity);

  /**
   * Returns the id of the given object if it has been observed; else nothing.  Does not record anything.
   *
   * @param identity
   *        The object.
   * @return See above.
   */
  std::optional<pickle_id_t> lookup(Object_identity identity) const;

  /**
   * Returns the object with the given id; null if no such id has been assigned.
   *
   * @param id
   *        Id.
   * @return See above.
   */
  Object_identity identity_of(pickle_id_t id) const;

  /**
   * Number of distinct objects observed so far; equivalently the next id to be assigned.
   *
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// The arena: `m_identities[id]` is the object with that id.
  std::vector<Object_identity> m_identities;

  /// Index of #m_identities: identity => id.
  boost::unordered_map<Object_identity, pickle_id_t> m_ids;
}; // class Reference_tracker

} // namespace pickle::format
