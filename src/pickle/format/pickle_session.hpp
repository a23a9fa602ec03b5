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

#include "pickle/format/protocol_writer.hpp"
#include "pickle/format/reference_tracker.hpp"

namespace pickle::format
{

// Types.

/**
 * Scope of the pickling of one root object graph: owns the graph's Reference_tracker, and runs producer passes
 * against an Emitter, each with a fresh Protocol_writer.
 *
 * A producer may be run any number of times in Mode::S_DRY_RUN (e.g., to estimate size; see estimate_size()):
 * such a pass validates the protocol fully, but it tracks references in a scratch copy of the session tracker,
 * and its flushes do not reach the Emitter.  Thus a dry run leaves no trace in the session; a producer's side
 * effects (if any) on its own state are its own business.  Then it may be run once in Mode::S_COMMIT, which uses
 * the session tracker itself.
 *
 * ### Thread safety ###
 * None: one thread at a time per `*this`.
 */
class Pickle_session :
  public flow::log::Log_context
{
public:
  // Types.

  /// Knobs.  Aggregate; cheaply copyable.
  struct Config
  {
    // Data.

    /// Logger to use for `*this` and the writers/tracker it makes; may be null.
    flow::log::Logger* m_logger_ptr;
    /// See Protocol_writer::Config::m_max_depth.
    size_t m_max_depth;
  }; // struct Config

  // Constructors/destructor.

  /**
   * Constructs a session with an empty Reference_tracker, not yet committed.
   *
   * @param config
   *        See Config.
   * @param registry
   *        Registry of known tags.  Must outlive `*this`.
   */
  explicit Pickle_session(const Config& config, const Tag_registry& registry);

  /// Logs and destroys.
  ~Pickle_session();

  // Methods.

  /**
   * Runs one pass: makes a Protocol_writer in the given mode targeting the given Emitter, gives it to
   * `producer`, then checks that `producer` left the writer balanced.  The writer does not outlive this call.
   *
   * If `producer` exits via exception, it propagates; in Mode::S_COMMIT the session is considered committed
   * nonetheless.
   *
   * @param mode
   *        Dry run or commit.
   * @param emitter
   *        Backend.  Must be non-null; used only during this call.
   * @param producer
   *        Drives the writer: typically puts one top-level entry (the root) and flushes.
   * @param err_code
   *        See flow::Error_code docs for error reporting semantics.  Error_code generated:
   *        error::Code::S_SESSION_ALREADY_COMMITTED (Mode::S_COMMIT a second time),
   *        error::Code::S_SESSION_LEFT_FRAMES_OPEN, or whatever broke the writer (see Protocol_writer),
   *        or whatever the Emitter's flush reported.
   */
  void run(Mode mode, Emitter* emitter, const Writer_func& producer, Error_code* err_code = 0);

  /**
   * Dry-runs `producer` against a Size_estimator and returns its estimate.
   *
   * @param producer
   *        See run().
   * @param err_code
   *        See run().  On error returns 0.
   * @return Estimated serialized size in bytes.
   */
  size_t estimate_size(const Writer_func& producer, Error_code* err_code = 0);

  /**
   * The session tracker: what the commit pass (if any, so far) has recorded.
   *
   * @return See above.
   */
  const Reference_tracker& tracker() const;

  /**
   * Whether run() in Mode::S_COMMIT has been invoked.
   *
   * @return See above.
   */
  bool committed() const;

private:
  // Data.

  /// See Config.
  const size_t m_max_depth;

  /// See ctor.
  const Tag_registry& m_registry;

  /// Identity tracking for the one graph of `*this`; touched only by the commit pass.
  Reference_tracker m_tracker;

  /// Whether the commit pass has run.
  bool m_committed;

  /// Number of passes run so far, for logging.
  unsigned int m_n_passes;
}; // class Pickle_session

} // namespace pickle::format
