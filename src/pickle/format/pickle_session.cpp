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
#include "pickle/format/pickle_session.hpp"
#include "pickle/format/size_estimator.hpp"
#include <flow/error/error.hpp>
#include <cassert>
#include <optional>

namespace pickle::format
{

// Implementations.

Pickle_session::Pickle_session(const Config& config, const Tag_registry& registry) :
  flow::log::Log_context(config.m_logger_ptr, Log_component::S_FORMAT),
  m_max_depth(config.m_max_depth),
  m_registry(registry),
  m_tracker(config.m_logger_ptr),
  m_committed(false),
  m_n_passes(0)
{
  FLOW_LOG_TRACE("Pickle_session [" << *this << "]: Created.");
}

Pickle_session::~Pickle_session()
{
  FLOW_LOG_TRACE("Pickle_session [" << *this << "]: Destroyed after [" << m_n_passes << "] passes; "
                 "committed? [" << m_committed << "]; [" << m_tracker.size() << "] objects tracked.");
}

void Pickle_session::run(Mode mode, Emitter* emitter, const Writer_func& producer, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { run(mode, emitter, producer, actual_err_code); },
         err_code, "Pickle_session::run()"))
  {
    return;
  }
  // If got here: err_code is not null.

  assert(emitter);
  err_code->clear();

  if (mode == Mode::S_COMMIT)
  {
    if (m_committed)
    {
      FLOW_LOG_WARNING("Pickle_session [" << *this << "]: Commit pass requested, but one was already run.  "
                       "A session pickles one root graph once.");
      *err_code = error::Code::S_SESSION_ALREADY_COMMITTED;
      return;
    }
    // else
    m_committed = true;
  }

  const auto pass_idx = ++m_n_passes;
  FLOW_LOG_INFO("Pickle_session [" << *this << "]: Pass [" << pass_idx << "] in mode [" << mode << "] begins; "
                "[" << m_tracker.size() << "] objects tracked so far.");

  // A dry run must leave the session tracker alone: work on a throwaway copy.
  std::optional<Reference_tracker> scratch_tracker;
  Reference_tracker* tracker = &m_tracker;
  if (mode == Mode::S_DRY_RUN)
  {
    scratch_tracker.emplace(m_tracker);
    tracker = &(*scratch_tracker);
  }

  Protocol_writer writer(Protocol_writer::Config{ get_logger(), mode, m_max_depth },
                         m_registry, emitter, tracker);

  // Exceptions from the producer go to our caller.  Error_code failures inside it break `writer`: see below.
  producer(writer);

  if (writer.broken_err_code())
  {
    *err_code = writer.broken_err_code();
    FLOW_LOG_WARNING("Pickle_session [" << *this << "]: Pass [" << pass_idx << "] failed: writer broke with "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  if (!writer.idle())
  {
    FLOW_LOG_WARNING("Pickle_session [" << *this << "]: Pass [" << pass_idx << "]: producer returned with "
                     "[" << writer.n_open_frames() << "] frames still open.");
    *err_code = error::Code::S_SESSION_LEFT_FRAMES_OPEN;
    return;
  }
  // else

  FLOW_LOG_INFO("Pickle_session [" << *this << "]: Pass [" << pass_idx << "] in mode [" << mode << "] done: "
                "[" << writer.n_top_level_entries() << "] top-level entries; "
                "[" << tracker->size() << "] objects tracked.");
} // Pickle_session::run()

size_t Pickle_session::estimate_size(const Writer_func& producer, Error_code* err_code)
{
  size_t estimate = 0;
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { estimate = estimate_size(producer, actual_err_code); },
         err_code, "Pickle_session::estimate_size()"))
  {
    return estimate;
  }
  // If got here: err_code is not null.

  Size_estimator estimator;
  run(Mode::S_DRY_RUN, &estimator, producer, err_code);
  if (*err_code)
  {
    return 0;
  }
  // else

  estimate = estimator.size_estimate();
  FLOW_LOG_TRACE("Pickle_session [" << *this << "]: Size estimate: [" << estimate << "] bytes.");
  return estimate;
}

const Reference_tracker& Pickle_session::tracker() const
{
  return m_tracker;
}

bool Pickle_session::committed() const
{
  return m_committed;
}

std::ostream& operator<<(std::ostream& os, const Pickle_session& val)
{
  return os << '@' << &val;
}

} // namespace pickle::format
