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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/util/string_view.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/**
 * Flow-Pickle: the write side of a structural pickling engine.  The big daddy is the sub-namespace
 * pickle::format, which specifies (and enforces) the protocol by which a graph-walking driver describes
 * an object graph to a format-specific backend, without either side knowing much about the other.
 *
 * The present header holds the handful of items that every part of the project needs: the error-code
 * alias, logging components, and a few `using`s from Flow.
 */
namespace pickle
{

// Types.

/// Short-hand for the boost.system error code type used throughout, same as Flow's.
using Error_code = flow::Error_code;

/**
 * The `flow::log::Component` payload type used by all `Log_context`s in this project.  Register it with
 * a `flow::log::Config` via `init_component_to_union_idx_mapping<Log_component>()` and
 * `init_component_names<Log_component>(S_PICKLE_LOG_COMPONENT_NAME_MAP)`.
 */
enum class Log_component
{
  /// Catch-all.
  S_UNCAT = 0,
  /// pickle::format protocol core: writer state machine, session, tags, reference tracking.
  S_FORMAT,
  /// Backends that render protocol calls into some representation.
  S_EMITTER,
  /// SENTINEL: Not a component.  Must be last.
  S_END_SENTINEL
}; // enum class Log_component

// Constants.

/// Names of the #Log_component values, for `flow::log::Config::init_component_names()`.
extern const boost::unordered_multimap<Log_component, std::string> S_PICKLE_LOG_COMPONENT_NAME_MAP;

} // namespace pickle

/// Sub-namespace containing misc utilities; small at the moment.
namespace pickle::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

} // namespace pickle::util
