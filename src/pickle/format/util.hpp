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
#include "pickle/format/schema/pickle.capnp.h"
#include <ostream>

namespace pickle::format
{

// Types.

/**
 * Proxy around a `schema::Pickle::Reader` (e.g., from Capnp_tree_emitter::root()) for output via `ostream<<` as a
 * one-line summary: each entry as its tag (unless elided) followed by its resolution, in the notation
 * `ostream<<` uses for Primitive; structures as `{ name: ..., ... }`; collections as `[ ..., ... ]`.
 * Nesting deeper than #m_max_depth is shown as `{...}` or `[...]`; string and array contents are never printed,
 * only their sizes.  Intended for log messages.  Use ostreamable_pickle_brief() to construct one.
 *
 * `Reader`s are cheap handles, so the proxy stores a copy; the message it refers to must remain alive while the
 * proxy is used.
 */
struct Ostreamable_pickle_brief
{
  // Data.

  /// The tree to print.
  schema::Pickle::Reader m_pickle;
  /// Structure/collection nesting levels printed below each top-level entry.
  size_t m_max_depth;
};

/**
 * Proxy around a `schema::Pickle::Reader` for output via `ostream<<` in capnp's multi-line, indented, full-length
 * text form, contents included.  Use ostreamable_pickle_full() to construct one.  Otherwise see
 * Ostreamable_pickle_brief.
 */
struct Ostreamable_pickle_full
{
  // Data.

  /// The tree to print.
  schema::Pickle::Reader m_pickle;
};

// Free functions.

/**
 * Returns an object that prints the given tree in brief when given to `ostream<<`.
 *
 * @param pickle
 *        The tree.  Tip: if you have a `Builder` then pass `builder.asReader()` here.
 * @param max_depth
 *        See Ostreamable_pickle_brief::m_max_depth.
 * @return See above.
 */
Ostreamable_pickle_brief ostreamable_pickle_brief(schema::Pickle::Reader pickle, size_t max_depth = 2);

/**
 * Returns an object that prints the given tree in full when given to `ostream<<`.
 *
 * @param pickle
 *        The tree.
 * @return See above.
 */
Ostreamable_pickle_full ostreamable_pickle_full(schema::Pickle::Reader pickle);

/**
 * Prints the brief form of a tree.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Ostreamable_pickle_brief& val);

/**
 * Prints the full form of a tree.
 *
 * @warning The entire tree is traversed and printed.  Do not use in perf-critical paths, unless verbose-logging
 *          (etc.) is enabled.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Ostreamable_pickle_full& val);

} // namespace pickle::format
