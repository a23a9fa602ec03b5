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

#include "pickle/common.hpp"
#include <flow/util/blob.hpp>
#include <cstdint>
#include <ostream>
#include <vector>

/**
 * Sub-module of Flow-Pickle providing the write-side pickling protocol: the vocabulary a graph-walking driver
 * uses to describe one object graph, the state machine that makes sure only legal call sequences reach the
 * backend, and the backend (Emitter) interface itself.  The big daddy here is Protocol_writer, usually
 * obtained via Pickle_session::run().
 *
 * The protocol, in brief:
 *   - Each value being pickled is an *entry*: Pickle_writer::begin_entry() ... Pickle_writer::end_entry().
 *   - An entry resolves to exactly one of:
 *     - a *primitive* (one Pickle_writer::put_primitive() call; see Primitive_tag for the closed set);
 *     - a *structure* (0+ Pickle_structure_writer::put_field() calls, each field value itself one entry);
 *     - a *collection* (Pickle_writer::begin_collection() with a declared length, that many
 *       Pickle_collection_writer::put_element() calls, each element itself one entry, then
 *       Pickle_collection_writer::end_collection()).
 *   - Sharing and cycles are expressed only via the Ref primitive, whose id is assigned by Reference_tracker.
 *
 * Any deviation is a *protocol violation*, reported via error::Code and fatal to the writer.
 */
namespace pickle::format
{

// Types.

// Find doc headers near the bodies of these compound types.

class Type_tag;
class Tag_registry;
struct Elision_context;

class Reference_tracker;

class Pickle_writer;
class Pickle_structure_writer;
class Pickle_collection_writer;
class Protocol_writer;
struct Entry_token;
struct Collection_token;

class Pickle_session;

class Emitter;
class Size_estimator;
class Capnp_tree_emitter;

struct Ostreamable_pickle_brief;
struct Ostreamable_pickle_full;

/**
 * Identifier assigned by Reference_tracker to an object the first time it is seen in a session; carried as the
 * payload of the Ref primitive when the same object is encountered again.  Assigned from 0, densely, in order of
 * first sight.
 */
using pickle_id_t = uint32_t;

/**
 * Identity of an object being pickled: its address.  The protocol never dereferences it; it is only compared for
 * equality (never for value-equality of the pointees) by Reference_tracker.  Null means "no identity" (for example
 * a primitive temporary), and such entries are never tracked.
 *
 * The address is stable for as long as the object is alive, and the object graph must stay alive and unmutated
 * for the duration of a Pickle_session; so (unlike in a language with a moving collector) no further indirection
 * is needed.
 */
using Object_identity = const void*;

/**
 * Sequence of 1+ `Blob` *pointers* to blobs which must stay alive while these pointers may be dereferenced,
 * holding the segments of a capnp serialization (see Capnp_tree_emitter::emit_serialization()).
 */
using Segment_ptrs = std::vector<flow::util::Blob*>;

/**
 * Whether a pass over the object graph is a throwaway (for example size-estimating) one or the real thing.
 * See Pickle_session::run().
 */
enum class Mode
{
  /**
   * Nothing may be committed: Reference_tracker state is scratch (discarded at the end of the pass),
   * and Pickle_writer::flush() is not forwarded to the Emitter.
   */
  S_DRY_RUN,
  /// The real pass: the session's Reference_tracker is used and kept; flushes reach the Emitter.
  S_COMMIT
}; // enum class Mode

// Free functions.

/**
 * Prints string representation of the given Mode to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Mode val);

/**
 * Prints string representation of the given Type_tag to the given `ostream`.
 *
 * @relatesalso Type_tag
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Type_tag& val);

/**
 * Prints string representation of the given Entry_token to the given `ostream`.
 *
 * @relatesalso Entry_token
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Entry_token& val);

/**
 * Prints string representation of the given Collection_token to the given `ostream`.
 *
 * @relatesalso Collection_token
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Collection_token& val);

/**
 * Prints string representation of the given Protocol_writer to the given `ostream`.
 *
 * @relatesalso Protocol_writer
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Protocol_writer& val);

/**
 * Prints string representation of the given Pickle_session to the given `ostream`.
 *
 * @relatesalso Pickle_session
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Pickle_session& val);

/**
 * Prints string representation of the given Capnp_tree_emitter to the given `ostream`.
 *
 * @relatesalso Capnp_tree_emitter
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Capnp_tree_emitter& val);

// The Ostreamable_pickle_* factories and `ostream<<` overloads are in util.hpp, as they need the schema.

} // namespace pickle::format
