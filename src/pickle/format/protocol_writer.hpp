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

#include "pickle/format/pickle_writer.hpp"
#include "pickle/format/emitter.hpp"
#include "pickle/format/reference_tracker.hpp"
#include "pickle/format/error.hpp"
#include <optional>
#include <vector>

namespace pickle::format
{

// Types.

/**
 * The pickling protocol's enforcing state machine: implements all three protocol roles (Pickle_writer,
 * Pickle_structure_writer, Pickle_collection_writer), validates each call against the legal call sequences,
 * and forwards only valid calls to an Emitter.  Hence the Emitter sees well-formed sequences only (see its doc
 * header), while the driver gets a precise error::Code the moment it steps out of line.
 *
 * Typically one does not construct this directly but lets Pickle_session::run() make one per pass.
 *
 * ### State ###
 * An explicit stack of frames (rather than the call stack alone), so that each violation is a pure state-transition
 * check independent of any I/O.  There are three kinds of frame:
 *   - *entry*: pushed by begin_entry(), popped by end_entry().  It carries a resolution state:
 *     Entry_state::S_IN_ENTRY (nothing written yet), then one of Entry_state::S_IN_STRUCTURE (1+ fields, or put_structure()),
 *     Entry_state::S_PRIMITIVE_WRITTEN, or Entry_state::S_IN_COLLECTION followed by
 *     Entry_state::S_COLLECTION_WRITTEN.  Transitions out of S_IN_ENTRY are one-way.
 *   - *collection*: pushed by begin_collection(), popped by end_collection(); counts elements against the declared
 *     length.
 *   - *value slot*: pushed by put_field() and put_element() for the duration of their callback; the callback's
 *     begin_entry() fills it.  A slot accepts exactly one entry.
 *
 * An empty stack is the idle (top-level) state: begin_entry() and flush() are legal there, and nothing else.
 *
 * ### Failure ###
 * The first violation breaks `*this`: it is logged (WARNING), reported, and remembered; every later call reports
 * the same code without touching the Emitter.  If a callback (or `work` function) exits via exception, `*this` is
 * likewise broken (error::Code::S_WRITER_ABANDONED) and the exception continues on its way.  Exceptions thrown by
 * the Emitter propagate unchanged, too; after one, `*this` should be considered unusable.
 *
 * ### Re-entrancy ###
 * A callback may be invoked more than once for the same logical value, namely once per pass when a session
 * does a dry run before committing.  Each pass uses its own Protocol_writer, so no frame state leaks between passes;
 * and nothing is memoized across top-level entries.
 *
 * ### Thread safety ###
 * None; one producer at a time.
 */
class Protocol_writer :
  public flow::log::Log_context,
  public Pickle_writer,
  public Pickle_structure_writer,
  public Pickle_collection_writer
{
public:
  // Types.

  /// Knobs controlling Protocol_writer behavior.  Cheaply copyable; aggregate-initializable.
  struct Config
  {
    // Data.

    /// Logger to use for logging subsequently.
    flow::log::Logger* m_logger_ptr;
    /// Dry run or commit.  In Mode::S_DRY_RUN flush() validates but is not forwarded to the Emitter.
    Mode m_mode;
    /// Maximum entry nesting depth (top-level entry = 1); 0 means unlimited.
    size_t m_max_depth;
  }; // struct Config

  /// Resolution state of an entry frame.  See class doc header.
  enum class Entry_state
  {
    /// Nothing written yet: it may yet become a structure, a primitive, or a collection.
    S_IN_ENTRY,
    /// Resolved as a structure: 1+ fields written, or begun by put_structure().
    S_IN_STRUCTURE,
    /// A primitive written.
    S_PRIMITIVE_WRITTEN,
    /// A collection is open in it.
    S_IN_COLLECTION,
    /// A collection was written into it.
    S_COLLECTION_WRITTEN
  }; // enum class Entry_state

  // Constructors/destructor.

  /**
   * Constructs the writer in idle state.
   *
   * @param config
   *        See Config.
   * @param registry
   *        The tag universe.  Must outlive `*this`.
   * @param emitter
   *        The backend to drive.  Must outlive `*this`.
   * @param tracker
   *        The session's reference tracker, used by put_structure(); or null to not track (every structure written
   *        in full, which will not terminate for cyclic graphs).  Must outlive `*this`.
   */
  explicit Protocol_writer(const Config& config, const Tag_registry& registry, Emitter* emitter,
                           Reference_tracker* tracker);

  /// Disallow copy construction.
  Protocol_writer(const Protocol_writer&) = delete;

  /// Disallow copy assignment.
  Protocol_writer& operator=(const Protocol_writer&) = delete;

  /// Logs and destroys.  Open frames at this point are not reported as an error; see Pickle_session::run().
  ~Protocol_writer() override;

  // Methods.

  /**
   * Implements Pickle_writer API.
   * @see Pickle_writer::begin_entry().
   *
   * @param picklee
   *        See above.
   * @param tag
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  Entry_token begin_entry(Object_identity picklee, const Type_tag& tag, Error_code* err_code = 0) override;

  /**
   * Implements Pickle_writer API.
   * @see Pickle_writer::end_entry().
   *
   * @param token
   *        See above.
   * @param err_code
   *        See above.
   */
  void end_entry(const Entry_token& token, Error_code* err_code = 0) override;

  /**
   * Implements Pickle_writer API.
   * @see Pickle_writer::put_structure().
   *
   * @param picklee
   *        See above.
   * @param tag
   *        See above.
   * @param work
   *        See above.
   * @param err_code
   *        See above.
   */
  void put_structure(Object_identity picklee, const Type_tag& tag, const Structure_func& work,
                     Error_code* err_code = 0) override;

  /**
   * Implements Pickle_writer API.
   * @see Pickle_writer::put_primitive().
   *
   * @param val
   *        See above.
   * @param tag
   *        See above.
   * @param err_code
   *        See above.
   */
  void put_primitive(const Primitive& val, Primitive_tag tag, Error_code* err_code = 0) override;

  /**
   * Implements Pickle_writer API.
   * @see Pickle_writer::begin_collection().
   *
   * @param length
   *        See above.
   * @param element_tag
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  Collection_token begin_collection(size_t length, const Type_tag* element_tag = 0,
                                    Error_code* err_code = 0) override;

  /**
   * Implements Pickle_writer API.
   * @see Pickle_writer::put_collection().
   *
   * @param length
   *        See above.
   * @param element_tag
   *        See above.
   * @param work
   *        See above.
   * @param err_code
   *        See above.
   */
  void put_collection(size_t length, const Type_tag* element_tag, const Collection_func& work,
                      Error_code* err_code = 0) override;

  /**
   * Implements Pickle_writer API.
   * @return `*this`.
   */
  Pickle_structure_writer& structure_writer() override;

  /**
   * Implements Pickle_writer API.
   * @return `*this`.
   */
  Pickle_collection_writer& collection_writer() override;

  /**
   * Implements Pickle_writer API.
   * @see Pickle_writer::flush().
   *
   * @param err_code
   *        See above.
   */
  void flush(Error_code* err_code = 0) override;

  /**
   * Implements Pickle_structure_writer API.
   * @see Pickle_structure_writer::put_field().
   *
   * @param name
   *        See above.
   * @param pickler
   *        See above.
   * @param static_tag
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  Pickle_structure_writer& put_field(util::String_view name, const Writer_func& pickler,
                                     const Type_tag* static_tag = 0, Error_code* err_code = 0) override;

  /**
   * Implements Pickle_collection_writer API.
   * @see Pickle_collection_writer::put_element().
   *
   * @param pickler
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  Pickle_collection_writer& put_element(const Writer_func& pickler, Error_code* err_code = 0) override;

  /**
   * Implements Pickle_collection_writer API.
   * @see Pickle_collection_writer::end_collection().
   *
   * @param token
   *        See above.
   * @param err_code
   *        See above.
   */
  void end_collection(const Collection_token& token, Error_code* err_code = 0) override;

  /**
   * Returns `true` if and only if no frame is open: the top-level state.
   *
   * @return See above.
   */
  bool idle() const;

  /**
   * Number of open frames (entries, collections, and value slots).
   *
   * @return See above.
   */
  size_t n_open_frames() const;

  /**
   * Number of top-level entries completed so far.
   *
   * @return See above.
   */
  size_t n_top_level_entries() const;

  /**
   * The code that broke `*this`, or success if it is not broken.
   *
   * @return See above.
   */
  const Error_code& broken_err_code() const;

  /**
   * The mode from Config.
   *
   * @return See above.
   */
  Mode mode() const;

private:
  // Types.

  /// Kind of a frame on #m_frames.  See class doc header.
  enum class Frame_kind
  {
    /// An entry.
    S_ENTRY,
    /// A collection, in an entry.
    S_COLLECTION,
    /// A field's or element's value slot, awaiting or holding one entry.
    S_VALUE_SLOT
  };

  /// One open frame.  Which members are meaningful depends on #m_kind.
  struct Frame
  {
    // Data.

    /// Kind.
    Frame_kind m_kind;
    /// Unique (within `*this`) serial number; matches the token given out, if any.
    uint64_t m_serial;

    /// Entry: resolution state.
    Entry_state m_entry_state;
    /// Entry: canonical tag.
    Type_tag m_tag;
    /// Entry: primitive kind of #m_tag, if it is a primitive tag.
    std::optional<Primitive_tag> m_primitive_kind;

    /// Collection: declared length.
    size_t m_length;
    /// Collection: elements put so far (including one in progress).
    size_t m_n_elements;

    /// Collection: element type hint.  Value slot: value type hint.
    std::optional<Type_tag> m_static_tag;
    /// Value slot: whether its entry has begun.
    bool m_filled;
  }; // struct Frame

  // Methods.

  /**
   * Reports the code that broke `*this`, if it is broken.
   *
   * @param err_code
   *        Not null.  Set iff `*this` is broken.
   * @return `true` if not broken.
   */
  bool check_usable(Error_code* err_code) const;

  /**
   * Breaks `*this` with the given code; logs; reports.
   *
   * @param code
   *        The violation.
   * @param op
   *        Name of the method in which it was detected.
   * @param err_code
   *        Not null.  Set to `code`.
   */
  void fail(error::Code code, util::String_view op, Error_code* err_code);

  /**
   * Breaks `*this` on account of an exception leaving a user callback, unless it is already broken.
   *
   * @param op
   *        Name of the method that invoked the callback.
   */
  void abandon(util::String_view op);

  /**
   * Returns the code of the violation that would occur if an entry frame in the given state were resolved again;
   * `S_END_SENTINEL` if it's still unresolved.
   *
   * @param state
   *        State.
   * @return See above.
   */
  static error::Code resolution_conflict(Entry_state state);

  /**
   * Returns `true` if and only if an entry may begin now: idle, or the top frame is an unfilled value slot.
   *
   * @return See above.
   */
  bool entry_may_begin() const;

  /**
   * The body of begin_entry(), with the additional knob that says whether the tag may be outside the known universe.
   *
   * @param picklee
   *        See begin_entry().
   * @param tag
   *        See begin_entry().
   * @param structural_path_supplied
   *        If `true` an unknown `tag` is fine.
   * @param err_code
   *        Not null.
   * @return See begin_entry().
   */
  Entry_token begin_entry_impl(Object_identity picklee, const Type_tag& tag, bool structural_path_supplied,
                               Error_code* err_code);

  /**
   * Pushes a value slot, runs `pickler` to fill it, checks it was filled with exactly one complete entry,
   * and pops it.
   *
   * @param pickler
   *        The callback.
   * @param static_tag
   *        Slot's static type hint, already canonicalized; or nothing.
   * @param op
   *        Name of the calling method, for logging.
   * @param err_code
   *        Not null.
   * @return `true` on success.
   */
  bool run_value_slot(const Writer_func& pickler, std::optional<Type_tag>&& static_tag, util::String_view op,
                      Error_code* err_code);

  // Data.

  /// See Config.
  const Mode m_mode;

  /// See Config.
  const size_t m_max_depth;

  /// See ctor.
  const Tag_registry& m_registry;

  /// See ctor.
  Emitter* const m_emitter;

  /// See ctor.  May be null.
  Reference_tracker* const m_tracker;

  /// The frame stack.  Empty <=> idle.
  std::vector<Frame> m_frames;

  /// Number of entry frames in #m_frames.
  size_t m_entry_depth;

  /// Last serial number issued; 0 before any.
  uint64_t m_last_serial;

  /// See n_top_level_entries().
  size_t m_n_top_level_entries;

  /// See broken_err_code().
  Error_code m_broken_err_code;
}; // class Protocol_writer

} // namespace pickle::format
