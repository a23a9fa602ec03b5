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
#include "pickle/format/error.hpp"
#include <flow/util/util.hpp>
#include <cassert>

namespace pickle::format::error
{

// Types.

/**
 * The boost.system category for errors returned by the pickle::format module.  Conceptually it is a singleton:
 * `Category::S_CATEGORY` is the only instance.  Converting a Code to `Error_code` (implicitly or via
 * make_error_code()) associates the resulting `Error_code` with it; `.message()` on that code then forwards to
 * Category::message().
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string naming this category.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns a string describing the given error code value of this category.
   *
   * @param val
   *        Error code value, namely a `Code` cast to `int`.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns the symbolic name of the given code, as printed by `ostream<<` (and parsed by `istream>>`).
   *
   * @param code
   *        The code.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for pickle::format::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

bool is_protocol_violation(const Error_code& err_code)
{
  if ((!err_code) || (err_code.category() != Category::S_CATEGORY))
  {
    return false;
  }
  // else

  const auto val = err_code.value();
  return (val >= static_cast<int>(Code::S_ENTRY_OUTSIDE_VALUE_SLOT))
         && (val <= static_cast<int>(Code::S_SESSION_ALREADY_COMMITTED));
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "pickle/format";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_ENTRY_OUTSIDE_VALUE_SLOT:
    return "Protocol violation: an entry was begun where no value is expected: not at the top level, and not as the "
           "one value of the current field or element (e.g., the previous entry at the same depth was never closed, "
           "or a field/element callback began a second entry).";
  case Code::S_END_ENTRY_MISMATCH:
    return "Protocol violation: end-entry token does not match the innermost open entry "
           "(unbalanced or out-of-order close).";
  case Code::S_COLLECTION_OUTSIDE_ENTRY:
    return "Protocol violation: collection begun outside an open, not-yet-resolved entry.";
  case Code::S_ENTRY_ALREADY_PRIMITIVE:
    return "Protocol violation: field, primitive, or collection issued on an entry already resolved as a primitive.";
  case Code::S_ENTRY_ALREADY_STRUCTURE:
    return "Protocol violation: primitive or collection issued on an entry already resolved as a structure.";
  case Code::S_ENTRY_ALREADY_COLLECTION:
    return "Protocol violation: field, primitive, or a second collection issued on an entry already resolved as a "
           "collection.";
  case Code::S_ELEMENT_OUTSIDE_COLLECTION:
    return "Protocol violation: element put while no collection is open in the innermost frame.";
  case Code::S_FIELD_OUTSIDE_ENTRY:
    return "Protocol violation: field put while no entry is open in the innermost frame.";
  case Code::S_PRIMITIVE_OUTSIDE_ENTRY:
    return "Protocol violation: primitive put while no entry is open in the innermost frame.";
  case Code::S_END_COLLECTION_MISMATCH:
    return "Protocol violation: end-collection token does not match the innermost open collection.";
  case Code::S_COLLECTION_LENGTH_EXCEEDED:
    return "Protocol violation: more elements put than the length declared when the collection was begun.";
  case Code::S_COLLECTION_LENGTH_MISMATCH:
    return "Protocol violation: collection ended with fewer elements put than the length declared when it was "
           "begun.";
  case Code::S_CALLBACK_WROTE_NO_ENTRY:
    return "Protocol violation: a field/element callback returned without writing its one entry.";
  case Code::S_CALLBACK_LEFT_FRAMES_OPEN:
    return "Protocol violation: a field/element callback returned leaving entries or collections it had begun "
           "still open.";
  case Code::S_PRIMITIVE_TAG_MISMATCH:
    return "Protocol violation: primitive's tag differs from its value's actual kind, or from the primitive tag with "
           "which its entry was begun.";
  case Code::S_FLUSH_WITH_OPEN_FRAMES:
    return "Protocol violation: flush requested while entries or collections are open.";
  case Code::S_MAX_DEPTH_EXCEEDED:
    return "Protocol violation: nesting of entries exceeded the configured maximum depth.";
  case Code::S_SESSION_LEFT_FRAMES_OPEN:
    return "Protocol violation: the producer of a session pass returned leaving entries or collections open.";
  case Code::S_SESSION_ALREADY_COMMITTED:
    return "Protocol violation: a session (one root object graph) may be committed only once.";
  case Code::S_UNKNOWN_TAG:
    return "Entry's tag is not a known primitive or registered structure, and no structural write path was "
           "supplied.";
  case Code::S_WRITER_ABANDONED:
    return "Writer abandoned: a producer callback exited via exception; the writer is no longer usable.";
  case Code::S_EMITTER_SINK_WRITE_FAILED:
    return "Emitter: the configured output stream reported failure while writing the serialization.";
  case Code::S_EMITTER_SEGMENT_TOO_BIG:
    return "Emitter: a leaf datum (e.g., a string or array) is so large as to require a segment exceeding the "
           "configured segment size.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_ENTRY_OUTSIDE_VALUE_SLOT:
    return "ENTRY_OUTSIDE_VALUE_SLOT";
  case Code::S_END_ENTRY_MISMATCH:
    return "END_ENTRY_MISMATCH";
  case Code::S_COLLECTION_OUTSIDE_ENTRY:
    return "COLLECTION_OUTSIDE_ENTRY";
  case Code::S_ENTRY_ALREADY_PRIMITIVE:
    return "ENTRY_ALREADY_PRIMITIVE";
  case Code::S_ENTRY_ALREADY_STRUCTURE:
    return "ENTRY_ALREADY_STRUCTURE";
  case Code::S_ENTRY_ALREADY_COLLECTION:
    return "ENTRY_ALREADY_COLLECTION";
  case Code::S_ELEMENT_OUTSIDE_COLLECTION:
    return "ELEMENT_OUTSIDE_COLLECTION";
  case Code::S_FIELD_OUTSIDE_ENTRY:
    return "FIELD_OUTSIDE_ENTRY";
  case Code::S_PRIMITIVE_OUTSIDE_ENTRY:
    return "PRIMITIVE_OUTSIDE_ENTRY";
  case Code::S_END_COLLECTION_MISMATCH:
    return "END_COLLECTION_MISMATCH";
  case Code::S_COLLECTION_LENGTH_EXCEEDED:
    return "COLLECTION_LENGTH_EXCEEDED";
  case Code::S_COLLECTION_LENGTH_MISMATCH:
    return "COLLECTION_LENGTH_MISMATCH";
  case Code::S_CALLBACK_WROTE_NO_ENTRY:
    return "CALLBACK_WROTE_NO_ENTRY";
  case Code::S_CALLBACK_LEFT_FRAMES_OPEN:
    return "CALLBACK_LEFT_FRAMES_OPEN";
  case Code::S_PRIMITIVE_TAG_MISMATCH:
    return "PRIMITIVE_TAG_MISMATCH";
  case Code::S_FLUSH_WITH_OPEN_FRAMES:
    return "FLUSH_WITH_OPEN_FRAMES";
  case Code::S_MAX_DEPTH_EXCEEDED:
    return "MAX_DEPTH_EXCEEDED";
  case Code::S_SESSION_LEFT_FRAMES_OPEN:
    return "SESSION_LEFT_FRAMES_OPEN";
  case Code::S_SESSION_ALREADY_COMMITTED:
    return "SESSION_ALREADY_COMMITTED";
  case Code::S_UNKNOWN_TAG:
    return "UNKNOWN_TAG";
  case Code::S_WRITER_ABANDONED:
    return "WRITER_ABANDONED";
  case Code::S_EMITTER_SINK_WRITE_FAILED:
    return "EMITTER_SINK_WRITE_FAILED";
  case Code::S_EMITTER_SEGMENT_TOO_BIG:
    return "EMITTER_SEGMENT_TOO_BIG";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace pickle::format::error
