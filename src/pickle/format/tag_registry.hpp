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

#include "pickle/format/primitive.hpp"
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>
#include <optional>
#include <string>

namespace pickle::format
{

// Types.

/**
 * Symbolic identity of the runtime type of a value being pickled: the tag stored alongside (or, if elided,
 * implied by the context of) each entry.  It is a thin value wrapper around a key string, such as
 * `"pickle.Int"` or `"example.Person"`.
 *
 * Two spellings can denote the same type (`"int32_t"` versus `"pickle.Int"`); Tag_registry::canonicalize()
 * maps any known spelling to the one canonical key.  Type_tag itself compares keys literally.
 */
class Type_tag
{
public:
  // Constructors/destructor.

  /// Constructs a tag with an empty key, which is never known to any Tag_registry.
  Type_tag();

  /**
   * Constructs a tag with the given key.
   *
   * @param key
   *        Type name.
   */
  explicit Type_tag(std::string key);

  // Methods.

  /**
   * Returns the canonical tag of the given primitive kind: key `"pickle."` + primitive_tag_name().
   *
   * @param kind
   *        Kind.
   * @return See above.
   */
  static Type_tag of(Primitive_tag kind);

  /**
   * The key.
   *
   * @return See above.
   */
  const std::string& key() const;

  /**
   * Returns `true` if and only if the keys are equal.
   *
   * @param other
   *        Other tag.
   * @return See above.
   */
  bool operator==(const Type_tag& other) const;

  /**
   * Negation of `operator==()`.
   *
   * @param other
   *        Other tag.
   * @return See above.
   */
  bool operator!=(const Type_tag& other) const;

private:
  // Data.

  /// See key().
  std::string m_key;
}; // class Type_tag

/**
 * What the surrounding structure statically knows about the type of the value in a given slot (field or collection
 * element), as consulted by Tag_registry::can_elide().  Supplied by the driver: a per-field hint via
 * Pickle_structure_writer::put_field(); a per-collection element hint via Pickle_writer::begin_collection().
 */
struct Elision_context
{
  // Data.

  /// The statically-known type of the slot; null if the slot's type is not statically fixed.
  const Type_tag* m_static_tag;
};

/**
 * Knows the universe of tags: the fixed primitive ones (always) and the structural ones registered by the user;
 * as well as alternative spellings (aliases) of either.  Answers two questions purely (with no side effects):
 * "what is the canonical form of this tag?" and "may this tag be omitted from the output in this context?".
 *
 * ### Thread safety ###
 * Set it up (register_structure(), register_alias()) first; then it may be shared, by `const` reference,
 * among any number of concurrent sessions.  Mutation concurrent with anything else is not safe.
 *
 * ### Preloaded aliases ###
 * For each primitive kind the canonical key (e.g., `"pickle.Array[Int]"`) and its short name (`"Array[Int]"`)
 * are known; plus the obvious C++ spellings: `"int32_t"`, `"std::string"`, `"int32_t[]"`,
 * `"std::vector<int32_t>"`, and the like.  Hence the many spellings of primitive-array tags all canonicalize
 * to one key, which is what an Emitter dispatches on.
 */
class Tag_registry
{
public:
  // Constructors/destructor.

  /// Constructs a registry that knows the primitive tags and their preloaded aliases; and no structures.
  Tag_registry();

  // Methods.

  /**
   * Makes the given tag (as canonicalized) known as a structural type.  Idempotent.
   *
   * @param tag
   *        Tag.  If it is an alias of a primitive tag this is a no-op, as it is already known.
   */
  void register_structure(const Type_tag& tag);

  /**
   * Makes `alias` another spelling of `canonical`, which should be either a primitive tag or a registered structure
   * (otherwise the alias will canonicalize fine but remain unknown until `canonical` is registered).
   * A later call with the same alias replaces the mapping.
   *
   * @param alias
   *        Alternative spelling.
   * @param canonical
   *        What it means.  It is itself canonicalized first.
   */
  void register_alias(const Type_tag& alias, const Type_tag& canonical);

  /**
   * Returns the canonical form of the given tag: the tag it aliases, if it is an alias; else itself.
   *
   * @param tag
   *        Tag.
   * @return See above.
   */
  Type_tag canonicalize(const Type_tag& tag) const;

  /**
   * Returns `true` if and only if the given tag (as canonicalized) is a primitive tag or a registered structure.
   *
   * @param tag
   *        Tag.
   * @return See above.
   */
  bool is_known(const Type_tag& tag) const;

  /**
   * If the given tag (as canonicalized) is a primitive tag, returns its kind; else returns nothing.
   *
   * @param tag
   *        Tag.
   * @return See above.
   */
  std::optional<Primitive_tag> primitive_kind(const Type_tag& tag) const;

  /**
   * Returns `true` if and only if the given tag, for a value in a slot with the given context, is redundant
   * and may hence be omitted from the serialized form.  That is the case if and only if:
   *   - the context carries a static tag; and
   *   - it and `tag` canonicalize to the same tag; and
   *   - `tag` is not `Ref` or `Null`: a field statically typed `Person` may still hold a back-reference or a null,
   *     so those must always be distinguishable from the statically-implied type.
   *
   * @param tag
   *        Tag of the value.
   * @param context
   *        What is statically known about the slot.
   * @return See above.
   */
  bool can_elide(const Type_tag& tag, const Elision_context& context) const;

private:
  // Data.

  /// Alias key => canonical key.  Canonical keys never appear as keys here.
  boost::unordered_map<std::string, std::string> m_canonical_by_alias;

  /// Canonical key => primitive kind, for the primitive tags.  Fixed after construction.
  boost::unordered_map<std::string, Primitive_tag> m_primitive_by_key;

  /// Canonical keys of registered structures.
  boost::unordered_set<std::string> m_structure_keys;
}; // class Tag_registry

} // namespace pickle::format
