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
#include "pickle/format/tag_registry.hpp"
#include <cassert>
#include <initializer_list>

namespace pickle::format
{

// Type_tag implementations.

Type_tag::Type_tag() = default;

Type_tag::Type_tag(std::string key) :
  m_key(std::move(key))
{
  // Yep.
}

Type_tag Type_tag::of(Primitive_tag kind) // Static.
{
  std::string key("pickle.");
  const auto name = primitive_tag_name(kind);
  key.append(name.data(), name.size());
  return Type_tag(std::move(key));
}

const std::string& Type_tag::key() const
{
  return m_key;
}

bool Type_tag::operator==(const Type_tag& other) const
{
  return m_key == other.m_key;
}

bool Type_tag::operator!=(const Type_tag& other) const
{
  return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Type_tag& val)
{
  return os << '[' << val.key() << ']';
}

// Tag_registry implementations.

Tag_registry::Tag_registry()
{
  using std::string;
  using Aliases = std::initializer_list<const char*>;

  const auto load = [&](Primitive_tag kind, Aliases aliases)
  {
    const auto canonical = Type_tag::of(kind).key();
    m_primitive_by_key.emplace(canonical, kind);

    const auto name = primitive_tag_name(kind);
    m_canonical_by_alias.emplace(string(name.data(), name.size()), canonical);
    for (const auto alias : aliases)
    {
      m_canonical_by_alias.emplace(alias, canonical);
    }
  };

  load(Primitive_tag::S_NOTHING, {});
  load(Primitive_tag::S_NULL, { "std::nullptr_t", "nullptr_t" });
  load(Primitive_tag::S_UNIT, { "void", "std::monostate" });
  load(Primitive_tag::S_BYTE, { "int8_t", "std::int8_t" });
  load(Primitive_tag::S_CHAR, { "char16_t" });
  load(Primitive_tag::S_STRING, { "std::string", "string" });
  load(Primitive_tag::S_SHORT, { "int16_t", "std::int16_t", "short" });
  load(Primitive_tag::S_INT, { "int32_t", "std::int32_t", "int" });
  load(Primitive_tag::S_LONG, { "int64_t", "std::int64_t" });
  load(Primitive_tag::S_FLOAT, { "float" });
  load(Primitive_tag::S_DOUBLE, { "double" });
  load(Primitive_tag::S_REF, {});
  load(Primitive_tag::S_ARRAY_BYTE, { "int8_t[]", "std::vector<int8_t>", "std::vector<std::int8_t>" });
  load(Primitive_tag::S_ARRAY_SHORT, { "int16_t[]", "std::vector<int16_t>", "std::vector<std::int16_t>" });
  load(Primitive_tag::S_ARRAY_CHAR, { "char16_t[]", "std::vector<char16_t>", "std::u16string" });
  load(Primitive_tag::S_ARRAY_INT, { "int32_t[]", "std::vector<int32_t>", "std::vector<std::int32_t>" });
  load(Primitive_tag::S_ARRAY_LONG, { "int64_t[]", "std::vector<int64_t>", "std::vector<std::int64_t>" });
  load(Primitive_tag::S_ARRAY_BOOLEAN, { "bool[]", "std::vector<bool>" });
  load(Primitive_tag::S_ARRAY_FLOAT, { "float[]", "std::vector<float>" });
  load(Primitive_tag::S_ARRAY_DOUBLE, { "double[]", "std::vector<double>" });

  assert(m_primitive_by_key.size() == size_t(Primitive_tag::S_END_SENTINEL));
} // Tag_registry::Tag_registry()

void Tag_registry::register_structure(const Type_tag& tag)
{
  const auto canonical = canonicalize(tag);
  if (m_primitive_by_key.find(canonical.key()) == m_primitive_by_key.end())
  {
    m_structure_keys.insert(canonical.key());
  }
}

void Tag_registry::register_alias(const Type_tag& alias, const Type_tag& canonical)
{
  const auto target = canonicalize(canonical);
  if (alias == target)
  {
    return; // Aliasing a thing to itself; nothing to remember (and it'd make canonical keys appear as aliases).
  }
  // else
  m_canonical_by_alias[alias.key()] = target.key();
}

Type_tag Tag_registry::canonicalize(const Type_tag& tag) const
{
  const auto it = m_canonical_by_alias.find(tag.key());
  return (it == m_canonical_by_alias.end()) ? tag : Type_tag(it->second);
}

bool Tag_registry::is_known(const Type_tag& tag) const
{
  const auto canonical = canonicalize(tag);
  return (m_primitive_by_key.find(canonical.key()) != m_primitive_by_key.end())
         || (m_structure_keys.find(canonical.key()) != m_structure_keys.end());
}

std::optional<Primitive_tag> Tag_registry::primitive_kind(const Type_tag& tag) const
{
  const auto it = m_primitive_by_key.find(canonicalize(tag).key());
  if (it == m_primitive_by_key.end())
  {
    return std::nullopt;
  }
  // else
  return it->second;
}

bool Tag_registry::can_elide(const Type_tag& tag, const Elision_context& context) const
{
  if (!context.m_static_tag)
  {
    return false;
  }
  // else

  const auto canonical = canonicalize(tag);
  if (canonical != canonicalize(*context.m_static_tag))
  {
    return false;
  }
  // else

  const auto kind = primitive_kind(canonical);
  return !(kind && ((*kind == Primitive_tag::S_REF) || (*kind == Primitive_tag::S_NULL)));
}

} // namespace pickle::format
