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
#include <gtest/gtest.h>

namespace pickle::format::test
{

TEST(Tag_registry_test, Primitives)
{
  const Tag_registry registry;

  EXPECT_EQ(Type_tag::of(Primitive_tag::S_INT).key(), "pickle.Int");
  EXPECT_EQ(Type_tag::of(Primitive_tag::S_ARRAY_DOUBLE).key(), "pickle.Array[Double]");

  for (size_t idx = 0; idx != size_t(Primitive_tag::S_END_SENTINEL); ++idx)
  {
    const auto kind = Primitive_tag(idx);
    EXPECT_TRUE(registry.is_known(Type_tag::of(kind)));
    EXPECT_EQ(registry.primitive_kind(Type_tag::of(kind)), kind);
  }

  EXPECT_FALSE(registry.primitive_kind(Type_tag("test.Point")));
}

TEST(Tag_registry_test, Canonicalization)
{
  Tag_registry registry;

  // Equivalent spellings, notably of the primitive arrays, map to one canonical tag.
  EXPECT_EQ(registry.canonicalize(Type_tag("int32_t")), Type_tag::of(Primitive_tag::S_INT));
  EXPECT_EQ(registry.canonicalize(Type_tag("Int")), Type_tag::of(Primitive_tag::S_INT));
  EXPECT_EQ(registry.canonicalize(Type_tag("std::vector<double>")), Type_tag::of(Primitive_tag::S_ARRAY_DOUBLE));
  EXPECT_EQ(registry.canonicalize(Type_tag("double[]")), Type_tag::of(Primitive_tag::S_ARRAY_DOUBLE));
  EXPECT_EQ(registry.canonicalize(Type_tag("Array[Double]")), Type_tag::of(Primitive_tag::S_ARRAY_DOUBLE));

  // Unknown tags are their own canonical form.
  EXPECT_EQ(registry.canonicalize(Type_tag("test.Point")), Type_tag("test.Point"));
  EXPECT_FALSE(registry.is_known(Type_tag("test.Point")));

  registry.register_structure(Type_tag("test.Point"));
  registry.register_alias(Type_tag("Point"), Type_tag("test.Point"));
  EXPECT_TRUE(registry.is_known(Type_tag("test.Point")));
  EXPECT_TRUE(registry.is_known(Type_tag("Point")));
  EXPECT_EQ(registry.canonicalize(Type_tag("Point")), Type_tag("test.Point"));
}

TEST(Tag_registry_test, Elision)
{
  Tag_registry registry;
  registry.register_structure(Type_tag("test.Point"));

  const auto int_tag = Type_tag::of(Primitive_tag::S_INT);
  const Type_tag int_alias("int32_t");
  const auto long_tag = Type_tag::of(Primitive_tag::S_LONG);
  const auto ref_tag = Type_tag::of(Primitive_tag::S_REF);
  const auto null_tag = Type_tag::of(Primitive_tag::S_NULL);
  const Type_tag point_tag("test.Point");

  // No static context: never.
  EXPECT_FALSE(registry.can_elide(int_tag, Elision_context{ nullptr }));

  // Static type equal, up to canonicalization: yes.
  EXPECT_TRUE(registry.can_elide(int_tag, Elision_context{ &int_tag }));
  EXPECT_TRUE(registry.can_elide(int_tag, Elision_context{ &int_alias }));
  EXPECT_TRUE(registry.can_elide(point_tag, Elision_context{ &point_tag }));

  // Static type differs: no.
  EXPECT_FALSE(registry.can_elide(int_tag, Elision_context{ &long_tag }));
  EXPECT_FALSE(registry.can_elide(point_tag, Elision_context{ &int_tag }));

  // A reader can never infer a back-reference or a null from the static type.
  EXPECT_FALSE(registry.can_elide(ref_tag, Elision_context{ &ref_tag }));
  EXPECT_FALSE(registry.can_elide(null_tag, Elision_context{ &null_tag }));
}

} // namespace pickle::format::test
