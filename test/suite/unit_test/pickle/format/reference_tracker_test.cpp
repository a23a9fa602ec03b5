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
#include "pickle/format/reference_tracker.hpp"
#include "pickle/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <string>

namespace pickle::format::test
{

TEST(Reference_tracker_test, Interface)
{
  using Outcome = Reference_tracker::Outcome;

  Reference_tracker tracker(pickle::test::test_logger());
  EXPECT_EQ(tracker.size(), 0u);

  const std::string a("same");
  const std::string b("same"); // Equal to `a` but a different object.

  const auto obs_a = tracker.observe(&a);
  EXPECT_EQ(obs_a.m_outcome, Outcome::S_FIRST_SEEN);
  EXPECT_EQ(obs_a.m_id, 0u);

  const auto obs_b = tracker.observe(&b);
  EXPECT_EQ(obs_b.m_outcome, Outcome::S_FIRST_SEEN);
  EXPECT_EQ(obs_b.m_id, 1u);

  const auto obs_a_again = tracker.observe(&a);
  EXPECT_EQ(obs_a_again.m_outcome, Outcome::S_ALREADY_SEEN);
  EXPECT_EQ(obs_a_again.m_id, 0u);

  EXPECT_EQ(tracker.size(), 2u);
  EXPECT_EQ(tracker.lookup(&b), 1u);
  EXPECT_FALSE(tracker.lookup(&tracker));
  EXPECT_EQ(tracker.identity_of(0), &a);
  EXPECT_EQ(tracker.identity_of(1), &b);
  EXPECT_EQ(tracker.identity_of(2), nullptr);
}

TEST(Reference_tracker_test, Copy_is_independent)
{
  const int x = 0;
  const int y = 0;

  Reference_tracker tracker(pickle::test::test_logger());
  tracker.observe(&x);

  Reference_tracker scratch(tracker);
  EXPECT_EQ(scratch.observe(&x).m_outcome, Reference_tracker::Outcome::S_ALREADY_SEEN);
  EXPECT_EQ(scratch.observe(&y).m_id, 1u);

  EXPECT_EQ(scratch.size(), 2u);
  EXPECT_EQ(tracker.size(), 1u);
  EXPECT_FALSE(tracker.lookup(&y));
}

} // namespace pickle::format::test
