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
#include "pickle/test/recording_emitter.hpp"
#include "pickle/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace pickle::format::test
{

namespace
{

using pickle::test::Recording_emitter;

const Type_tag S_NODE_TAG("test.Node");
const Type_tag S_NODES_TAG("test.Nodes");
const Type_tag S_NODE_LIST_TAG("test.NodeList");
const Type_tag S_STRING_TAG = Type_tag::of(Primitive_tag::S_STRING);

/// A graph vertex: a name and an optional edge to another vertex (possibly itself).
struct Node
{
  std::string m_name;
  const Node* m_next;
};

/**
 * The per-type writer a derivation layer would generate for Node.
 *
 * @param writer
 *        Writer.
 * @param node
 *        Node.
 */
void pickle_node(Pickle_writer& writer, const Node& node)
{
  writer.put_structure(&node, S_NODE_TAG, [&](Pickle_structure_writer& fields)
  {
    fields.put_field("name", [&](Pickle_writer& field) { write_primitive(field, node.m_name); }, &S_STRING_TAG)
          .put_field("next", [&](Pickle_writer& field)
    {
      if (node.m_next)
      {
        pickle_node(field, *node.m_next);
      }
      else
      {
        write_primitive(field, Null());
      }
    }, &S_NODE_TAG);
  });
}

/**
 * Writer for a list of nodes: a structure (so the list itself is tracked) with one field `items`, a collection.
 *
 * @param writer
 *        Writer.
 * @param nodes
 *        Nodes.
 */
void pickle_nodes(Pickle_writer& writer, const std::vector<const Node*>& nodes)
{
  writer.put_structure(&nodes, S_NODES_TAG, [&](Pickle_structure_writer& fields)
  {
    fields.put_field("items", [&](Pickle_writer& field)
    {
      const auto token = field.begin_entry(nullptr, S_NODE_LIST_TAG);
      field.put_collection(nodes.size(), &S_NODE_TAG, [&](Pickle_collection_writer& elements)
      {
        for (const auto node : nodes)
        {
          elements.put_element([&](Pickle_writer& element) { pickle_node(element, *node); });
        }
      });
      field.end_entry(token);
    });
  });
}

class Pickle_session_test :
  public ::testing::Test
{
protected:
  Pickle_session_test()
  {
    m_registry.register_structure(S_NODE_TAG);
    m_registry.register_structure(S_NODES_TAG);
    m_registry.register_structure(S_NODE_LIST_TAG);
  }

  Pickle_session::Config config() const
  {
    return Pickle_session::Config{ pickle::test::test_logger(), 0 };
  }

  Tag_registry m_registry;
};

} // namespace (anon)

TEST_F(Pickle_session_test, Self_cycle)
{
  Node a{ "a", nullptr };
  a.m_next = &a;

  Pickle_session session(config(), m_registry);
  Recording_emitter emitter;
  session.run(Mode::S_COMMIT, &emitter, [&](Pickle_writer& writer) { pickle_node(writer, a); });

  EXPECT_EQ(emitter.events(), (Recording_emitter::Events{
                                 "entry:test.Node", "struct",
                                 "field:name", "entry:pickle.String:elided", "prim:String(sz=1)", "/entry", "/field",
                                 "field:next", "entry:pickle.Ref", "prim:Ref(#0)", "/entry", "/field",
                                 "/struct", "/entry" }));
  EXPECT_EQ(session.tracker().size(), 1u);
  EXPECT_EQ(session.tracker().identity_of(0), &a);
}

TEST_F(Pickle_session_test, Longer_cycle)
{
  Node a{ "a", nullptr };
  Node b{ "b", &a };
  Node c{ "c", &b };
  a.m_next = &c;

  Pickle_session session(config(), m_registry);
  Recording_emitter emitter;
  session.run(Mode::S_COMMIT, &emitter, [&](Pickle_writer& writer) { pickle_node(writer, a); });

  // Each node exactly once in full; the back-edge c->a is a reference to a's id.
  EXPECT_EQ(emitter.count("entry:test.Node"), 1u); // a, at the top level: not elided.
  EXPECT_EQ(emitter.count("entry:test.Node:elided"), 2u); // c and b, in `next` fields typed Node.
  EXPECT_EQ(emitter.count("entry:pickle.Ref"), 1u);
  EXPECT_EQ(emitter.count("prim:Ref(#0)"), 1u);
  EXPECT_EQ(session.tracker().size(), 3u);
  EXPECT_EQ(session.tracker().lookup(&b), 2u);
}

TEST_F(Pickle_session_test, Identity_not_equality)
{
  const Node x{ "twin", nullptr };
  const Node y{ "twin", nullptr }; // Value-equal to x.

  Pickle_session session(config(), m_registry);
  Recording_emitter emitter;
  session.run(Mode::S_COMMIT, &emitter, [&](Pickle_writer& writer) { pickle_nodes(writer, { &x, &y }); });

  EXPECT_EQ(emitter.count("entry:test.Node:elided"), 2u);
  EXPECT_EQ(emitter.count("entry:pickle.Ref"), 0u);
  EXPECT_EQ(emitter.count("prim:Null"), 2u);

  // Whereas the same object twice is shared.
  Pickle_session session2(config(), m_registry);
  Recording_emitter emitter2;
  session2.run(Mode::S_COMMIT, &emitter2, [&](Pickle_writer& writer) { pickle_nodes(writer, { &x, &x }); });

  EXPECT_EQ(emitter2.count("entry:test.Node:elided"), 1u);
  EXPECT_EQ(emitter2.count("prim:Ref(#1)"), 1u); // #0 is the list itself.
}

TEST_F(Pickle_session_test, Dry_run_then_commit)
{
  Node a{ "a", nullptr };
  Node b{ "b", &a };
  a.m_next = &b;

  Pickle_session session(config(), m_registry);
  const auto producer = [&](Pickle_writer& writer)
  {
    pickle_node(writer, a);
    writer.flush();
  };

  Recording_emitter dry_emitter;
  session.run(Mode::S_DRY_RUN, &dry_emitter, producer);
  EXPECT_EQ(session.tracker().size(), 0u) << "A dry run must not touch the session tracker.";
  EXPECT_FALSE(session.committed());
  EXPECT_EQ(dry_emitter.count("flush"), 0u);

  // Again: identical, since each pass starts from a fresh stack and the same (empty) tracker state.
  Recording_emitter dry_emitter2;
  session.run(Mode::S_DRY_RUN, &dry_emitter2, producer);
  EXPECT_EQ(dry_emitter2.events(), dry_emitter.events());

  Recording_emitter commit_emitter;
  session.run(Mode::S_COMMIT, &commit_emitter, producer);
  EXPECT_TRUE(session.committed());
  EXPECT_EQ(commit_emitter.events_sans_flushes(), dry_emitter.events());
  EXPECT_EQ(commit_emitter.count("flush"), 1u);
  EXPECT_EQ(session.tracker().size(), 2u) << "Tracker entries must not be duplicated by the earlier passes.";
  EXPECT_EQ(session.tracker().lookup(&a), 0u);
  EXPECT_EQ(session.tracker().lookup(&b), 1u);
}

TEST_F(Pickle_session_test, One_commit_per_session)
{
  const Node a{ "a", nullptr };
  Pickle_session session(config(), m_registry);
  Recording_emitter emitter;
  const auto producer = [&](Pickle_writer& writer) { pickle_node(writer, a); };

  session.run(Mode::S_COMMIT, &emitter, producer);

  Error_code err_code;
  session.run(Mode::S_COMMIT, &emitter, producer, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SESSION_ALREADY_COMMITTED);
  EXPECT_EQ(emitter.count("entry:test.Node"), 1u);

  // Dry runs are still fine; and they see the committed tracker state (a copy of it).
  Recording_emitter dry_emitter;
  session.run(Mode::S_DRY_RUN, &dry_emitter, producer, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(dry_emitter.count("entry:pickle.Ref"), 1u);
  EXPECT_EQ(session.tracker().size(), 1u);
}

TEST_F(Pickle_session_test, Producer_errors)
{
  {
    Pickle_session session(config(), m_registry);
    Recording_emitter emitter;
    Error_code err_code;

    session.run(Mode::S_DRY_RUN, &emitter, [](Pickle_writer& writer)
    {
      writer.begin_entry(nullptr, S_NODE_TAG);
    }, &err_code);
    EXPECT_EQ(err_code, error::Code::S_SESSION_LEFT_FRAMES_OPEN);
    EXPECT_TRUE(error::is_protocol_violation(err_code));
  }
  {
    Pickle_session session(config(), m_registry);
    Recording_emitter emitter;
    Error_code err_code;
    Error_code producer_err_code;

    session.run(Mode::S_COMMIT, &emitter, [&](Pickle_writer& writer)
    {
      writer.collection_writer().put_element([](Pickle_writer&) {}, &producer_err_code);
    }, &err_code);
    EXPECT_EQ(producer_err_code, error::Code::S_ELEMENT_OUTSIDE_COLLECTION);
    EXPECT_EQ(err_code, error::Code::S_ELEMENT_OUTSIDE_COLLECTION);
  }
  {
    Pickle_session session(config(), m_registry);
    Recording_emitter emitter;

    EXPECT_THROW(session.run(Mode::S_COMMIT, &emitter, [](Pickle_writer& writer)
    {
      writer.begin_entry(nullptr, Type_tag("test.Unregistered"));
    }), flow::error::Runtime_error);
    EXPECT_TRUE(session.committed());
  }
}

TEST_F(Pickle_session_test, Estimate_size)
{
  Node a{ "a", nullptr };
  a.m_next = &a;
  const auto producer = [&](Pickle_writer& writer) { pickle_node(writer, a); };

  Pickle_session session(config(), m_registry);
  const auto estimate = session.estimate_size(producer);

  // Compare against a direct dry run with another estimator.
  Size_estimator estimator;
  Pickle_session other_session(config(), m_registry);
  other_session.run(Mode::S_DRY_RUN, &estimator, producer);

  EXPECT_GT(estimate, 0u);
  EXPECT_EQ(estimate, estimator.size_estimate());
  EXPECT_EQ(session.tracker().size(), 0u);
  EXPECT_FALSE(session.committed());
}

} // namespace pickle::format::test
