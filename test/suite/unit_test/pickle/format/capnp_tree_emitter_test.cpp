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
#include "pickle/format/capnp_tree_emitter.hpp"
#include "pickle/format/pickle_session.hpp"
#include "pickle/format/util.hpp"
#include "pickle/test/test_logger.hpp"
#include <capnp/serialize.h>
#include <kj/std/iostream.h>
#include <gtest/gtest.h>
#include <sstream>

namespace pickle::format::test
{

namespace
{

const Type_tag S_POINT_TAG("test.Point");
const Type_tag S_LIST_TAG("test.List");
const Type_tag S_INT_TAG = Type_tag::of(Primitive_tag::S_INT);

class Capnp_tree_emitter_test :
  public ::testing::Test
{
protected:
  Capnp_tree_emitter_test()
  {
    m_registry.register_structure(S_POINT_TAG);
    m_registry.register_structure(S_LIST_TAG);
  }

  Capnp_tree_emitter::Config config(size_t segment_sz = 8192, std::ostream* sink = nullptr) const
  {
    return Capnp_tree_emitter::Config{ pickle::test::test_logger(), segment_sz, sink };
  }

  /// Pickles a point `{x, y, label}` (fields in that order) and a 3-element int list, sharing the point.
  void produce(Pickle_writer& writer) const
  {
    writer.put_structure(&m_point_x, S_POINT_TAG, [&](Pickle_structure_writer& fields)
    {
      fields.put_field("x", [&](Pickle_writer& field) { write_primitive(field, m_point_x); }, &S_INT_TAG)
            .put_field("y", [](Pickle_writer& field) { write_primitive(field, int64_t(-2)); })
            .put_field("label", [](Pickle_writer& field) { write_primitive(field, std::string("p")); });
    });
    const auto list_token = writer.begin_entry(nullptr, S_LIST_TAG);
    writer.put_collection(3, &S_INT_TAG, [&](Pickle_collection_writer& elements)
    {
      elements.put_element([](Pickle_writer& element) { write_primitive(element, int32_t(10)); })
              .put_element([](Pickle_writer& element) { write_primitive(element, std::vector<double>{ 0.5 }); })
              .put_element([&](Pickle_writer& element)
      {
        element.put_structure(&m_point_x, S_POINT_TAG, [](Pickle_structure_writer&) {});
      });
    });
    writer.end_entry(list_token);
    writer.flush();
  }

  Tag_registry m_registry;
  const int32_t m_point_x = 1;
};

} // namespace (anon)

TEST_F(Capnp_tree_emitter_test, Tree)
{
  Capnp_tree_emitter emitter(config());
  Pickle_session session(Pickle_session::Config{ pickle::test::test_logger(), 0 }, m_registry);
  session.run(Mode::S_COMMIT, &emitter, [&](Pickle_writer& writer) { produce(writer); });

  EXPECT_EQ(emitter.n_pending_entries(), 0u);
  const auto entries = emitter.root().getEntries();
  ASSERT_EQ(entries.size(), 2u);

  const auto point = entries[0];
  EXPECT_STREQ(point.getTag().cStr(), "test.Point");
  EXPECT_FALSE(point.getTagElided());
  ASSERT_TRUE(point.isStructure());
  const auto fields = point.getStructure();
  ASSERT_EQ(fields.size(), 3u);
  EXPECT_STREQ(fields[0].getName().cStr(), "x");
  EXPECT_STREQ(fields[1].getName().cStr(), "y");
  EXPECT_STREQ(fields[2].getName().cStr(), "label");
  EXPECT_TRUE(fields[0].getValue().getTagElided());
  EXPECT_FALSE(fields[0].getValue().hasTag());
  EXPECT_EQ(fields[0].getValue().getIntVal(), 1);
  EXPECT_STREQ(fields[1].getValue().getTag().cStr(), "pickle.Long");
  EXPECT_EQ(fields[1].getValue().getLongVal(), -2);
  EXPECT_STREQ(fields[2].getValue().getStringVal().cStr(), "p");

  const auto list = entries[1];
  ASSERT_TRUE(list.isCollection());
  const auto elements = list.getCollection();
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_TRUE(elements[0].getTagElided());
  EXPECT_EQ(elements[0].getIntVal(), 10);
  EXPECT_STREQ(elements[1].getTag().cStr(), "pickle.Array[Double]");
  ASSERT_TRUE(elements[1].isDoubleArray());
  EXPECT_EQ(elements[1].getDoubleArray()[0], 0.5);
  ASSERT_TRUE(elements[2].isRef());
  EXPECT_EQ(elements[2].getRef(), 0u);
  EXPECT_STREQ(elements[2].getTag().cStr(), "pickle.Ref");

  std::ostringstream os;
  os << ostreamable_pickle_full(emitter.root());
  EXPECT_NE(os.str().find("label"), std::string::npos);

  std::ostringstream brief_os;
  brief_os << ostreamable_pickle_brief(emitter.root());
  EXPECT_EQ(brief_os.str(),
            "pickle[2]; "
            "test.Point { x: Int(1), y: pickle.Long Long(-2), label: pickle.String String(sz=1) }; "
            "test.List [ Int(10), pickle.Array[Double] Array[Double](sz=1), pickle.Ref Ref(#0) ]");

  std::ostringstream shallow_os;
  shallow_os << ostreamable_pickle_brief(emitter.root(), 0);
  EXPECT_EQ(shallow_os.str(), "pickle[2]; test.Point {...}; test.List [...]");
}

TEST_F(Capnp_tree_emitter_test, Structures_and_text)
{
  const std::string with_nul("a\0b", 3);
  const std::string name_with_nul("n\0m", 3);

  Capnp_tree_emitter emitter(config());
  Protocol_writer writer(Protocol_writer::Config{ pickle::test::test_logger(), Mode::S_COMMIT, 0 },
                         m_registry, &emitter, nullptr);

  write_primitive(writer, with_nul);
  writer.put_structure(nullptr, S_POINT_TAG, [](Pickle_structure_writer&) {});
  const auto token = writer.begin_entry(nullptr, S_POINT_TAG); // Ended with nothing in it.
  writer.end_entry(token);
  writer.put_structure(nullptr, S_POINT_TAG, [&](Pickle_structure_writer& fields)
  {
    fields.put_field(name_with_nul, [&](Pickle_writer& field) { write_primitive(field, with_nul); });
  });
  writer.flush();

  const auto entries = emitter.root().getEntries();
  ASSERT_EQ(entries.size(), 4u);

  ASSERT_TRUE(entries[0].isStringVal());
  const auto text = entries[0].getStringVal();
  EXPECT_EQ(text.size(), 3u);
  EXPECT_EQ(std::string(text.begin(), text.size()), with_nul);

  for (size_t idx = 1; idx != 3; ++idx)
  {
    ASSERT_TRUE(entries[idx].isStructure());
    EXPECT_EQ(entries[idx].getStructure().size(), 0u);
  }

  ASSERT_TRUE(entries[3].isStructure());
  const auto field = entries[3].getStructure()[0];
  EXPECT_EQ(std::string(field.getName().begin(), field.getName().size()), name_with_nul);
  EXPECT_EQ(field.getValue().getStringVal().size(), 3u);

  std::ostringstream os;
  os << ostreamable_pickle_brief(emitter.root());
  EXPECT_EQ(os.str(),
            "pickle[4]; pickle.String String(sz=3); test.Point {}; test.Point {}; "
            "test.Point { " + name_with_nul + ": pickle.String String(sz=3) }");
}

TEST_F(Capnp_tree_emitter_test, Flush_appends)
{
  Capnp_tree_emitter emitter(config());
  Protocol_writer writer(Protocol_writer::Config{ pickle::test::test_logger(), Mode::S_COMMIT, 0 },
                         m_registry, &emitter, nullptr);

  write_primitive(writer, int32_t(1));
  EXPECT_EQ(emitter.n_pending_entries(), 1u);
  EXPECT_EQ(emitter.root().getEntries().size(), 0u) << "Nothing is in the root until flushed.";
  writer.flush();
  EXPECT_EQ(emitter.root().getEntries().size(), 1u);

  write_primitive(writer, int32_t(2));
  write_primitive(writer, Unit());
  writer.flush();
  const auto entries = emitter.root().getEntries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].getIntVal(), 1);
  EXPECT_EQ(entries[1].getIntVal(), 2);
  EXPECT_TRUE(entries[2].isUnit());
}

TEST_F(Capnp_tree_emitter_test, Sink)
{
  std::ostringstream sink;
  Capnp_tree_emitter emitter(config(8192, &sink));
  Pickle_session session(Pickle_session::Config{ pickle::test::test_logger(), 0 }, m_registry);
  session.run(Mode::S_COMMIT, &emitter, [&](Pickle_writer& writer) { produce(writer); });
  ASSERT_FALSE(sink.str().empty());

  std::istringstream source(sink.str());
  kj::std::StdInputStream source_stream(source);
  ::capnp::InputStreamMessageReader reader(source_stream);
  const auto entries = reader.getRoot<schema::Pickle>().getEntries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_STREQ(entries[0].getStructure()[2].getValue().getStringVal().cStr(), "p");
}

TEST_F(Capnp_tree_emitter_test, Sink_failure)
{
  std::ostringstream sink;
  sink.setstate(std::ios::badbit);
  Capnp_tree_emitter emitter(config(8192, &sink));
  Protocol_writer writer(Protocol_writer::Config{ pickle::test::test_logger(), Mode::S_COMMIT, 0 },
                         m_registry, &emitter, nullptr);

  write_primitive(writer, int32_t(1));
  Error_code err_code;
  writer.flush(&err_code);
  EXPECT_EQ(err_code, error::Code::S_EMITTER_SINK_WRITE_FAILED);
  EXPECT_FALSE(error::is_protocol_violation(err_code));
  EXPECT_FALSE(writer.broken_err_code());
}

TEST_F(Capnp_tree_emitter_test, Serialization)
{
  {
    Capnp_tree_emitter emitter(config(1024));
    Protocol_writer writer(Protocol_writer::Config{ pickle::test::test_logger(), Mode::S_COMMIT, 0 },
                           m_registry, &emitter, nullptr);
    write_primitive(writer, std::string(100, 'x'));
    writer.flush();

    Segment_ptrs segs;
    Error_code err_code;
    emitter.emit_serialization(&segs, &err_code);
    EXPECT_FALSE(err_code);
    ASSERT_FALSE(segs.empty());
    for (const auto seg : segs)
    {
      EXPECT_GT(seg->size(), 0u);
      EXPECT_LE(seg->size(), 1024u);
    }
  }
  {
    Capnp_tree_emitter emitter(config(64));
    Protocol_writer writer(Protocol_writer::Config{ pickle::test::test_logger(), Mode::S_COMMIT, 0 },
                           m_registry, &emitter, nullptr);
    write_primitive(writer, std::string(1000, 'x'));
    writer.flush();

    Segment_ptrs segs;
    Error_code err_code;
    emitter.emit_serialization(&segs, &err_code);
    EXPECT_EQ(err_code, error::Code::S_EMITTER_SEGMENT_TOO_BIG);
    EXPECT_TRUE(segs.empty());
  }
}

} // namespace pickle::format::test
