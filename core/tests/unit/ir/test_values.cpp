// tests/unit/ir/test_values.cpp - Unit tests for typed value helpers
//
#include <gtest/gtest.h>

#include "xelogen/basic/build_error.hpp"
#include "xelogen/ir/graph.hpp"
#include "xelogen/ir/values.hpp"

using namespace xelogen;

class ValuesTest : public ::testing::Test
{
protected:
  void SetUp() override { register_builtin_nodes(registry); }

  NodeRegistry registry;
};

TEST_F(ValuesTest, RootChildCountPlusOne)
{
  Graph graph(registry);
  const SlotValue root = SlotValue::root(graph);
  const IntValue count = root.num_children();
  const IntValue next = count.plus(1);

  ASSERT_EQ(graph.size(), 3U);
  EXPECT_EQ(graph.node(0)->type_name(), "RootSlot");
  EXPECT_EQ(count.output().node().type_name(), "NumChildren");
  EXPECT_EQ(count.output().node().bound("slot")[0].node_id(), 0U);
  EXPECT_EQ(next.output().node().type_name(), "PlusOne<Int>");
}

TEST_F(ValuesTest, PlusOtherValueAccumulates)
{
  Graph graph(registry);
  const IntValue a(graph.add_node("IntInput").only_output());
  const IntValue b(graph.add_node("IntInput").only_output());
  const IntValue sum = a.plus(b);

  EXPECT_EQ(sum.output().node().type_name(), "Plus<Int>");
  EXPECT_EQ(sum.output().node().bound("values").size(), 2U);
}

TEST_F(ValuesTest, WrongDatatypeIsRejected)
{
  Graph graph(registry);
  const OutputPort text = graph.add_node("StringInput").only_output();

  try {
    const IntValue v(text);
    FAIL() << "expected TypeMismatch";
  } catch (const BuildError & e) {
    EXPECT_EQ(e.code(), ErrorCode::TypeMismatch);
  }

  try {
    const SlotValue v(text);
    FAIL() << "expected TypeMismatch";
  } catch (const BuildError & e) {
    EXPECT_EQ(e.code(), ErrorCode::TypeMismatch);
  }
}
