// tests/unit/ir/test_graph.cpp - Unit tests for graph identity and ownership
//
#include <gtest/gtest.h>

#include <type_traits>

#include "xelogen/basic/build_error.hpp"
#include "xelogen/ir/graph.hpp"

using namespace xelogen;

class GraphTest : public ::testing::Test
{
protected:
  void SetUp() override { register_builtin_nodes(registry); }

  NodeRegistry registry;
};

TEST_F(GraphTest, EndToEndIdentityAndBindings)
{
  Graph graph(registry);

  Node & pulse = graph.add_node("Pulse");
  EXPECT_EQ(pulse.id(), 0U);

  Node & root = graph.root();
  EXPECT_EQ(root.id(), 1U);
  EXPECT_EQ(root.type_name(), "RootSlot");

  Node & num_children = graph.add_node("NumChildren");
  EXPECT_EQ(num_children.id(), 2U);
  num_children.bind("slot", root.output("*"));

  Node & plus_one = graph.add_node("PlusOne<Int>");
  EXPECT_EQ(plus_one.id(), 3U);
  plus_one.bind("value", num_children.output("*"));

  const auto slot = num_children.bound("slot");
  ASSERT_EQ(slot.size(), 1U);
  EXPECT_EQ(slot[0].node_id(), 1U);
  EXPECT_EQ(slot[0].name(), "*");

  const auto value = plus_one.bound("value");
  ASSERT_EQ(value.size(), 1U);
  EXPECT_EQ(value[0].node_id(), 2U);
  EXPECT_EQ(value[0].name(), "*");
}

TEST_F(GraphTest, UnknownNodeTypeFailsWithoutAddingNode)
{
  Graph graph(registry);
  graph.add_node("Pulse");
  try {
    graph.add_node("Pulse2");
    FAIL() << "expected UnknownNodeType";
  } catch (const BuildError & e) {
    EXPECT_EQ(e.code(), ErrorCode::UnknownNodeType);
  }
  EXPECT_EQ(graph.size(), 1U);
  EXPECT_EQ(graph.add_node("Pulse").id(), 1U);
}

TEST_F(GraphTest, OnlyGraphCreatesNodes)
{
  static_assert(!std::is_default_constructible<Node::CreationKey>::value);
  static_assert(!std::is_copy_constructible<Node>::value);

  Graph graph(registry);
  Node & write = graph.add_node("WriteDynVar<Int>");
  EXPECT_EQ(&write.graph(), &graph);
  EXPECT_EQ(write.id(), 0U);
  EXPECT_FALSE(write.content().has_value());
  for (const auto & input : write.spec().inputs) {
    EXPECT_TRUE(write.bound(input.name).empty()) << input.name;
  }
}

TEST_F(GraphTest, RootIsCreatedOnce)
{
  Graph graph(registry);
  Node & first = graph.root();
  Node & second = graph.root();
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(graph.size(), 1U);
}

TEST_F(GraphTest, NodesInInsertionOrder)
{
  Graph graph(registry);
  graph.add_node("Pulse");
  graph.add_node("StringInput");
  graph.add_node("If");

  ASSERT_EQ(graph.nodes().size(), 3U);
  for (size_t i = 0; i < graph.nodes().size(); ++i) {
    EXPECT_EQ(graph.nodes()[i]->id(), i);
    EXPECT_EQ(graph.node(i), graph.nodes()[i].get());
  }
  EXPECT_EQ(graph.nodes()[2]->type_name(), "If");
  EXPECT_EQ(graph.node(3), nullptr);
}

TEST_F(GraphTest, GraphsAreIndependent)
{
  Graph a(registry);
  Graph b(registry);
  a.add_node("Pulse");
  a.add_node("Pulse");

  EXPECT_EQ(b.add_node("Pulse").id(), 0U);
  EXPECT_EQ(b.root().id(), 1U);
  EXPECT_EQ(a.root().id(), 2U);
  EXPECT_EQ(&a.node(0)->graph(), &a);
  EXPECT_EQ(&b.node(0)->graph(), &b);
}

TEST_F(GraphTest, NodesShareTheirSpec)
{
  Graph graph(registry);
  Node & a = graph.add_node("IntInput");
  Node & b = graph.add_node("IntInput");
  EXPECT_EQ(&a.spec(), &b.spec());
  EXPECT_EQ(&a.spec(), registry.lookup("IntInput"));
}

TEST_F(GraphTest, DescribeNamesIdAndType)
{
  Graph graph(registry);
  graph.add_node("Pulse");
  EXPECT_EQ(graph.add_node("PlusOne<Int>").describe(), "node 1 <PlusOne<Int>>");
}
