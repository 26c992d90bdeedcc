// tests/unit/flow/test_impulse_chain.cpp - Unit tests for sequential impulse wiring
//
#include <gtest/gtest.h>

#include "xelogen/basic/build_error.hpp"
#include "xelogen/flow/impulse_chain.hpp"
#include "xelogen/ir/graph.hpp"

using namespace xelogen;

class ImpulseChainTest : public ::testing::Test
{
protected:
  void SetUp() override { register_builtin_nodes(registry); }

  NodeRegistry registry;
};

TEST_F(ImpulseChainTest, AppendWiresCurrentImpulseAndAdvances)
{
  Graph graph(registry);
  Node & pulse = graph.add_node("Pulse");
  Node & first = graph.add_node("WriteDynVar<Int>");
  Node & second = graph.add_node("WriteDynVar<Int>");

  ImpulseChain chain(pulse.only_output());
  EXPECT_EQ(chain.last(), nullptr);

  chain.append(first).append(second);

  ASSERT_EQ(first.bound("write").size(), 1U);
  EXPECT_EQ(first.bound("write")[0], pulse.only_output());
  ASSERT_EQ(second.bound("write").size(), 1U);
  EXPECT_EQ(second.bound("write")[0], first.output("success"));

  EXPECT_EQ(chain.current(), second.output("success"));
  ASSERT_EQ(chain.history().size(), 2U);
  EXPECT_EQ(chain.history()[0], &first);
  EXPECT_EQ(chain.last(), &second);
}

TEST_F(ImpulseChainTest, AppendToImpulseListKeepsExistingTriggers)
{
  Graph graph(registry);
  Node & pulse = graph.add_node("Pulse");
  Node & other = graph.add_node("Pulse");
  Node & write = graph.add_node("WriteDynVar<Int>");
  write.bind_to_node("write", other);

  ImpulseChain chain(pulse.only_output());
  chain.append(write);

  const auto triggers = write.bound("write");
  ASSERT_EQ(triggers.size(), 2U);
  EXPECT_EQ(triggers[0].node_id(), other.id());
  EXPECT_EQ(triggers[1].node_id(), pulse.id());
}

TEST_F(ImpulseChainTest, NonImpulseStartFails)
{
  Graph graph(registry);
  Node & text = graph.add_node("StringInput");
  try {
    ImpulseChain chain(text.only_output());
    FAIL() << "expected NotAnImpulse";
  } catch (const BuildError & e) {
    EXPECT_EQ(e.code(), ErrorCode::NotAnImpulse);
  }
}

TEST_F(ImpulseChainTest, NodeWithoutImpulseInputIsRejected)
{
  Graph graph(registry);
  Node & pulse = graph.add_node("Pulse");
  Node & count = graph.add_node("NumChildren");

  ImpulseChain chain(pulse.only_output());
  try {
    chain.append(count);
    FAIL() << "expected MissingImpulseInput";
  } catch (const BuildError & e) {
    EXPECT_EQ(e.code(), ErrorCode::MissingImpulseInput);
  }
  EXPECT_TRUE(chain.history().empty());
}

TEST_F(ImpulseChainTest, SinkNodeIsRejectedBeforeBinding)
{
  Graph graph(registry);
  Node & pulse = graph.add_node("Pulse");
  Node & display = graph.add_node("ImpulseDisplay");

  ImpulseChain chain(pulse.only_output());
  try {
    chain.append(display);
    FAIL() << "expected MissingImpulseOutput";
  } catch (const BuildError & e) {
    EXPECT_EQ(e.code(), ErrorCode::MissingImpulseOutput);
  }
  EXPECT_FALSE(display.is_bound("impulse"));
  EXPECT_EQ(chain.current(), pulse.only_output());
}

TEST_F(ImpulseChainTest, ForeignNodeIsRejected)
{
  Graph graph(registry);
  Graph other(registry);
  Node & pulse = graph.add_node("Pulse");
  Node & write = other.add_node("WriteDynVar<Int>");

  ImpulseChain chain(pulse.only_output());
  try {
    chain.append(write);
    FAIL() << "expected ForeignNode";
  } catch (const BuildError & e) {
    EXPECT_EQ(e.code(), ErrorCode::ForeignNode);
  }
  EXPECT_TRUE(chain.history().empty());
}
