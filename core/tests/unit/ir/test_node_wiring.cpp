// tests/unit/ir/test_node_wiring.cpp - Unit tests for port resolution and binding
//
#include <gtest/gtest.h>

#include <memory>
#include <variant>

#include "xelogen/basic/build_error.hpp"
#include "xelogen/ir/graph.hpp"

using namespace xelogen;

// ============================================================================
// Helpers
// ============================================================================

template <typename Fn>
static void expect_error(ErrorCode code, Fn && fn)
{
  try {
    fn();
    FAIL() << "expected " << error_code_name(code);
  } catch (const BuildError & e) {
    EXPECT_EQ(e.code(), code) << e.what();
  }
}

class NodeWiringTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    register_builtin_nodes(registry);

    NodeSpec probe;
    probe.name = "Probe";
    probe.inputs = {{"in", Datatype::Int}};
    probe.outputs = {
      {"label", Datatype::String}, {"first", Datatype::Int}, {"second", Datatype::Int}};
    registry.define(probe);

    NodeSpec both;
    both.name = "Shadow";
    both.inputs = {{"x", Datatype::Int}};
    both.outputs = {{"x", Datatype::Int}};
    registry.define(both);

    graph = std::make_unique<Graph>(registry);
  }

  NodeRegistry registry;
  std::unique_ptr<Graph> graph;
};

// ============================================================================
// Port Resolution
// ============================================================================

TEST_F(NodeWiringTest, PortResolvesOutputsBeforeInputs)
{
  Node & shadow = graph->add_node("Shadow");
  EXPECT_TRUE(std::holds_alternative<OutputPort>(shadow.port("x")));

  Node & plus_one = graph->add_node("PlusOne<Int>");
  EXPECT_TRUE(std::holds_alternative<OutputPort>(plus_one.port("*")));
  const Port value = plus_one.port("value");
  ASSERT_TRUE(std::holds_alternative<InputPort>(value));
  EXPECT_EQ(std::get<InputPort>(value).datatype(), Datatype::Int);
}

TEST_F(NodeWiringTest, UnknownPortFails)
{
  Node & plus_one = graph->add_node("PlusOne<Int>");
  expect_error(ErrorCode::UnknownPort, [&] { (void)plus_one.port("values"); });
  expect_error(ErrorCode::UnknownPort, [&] { (void)plus_one.output("value"); });
  expect_error(ErrorCode::UnknownPort, [&] { (void)plus_one.input("*"); });
  expect_error(ErrorCode::UnknownPort, [&] { (void)plus_one.bound("nope"); });
}

TEST_F(NodeWiringTest, InputPortReportsElementType)
{
  Node & concat = graph->add_node("Plus<String>");
  const InputPort values = concat.input("values");
  EXPECT_TRUE(values.is_list());
  EXPECT_EQ(values.declared_type(), Datatype::StringList);
  EXPECT_EQ(values.datatype(), Datatype::String);
}

// ============================================================================
// Binding
// ============================================================================

TEST_F(NodeWiringTest, ScalarInputBindsOnce)
{
  Node & a = graph->add_node("IntInput");
  Node & b = graph->add_node("IntInput");
  Node & plus_one = graph->add_node("PlusOne<Int>");

  plus_one.bind("value", a.only_output());
  expect_error(ErrorCode::DuplicateBinding, [&] { plus_one.bind("value", b.only_output()); });

  ASSERT_EQ(plus_one.bound("value").size(), 1U);
  EXPECT_EQ(plus_one.bound("value")[0].node_id(), a.id());
}

TEST_F(NodeWiringTest, DuplicateBindingIsReportedBeforeTypeMismatch)
{
  Node & a = graph->add_node("IntInput");
  Node & text = graph->add_node("StringInput");
  Node & plus_one = graph->add_node("PlusOne<Int>");

  plus_one.bind("value", a.only_output());
  expect_error(ErrorCode::DuplicateBinding, [&] { plus_one.bind("value", text.only_output()); });
}

TEST_F(NodeWiringTest, TypeMismatchLeavesInputUnbound)
{
  Node & text = graph->add_node("StringInput");
  Node & plus_one = graph->add_node("PlusOne<Int>");

  expect_error(ErrorCode::TypeMismatch, [&] { plus_one.bind("value", text.only_output()); });
  EXPECT_FALSE(plus_one.is_bound("value"));
}

TEST_F(NodeWiringTest, ListInputKeepsBindOrder)
{
  Node & a = graph->add_node("StringInput");
  Node & b = graph->add_node("StringInput");
  Node & concat = graph->add_node("Plus<String>");

  concat.bind("values", b.only_output());
  concat.bind("values", a.only_output());
  concat.bind("values", b.only_output());

  const auto values = concat.bound("values");
  ASSERT_EQ(values.size(), 3U);
  EXPECT_EQ(values[0].node_id(), b.id());
  EXPECT_EQ(values[1].node_id(), a.id());
  EXPECT_EQ(values[2].node_id(), b.id());
}

TEST_F(NodeWiringTest, ListInputRejectsWrongElementType)
{
  Node & num = graph->add_node("IntInput");
  Node & concat = graph->add_node("Plus<String>");
  expect_error(ErrorCode::TypeMismatch, [&] { concat.bind("values", num.only_output()); });
  EXPECT_TRUE(concat.bound("values").empty());
}

TEST_F(NodeWiringTest, InputPortConnectAndAppend)
{
  Node & text = graph->add_node("StringInput");
  Node & concat = graph->add_node("Plus<String>");
  Node & write = graph->add_node("WriteDynVar<Int>");

  concat.input("values").append(text);
  concat.input("values").append(text.only_output());
  write.input("name").connect(concat);

  EXPECT_EQ(concat.input("values").bound().size(), 2U);
  ASSERT_EQ(write.bound("name").size(), 1U);
  EXPECT_EQ(write.bound("name")[0].node_id(), concat.id());
}

TEST_F(NodeWiringTest, AppendToScalarInputFails)
{
  Node & text = graph->add_node("StringInput");
  Node & write = graph->add_node("WriteDynVar<Int>");
  expect_error(ErrorCode::TypeMismatch, [&] { write.input("name").append(text); });
  EXPECT_FALSE(write.is_bound("name"));
}

TEST_F(NodeWiringTest, BindAcrossGraphsFails)
{
  Graph other(registry);
  Node & foreign = other.add_node("IntInput");
  Node & plus_one = graph->add_node("PlusOne<Int>");

  expect_error(ErrorCode::ForeignNode, [&] { plus_one.bind("value", foreign.only_output()); });
  EXPECT_FALSE(plus_one.is_bound("value"));
}

// ============================================================================
// Typed Queries
// ============================================================================

TEST_F(NodeWiringTest, BindToNodePicksFirstMatchingOutput)
{
  Node & probe = graph->add_node("Probe");
  Node & plus_one = graph->add_node("PlusOne<Int>");

  plus_one.bind_to_node("value", probe);
  ASSERT_EQ(plus_one.bound("value").size(), 1U);
  EXPECT_EQ(plus_one.bound("value")[0].name(), "first");
}

TEST_F(NodeWiringTest, BindToNodeUsesElementTypeForLists)
{
  Node & probe = graph->add_node("Probe");
  Node & concat = graph->add_node("Plus<String>");

  concat.bind_to_node("values", probe);
  EXPECT_EQ(concat.bound("values")[0].name(), "label");
}

TEST_F(NodeWiringTest, BindToNodeWithoutMatchFails)
{
  Node & pulse = graph->add_node("Pulse");
  Node & plus_one = graph->add_node("PlusOne<Int>");
  expect_error(ErrorCode::NoMatchingOutput, [&] { plus_one.bind_to_node("value", pulse); });
}

TEST_F(NodeWiringTest, FirstOutputOfType)
{
  Node & probe = graph->add_node("Probe");
  EXPECT_EQ(probe.first_output_of_type(Datatype::Int).name(), "first");
  EXPECT_EQ(probe.first_output_of_type(Datatype::IntList).name(), "first");
  EXPECT_EQ(probe.first_output_of_type(Datatype::String).name(), "label");
  expect_error(ErrorCode::NoMatchingOutput, [&] {
    (void)probe.first_output_of_type(Datatype::Bool);
  });
}

TEST_F(NodeWiringTest, ImpulsePorts)
{
  Node & write = graph->add_node("WriteDynVar<Int>");
  EXPECT_EQ(write.first_input_impulse(), "write");
  EXPECT_EQ(write.first_output_impulse().name(), "success");

  Node & pulse = graph->add_node("Pulse");
  expect_error(ErrorCode::MissingImpulseInput, [&] { (void)pulse.first_input_impulse(); });

  Node & display = graph->add_node("ImpulseDisplay");
  EXPECT_EQ(display.first_input_impulse(), "impulse");
  expect_error(ErrorCode::MissingImpulseOutput, [&] { (void)display.first_output_impulse(); });
}
