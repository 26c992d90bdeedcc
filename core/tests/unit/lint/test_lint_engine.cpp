// tests/unit/lint/test_lint_engine.cpp - Unit tests for the lint engine
//
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "xelogen/ir/graph.hpp"
#include "xelogen/lint/lint_pass.hpp"
#include "xelogen/lint/unbound_input_pass.hpp"

using namespace xelogen;

namespace
{

/// Reports one warning per node of a given type
class CountingPass final : public LintPass
{
public:
  CountingPass(std::string name, std::string type, std::vector<std::string> * log)
  : name_(std::move(name)), type_(std::move(type)), log_(log)
  {
  }

  [[nodiscard]] std::string_view name() const noexcept override { return name_; }

  size_t run(const Graph & graph, DiagnosticBag * diags) const override
  {
    log_->push_back(name_);
    size_t n = 0;
    for (const auto & node : graph.nodes()) {
      if (node->type_name() == type_) {
        ++n;
        if (diags) {
          diags->report_warning(location_of(*node), name_);
        }
      }
    }
    return n;
  }

private:
  std::string name_;
  std::string type_;
  std::vector<std::string> * log_;
};

}  // namespace

class LintEngineTest : public ::testing::Test
{
protected:
  void SetUp() override { register_builtin_nodes(registry); }

  NodeRegistry registry;
};

TEST_F(LintEngineTest, RunsPassesInRegistrationOrderAndSums)
{
  Graph graph(registry);
  graph.add_node("Pulse");
  graph.add_node("Pulse");
  graph.add_node("StringInput");

  std::vector<std::string> log;
  LintEngine engine;
  engine.register_pass(std::make_unique<CountingPass>("pulses", "Pulse", &log));
  engine.register_pass(std::make_unique<CountingPass>("strings", "StringInput", &log));

  DiagnosticBag diags;
  EXPECT_EQ(engine.run(graph, &diags), 3U);
  EXPECT_EQ(diags.size(), 3U);
  EXPECT_EQ(log, (std::vector<std::string>{"pulses", "strings"}));
  EXPECT_EQ(engine.size(), 2U);
  EXPECT_EQ(engine.pass_names()[1], "strings");
}

TEST_F(LintEngineTest, EmptyEngineFindsNothing)
{
  Graph graph(registry);
  graph.add_node("WriteDynVar<Int>");
  LintEngine engine;
  EXPECT_EQ(engine.run(graph), 0U);
}

TEST_F(LintEngineTest, RunDoesNotMutateGraph)
{
  Graph graph(registry);
  graph.add_node("WriteDynVar<Int>");
  LintEngine engine;
  register_default_passes(engine);

  EXPECT_GT(engine.run(graph), 0U);
  EXPECT_EQ(graph.size(), 1U);
  EXPECT_FALSE(graph.node(0)->is_bound("name"));
}

TEST_F(LintEngineTest, DefaultPassesCanBeDisabled)
{
  LintEngine all;
  register_default_passes(all);
  EXPECT_EQ(all.pass_names(), (std::vector<std::string_view>{"dyn-var-name", "unbound-input"}));

  LintEngine some;
  register_default_passes(some, {"unbound-input"});
  EXPECT_EQ(some.pass_names(), (std::vector<std::string_view>{"dyn-var-name"}));
}

TEST_F(LintEngineTest, EnginesAreIndependent)
{
  LintEngine a;
  LintEngine b;
  register_default_passes(a);
  EXPECT_EQ(b.size(), 0U);
}

TEST(UnboundInputPassTest, ReportsUnboundScalarDataInputs)
{
  NodeRegistry registry;
  register_builtin_nodes(registry);
  Graph graph(registry);

  Node & write = graph.add_node("WriteDynVar<Int>");
  Node & name = graph.add_node("StringInput");
  name.set_content(ContentValue::make_string("World/Meow"));
  write.bind_to_node("name", name);
  graph.add_node("Plus<Int>");

  DiagnosticBag diags;
  UnboundInputPass pass;
  // slot and value; list inputs and impulse inputs are optional.
  EXPECT_EQ(pass.run(graph, &diags), 2U);
  ASSERT_EQ(diags.size(), 2U);
  EXPECT_EQ(diags.all()[0].code, "L010");
  EXPECT_EQ(diags.all()[0].primary_location().port, "slot");
  EXPECT_EQ(diags.all()[1].primary_location().port, "value");
}
