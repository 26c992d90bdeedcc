// xelogen/flow/branch.cpp - If/Else branch construction
#include "xelogen/flow/branch.hpp"

#include <fmt/core.h>

#include <utility>

#include "xelogen/basic/build_error.hpp"
#include "xelogen/ir/graph.hpp"

namespace xelogen
{

// ============================================================================
// BranchScope
// ============================================================================

BranchScope::BranchScope(BranchStack & stack, Node & if_node, ImpulseChain chain)
: stack_(&stack), if_node_(&if_node), token_(stack.push_level()), chain_(std::move(chain))
{
}

BranchScope::BranchScope(BranchScope && other) noexcept
: stack_(other.stack_),
  if_node_(other.if_node_),
  token_(other.token_),
  chain_(std::move(other.chain_)),
  active_(other.active_)
{
  other.active_ = false;
}

bool BranchScope::close_level()
{
  if (!active_) {
    return false;
  }
  stack_->pop_level(token_);
  active_ = false;
  return true;
}

bool BranchScope::release_level() noexcept
{
  if (!active_) {
    return false;
  }
  active_ = false;
  return stack_->release_level(token_);
}

// ============================================================================
// IfScope / ElseScope
// ============================================================================

IfScope::IfScope(BranchStack & stack, Node & if_node)
: BranchScope(stack, if_node, ImpulseChain(if_node.output(k_if_true_output)))
{
}

IfScope::~IfScope()
{
  if (release_level()) {
    stack_->set_pending_if(*if_node_);
  }
}

void IfScope::close()
{
  if (close_level()) {
    stack_->set_pending_if(*if_node_);
  }
}

ElseScope::ElseScope(BranchStack & stack, Node & if_node)
: BranchScope(stack, if_node, ImpulseChain(if_node.output(k_if_false_output)))
{
}

ElseScope::~ElseScope() { release_level(); }

void ElseScope::close() { close_level(); }

// ============================================================================
// Entry Points
// ============================================================================

IfScope begin_if(Graph & graph, const OutputPort & trigger, const OutputPort & condition)
{
  if (trigger.datatype() != Datatype::Impulse) {
    throw BuildError(
      ErrorCode::NotAnImpulse,
      fmt::format(
        "output '{}' of {} is not an impulse", trigger.name(), trigger.node().describe()));
  }
  if (condition.datatype() != Datatype::Bool) {
    throw BuildError(
      ErrorCode::NotABoolean,
      fmt::format("output '{}' of {} is not a bool", condition.name(), condition.node().describe()));
  }

  for (const OutputPort * port : {&trigger, &condition}) {
    if (&port->node().graph() != &graph) {
      throw BuildError(
        ErrorCode::ForeignNode,
        fmt::format("{} belongs to a different graph", port->node().describe()));
    }
  }

  Node & if_node = graph.add_node(k_if_node_type);
  if_node.bind(if_node.first_input_impulse(), trigger);
  if_node.bind(k_if_condition_input, condition);
  return IfScope(graph.branch_stack(), if_node);
}

ElseScope begin_else(Graph & graph)
{
  BranchStack & stack = graph.branch_stack();
  return ElseScope(stack, stack.consume_else());
}

}  // namespace xelogen
