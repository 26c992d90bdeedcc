// xelogen/flow/branch.hpp - If/Else branch construction
//
// Branches are built with scoped guards:
//
// @code
//   {
//     IfScope when_true = begin_if(graph, pulse.only_output(), flag.only_output());
//     when_true.chain().append(write_a);
//   }
//   {
//     ElseScope when_false = begin_else(graph);
//     when_false.chain().append(write_b);
//   }
// @endcode
//
// An Else pairs with the most recently closed If of the same nesting level, so
// the If scope must be closed (destroyed or close()d) before begin_else is
// called. Other statements may appear between the two.
//
#pragma once

#include "xelogen/flow/branch_stack.hpp"
#include "xelogen/flow/impulse_chain.hpp"
#include "xelogen/ir/node.hpp"

namespace xelogen
{

class Graph;

/// Type name and port names of the branch node
inline constexpr std::string_view k_if_node_type = "If";
inline constexpr std::string_view k_if_condition_input = "condition";
inline constexpr std::string_view k_if_true_output = "true";
inline constexpr std::string_view k_if_false_output = "false";

// ============================================================================
// BranchScope
// ============================================================================

/**
 * Common part of IfScope and ElseScope: one level of the session's
 * BranchStack plus the chain of the branch body.
 *
 * The level is released when the scope is closed, explicitly by close() or
 * by the destructor.
 */
class BranchScope
{
public:
  BranchScope(const BranchScope &) = delete;
  BranchScope & operator=(const BranchScope &) = delete;
  BranchScope(BranchScope && other) noexcept;
  BranchScope & operator=(BranchScope &&) = delete;

  /// Chain of the branch body
  [[nodiscard]] ImpulseChain & chain() noexcept { return chain_; }

  /// The If node this branch belongs to
  [[nodiscard]] Node & if_node() const noexcept { return *if_node_; }

  [[nodiscard]] bool is_open() const noexcept { return active_; }

protected:
  BranchScope(BranchStack & stack, Node & if_node, ImpulseChain chain);
  ~BranchScope() = default;

  /// Pops the level; throws UnbalancedScope if an inner scope is still open.
  bool close_level();

  /// Pops the level if it is innermost, without throwing.
  bool release_level() noexcept;

  BranchStack * stack_;
  Node * if_node_;
  BranchStack::LevelToken token_;
  ImpulseChain chain_;
  bool active_ = true;
};

/**
 * Body of the true branch of an If node.
 *
 * Closing leaves the If on the enclosing level, ready for begin_else().
 */
class IfScope : public BranchScope
{
public:
  IfScope(BranchStack & stack, Node & if_node);
  IfScope(IfScope &&) noexcept = default;
  ~IfScope();

  /// @throws BuildError (UnbalancedScope) if an inner scope is still open
  void close();
};

/**
 * Body of the false branch of an If node.
 */
class ElseScope : public BranchScope
{
public:
  ElseScope(BranchStack & stack, Node & if_node);
  ElseScope(ElseScope &&) noexcept = default;
  ~ElseScope();

  /// @throws BuildError (UnbalancedScope) if an inner scope is still open
  void close();
};

// ============================================================================
// Entry Points
// ============================================================================

/**
 * Create an If node triggered by `trigger` on `condition` and open its true
 * branch.
 *
 * @throws BuildError (NotAnImpulse) if `trigger` is not an Impulse output
 * @throws BuildError (NotABoolean) if `condition` is not a Bool output
 * @throws BuildError (ForeignNode) if either output belongs to another graph
 */
[[nodiscard]] IfScope begin_if(
  Graph & graph, const OutputPort & trigger, const OutputPort & condition);

/**
 * Open the false branch of the most recently closed If on the current level.
 *
 * @throws BuildError (DanglingElse) if there is no such If, or its Else was
 * already opened
 */
[[nodiscard]] ElseScope begin_else(Graph & graph);

}  // namespace xelogen
