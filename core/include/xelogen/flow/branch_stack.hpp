// xelogen/flow/branch_stack.hpp - If/Else nesting state of a construction session
//
// Each open branch scope (the body of an If or of an Else) owns one level of
// the stack. When an If scope closes, its If node is recorded on the enclosing
// level as "else-pending"; a later Else on that same level consumes it.
// Resolution therefore always targets the innermost level at the time Else is
// requested, which keeps nested If/Else pairs independent of outer ones.
//
#pragma once

#include <cstddef>
#include <vector>

namespace xelogen
{

class Node;

/**
 * Session-owned nesting stack for branch construction.
 *
 * Frame states: open (If scope active) -> else-pending (If scope closed)
 * -> else-open (Else scope active) -> else-closed. Only else-pending accepts
 * an Else.
 */
class BranchStack
{
public:
  /// Opaque identifier of a pushed level
  using LevelToken = size_t;

  BranchStack();

  /// Push a level for a newly opened scope.
  [[nodiscard]] LevelToken push_level();

  /**
   * Pop the innermost level.
   *
   * @throws BuildError (UnbalancedScope) if `token` is not the innermost level
   */
  void pop_level(LevelToken token);

  /**
   * Remove the level `token` together with every level above it.
   *
   * @return false if `token` is no longer on the stack
   */
  bool release_level(LevelToken token) noexcept;

  /// Record a closed If on the innermost level, replacing any pending one.
  void set_pending_if(Node & if_node) noexcept;

  /**
   * Consume the else-pending If of the innermost level.
   *
   * @throws BuildError (DanglingElse) if there is none
   */
  Node & consume_else();

  /// The else-pending If of the innermost level, or nullptr
  [[nodiscard]] Node * pending_if() const noexcept;

  /// Number of open scopes
  [[nodiscard]] size_t depth() const noexcept { return levels_.size() - 1; }

private:
  struct Level
  {
    LevelToken token = 0;
    Node * last_if = nullptr;
    bool else_consumed = false;
  };

  std::vector<Level> levels_;
  LevelToken next_token_ = 1;
};

}  // namespace xelogen
