// xelogen/flow/branch_stack.cpp - If/Else nesting state
#include "xelogen/flow/branch_stack.hpp"

#include <algorithm>

#include "xelogen/basic/build_error.hpp"
#include "xelogen/ir/node.hpp"

namespace xelogen
{

BranchStack::BranchStack()
{
  // Base level: the session's top-level statements.
  levels_.push_back(Level{0, nullptr, false});
}

BranchStack::LevelToken BranchStack::push_level()
{
  const LevelToken token = next_token_++;
  levels_.push_back(Level{token, nullptr, false});
  return token;
}

void BranchStack::pop_level(LevelToken token)
{
  if (levels_.size() <= 1 || levels_.back().token != token) {
    throw BuildError(
      ErrorCode::UnbalancedScope, "branch scope closed while an inner scope is still open");
  }
  levels_.pop_back();
}

bool BranchStack::release_level(LevelToken token) noexcept
{
  const auto it = std::find_if(
    levels_.begin() + 1, levels_.end(), [token](const Level & l) { return l.token == token; });
  if (it == levels_.end()) {
    return false;
  }
  levels_.erase(it, levels_.end());
  return true;
}

void BranchStack::set_pending_if(Node & if_node) noexcept
{
  Level & top = levels_.back();
  top.last_if = &if_node;
  top.else_consumed = false;
}

Node & BranchStack::consume_else()
{
  Level & top = levels_.back();
  if (top.last_if == nullptr) {
    throw BuildError(ErrorCode::DanglingElse, "cannot have Else without If first");
  }
  if (top.else_consumed) {
    throw BuildError(
      ErrorCode::DanglingElse,
      "the Else of " + top.last_if->describe() + " has already been opened");
  }
  top.else_consumed = true;
  return *top.last_if;
}

Node * BranchStack::pending_if() const noexcept
{
  const Level & top = levels_.back();
  return top.else_consumed ? nullptr : top.last_if;
}

}  // namespace xelogen
