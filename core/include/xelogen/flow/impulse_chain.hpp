// xelogen/flow/impulse_chain.hpp - Sequential impulse wiring
#pragma once

#include <vector>

#include "xelogen/ir/node.hpp"

namespace xelogen
{

/**
 * A chain of impulses.
 *
 * The chain holds the impulse output still waiting for a consumer. Appending
 * a node sends that impulse to the node's first impulse input and moves the
 * cursor to the node's first impulse output.
 *
 * Example:
 * @code
 *   ImpulseChain chain(write.output("success"));
 *   chain.append(write_a).append(write_b);
 * @endcode
 */
class ImpulseChain
{
public:
  /// @throws BuildError (NotAnImpulse) if `impulse` is not an Impulse output
  explicit ImpulseChain(const OutputPort & impulse);

  /**
   * Extend the chain with `node`.
   *
   * Both impulse ports of `node` are resolved before anything is bound, so a
   * failure leaves the chain and the node unchanged.
   *
   * @throws BuildError (MissingImpulseInput, MissingImpulseOutput, ForeignNode)
   */
  ImpulseChain & append(Node & node);

  /// The impulse output awaiting a downstream consumer
  [[nodiscard]] const OutputPort & current() const noexcept { return current_; }

  /// Nodes appended so far, in order
  [[nodiscard]] const std::vector<Node *> & history() const noexcept { return history_; }

  /// Last appended node, nullptr if none
  [[nodiscard]] Node * last() const noexcept
  {
    return history_.empty() ? nullptr : history_.back();
  }

private:
  OutputPort current_;
  std::vector<Node *> history_;
};

}  // namespace xelogen
