// xelogen/ir/values.hpp - Typed views over node outputs
//
// Small wrappers that let graph-building code talk in terms of values
// ("the root slot", "its child count plus one") instead of node types.
//
#pragma once

#include <cstdint>

#include "xelogen/ir/node.hpp"

namespace xelogen
{

class Graph;

/**
 * An Int output.
 */
class IntValue
{
public:
  /// @throws BuildError (TypeMismatch) if `output` is not an Int output
  explicit IntValue(const OutputPort & output);

  [[nodiscard]] const OutputPort & output() const noexcept { return output_; }

  /// this + literal
  [[nodiscard]] IntValue plus(int64_t value) const;

  /// this + other
  [[nodiscard]] IntValue plus(const IntValue & other) const;

private:
  OutputPort output_;
};

/**
 * A Slot output.
 */
class SlotValue
{
public:
  /// @throws BuildError (TypeMismatch) if `output` is not a Slot output
  explicit SlotValue(const OutputPort & output);

  /// The graph's root slot
  [[nodiscard]] static SlotValue root(Graph & graph);

  [[nodiscard]] const OutputPort & output() const noexcept { return output_; }

  /// Number of children of this slot (NumChildren node)
  [[nodiscard]] IntValue num_children() const;

private:
  OutputPort output_;
};

}  // namespace xelogen
