// xelogen/ir/combine.hpp - Composition of outputs with operands
//
// combine(source, operand) builds the node that computes "source + operand"
// and wires it into the source's graph. Dispatch is on the operand's kind;
// supporting a new kind means adding an alternative to Operand::Variant and
// the matching case to the combiner in combine.cpp.
//
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "xelogen/ir/node.hpp"

namespace xelogen
{

// ============================================================================
// Operand Kinds
// ============================================================================

struct IntegerLiteral
{
  int64_t value = 0;
};

struct StringLiteral
{
  std::string value;
};

/// An output of another node in the same graph
struct NodeOutput
{
  OutputPort output;
};

// ============================================================================
// Operand
// ============================================================================

class Operand
{
public:
  using Variant = std::variant<IntegerLiteral, StringLiteral, NodeOutput>;

  Operand(IntegerLiteral v) : value_(v) {}                            // NOLINT
  Operand(StringLiteral v) : value_(std::move(v)) {}                  // NOLINT
  Operand(NodeOutput v) : value_(v) {}                                // NOLINT
  Operand(const OutputPort & output) : value_(NodeOutput{output}) {}  // NOLINT

  static Operand integer(int64_t value) { return IntegerLiteral{value}; }
  static Operand string(std::string value) { return StringLiteral{std::move(value)}; }

  [[nodiscard]] const Variant & value() const noexcept { return value_; }

private:
  Variant value_;
};

// ============================================================================
// Combination
// ============================================================================

/**
 * Create and wire the node computing `source + operand`.
 *
 * - Integer literal on an Int output: `PlusOne<Int>` for 1, otherwise an
 *   `IntInput` literal accumulated with the source by `Plus<Int>`.
 * - String literal on a String output: a `StringInput` literal concatenated
 *   after the source by `Plus<String>`.
 * - Int output of the same graph: `Plus<Int>` over [source, operand].
 * - String output of the same graph: `Plus<String>` over [operand, source].
 *
 * @return The combinator node (the last node created)
 * @throws BuildError (TypeMismatch) if the operand's datatype differs from the source's
 * @throws BuildError (UnsupportedCombination) if no combinator exists for the datatype
 * @throws BuildError (ForeignNode) if an operand output belongs to another graph
 */
Node & combine(const OutputPort & source, const Operand & operand);

}  // namespace xelogen
