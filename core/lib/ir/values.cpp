// xelogen/ir/values.cpp - Typed views over node outputs
#include "xelogen/ir/values.hpp"

#include <fmt/core.h>

#include "xelogen/basic/build_error.hpp"
#include "xelogen/ir/combine.hpp"
#include "xelogen/ir/graph.hpp"

namespace xelogen
{

namespace
{

const OutputPort & require(const OutputPort & output, Datatype type)
{
  if (output.datatype() != type) {
    throw BuildError(
      ErrorCode::TypeMismatch,
      fmt::format(
        "output '{}' of {} is {}, expected {}", output.name(), output.node().describe(),
        to_string(output.datatype()), to_string(type)));
  }
  return output;
}

}  // namespace

IntValue::IntValue(const OutputPort & output) : output_(require(output, Datatype::Int)) {}

IntValue IntValue::plus(int64_t value) const
{
  return IntValue(output_.combine(IntegerLiteral{value}).only_output());
}

IntValue IntValue::plus(const IntValue & other) const
{
  return IntValue(output_.combine(other.output_).only_output());
}

SlotValue::SlotValue(const OutputPort & output) : output_(require(output, Datatype::Slot)) {}

SlotValue SlotValue::root(Graph & graph) { return SlotValue(graph.root().only_output()); }

IntValue SlotValue::num_children() const
{
  Node & node = output_.node().graph().add_node("NumChildren");
  node.bind("slot", output_);
  return IntValue(node.only_output());
}

}  // namespace xelogen
