// xelogen/flow/impulse_chain.cpp - Sequential impulse wiring
#include "xelogen/flow/impulse_chain.hpp"

#include <fmt/core.h>

#include "xelogen/basic/build_error.hpp"

namespace xelogen
{

namespace
{

const OutputPort & require_impulse(const OutputPort & impulse)
{
  if (impulse.datatype() != Datatype::Impulse) {
    throw BuildError(
      ErrorCode::NotAnImpulse, fmt::format(
                                 "output '{}' of {} is not an impulse", impulse.name(),
                                 impulse.node().describe()));
  }
  return impulse;
}

}  // namespace

ImpulseChain::ImpulseChain(const OutputPort & impulse) : current_(require_impulse(impulse)) {}

ImpulseChain & ImpulseChain::append(Node & node)
{
  const std::string_view input = node.first_input_impulse();
  const OutputPort next = node.first_output_impulse();
  node.bind(input, current_);
  current_ = next;
  history_.push_back(&node);
  return *this;
}

}  // namespace xelogen
