// xelogen/ir/node.cpp - Graph nodes and port handles
#include "xelogen/ir/node.hpp"

#include <fmt/core.h>

#include <utility>

#include "xelogen/basic/build_error.hpp"
#include "xelogen/ir/combine.hpp"

namespace xelogen
{

// ============================================================================
// OutputPort
// ============================================================================

NodeId OutputPort::node_id() const noexcept { return node_->id(); }

Datatype OutputPort::datatype() const { return node_->spec().find_output(name_)->type; }

// ============================================================================
// InputPort
// ============================================================================

Datatype InputPort::declared_type() const { return node_->spec().find_input(name_)->type; }

void InputPort::connect(const OutputPort & source) const { node_->bind(name_, source); }

void InputPort::connect(const Node & source) const { node_->bind_to_node(name_, source); }

void InputPort::append(const OutputPort & source) const
{
  require_list();
  node_->bind(name_, source);
}

void InputPort::append(const Node & source) const
{
  require_list();
  node_->bind_to_node(name_, source);
}

gsl::span<const OutputPort> InputPort::bound() const { return node_->bound(name_); }

void InputPort::require_list() const
{
  if (!is_list()) {
    throw BuildError(
      ErrorCode::TypeMismatch,
      fmt::format(
        "cannot append to input '{}' of {}: {} is not a list type", name_, node_->describe(),
        to_string(declared_type())));
  }
}

// ============================================================================
// Node
// ============================================================================

Node::Node(CreationKey /*key*/, Graph & graph, NodeSpecPtr spec, NodeId id)
: graph_(&graph), spec_(std::move(spec)), id_(id)
{
  inputs_.reserve(spec_->inputs.size());
  for (const auto & in : spec_->inputs) {
    inputs_.push_back(InputSlot{&in, {}});
  }
}

std::string Node::describe() const { return fmt::format("node {} <{}>", id_, spec_->name); }

Port Node::port(std::string_view name)
{
  if (const PortSpec * out = spec_->find_output(name)) {
    return OutputPort(*this, out->name);
  }
  if (const PortSpec * in = spec_->find_input(name)) {
    return InputPort(*this, in->name);
  }
  throw BuildError(
    ErrorCode::UnknownPort, fmt::format("{} has no port named '{}'", describe(), name));
}

OutputPort Node::output(std::string_view name) const
{
  const PortSpec * out = spec_->find_output(name);
  if (!out) {
    throw BuildError(
      ErrorCode::UnknownPort, fmt::format("{} has no output named '{}'", describe(), name));
  }
  return OutputPort(*this, out->name);
}

InputPort Node::input(std::string_view name)
{
  const InputSlot & slot = input_slot(name);
  return InputPort(*this, slot.spec->name);
}

const Node::InputSlot & Node::input_slot(std::string_view name) const
{
  for (const auto & slot : inputs_) {
    if (slot.spec->name == name) {
      return slot;
    }
  }
  throw BuildError(
    ErrorCode::UnknownPort, fmt::format("{} has no input named '{}'", describe(), name));
}

Node::InputSlot & Node::input_slot(std::string_view name)
{
  return const_cast<InputSlot &>(std::as_const(*this).input_slot(name));
}

void Node::bind(std::string_view input, const OutputPort & source)
{
  InputSlot & slot = input_slot(input);
  const Datatype declared = slot.spec->type;
  const bool list = is_list(declared);

  if (!list && !slot.sources.empty()) {
    throw BuildError(
      ErrorCode::DuplicateBinding,
      fmt::format(
        "input '{}' of {} is already bound to output '{}' of {}", slot.spec->name, describe(),
        slot.sources.front().name(), slot.sources.front().node().describe()));
  }

  if (&source.node().graph() != graph_) {
    throw BuildError(
      ErrorCode::ForeignNode,
      fmt::format(
        "cannot bind {} into {}: the nodes belong to different graphs",
        source.node().describe(), describe()));
  }

  const Datatype expected = scalar_type(declared);
  if (source.datatype() != expected) {
    throw BuildError(
      ErrorCode::TypeMismatch,
      fmt::format(
        "connecting output '{}' of {} (type {}) to input '{}' of {} (type {}) is not possible",
        source.name(), source.node().describe(), to_string(source.datatype()), slot.spec->name,
        describe(), to_string(expected)));
  }

  slot.sources.push_back(source);
}

void Node::bind_to_node(std::string_view input, const Node & source)
{
  const InputSlot & slot = input_slot(input);
  bind(input, source.first_output_of_type(slot.spec->type));
}

gsl::span<const OutputPort> Node::bound(std::string_view input) const
{
  const InputSlot & slot = input_slot(input);
  return gsl::span<const OutputPort>(slot.sources.data(), slot.sources.size());
}

void Node::set_content(ContentValue value)
{
  if (!spec_->content_type) {
    throw BuildError(
      ErrorCode::NoContentSlot, fmt::format("{} does not have content to set", describe()));
  }
  if (value.kind() != *spec_->content_type) {
    throw BuildError(
      ErrorCode::ContentTypeMismatch,
      fmt::format(
        "{} can only take content of type {}, and {} is not compatible", describe(),
        to_string(*spec_->content_type), to_string(value.kind())));
  }
  content_ = std::move(value);
}

const std::optional<ContentValue> & Node::get_content() const
{
  if (!spec_->content_type) {
    throw BuildError(
      ErrorCode::NoContentSlot, fmt::format("{} does not have content", describe()));
  }
  return content_;
}

std::string_view Node::first_input_impulse() const
{
  for (const auto & in : spec_->inputs) {
    if (in.type == Datatype::ImpulseList) {
      return in.name;
    }
  }
  throw BuildError(
    ErrorCode::MissingImpulseInput, fmt::format("{} has no input impulses", describe()));
}

OutputPort Node::first_output_impulse() const
{
  for (const auto & out : spec_->outputs) {
    if (out.type == Datatype::Impulse) {
      return OutputPort(*this, out.name);
    }
  }
  throw BuildError(
    ErrorCode::MissingImpulseOutput, fmt::format("{} has no output impulses", describe()));
}

OutputPort Node::first_output_of_type(Datatype t) const
{
  const Datatype wanted = scalar_type(t);
  for (const auto & out : spec_->outputs) {
    if (out.type == wanted) {
      return OutputPort(*this, out.name);
    }
  }
  throw BuildError(
    ErrorCode::NoMatchingOutput,
    fmt::format("{} has no output of type {}", describe(), to_string(wanted)));
}

Node & Node::combine(const Operand & operand) { return only_output().combine(operand); }

}  // namespace xelogen
