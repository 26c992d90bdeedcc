// xelogen/ir/node.hpp - Graph nodes and port handles
//
// A Node is an instance of a NodeSpec inside a Graph. Ports are not stored:
// OutputPort and InputPort are transient (node, slot name) handles that carry
// the wiring operations. All wiring goes through Node::bind, which enforces
// the arity and type rules.
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "xelogen/ir/content.hpp"
#include "xelogen/ir/datatype.hpp"
#include "xelogen/ir/node_registry.hpp"

namespace xelogen
{

class Graph;
class Node;
class Operand;

/// Node identity: the 0-based insertion index in the owning graph
using NodeId = size_t;

// ============================================================================
// Port Handles
// ============================================================================

/**
 * Handle to a declared output of a node.
 */
class OutputPort
{
public:
  [[nodiscard]] const Node & node() const noexcept { return *node_; }
  [[nodiscard]] NodeId node_id() const noexcept;
  [[nodiscard]] std::string_view name() const noexcept { return name_; }

  /// Declared datatype of this output
  [[nodiscard]] Datatype datatype() const;

  /**
   * Combine this output with an operand (literal or another output).
   *
   * Creates and wires a new combinator node in the owning graph.
   * See combine() in xelogen/ir/combine.hpp.
   */
  Node & combine(const Operand & operand) const;

  friend bool operator==(const OutputPort & a, const OutputPort & b) noexcept
  {
    return a.node_ == b.node_ && a.name_ == b.name_;
  }
  friend bool operator!=(const OutputPort & a, const OutputPort & b) noexcept { return !(a == b); }

private:
  friend class Node;
  OutputPort(const Node & node, std::string_view name) noexcept : node_(&node), name_(name) {}

  const Node * node_;
  std::string_view name_;  // views the name stored in the NodeSpec
};

/**
 * Handle to a declared input of a node.
 *
 * datatype() is the element type for list inputs: the type an output must
 * have to be bound here.
 */
class InputPort
{
public:
  [[nodiscard]] Node & node() const noexcept { return *node_; }
  [[nodiscard]] std::string_view name() const noexcept { return name_; }

  [[nodiscard]] Datatype declared_type() const;
  [[nodiscard]] Datatype datatype() const { return scalar_type(declared_type()); }
  [[nodiscard]] bool is_list() const { return xelogen::is_list(declared_type()); }

  /// Bind an output to this input (Node::bind)
  void connect(const OutputPort & source) const;

  /// Bind the first matching output of `source` (Node::bind_to_node)
  void connect(const Node & source) const;

  /**
   * Append to a list input.
   *
   * @throws BuildError (TypeMismatch) if this is not a list input
   */
  void append(const OutputPort & source) const;
  void append(const Node & source) const;

  /// Outputs bound to this input, in bind order
  [[nodiscard]] gsl::span<const OutputPort> bound() const;

private:
  friend class Node;
  InputPort(Node & node, std::string_view name) noexcept : node_(&node), name_(name) {}

  void require_list() const;

  Node * node_;
  std::string_view name_;
};

/// Result of a name lookup that may resolve to either direction
using Port = std::variant<OutputPort, InputPort>;

// ============================================================================
// Node
// ============================================================================

/**
 * A typed vertex in a Graph.
 *
 * Nodes are created only by Graph::add_node, which assigns the identity and
 * keeps ownership. Nodes are never copied or moved, so port handles and
 * bindings may refer to them by address for the lifetime of the graph.
 */
class Node
{
public:
  /// Construction token; only Graph can create one
  class CreationKey
  {
    friend class Graph;
    CreationKey() {}  // NOLINT(modernize-use-equals-default)
  };

  Node(CreationKey key, Graph & graph, NodeSpecPtr spec, NodeId id);

  Node(const Node &) = delete;
  Node & operator=(const Node &) = delete;
  Node(Node &&) = delete;
  Node & operator=(Node &&) = delete;
  ~Node() = default;

  // ===========================================================================
  // Identity
  // ===========================================================================

  [[nodiscard]] NodeId id() const noexcept { return id_; }
  [[nodiscard]] const NodeSpec & spec() const noexcept { return *spec_; }
  [[nodiscard]] std::string_view type_name() const noexcept { return spec_->name; }
  [[nodiscard]] Graph & graph() const noexcept { return *graph_; }

  /// "node 3 <PlusOne<Int>>", for messages
  [[nodiscard]] std::string describe() const;

  // ===========================================================================
  // Port Lookup
  // ===========================================================================

  /**
   * Resolve a port by name. Outputs take precedence over inputs.
   *
   * @throws BuildError (UnknownPort) if neither an output nor an input
   */
  [[nodiscard]] Port port(std::string_view name);

  /// @throws BuildError (UnknownPort)
  [[nodiscard]] OutputPort output(std::string_view name) const;

  /// @throws BuildError (UnknownPort)
  [[nodiscard]] InputPort input(std::string_view name);

  /// The conventional single output "*"
  [[nodiscard]] OutputPort only_output() const { return output("*"); }

  // ===========================================================================
  // Wiring
  // ===========================================================================

  /**
   * Bind `source` to the input named `input`.
   *
   * Scalar inputs accept one binding; list inputs append. Checks, in order:
   * UnknownPort, DuplicateBinding, ForeignNode, TypeMismatch.
   */
  void bind(std::string_view input, const OutputPort & source);

  /**
   * Bind the first output of `source` whose datatype matches the input's
   * (element) datatype.
   *
   * @throws BuildError (NoMatchingOutput) if `source` has no such output
   */
  void bind_to_node(std::string_view input, const Node & source);

  /**
   * Outputs bound to an input, in bind order.
   *
   * @throws BuildError (UnknownPort)
   */
  [[nodiscard]] gsl::span<const OutputPort> bound(std::string_view input) const;

  [[nodiscard]] bool is_bound(std::string_view input) const { return !bound(input).empty(); }

  // ===========================================================================
  // Literal Content
  // ===========================================================================

  /**
   * Set the literal content.
   *
   * @throws BuildError (NoContentSlot) if the spec declares no content type
   * @throws BuildError (ContentTypeMismatch) if the value kind differs
   */
  void set_content(ContentValue value);

  /**
   * Get the literal content (empty until set).
   *
   * @throws BuildError (NoContentSlot) if the spec declares no content type
   */
  [[nodiscard]] const std::optional<ContentValue> & get_content() const;

  /// Content without the content-slot check (empty for non-literal nodes)
  [[nodiscard]] const std::optional<ContentValue> & content() const noexcept { return content_; }

  // ===========================================================================
  // Typed Port Queries
  // ===========================================================================

  /// @throws BuildError (MissingImpulseInput)
  [[nodiscard]] std::string_view first_input_impulse() const;

  /// @throws BuildError (MissingImpulseOutput)
  [[nodiscard]] OutputPort first_output_impulse() const;

  /**
   * First declared output whose datatype is `t` (its element type if `t` is
   * a list datatype).
   *
   * @throws BuildError (NoMatchingOutput)
   */
  [[nodiscard]] OutputPort first_output_of_type(Datatype t) const;

  // ===========================================================================
  // Composition
  // ===========================================================================

  /// only_output().combine(operand)
  Node & combine(const Operand & operand);

private:
  struct InputSlot
  {
    const PortSpec * spec = nullptr;
    std::vector<OutputPort> sources;
  };

  [[nodiscard]] const InputSlot & input_slot(std::string_view name) const;
  [[nodiscard]] InputSlot & input_slot(std::string_view name);

  Graph * graph_;
  NodeSpecPtr spec_;
  NodeId id_;
  std::vector<InputSlot> inputs_;  // declaration order
  std::optional<ContentValue> content_;
};

}  // namespace xelogen
