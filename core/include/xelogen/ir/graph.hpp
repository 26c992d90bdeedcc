// xelogen/ir/graph.hpp - Node graph (one construction session)
#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

#include "xelogen/flow/branch_stack.hpp"
#include "xelogen/ir/node.hpp"
#include "xelogen/ir/node_registry.hpp"

namespace xelogen
{

/**
 * An ordered collection of nodes built in one construction session.
 *
 * The graph owns its nodes, assigns their identities (insertion index), caches
 * the root slot node, and holds the session's branch nesting stack. Graphs
 * are independent of each other: nothing is shared between sessions except
 * the immutable node specs.
 *
 * Example:
 * @code
 *   NodeRegistry registry;
 *   register_builtin_nodes(registry);
 *   Graph graph(registry);
 *   Node & count = graph.add_node("NumChildren");
 *   count.bind_to_node("slot", graph.root());
 * @endcode
 */
class Graph
{
public:
  /// `registry` must outlive the graph.
  explicit Graph(const NodeRegistry & registry) : registry_(registry) {}

  // Nodes keep a back-pointer to their graph.
  Graph(const Graph &) = delete;
  Graph & operator=(const Graph &) = delete;
  Graph(Graph &&) = delete;
  Graph & operator=(Graph &&) = delete;
  ~Graph() = default;

  /**
   * Create a node of the given type and append it to the graph.
   *
   * @throws BuildError (UnknownNodeType) if the type is not registered
   */
  Node & add_node(std::string_view type_name);

  /// The graph's RootSlot node, created on first request.
  Node & root();

  /// Nodes in insertion order (node(i)->id() == i)
  [[nodiscard]] const std::vector<std::unique_ptr<Node>> & nodes() const noexcept
  {
    return nodes_;
  }

  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }

  /// Node by identity, nullptr if out of range
  [[nodiscard]] Node * node(NodeId id) const noexcept;

  [[nodiscard]] const NodeRegistry & registry() const noexcept { return registry_; }

  [[nodiscard]] BranchStack & branch_stack() noexcept { return branches_; }
  [[nodiscard]] const BranchStack & branch_stack() const noexcept { return branches_; }

private:
  const NodeRegistry & registry_;
  std::vector<std::unique_ptr<Node>> nodes_;
  Node * root_ = nullptr;
  BranchStack branches_;
};

/// Type name of the root slot node
inline constexpr std::string_view k_root_slot_type = "RootSlot";

}  // namespace xelogen
