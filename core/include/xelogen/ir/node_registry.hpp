// xelogen/ir/node_registry.hpp - Node schema registry
//
// Read-only lookup from a node type name to its NodeSpec. Filled before a
// construction session starts (built-in catalog, YAML catalogs) and only read
// afterwards.
//
#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "xelogen/ir/node_spec.hpp"

namespace xelogen
{

/// Shared, immutable handle to a node schema
using NodeSpecPtr = std::shared_ptr<const NodeSpec>;

/**
 * Registry of all known node types.
 */
class NodeRegistry
{
public:
  NodeRegistry() = default;

  // ===========================================================================
  // Definition
  // ===========================================================================

  /**
   * Define a node type.
   *
   * @param spec The schema to register
   * @return true if defined successfully, false if the name already exists
   */
  bool define(NodeSpec spec);

  // ===========================================================================
  // Lookup
  // ===========================================================================

  /**
   * Look up a node type by name.
   *
   * @return Pointer to the spec if found, nullptr otherwise
   */
  [[nodiscard]] const NodeSpec * lookup(std::string_view name) const;

  /**
   * Get the shared spec of a node type.
   *
   * @throws BuildError (UnknownNodeType) if the name is not registered
   */
  [[nodiscard]] const NodeSpecPtr & spec_of(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return specs_.size(); }

  /// All registered specs, sorted by name
  [[nodiscard]] std::vector<const NodeSpec *> all_specs() const;

private:
  // Keys view the name stored inside the (heap-allocated, immutable) spec.
  std::unordered_map<std::string_view, NodeSpecPtr> specs_;
};

/**
 * Register the standard node catalog (RootSlot, Pulse, If, Plus<Int>, ...).
 *
 * Entries whose name is already defined are left untouched.
 */
void register_builtin_nodes(NodeRegistry & registry);

}  // namespace xelogen
