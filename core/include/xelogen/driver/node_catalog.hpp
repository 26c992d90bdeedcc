// xelogen/driver/node_catalog.hpp - Node catalog files (YAML)
//
// Loads additional node schemas from YAML documents of the form:
//
//   nodes:
//     - name: Multiply<Int>
//       inputs:  [{name: values, type: IntList}]
//       outputs: [{name: "*", type: Int}]
//       content: Int        # optional
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "xelogen/ir/node_spec.hpp"

namespace xelogen
{

class NodeRegistry;

/**
 * Result of loading a node catalog.
 */
struct CatalogLoadResult
{
  /// Parsed schemas in document order (only valid if success == true)
  std::vector<NodeSpec> specs;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static CatalogLoadResult ok(std::vector<NodeSpec> specs)
  {
    CatalogLoadResult r;
    r.specs = std::move(specs);
    r.success = true;
    return r;
  }

  static CatalogLoadResult fail(std::string msg)
  {
    CatalogLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Parse a node catalog from YAML text.
 *
 * Rejects unknown datatype names, malformed entries and specs that fail
 * NodeSpec::validate().
 */
[[nodiscard]] CatalogLoadResult parse_node_catalog(std::string_view yaml_text);

/**
 * Load a node catalog from a YAML file.
 */
[[nodiscard]] CatalogLoadResult load_node_catalog(const std::filesystem::path & catalog_path);

/**
 * Define every spec of a loaded catalog in a registry.
 *
 * @return Names that were already defined (those specs are skipped)
 */
std::vector<std::string> merge_into(const CatalogLoadResult & catalog, NodeRegistry & registry);

}  // namespace xelogen
