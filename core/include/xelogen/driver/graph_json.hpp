// xelogen/driver/graph_json.hpp - JSON debug dump of a finished graph
#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace xelogen
{

class Graph;

/**
 * Convert a graph to JSON for inspection.
 *
 * Shape:
 * @code
 *   {"nodes": [
 *     {"id": 3, "type": "WriteDynVar<Int>",
 *      "inputs": [{"name": "write", "sources": []},
 *                 {"name": "slot", "sources": [{"node": 1, "output": "*"}]}, ...],
 *      "content": null}
 *   ]}
 * @endcode
 * Nodes appear in identity order and inputs in declaration order.
 */
[[nodiscard]] nlohmann::json graph_to_json(const Graph & graph);

/// graph_to_json(graph).dump(indent)
[[nodiscard]] std::string dump_graph_json(const Graph & graph, int indent = 2);

}  // namespace xelogen
