// xelogen/driver/graph_json.cpp - JSON debug dump
//
#include "xelogen/driver/graph_json.hpp"

#include <optional>
#include <string>

#include "xelogen/ir/graph.hpp"

namespace xelogen
{

using json = nlohmann::json;

namespace
{

json content_to_json(const std::optional<ContentValue> & content)
{
  if (!content) {
    return nullptr;
  }
  switch (content->kind()) {
    case Datatype::Int:
      return content->as_int();
    case Datatype::Float:
      return content->as_float();
    case Datatype::Bool:
      return content->as_bool();
    default:
      return std::string(content->as_string());
  }
}

json node_to_json(const Node & node)
{
  json j;
  j["id"] = node.id();
  j["type"] = std::string(node.type_name());

  j["inputs"] = json::array();
  for (const auto & input : node.spec().inputs) {
    json slot;
    slot["name"] = input.name;
    slot["sources"] = json::array();
    for (const auto & source : node.bound(input.name)) {
      json edge;
      edge["node"] = source.node_id();
      edge["output"] = std::string(source.name());
      slot["sources"].push_back(std::move(edge));
    }
    j["inputs"].push_back(std::move(slot));
  }

  j["content"] = content_to_json(node.content());
  return j;
}

}  // namespace

json graph_to_json(const Graph & graph)
{
  json out;
  out["nodes"] = json::array();
  for (const auto & node : graph.nodes()) {
    out["nodes"].push_back(node_to_json(*node));
  }
  return out;
}

std::string dump_graph_json(const Graph & graph, int indent)
{
  return graph_to_json(graph).dump(indent);
}

}  // namespace xelogen
