// xelogen/driver/node_catalog.cpp - Node catalog loader implementation
//
#include "xelogen/driver/node_catalog.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <optional>

#include "xelogen/ir/node_registry.hpp"

namespace xelogen
{

namespace
{

/// Parse one {name, type} port entry
std::optional<PortSpec> parse_port(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "port entry must be a map";
    return std::nullopt;
  }
  if (!node["name"] || !node["type"]) {
    error = "port entry must have 'name' and 'type'";
    return std::nullopt;
  }

  const auto type_name = node["type"].as<std::string>();
  const auto type = datatype_from_string(type_name);
  if (!type) {
    error = fmt::format("unknown datatype '{}'", type_name);
    return std::nullopt;
  }
  return PortSpec{node["name"].as<std::string>(), *type};
}

bool parse_ports(
  const YAML::Node & list, const char * section, std::vector<PortSpec> & out, std::string & error)
{
  if (!list) {
    return true;
  }
  if (!list.IsSequence()) {
    error = fmt::format("'{}' must be a list", section);
    return false;
  }
  for (const auto & entry : list) {
    std::string port_error;
    auto port = parse_port(entry, port_error);
    if (!port) {
      error = fmt::format("{}: {}", section, port_error);
      return false;
    }
    out.push_back(std::move(*port));
  }
  return true;
}

/// Parse a single node entry
std::optional<NodeSpec> parse_node(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "node entry must be a map";
    return std::nullopt;
  }
  if (!node["name"]) {
    error = "node entry must have a 'name'";
    return std::nullopt;
  }

  NodeSpec spec;
  spec.name = node["name"].as<std::string>();

  std::string port_error;
  if (
    !parse_ports(node["inputs"], "inputs", spec.inputs, port_error) ||
    !parse_ports(node["outputs"], "outputs", spec.outputs, port_error)) {
    error = fmt::format("node '{}': {}", spec.name, port_error);
    return std::nullopt;
  }

  if (node["content"]) {
    const auto type_name = node["content"].as<std::string>();
    spec.content_type = datatype_from_string(type_name);
    if (!spec.content_type) {
      error = fmt::format("node '{}': unknown content datatype '{}'", spec.name, type_name);
      return std::nullopt;
    }
  }

  if (auto invalid = spec.validate()) {
    error = *invalid;
    return std::nullopt;
  }
  return spec;
}

CatalogLoadResult parse_root(const YAML::Node & root)
{
  if (!root["nodes"]) {
    return CatalogLoadResult::fail("catalog has no 'nodes' section");
  }
  if (!root["nodes"].IsSequence()) {
    return CatalogLoadResult::fail("nodes must be a list");
  }

  std::vector<NodeSpec> specs;
  for (const auto & entry : root["nodes"]) {
    std::string node_error;
    auto spec = parse_node(entry, node_error);
    if (!spec) {
      return CatalogLoadResult::fail("invalid node: " + node_error);
    }
    specs.push_back(std::move(*spec));
  }
  return CatalogLoadResult::ok(std::move(specs));
}

}  // namespace

CatalogLoadResult parse_node_catalog(std::string_view yaml_text)
{
  try {
    return parse_root(YAML::Load(std::string(yaml_text)));
  } catch (const YAML::Exception & e) {
    return CatalogLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

CatalogLoadResult load_node_catalog(const std::filesystem::path & catalog_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(catalog_path)) {
    return CatalogLoadResult::fail("catalog file not found: " + catalog_path.string());
  }

  try {
    return parse_root(YAML::LoadFile(catalog_path.string()));
  } catch (const YAML::Exception & e) {
    return CatalogLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::vector<std::string> merge_into(const CatalogLoadResult & catalog, NodeRegistry & registry)
{
  std::vector<std::string> duplicates;
  for (const auto & spec : catalog.specs) {
    if (!registry.define(spec)) {
      duplicates.push_back(spec.name);
    }
  }
  return duplicates;
}

}  // namespace xelogen
