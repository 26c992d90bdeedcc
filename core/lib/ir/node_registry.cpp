// xelogen/ir/node_registry.cpp - Node schema registry
#include "xelogen/ir/node_registry.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "xelogen/basic/build_error.hpp"

namespace xelogen
{

bool NodeRegistry::define(NodeSpec spec)
{
  if (contains(spec.name)) {
    return false;
  }
  auto ptr = std::make_shared<const NodeSpec>(std::move(spec));
  const std::string_view key = ptr->name;
  specs_.emplace(key, std::move(ptr));
  return true;
}

const NodeSpec * NodeRegistry::lookup(std::string_view name) const
{
  auto it = specs_.find(name);
  return it != specs_.end() ? it->second.get() : nullptr;
}

const NodeSpecPtr & NodeRegistry::spec_of(std::string_view name) const
{
  auto it = specs_.find(name);
  if (it == specs_.end()) {
    throw BuildError(ErrorCode::UnknownNodeType, "no node type named '" + std::string(name) + "'");
  }
  return it->second;
}

std::vector<const NodeSpec *> NodeRegistry::all_specs() const
{
  std::vector<const NodeSpec *> result;
  result.reserve(specs_.size());
  for (const auto & [_, spec] : specs_) {
    result.push_back(spec.get());
  }
  std::sort(result.begin(), result.end(), [](const NodeSpec * a, const NodeSpec * b) {
    return a->name < b->name;
  });
  return result;
}

}  // namespace xelogen
