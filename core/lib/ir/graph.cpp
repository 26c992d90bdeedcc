// xelogen/ir/graph.cpp - Node graph
#include "xelogen/ir/graph.hpp"

namespace xelogen
{

Node & Graph::add_node(std::string_view type_name)
{
  const NodeSpecPtr & spec = registry_.spec_of(type_name);
  nodes_.push_back(std::make_unique<Node>(Node::CreationKey(), *this, spec, nodes_.size()));
  return *nodes_.back();
}

Node & Graph::root()
{
  if (root_ == nullptr) {
    root_ = &add_node(k_root_slot_type);
  }
  return *root_;
}

Node * Graph::node(NodeId id) const noexcept
{
  return id < nodes_.size() ? nodes_[id].get() : nullptr;
}

}  // namespace xelogen
