// xelogen/ir/builtin_nodes.cpp - Standard node catalog
#include <utility>

#include "xelogen/ir/node_registry.hpp"

namespace xelogen
{

namespace
{

NodeSpec make_spec(
  std::string name, std::vector<PortSpec> inputs, std::vector<PortSpec> outputs,
  std::optional<Datatype> content_type = std::nullopt)
{
  NodeSpec spec;
  spec.name = std::move(name);
  spec.inputs = std::move(inputs);
  spec.outputs = std::move(outputs);
  spec.content_type = content_type;
  return spec;
}

}  // namespace

void register_builtin_nodes(NodeRegistry & registry)
{
  using D = Datatype;

  registry.define(make_spec("RootSlot", {}, {{"*", D::Slot}}));
  registry.define(make_spec("NumChildren", {{"slot", D::Slot}}, {{"*", D::Int}}));
  registry.define(make_spec(
    "WriteDynVar<Int>",
    {
      {"write", D::ImpulseList},
      {"slot", D::Slot},
      {"name", D::String},
      {"value", D::Int},
    },
    {{"success", D::Impulse}, {"fail", D::Impulse}}));
  registry.define(make_spec("Pulse", {}, {{"*", D::Impulse}}));

  // Literal holders
  registry.define(make_spec("StringInput", {}, {{"*", D::String}}, D::String));
  registry.define(make_spec("IntInput", {}, {{"*", D::Int}}, D::Int));
  registry.define(make_spec("BoolInput", {}, {{"*", D::Bool}}, D::Bool));

  registry.define(make_spec("ImpulseDisplay", {{"impulse", D::ImpulseList}}, {}));

  // Combinators
  registry.define(make_spec("PlusOne<Int>", {{"value", D::Int}}, {{"*", D::Int}}));
  registry.define(make_spec("Plus<String>", {{"values", D::StringList}}, {{"*", D::String}}));
  registry.define(make_spec("Plus<Int>", {{"values", D::IntList}}, {{"*", D::Int}}));

  registry.define(make_spec(
    "If", {{"impulse", D::ImpulseList}, {"condition", D::Bool}},
    {{"true", D::Impulse}, {"false", D::Impulse}}));
}

}  // namespace xelogen
