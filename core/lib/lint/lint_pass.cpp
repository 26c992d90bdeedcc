// xelogen/lint/lint_pass.cpp - Lint engine
#include "xelogen/lint/lint_pass.hpp"

#include <algorithm>
#include <utility>

#include "xelogen/ir/graph.hpp"
#include "xelogen/lint/dyn_var_name_pass.hpp"
#include "xelogen/lint/unbound_input_pass.hpp"

namespace xelogen
{

void LintEngine::register_pass(std::unique_ptr<LintPass> pass)
{
  if (pass) {
    passes_.push_back(std::move(pass));
  }
}

size_t LintEngine::run(const Graph & graph, DiagnosticBag * diags) const
{
  size_t warnings = 0;
  for (const auto & pass : passes_) {
    warnings += pass->run(graph, diags);
  }
  return warnings;
}

std::vector<std::string_view> LintEngine::pass_names() const
{
  std::vector<std::string_view> names;
  names.reserve(passes_.size());
  for (const auto & pass : passes_) {
    names.push_back(pass->name());
  }
  return names;
}

void register_default_passes(LintEngine & engine, const std::vector<std::string> & disabled)
{
  std::vector<std::unique_ptr<LintPass>> defaults;
  defaults.push_back(std::make_unique<DynVarNamePass>());
  defaults.push_back(std::make_unique<UnboundInputPass>());

  for (auto & pass : defaults) {
    const bool off =
      std::find(disabled.begin(), disabled.end(), pass->name()) != disabled.end();
    if (!off) {
      engine.register_pass(std::move(pass));
    }
  }
}

GraphLocation location_of(const Node & node, std::string_view port)
{
  GraphLocation loc;
  loc.node_id = node.id();
  loc.node_type = std::string(node.type_name());
  loc.port = std::string(port);
  return loc;
}

}  // namespace xelogen
