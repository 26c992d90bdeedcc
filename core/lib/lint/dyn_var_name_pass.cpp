// xelogen/lint/dyn_var_name_pass.cpp - Naming convention of dynamic variables
#include "xelogen/lint/dyn_var_name_pass.hpp"

#include <fmt/core.h>

#include "xelogen/ir/graph.hpp"

namespace xelogen
{

namespace
{

constexpr std::string_view k_write_dyn_var_prefix = "WriteDynVar";
constexpr std::string_view k_name_input = "name";
constexpr std::string_view k_string_literal = "StringInput";

bool is_write_dyn_var(const Node & node)
{
  return node.type_name().substr(0, k_write_dyn_var_prefix.size()) == k_write_dyn_var_prefix;
}

}  // namespace

size_t DynVarNamePass::run(const Graph & graph, DiagnosticBag * diags) const
{
  size_t warnings = 0;

  for (const auto & node : graph.nodes()) {
    if (!is_write_dyn_var(*node) || !node->spec().find_input(k_name_input)) {
      continue;
    }

    const auto sources = node->bound(k_name_input);
    if (sources.empty()) {
      ++warnings;
      if (diags) {
        diags
          ->report_warning(
            location_of(*node, k_name_input),
            fmt::format("Node {} has no name input connected", node->type_name()),
            "name is not connected")
          .with_code("L001");
      }
      continue;
    }

    const OutputPort & source = sources.front();
    if (source.node().type_name() != k_string_literal) {
      continue;
    }

    const auto & content = source.node().content();
    if (!content || !content->is_string() || content->as_string().empty()) {
      ++warnings;
      if (diags) {
        diags
          ->report_warning(
            location_of(*node, k_name_input),
            fmt::format("Name input for {} is empty", node->type_name()), "empty name")
          .with_code("L002")
          .with_secondary_label(location_of(source.node()), "name literal defined here");
      }
      continue;
    }

    const std::string_view varname = content->as_string();
    if (varname.find('/') == std::string_view::npos) {
      ++warnings;
      if (diags) {
        diags
          ->report_warning(
            location_of(*node, k_name_input),
            fmt::format(
              "Name input for {} (\"{}\") does not contain a '/' separator", node->type_name(),
              varname),
            "unqualified variable name")
          .with_code("L003")
          .with_secondary_label(location_of(source.node()), "name literal defined here")
          .with_help(fmt::format(
            "qualify the name with its variable space, e.g. \"World/{}\"", varname));
      }
    }
  }

  return warnings;
}

}  // namespace xelogen
