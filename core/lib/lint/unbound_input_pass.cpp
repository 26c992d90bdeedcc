// xelogen/lint/unbound_input_pass.cpp - Unconnected data inputs
#include "xelogen/lint/unbound_input_pass.hpp"

#include <fmt/core.h>

#include "xelogen/ir/graph.hpp"

namespace xelogen
{

size_t UnboundInputPass::run(const Graph & graph, DiagnosticBag * diags) const
{
  size_t warnings = 0;

  for (const auto & node : graph.nodes()) {
    for (const auto & in : node->spec().inputs) {
      if (is_list(in.type) || in.type == Datatype::Impulse) {
        continue;
      }
      if (node->is_bound(in.name)) {
        continue;
      }
      ++warnings;
      if (diags) {
        diags
          ->report_warning(
            location_of(*node, in.name),
            fmt::format(
              "Input '{}' ({}) of {} is not connected", in.name, to_string(in.type),
              node->describe()),
            "not connected")
          .with_code("L010");
      }
    }
  }

  return warnings;
}

}  // namespace xelogen
