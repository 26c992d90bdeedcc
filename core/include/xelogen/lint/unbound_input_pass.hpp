// xelogen/lint/unbound_input_pass.hpp - Unconnected data inputs
#pragma once

#include "xelogen/lint/lint_pass.hpp"

namespace xelogen
{

/**
 * Reports scalar data inputs left unconnected (code L010).
 *
 * List inputs may legitimately be empty and impulse inputs only mark entry
 * points, so both are ignored.
 */
class UnboundInputPass final : public LintPass
{
public:
  [[nodiscard]] std::string_view name() const noexcept override { return "unbound-input"; }

  size_t run(const Graph & graph, DiagnosticBag * diags) const override;
};

}  // namespace xelogen
