// xelogen/lint/dyn_var_name_pass.hpp - Naming convention of dynamic variables
#pragma once

#include "xelogen/lint/lint_pass.hpp"

namespace xelogen
{

/**
 * Checks the variable name given to WriteDynVar* nodes.
 *
 * A dynamic variable name should be qualified by its variable space
 * ("World/Meow"); a bare name ("Meow") binds to whichever space happens to be
 * nearest. Only names coming straight from a StringInput literal are
 * inspected.
 *
 * Codes:
 * - L001: name input not connected
 * - L002: name literal empty
 * - L003: name literal has no '/' separator
 */
class DynVarNamePass final : public LintPass
{
public:
  [[nodiscard]] std::string_view name() const noexcept override { return "dyn-var-name"; }

  size_t run(const Graph & graph, DiagnosticBag * diags) const override;
};

}  // namespace xelogen
