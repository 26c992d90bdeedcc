// xelogen/lint/lint_pass.hpp - Lint pass interface and engine
//
// Lint passes inspect a finished graph and report advisory warnings. They
// never modify the graph and never fail construction.
//
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "xelogen/basic/diagnostic.hpp"

namespace xelogen
{

class Graph;
class Node;

/**
 * A stateless check over a finished graph.
 */
class LintPass
{
public:
  LintPass() = default;
  LintPass(const LintPass &) = delete;
  LintPass & operator=(const LintPass &) = delete;
  virtual ~LintPass() = default;

  /// Stable pass name (e.g. "dyn-var-name"), used to enable/disable passes
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /**
   * Lint the given graph.
   *
   * @param graph The graph to inspect
   * @param diags Bag receiving one warning per finding (may be nullptr)
   * @return The number of warnings found
   */
  virtual size_t run(const Graph & graph, DiagnosticBag * diags) const = 0;
};

/**
 * Session-local collection of lint passes.
 */
class LintEngine
{
public:
  LintEngine() = default;

  void register_pass(std::unique_ptr<LintPass> pass);

  /**
   * Run every registered pass, in registration order.
   *
   * @return Total number of warnings
   */
  size_t run(const Graph & graph, DiagnosticBag * diags = nullptr) const;

  [[nodiscard]] std::vector<std::string_view> pass_names() const;

  [[nodiscard]] size_t size() const noexcept { return passes_.size(); }

private:
  std::vector<std::unique_ptr<LintPass>> passes_;
};

/**
 * Register the shipped passes ("dyn-var-name", "unbound-input"), skipping the
 * ones named in `disabled`.
 */
void register_default_passes(LintEngine & engine, const std::vector<std::string> & disabled = {});

/// Location of a node's port, for diagnostics
[[nodiscard]] GraphLocation location_of(const Node & node, std::string_view port = {});

}  // namespace xelogen
