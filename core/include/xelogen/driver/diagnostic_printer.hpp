// xelogen/driver/diagnostic_printer.hpp
//
// Prints lint diagnostics with their graph locations in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "xelogen/basic/diagnostic.hpp"

namespace xelogen
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[L003]: Name input for WriteDynVar<Int> ("Meow") does not contain a '/' separator
 *     --> node 4 <WriteDynVar<Int>>.name
 *         |
 *         ^ unqualified variable name
 *         - node 5 <StringInput>: name literal defined here
 *         |
 *      = help: qualify the name with its variable space, e.g. "World/Meow"
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by node identity.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label, bool is_primary_location);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

/// "node 4 <WriteDynVar<Int>>.name", or "<graph>" for a location without a node
[[nodiscard]] std::string format_location(const GraphLocation & location);

}  // namespace xelogen
