// xelogen/driver/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "xelogen/driver/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <ostream>
#include <rang.hpp>
#include <vector>

namespace xelogen
{

std::string format_location(const GraphLocation & location)
{
  if (!location.is_valid()) {
    return "<graph>";
  }
  std::string out = fmt::format("node {} <{}>", *location.node_id, location.node_type);
  if (!location.port.empty()) {
    out += fmt::format(".{}", location.port);
  }
  return out;
}

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: warning[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> node N <Type>.port ===
  fmt::print(os_, "{} {}\n", gutter_arrow(), format_location(diag.primary_location()));

  fmt::print(os_, "{}\n", gutter_pipe());

  const Label * primary = diag.primary_label();
  for (const auto & label : diag.labels) {
    print_label(label, &label == primary);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  // Graph-level diagnostics (no node) go last; stable within a node.
  const auto key = [](const Diagnostic & d) {
    const GraphLocation loc = d.primary_location();
    return loc.node_id.value_or(std::numeric_limits<size_t>::max());
  };
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(),
    [&](const Diagnostic & a, const Diagnostic & b) { return key(a) < key(b); });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  std::string severity_str;
  switch (diag.severity) {
    case Severity::Error:
      severity_str = "error";
      break;
    case Severity::Warning:
      severity_str = "warning";
      break;
  }

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label, bool is_primary_location)
{
  const char marker = (label.style == LabelStyle::Primary) ? '^' : '-';

  // The primary location is already on the "-->" line.
  std::string text;
  if (!is_primary_location) {
    text = format_location(label.location);
    if (!label.message.empty()) {
      text += ": ";
    }
  }
  text += label.message;

  fmt::print(os_, "      ");
  if (use_color_) {
    if (label.style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
    fmt::print(os_, "{} {}", marker, text);
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{} {}", marker, text);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace xelogen
