// xelogen/basic/diagnostic.cpp - Diagnostic implementation
#include "xelogen/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace xelogen
{

namespace
{

Diagnostic make_diagnostic(
  Severity severity, GraphLocation location, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{std::move(location), std::move(label_message), LabelStyle::Primary});
  return d;
}

}  // namespace

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

GraphLocation Diagnostic::primary_location() const
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->location;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  GraphLocation location, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{std::move(location), std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(GraphLocation location, std::string msg)
{
  return with_label(std::move(location), std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  GraphLocation location, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(
             Severity::Error, std::move(location), std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  GraphLocation location, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(
             Severity::Warning, std::move(location), std::move(message), std::move(label_message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

void DiagnosticBag::promote_warnings()
{
  for (auto & d : diagnostics_) {
    if (d.severity == Severity::Warning) {
      d.severity = Severity::Error;
    }
  }
}

}  // namespace xelogen
