// itl/basic/diagnostic.cpp - Diagnostic implementation
#include "itl/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace itl
{

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

std::string_view Diagnostic::path() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->path;
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->range;
}

std::string_view to_string(Stage stage) noexcept
{
  switch (stage) {
    case Stage::Parse:
      return "parse";
    case Stage::Structure:
      return "structure";
    case Stage::Validation:
      return "validation";
  }
  return "unknown";
}

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "unknown";
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

DiagnosticBuilder & DiagnosticBuilder::with_range(SourceRange range)
{
  if (diagnostic_.labels.empty()) {
    diagnostic_.labels.push_back(Label{});
  }
  diagnostic_.labels.front().range = range;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(std::string path, std::string msg)
{
  diagnostic_.labels.push_back(
    Label{std::move(path), SourceRange{}, std::move(msg), LabelStyle::Secondary});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Stage stage, Severity severity, std::string rule, std::string path, std::string message)
{
  Diagnostic d;
  d.stage = stage;
  d.severity = severity;
  d.rule = std::move(rule);
  d.message = std::move(message);
  d.labels.push_back(Label{std::move(path), SourceRange{}, "", LabelStyle::Primary});
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  Stage stage, std::string rule, std::string path, std::string message)
{
  return report(stage, Severity::Error, std::move(rule), std::move(path), std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_warning(
  Stage stage, std::string rule, std::string path, std::string message)
{
  return report(stage, Severity::Warning, std::move(rule), std::move(path), std::move(message));
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::from_stage(Stage stage) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [stage](const Diagnostic & d) { return d.stage == stage; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

size_t DiagnosticBag::error_count() const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
      return d.severity == Severity::Error;
    }));
}

size_t DiagnosticBag::count_rule(std::string_view rule) const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [rule](const Diagnostic & d) {
      return d.rule == rule;
    }));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace itl
