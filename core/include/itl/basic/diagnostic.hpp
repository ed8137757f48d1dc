// itl/basic/diagnostic.hpp - Diagnostic types for the schema pipeline
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "itl/basic/source_manager.hpp"

namespace itl
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Pipeline stage that produced a diagnostic.
 *
 * Stages are ordered: a document that fails at one stage never reaches the
 * next one, so a bag never mixes errors from different stages.
 */
enum class Stage : uint8_t {
  Parse,       ///< Malformed JSON text
  Structure,   ///< JSON does not match the grammar, or a name does not resolve
  Validation,  ///< Semantic rule violated on a well-formed graph
};

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

enum class LabelStyle {
  Primary,    // Direct location of the problem
  Secondary,  // Related location (previous definition, other field, ...)
};

/**
 * A location attached to a diagnostic.
 *
 * Most locations are document paths (e.g. "types[3].fields[1].type").
 * Parse errors carry a byte range instead.
 */
struct Label
{
  std::string path;
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Stage stage = Stage::Validation;
  Severity severity = Severity::Error;
  std::string rule;     // e.g., "label-overlap"
  std::string message;  // detail

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] std::string_view path() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }
};

[[nodiscard]] std::string_view to_string(Stage stage) noexcept;
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic through a fluent interface and registers it into the
 * bag when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_range(SourceRange range);

  DiagnosticBuilder & with_secondary_label(std::string path, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(
    Stage stage, std::string rule, std::string path, std::string message);
  DiagnosticBuilder report_warning(
    Stage stage, std::string rule, std::string path, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] std::vector<Diagnostic> from_stage(Stage stage) const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;
  [[nodiscard]] size_t error_count() const;

  /// Count diagnostics (any severity) carrying the given rule code
  [[nodiscard]] size_t count_rule(std::string_view rule) const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Stage stage, Severity severity, std::string rule, std::string path, std::string message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace itl
