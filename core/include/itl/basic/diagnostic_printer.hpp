// itl/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their document path or, for parse errors, the
// offending source line and a position marker, in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "itl/basic/diagnostic.hpp"
#include "itl/basic/source_manager.hpp"

namespace itl
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[label-overlap]: labels of union fields 'ping' and 'pong' overlap on 1
 *     --> feed.json:types[1].fields[1]
 *      |
 *      = note: types[1].fields[0]: other field
 *
 * or, for malformed JSON:
 *   error[json-syntax]: syntax error while parsing object key
 *     --> feed.json:3:7
 *      |
 *    3 |   {"name" "Flag"}
 *      |           ^
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

  /**
   * Print a single diagnostic.
   *
   * @param source Document the diagnostic refers to (may be nullptr)
   */
  void print(const Diagnostic & diag, const SourceFile * source);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by stage.
   */
  void print_all(const DiagnosticBag & diags, const SourceFile * source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace itl
