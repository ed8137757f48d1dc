// itl/driver/schema_loader.hpp - Schema pipeline driver
//
// Single entry point for the pipeline: text -> JSON value tree -> linked
// type graph -> validated schema. Used by the CLI and by translators that
// embed the library.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "itl/basic/diagnostic.hpp"
#include "itl/basic/source_manager.hpp"
#include "itl/schema/schema.hpp"
#include "itl/sema/type_graph_builder.hpp"

namespace itl
{

// ============================================================================
// Load Options
// ============================================================================

struct LoadOptions
{
  /// Grammar generation and key policy
  GrammarOptions grammar;
};

// ============================================================================
// Load Result
// ============================================================================

struct LoadResult
{
  /// Whether the document is valid (no errors; warnings allowed)
  bool success = false;

  /// Collected diagnostics. Errors all come from the stage that failed.
  DiagnosticBag diagnostics;

  /// Document text (for rendering diagnostics)
  SourceFile source;

  /// The validated schema (only when success is true)
  std::unique_ptr<Schema> schema;
};

// ============================================================================
// SchemaLoader
// ============================================================================

/**
 * Driver that runs the full pipeline on one document.
 *
 * The pipeline consists of:
 * 1. JSON parsing (Stage::Parse)
 * 2. Type graph building and reference resolution (Stage::Structure)
 * 3. Semantic validation (Stage::Validation)
 *
 * Each stage runs only if the previous one reported no error. Acceptance is
 * all-or-nothing: a result never carries a schema together with errors.
 * Independent loads share no state and may run concurrently.
 */
class SchemaLoader
{
public:
  /**
   * Load a document from a file.
   *
   * A file that cannot be read yields a Stage::Parse `io-error`.
   *
   * @param file Path to the document
   * @param options Load options
   */
  [[nodiscard]] static LoadResult load_file(
    const std::filesystem::path & file, const LoadOptions & options = {});

  /**
   * Load a document from memory.
   *
   * @param text Document text
   * @param options Load options
   * @param name Name shown in diagnostics (may be empty)
   */
  [[nodiscard]] static LoadResult load_source(
    std::string text, const LoadOptions & options = {}, std::filesystem::path name = {});

private:
  /// Run the stages on result.source
  static void run_pipeline(LoadResult & result, const LoadOptions & options);
};

/**
 * Parse and validate a document held in memory.
 *
 * Equivalent to SchemaLoader::load_source(std::string(bytes), options).
 */
[[nodiscard]] LoadResult parse_and_validate(std::string_view bytes, const LoadOptions & options = {});

}  // namespace itl
