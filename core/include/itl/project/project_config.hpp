// itl/project/project_config.hpp - Project configuration (itl.yaml)
//
// Parses and validates itl.yaml project files, which list the schema
// documents of a project and the grammar options used to check them.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "itl/sema/type_graph_builder.hpp"

namespace itl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Schema section.
 */
struct SchemaConfig
{
  /// Documents to check (relative to itl.yaml)
  std::vector<std::filesystem::path> documents;

  /// Accept the encoding-centric grammar generation
  bool legacy_kinds = false;

  /// Unknown object keys are errors
  bool strict_keys = true;
};

/**
 * Complete project configuration (itl.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  SchemaConfig schema;

  /// Directory containing itl.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Grammar options described by the schema section
  [[nodiscard]] GrammarOptions grammar_options() const
  {
    GrammarOptions options;
    options.legacy_kinds = schema.legacy_kinds;
    options.strict_keys = schema.strict_keys;
    return options;
  }
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an itl.yaml file.
 *
 * @param config_path Path to itl.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to itl.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Render a project configuration as itl.yaml text.
 *
 * Strings are quoted as needed, so the output always loads back through
 * load_project_config(). project_root is not written.
 */
[[nodiscard]] std::string format_project_config(const ProjectConfig & config);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "itl.yaml";

}  // namespace itl
