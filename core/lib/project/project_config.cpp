// itl/project/project_config.cpp - Project configuration implementation
//
#include "itl/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace itl
{

namespace
{

/// Read an optional boolean key of a section
bool read_flag(
  const YAML::Node & section, const char * key, const std::string & where, bool & out,
  std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    error = where + "." + key + " must be a boolean";
    return false;
  }
  try {
    out = node.as<bool>();
  } catch (const YAML::BadConversion &) {
    error = where + "." + key + " must be a boolean";
    return false;
  }
  return true;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (root.IsNull()) {
    return ConfigLoadResult::fail("configuration file is empty");
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'package' section
    if (root["package"]) {
      const YAML::Node pkg = root["package"];
      if (!pkg.IsMap()) {
        return ConfigLoadResult::fail("package must be a map");
      }
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'schema' section
    if (root["schema"]) {
      const YAML::Node schema = root["schema"];
      if (!schema.IsMap()) {
        return ConfigLoadResult::fail("schema must be a map");
      }

      if (schema["documents"]) {
        if (!schema["documents"].IsSequence()) {
          return ConfigLoadResult::fail("schema.documents must be a list");
        }
        for (const auto & doc : schema["documents"]) {
          config.schema.documents.emplace_back(doc.as<std::string>());
        }
      }

      std::string error;
      if (
        !read_flag(schema, "legacy_kinds", "schema", config.schema.legacy_kinds, error) ||
        !read_flag(schema, "strict_keys", "schema", config.schema.strict_keys, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::string format_project_config(const ProjectConfig & config)
{
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "package" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << config.package.name;
  out << YAML::Key << "version" << YAML::Value << config.package.version;
  out << YAML::EndMap;

  out << YAML::Key << "schema" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "documents" << YAML::Value << YAML::BeginSeq;
  for (const auto & doc : config.schema.documents) {
    out << doc.generic_string();
  }
  out << YAML::EndSeq;
  out << YAML::Key << "legacy_kinds" << YAML::Value << config.schema.legacy_kinds;
  out << YAML::Key << "strict_keys" << YAML::Value << config.schema.strict_keys;
  out << YAML::EndMap;

  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace itl
