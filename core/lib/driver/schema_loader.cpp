// itl/driver/schema_loader.cpp - Schema pipeline driver implementation
//
#include "itl/driver/schema_loader.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "itl/sema/semantic_validator.hpp"
#include "itl/syntax/json_reader.hpp"

namespace itl
{

LoadResult SchemaLoader::load_file(const std::filesystem::path & file, const LoadOptions & options)
{
  LoadResult result;
  result.source = SourceFile(file, std::string());

  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    result.diagnostics.report_error(
      Stage::Parse, "io-error", std::string(), "file not found: " + file.string());
    return result;
  }

  std::ifstream in(file, std::ios::in | std::ios::binary);
  if (!in) {
    result.diagnostics.report_error(
      Stage::Parse, "io-error", std::string(), "cannot open file: " + file.string());
    return result;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    result.diagnostics.report_error(
      Stage::Parse, "io-error", std::string(), "failed to read file: " + file.string());
    return result;
  }

  result.source.set_content(ss.str());
  run_pipeline(result, options);
  return result;
}

LoadResult SchemaLoader::load_source(
  std::string text, const LoadOptions & options, std::filesystem::path name)
{
  LoadResult result;
  result.source = SourceFile(std::move(name), std::move(text));
  run_pipeline(result, options);
  return result;
}

void SchemaLoader::run_pipeline(LoadResult & result, const LoadOptions & options)
{
  // Stage 1: JSON
  std::optional<nlohmann::json> root = parse_json(result.source, result.diagnostics);
  if (!root || result.diagnostics.has_errors()) {
    return;
  }

  // Stage 2: type graph
  TypeGraphBuilder builder(&result.diagnostics, options.grammar);
  std::unique_ptr<Schema> schema = builder.build(*root);
  if (!schema) {
    return;
  }

  // Stage 3: semantic rules
  SemanticValidator validator(&result.diagnostics);
  if (!validator.validate(*schema)) {
    return;
  }

  result.schema = std::move(schema);
  result.success = true;
}

LoadResult parse_and_validate(std::string_view bytes, const LoadOptions & options)
{
  return SchemaLoader::load_source(std::string(bytes), options);
}

}  // namespace itl
