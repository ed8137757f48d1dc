// itl/syntax/json_reader.hpp - JSON text -> generic JSON value tree
#pragma once

#include <nlohmann/json.hpp>
#include <optional>

#include "itl/basic/diagnostic.hpp"
#include "itl/basic/document_path.hpp"
#include "itl/basic/source_manager.hpp"

namespace itl
{

/**
 * Parse the text of a document into a JSON value tree.
 *
 * This stage knows nothing about the ITL grammar. A syntax error is fatal:
 * it is reported as a Stage::Parse `json-syntax` error with the byte range of
 * the offending character and nullopt is returned. Repeated keys in one
 * object are reported as `duplicate-key` warnings; the last value wins.
 *
 * @param source The document text
 * @param diags Receives parse diagnostics
 * @return The value tree, or nullopt on malformed JSON
 */
[[nodiscard]] std::optional<nlohmann::json> parse_json(
  const SourceFile & source, DiagnosticBag & diags);

}  // namespace itl
