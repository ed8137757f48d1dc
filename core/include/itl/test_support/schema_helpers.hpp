// itl/test_support/schema_helpers.hpp - helpers for unit/integration tests
//
// These helpers run the whole pipeline on an in-memory document and offer
// small queries over the resulting diagnostics.
//
#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "itl/basic/diagnostic.hpp"
#include "itl/driver/schema_loader.hpp"

namespace itl::test_support
{

/// Run the pipeline on `src` with the given grammar options
[[nodiscard]] inline LoadResult load(std::string src, GrammarOptions grammar = {})
{
  LoadOptions options;
  options.grammar = grammar;
  return SchemaLoader::load_source(std::move(src), options, "<test>.json");
}

/// Run the pipeline accepting the legacy grammar generation
[[nodiscard]] inline LoadResult load_legacy(std::string src)
{
  GrammarOptions grammar;
  grammar.legacy_kinds = true;
  return load(std::move(src), grammar);
}

/// Number of diagnostics (any severity) with the given rule code
[[nodiscard]] inline size_t count_rule(const DiagnosticBag & diags, std::string_view rule)
{
  return diags.count_rule(rule);
}

/// First diagnostic with the given rule code, or nullptr
[[nodiscard]] inline const Diagnostic * find_rule(const DiagnosticBag & diags, std::string_view rule)
{
  const auto & all = diags.all();
  const auto it =
    std::find_if(all.begin(), all.end(), [&](const Diagnostic & d) { return d.rule == rule; });
  return it != all.end() ? &*it : nullptr;
}

/// Every diagnostic with the given rule code
[[nodiscard]] inline std::vector<Diagnostic> all_with_rule(
  const DiagnosticBag & diags, std::string_view rule)
{
  std::vector<Diagnostic> out;
  for (const auto & d : diags) {
    if (d.rule == rule) {
      out.push_back(d);
    }
  }
  return out;
}

/// Whether any error message contains `needle`
[[nodiscard]] inline bool has_error_containing(const DiagnosticBag & diags, std::string_view needle)
{
  const auto & all = diags.all();
  return std::any_of(all.begin(), all.end(), [&](const Diagnostic & d) {
    return d.severity == Severity::Error && d.message.find(needle) != std::string::npos;
  });
}

/// Rules of all diagnostics, in report order (for failure messages)
[[nodiscard]] inline std::string rules_of(const DiagnosticBag & diags)
{
  std::string out;
  for (const auto & d : diags) {
    if (!out.empty()) out += ", ";
    out += d.rule + "@" + std::string(d.path());
  }
  return out;
}

}  // namespace itl::test_support
