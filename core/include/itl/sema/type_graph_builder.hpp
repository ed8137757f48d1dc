// itl/sema/type_graph_builder.hpp - JSON value tree -> linked type graph
//
// Checks the grammar shape of every object, builds one TypeDef per
// definition, registers named definitions and links every by-name Type
// position to its definition.
//
#pragma once

#include <initializer_list>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "itl/basic/diagnostic.hpp"
#include "itl/schema/schema.hpp"
#include "itl/schema/schema_context.hpp"
#include "itl/schema/type_registry.hpp"

namespace itl
{

/**
 * Grammar generation and key policy accepted by the builder.
 */
struct GrammarOptions
{
  /// Accept rune/enum/bitset and the `encoding` key (encoding-centric generation)
  bool legacy_kinds = false;
  /// Unknown object keys are errors (warnings otherwise)
  bool strict_keys = true;
};

/**
 * Builds the type graph of one document.
 *
 * ## Processing Order
 * 1. Build every definition of Root.types, checking shapes. Named top-level
 *    definitions are registered as they are built, so duplicates are found
 *    before any reference is looked at.
 * 2. Register named inline definitions, in document order.
 * 3. Resolve every by-name Type position against the registry.
 *
 * Shape errors do not stop the walk: siblings of a malformed object are
 * still checked so that one run reports as many problems as possible.
 * Inline definitions nested deeper than k_max_nesting_depth are rejected
 * with `nesting-too-deep` instead of being walked.
 */
class TypeGraphBuilder
{
public:
  /**
   * @param diags DiagnosticBag for error reporting (nullptr for silent mode)
   * @param options Grammar generation and key policy
   */
  explicit TypeGraphBuilder(DiagnosticBag * diags = nullptr, GrammarOptions options = {});

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Build the linked graph of a document.
   *
   * @param root The parsed document
   * @return The graph, or nullptr if any structural error was reported
   */
  [[nodiscard]] std::unique_ptr<Schema> build(const nlohmann::json & root);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

  /// Deepest chain of inline definitions accepted below a top-level one
  static constexpr size_t k_max_nesting_depth = 256;

private:
  // ===========================================================================
  // Definitions
  // ===========================================================================

  /// Build a TypeDef object. Returns nullptr if its kind cannot be determined.
  TypeDef * build_type_def(const nlohmann::json & obj, const std::string & path);

  TypeDef * build_kind(TypeKind kind, const nlohmann::json & obj, const std::string & path);

  void build_int(IntType & def, const nlohmann::json & obj, const std::string & path);
  void build_float(FloatType & def, const nlohmann::json & obj, const std::string & path);
  void build_fixed(FixedType & def, const nlohmann::json & obj, const std::string & path);
  void build_sequence(SequenceType & def, const nlohmann::json & obj, const std::string & path);
  void build_string(StringType & def, const nlohmann::json & obj, const std::string & path);
  void build_record(RecordType & def, const nlohmann::json & obj, const std::string & path);
  void build_union(UnionType & def, const nlohmann::json & obj, const std::string & path);
  void build_rune(RuneType & def, const nlohmann::json & obj, const std::string & path);
  void build_enum(EnumType & def, const nlohmann::json & obj, const std::string & path);
  void build_bitset(BitsetType & def, const nlohmann::json & obj, const std::string & path);

  /// Read a Type position (name or inline definition) into `ref`
  void build_type_ref(const nlohmann::json & value, const std::string & path, TypeRef & ref);

  // ===========================================================================
  // Registration / Resolution
  // ===========================================================================

  void register_name(TypeDef * def, bool top_level);
  void resolve_references();

  // ===========================================================================
  // Shape Helpers
  // ===========================================================================

  /// Report keys of `obj` that are not in `allowed` (plus "note")
  void check_keys(
    const nlohmann::json & obj, const std::string & path,
    std::initializer_list<std::string_view> allowed);

  /// Report keys of `obj` that are not in `allowed` (plus "note")
  void check_keys(
    const nlohmann::json & obj, const std::string & path,
    const std::vector<std::string_view> & allowed);

  /// Member `key` of `obj`, or nullptr (reports missing-key)
  const nlohmann::json * require_key(
    const nlohmann::json & obj, const std::string & path, std::string_view key);

  /// Member `key` of `obj`, or nullptr
  [[nodiscard]] static const nlohmann::json * find_key(
    const nlohmann::json & obj, std::string_view key);

  std::optional<int64_t> read_int64(const nlohmann::json & value, const std::string & path);
  std::optional<IntValue> read_integer(const nlohmann::json & value, const std::string & path);
  std::optional<bool> read_bool(const nlohmann::json & value, const std::string & path);
  std::optional<std::string_view> read_string(
    const nlohmann::json & value, const std::string & path);

  /// Read a "name" member (non-empty string); empty view if absent or invalid
  std::string_view read_name(const nlohmann::json & value, const std::string & path);

  /// Keep the "note" member of `obj`, if any
  const nlohmann::json * read_note(const nlohmann::json & obj, const std::string & path);

  /// Read the legacy "encoding" member, if any (the caller admits the key)
  std::string_view read_encoding(const nlohmann::json & obj, const std::string & path);

  [[nodiscard]] std::string_view intern(std::string_view s) { return context_->intern(s); }

  // ===========================================================================
  // Reporting
  // ===========================================================================

  DiagnosticBuilder report_error(std::string rule, std::string path, std::string message);
  void report_wrong_kind(
    const std::string & path, std::string_view expected, const nlohmann::json & value);

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  DiagnosticBag * diags_;
  DiagnosticBag silent_;
  GrammarOptions options_;

  std::unique_ptr<SchemaContext> context_;
  TypeRegistry registry_;

  /// By-name Type positions awaiting resolution (arena memory, stable)
  std::vector<TypeRef *> pending_refs_;
  /// Named inline definitions, registered after the top-level ones
  std::vector<TypeDef *> inline_named_;
  /// Names of definitions that could not be built (references to them are not re-reported)
  std::unordered_set<std::string> failed_names_;
  /// Inline definitions currently open around the one being built
  size_t depth_ = 0;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace itl
