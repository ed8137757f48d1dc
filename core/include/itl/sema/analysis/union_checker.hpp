// itl/sema/analysis/union_checker.hpp - Union discriminator and label rules
//
// For every union:
// - at least one field
// - a discriminator of a kind that has enumerable values
// - every label is a legal value of the discriminator
// - label sets of distinct fields are disjoint
// - at most one field has an empty label set (the default)
//
#pragma once

#include <optional>
#include <string>

#include "itl/schema/schema.hpp"
#include "itl/sema/analysis/checker_base.hpp"

namespace itl
{

class UnionChecker : public CheckerBase
{
public:
  explicit UnionChecker(DiagnosticBag * diags = nullptr) : CheckerBase(diags) {}

  /**
   * Check every union of the schema.
   *
   * @return true if no errors occurred
   */
  bool check(const Schema & schema);

  /**
   * Map a label to the discriminator's value space.
   *
   * Enum value names become their integer value and single-character rune
   * strings become their code point, so labels denoting the same value
   * compare equal.
   *
   * @param label The label as written
   * @param discriminator The resolved discriminator type
   * @param reason Receives why the label is illegal
   * @return The normalized label, or nullopt if it is not a legal value
   */
  [[nodiscard]] static std::optional<LabelValue> normalize_label(
    const LabelValue & label, const TypeDef & discriminator, std::string & reason);

  /// byte, bool, int, string and the legacy rune and enum kinds
  [[nodiscard]] static bool is_discriminator_kind(TypeKind kind) noexcept;

private:
  void check_union(const UnionType & def);
  void check_defaults(const UnionType & def);
};

}  // namespace itl
