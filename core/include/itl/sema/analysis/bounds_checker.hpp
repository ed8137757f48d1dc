// itl/sema/analysis/bounds_checker.hpp - Numeric parameter sanity
//
// Covers the parameters of scalar and sequence kinds: sizes and capacities,
// sequence dimensions, fixed-point digits/scale/base, integer widths, legacy
// encodings, and the widths and values of the legacy enum and bitset kinds.
//
#pragma once

#include <cstdint>
#include <optional>

#include "itl/schema/schema.hpp"
#include "itl/schema/visitor.hpp"
#include "itl/sema/analysis/checker_base.hpp"

namespace itl
{

class BoundsChecker : public CheckerBase, public ConstTypeVisitor<BoundsChecker>
{
public:
  explicit BoundsChecker(DiagnosticBag * diags = nullptr) : CheckerBase(diags) {}

  /**
   * Check every definition of the schema.
   *
   * @return true if no errors occurred
   */
  bool check(const Schema & schema);

  // ===========================================================================
  // Visitor Methods
  // ===========================================================================

  void visit_int(const IntType * def);
  void visit_float(const FloatType * def);
  void visit_fixed(const FixedType * def);
  void visit_sequence(const SequenceType * def);
  void visit_string(const StringType * def);
  void visit_enum(const EnumType * def);
  void visit_bitset(const BitsetType * def);

private:
  /// size <= capacity, both non-negative
  void check_size_capacity(
    const TypeDef & def, const std::optional<int64_t> & size,
    const std::optional<int64_t> & capacity);
};

}  // namespace itl
