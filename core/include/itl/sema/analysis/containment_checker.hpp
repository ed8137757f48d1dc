// itl/sema/analysis/containment_checker.hpp - Finite representation check
//
// A type that contains itself by value, with no optional field, union
// alternative or variable-length sequence to end the recursion, has no finite
// value. Such reference cycles are reported as `infinite-type`.
//
// Reference cycles that do have a base case (an optional field, a union with a
// non-recursive alternative, a sequence of variable length) are permitted.
//
#pragma once

#include <cstddef>
#include <unordered_set>

#include "itl/schema/schema.hpp"
#include "itl/sema/analysis/checker_base.hpp"

namespace itl
{

class ContainmentChecker : public CheckerBase
{
public:
  explicit ContainmentChecker(DiagnosticBag * diags = nullptr) : CheckerBase(diags) {}

  /**
   * Check every definition of the schema.
   *
   * @return true if no errors occurred
   */
  bool check(const Schema & schema);

  /**
   * Compute the set of definitions that have at least one finite value.
   *
   * Least fixpoint: scalars are representable; a record when all its required
   * fields are; a union when any field is; a sequence when it may be empty
   * (no fixed size, or a zero size) or its element is.
   */
  [[nodiscard]] static std::unordered_set<const TypeDef *> representable_types(
    const Schema & schema);
};

}  // namespace itl
