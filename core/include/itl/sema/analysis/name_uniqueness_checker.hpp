// itl/sema/analysis/name_uniqueness_checker.hpp - Member name uniqueness
//
// Field names are unique within their record or union; enum value names and
// values, and bitset flag names and bits, are unique within their type.
// Type names are checked by the builder when they are registered.
//
#pragma once

#include "itl/schema/schema.hpp"
#include "itl/sema/analysis/checker_base.hpp"

namespace itl
{

class NameUniquenessChecker : public CheckerBase
{
public:
  explicit NameUniquenessChecker(DiagnosticBag * diags = nullptr) : CheckerBase(diags) {}

  /**
   * Check every record, union, enum and bitset of the schema.
   *
   * Each duplicate is reported at its later position, with the first
   * occurrence as a secondary label.
   *
   * @return true if no errors occurred
   */
  bool check(const Schema & schema);

private:
  void check_record(const RecordType & def);
  void check_union(const UnionType & def);
  void check_enum(const EnumType & def);
  void check_bitset(const BitsetType & def);
};

}  // namespace itl
