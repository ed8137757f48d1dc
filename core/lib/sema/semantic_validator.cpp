// itl/sema/semantic_validator.cpp - Semantic validation pass
#include "itl/sema/semantic_validator.hpp"

#include "itl/sema/analysis/bounds_checker.hpp"
#include "itl/sema/analysis/containment_checker.hpp"
#include "itl/sema/analysis/name_uniqueness_checker.hpp"
#include "itl/sema/analysis/union_checker.hpp"

namespace itl
{

bool SemanticValidator::validate(const Schema & schema)
{
  error_count_ = 0;

  NameUniquenessChecker names(diags_);
  (void)names.check(schema);
  error_count_ += names.error_count();

  BoundsChecker bounds(diags_);
  (void)bounds.check(schema);
  error_count_ += bounds.error_count();

  UnionChecker unions(diags_);
  (void)unions.check(schema);
  error_count_ += unions.error_count();

  ContainmentChecker containment(diags_);
  (void)containment.check(schema);
  error_count_ += containment.error_count();

  return error_count_ == 0;
}

}  // namespace itl
