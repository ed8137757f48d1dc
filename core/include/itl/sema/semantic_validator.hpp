// itl/sema/semantic_validator.hpp - Runs every semantic rule over a linked graph
//
// The checkers are independent; all of them run regardless of earlier
// failures so that a single pass reports every violated rule.
//
#pragma once

#include <cstddef>

#include "itl/basic/diagnostic.hpp"
#include "itl/schema/schema.hpp"

namespace itl
{

class SemanticValidator
{
public:
  /**
   * @param diags DiagnosticBag for error reporting (nullptr for silent mode)
   */
  explicit SemanticValidator(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /**
   * Validate a linked graph.
   *
   * Runs name uniqueness, bounds, union and containment checks.
   *
   * @return true if no rule is violated (warnings allowed)
   */
  bool validate(const Schema & schema);

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  DiagnosticBag * diags_ = nullptr;
  size_t error_count_ = 0;
};

}  // namespace itl
