// itl/sema/analysis/checker_base.hpp - Shared error state of validation passes
#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "itl/basic/diagnostic.hpp"

namespace itl
{

/**
 * Error bookkeeping shared by the semantic checkers.
 *
 * Every checker reports Stage::Validation diagnostics. A null bag selects
 * silent mode: diagnostics are dropped but still counted.
 */
class CheckerBase
{
public:
  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

protected:
  explicit CheckerBase(DiagnosticBag * diags) : diags_(diags) {}
  ~CheckerBase() = default;

  CheckerBase(const CheckerBase &) = delete;
  CheckerBase & operator=(const CheckerBase &) = delete;

  void reset() noexcept
  {
    has_errors_ = false;
    error_count_ = 0;
  }

  DiagnosticBuilder report_error(std::string rule, std::string path, std::string message)
  {
    has_errors_ = true;
    ++error_count_;
    return bag().report_error(
      Stage::Validation, std::move(rule), std::move(path), std::move(message));
  }

  DiagnosticBuilder report_warning(std::string rule, std::string path, std::string message)
  {
    return bag().report_warning(
      Stage::Validation, std::move(rule), std::move(path), std::move(message));
  }

private:
  DiagnosticBag & bag() { return diags_ ? *diags_ : silent_; }

  DiagnosticBag * diags_ = nullptr;
  DiagnosticBag silent_;
  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace itl
