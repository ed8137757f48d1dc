// itl/schema/value.cpp - IntValue / LabelValue implementation
#include "itl/schema/value.hpp"

#include <limits>

namespace itl
{

// ============================================================================
// IntValue
// ============================================================================

IntValue IntValue::from_signed(int64_t value) noexcept
{
  IntValue v;
  if (value < 0) {
    v.negative_ = true;
    // -(value + 1) never overflows, even for INT64_MIN
    v.magnitude_ = static_cast<uint64_t>(-(value + 1)) + 1;
  } else {
    v.magnitude_ = static_cast<uint64_t>(value);
  }
  return v;
}

IntValue IntValue::from_unsigned(uint64_t value) noexcept
{
  IntValue v;
  v.magnitude_ = value;
  return v;
}

std::optional<int64_t> IntValue::as_int64() const noexcept
{
  constexpr auto k_max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (!negative_) {
    if (magnitude_ > k_max) {
      return std::nullopt;
    }
    return static_cast<int64_t>(magnitude_);
  }
  if (magnitude_ > k_max + 1) {
    return std::nullopt;
  }
  return -static_cast<int64_t>(magnitude_ - 1) - 1;
}

bool IntValue::fits_bits(uint64_t bits, bool is_unsigned) const noexcept
{
  if (bits == 0) {
    return false;
  }

  if (is_unsigned) {
    if (negative_) {
      return false;
    }
    return bits >= 64 || magnitude_ < (uint64_t{1} << bits);
  }

  // Any stored magnitude fits once the width exceeds 64 bits.
  if (bits > 64) {
    return true;
  }
  const uint64_t limit = uint64_t{1} << (bits - 1);
  return negative_ ? magnitude_ <= limit : magnitude_ < limit;
}

std::string IntValue::to_string() const
{
  std::string out = std::to_string(magnitude_);
  if (negative_) {
    out.insert(out.begin(), '-');
  }
  return out;
}

bool IntValue::operator<(const IntValue & other) const noexcept
{
  if (negative_ != other.negative_) {
    return negative_;
  }
  if (negative_) {
    return magnitude_ > other.magnitude_;
  }
  return magnitude_ < other.magnitude_;
}

// ============================================================================
// LabelValue
// ============================================================================

std::string LabelValue::to_string() const
{
  switch (kind_) {
    case LabelKind::Integer:
      return int_value_.to_string();
    case LabelKind::Bool:
      return bool_value_ ? "true" : "false";
    case LabelKind::String:
      return "\"" + std::string(string_value_) + "\"";
  }
  return "<invalid>";
}

bool LabelValue::operator==(const LabelValue & other) const noexcept
{
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case LabelKind::Integer:
      return int_value_ == other.int_value_;
    case LabelKind::Bool:
      return bool_value_ == other.bool_value_;
    case LabelKind::String:
      return string_value_ == other.string_value_;
  }
  return false;
}

bool LabelValue::operator<(const LabelValue & other) const noexcept
{
  if (kind_ != other.kind_) {
    return static_cast<int>(kind_) < static_cast<int>(other.kind_);
  }
  switch (kind_) {
    case LabelKind::Integer:
      return int_value_ < other.int_value_;
    case LabelKind::Bool:
      return !bool_value_ && other.bool_value_;
    case LabelKind::String:
      return string_value_ < other.string_value_;
  }
  return false;
}

}  // namespace itl
