// itl/schema/value.hpp - Integer and label values carried by the type model
//
// JSON integers may use the full signed or unsigned 64-bit range, so values
// are stored as sign + magnitude.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace itl
{

// ============================================================================
// IntValue
// ============================================================================

/**
 * Integer in the range [-2^64 + 1, 2^64 - 1], stored as sign + magnitude.
 * Zero is never negative.
 */
class IntValue
{
public:
  constexpr IntValue() noexcept = default;

  [[nodiscard]] static IntValue from_signed(int64_t value) noexcept;
  [[nodiscard]] static IntValue from_unsigned(uint64_t value) noexcept;

  [[nodiscard]] bool is_negative() const noexcept { return negative_; }
  [[nodiscard]] uint64_t magnitude() const noexcept { return magnitude_; }

  /// Value as int64_t, if representable
  [[nodiscard]] std::optional<int64_t> as_int64() const noexcept;

  /**
   * Check that the value is representable as an integer of the given width.
   *
   * @param bits Width in bits (must be > 0)
   * @param is_unsigned Whether the integer is unsigned (two's complement otherwise)
   */
  [[nodiscard]] bool fits_bits(uint64_t bits, bool is_unsigned) const noexcept;

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const IntValue & other) const noexcept
  {
    return negative_ == other.negative_ && magnitude_ == other.magnitude_;
  }
  [[nodiscard]] bool operator!=(const IntValue & other) const noexcept { return !(*this == other); }
  [[nodiscard]] bool operator<(const IntValue & other) const noexcept;

private:
  bool negative_ = false;
  uint64_t magnitude_ = 0;
};

// ============================================================================
// LabelValue
// ============================================================================

enum class LabelKind : uint8_t {
  Integer,
  Bool,
  String,
};

/**
 * A union label as written in the document.
 *
 * String payloads point into the owning SchemaContext.
 */
class LabelValue
{
public:
  LabelValue() = default;

  static LabelValue make_integer(IntValue value)
  {
    LabelValue v;
    v.kind_ = LabelKind::Integer;
    v.int_value_ = value;
    return v;
  }

  static LabelValue make_bool(bool value)
  {
    LabelValue v;
    v.kind_ = LabelKind::Bool;
    v.bool_value_ = value;
    return v;
  }

  /// value must be arena-interned
  static LabelValue make_string(std::string_view value)
  {
    LabelValue v;
    v.kind_ = LabelKind::String;
    v.string_value_ = value;
    return v;
  }

  [[nodiscard]] LabelKind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_integer() const noexcept { return kind_ == LabelKind::Integer; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == LabelKind::Bool; }
  [[nodiscard]] bool is_string() const noexcept { return kind_ == LabelKind::String; }

  [[nodiscard]] const IntValue & as_integer() const noexcept { return int_value_; }
  [[nodiscard]] bool as_bool() const noexcept { return bool_value_; }
  [[nodiscard]] std::string_view as_string() const noexcept { return string_value_; }

  /// Human-readable rendering used in diagnostics (strings are quoted)
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const LabelValue & other) const noexcept;
  [[nodiscard]] bool operator!=(const LabelValue & other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] bool operator<(const LabelValue & other) const noexcept;

private:
  LabelKind kind_ = LabelKind::Integer;
  IntValue int_value_;
  bool bool_value_ = false;
  std::string_view string_value_;
};

}  // namespace itl
