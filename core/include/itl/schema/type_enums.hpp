// itl/schema/type_enums.hpp - Enumerations used by the type model
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace itl
{

// ============================================================================
// TypeKind - Identifies all TypeDef variants
// ============================================================================

/**
 * Kind enumeration for LLVM-style RTTI over TypeDef.
 * Auto-generated from type_kinds.def; legacy kinds come last.
 */
enum class TypeKind : uint8_t {
#define ITL_TYPE_KIND(Class, Kind, Snake, Keyword) Kind,
#include "itl/schema/type_kinds.def"
};

/// Keyword used for the kind in documents ("int", "union", ...)
[[nodiscard]] std::string_view to_string(TypeKind kind) noexcept;

/// Parse a "kind" keyword. Returns nullopt for unknown keywords.
[[nodiscard]] std::optional<TypeKind> type_kind_from_keyword(std::string_view keyword) noexcept;

/// rune, enum and bitset belong to the encoding-centric grammar generation
[[nodiscard]] constexpr bool is_legacy_kind(TypeKind kind) noexcept
{
  return kind == TypeKind::Rune || kind == TypeKind::Enum || kind == TypeKind::Bitset;
}

// ============================================================================
// FloatModel - Advisory float representation
// ============================================================================

enum class FloatModel : uint8_t {
  Binary16,
  Binary32,
  Binary64,
  Binary128,
  Decimal32,
  Decimal64,
  Decimal128,
};

[[nodiscard]] std::string_view to_string(FloatModel model) noexcept;
[[nodiscard]] std::optional<FloatModel> float_model_from_string(std::string_view text) noexcept;

// ============================================================================
// Legacy integer encodings ("int8", "uint32", ...)
// ============================================================================

struct IntEncoding
{
  int64_t bits = 0;
  bool is_unsigned = false;
};

/// Parse "intN" / "uintN" (N a positive decimal). Other strings yield nullopt.
[[nodiscard]] std::optional<IntEncoding> parse_int_encoding(std::string_view text) noexcept;

// ============================================================================
// SizeForm - Shape of a sequence "size"
// ============================================================================

enum class SizeForm : uint8_t {
  None,        ///< size absent: variable length
  Scalar,      ///< single integer
  Dimensions,  ///< ordered list of integers (multi-dimensional)
};

}  // namespace itl
