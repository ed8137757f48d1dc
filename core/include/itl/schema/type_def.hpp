// itl/schema/type_def.hpp - TypeDef node class definitions
//
// One class per kind, following the LLVM/Clang style with classof() for RTTI
// support. Nodes are allocated in and owned by a SchemaContext; references
// between them are non-owning pointers, so reference cycles never form
// ownership cycles.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <limits>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string_view>

#include "itl/basic/casting.hpp"
#include "itl/schema/type_enums.hpp"
#include "itl/schema/value.hpp"

namespace itl
{

class TypeDef;

// ============================================================================
// TypeRef - A "Type" position in the grammar
// ============================================================================

/**
 * Reference to a TypeDef: either by name (resolved to a registry entry by the
 * builder) or an inline anonymous definition owned by the enclosing node.
 */
struct TypeRef
{
  std::string_view name;  ///< Referenced name (by-name references only)
  std::string_view path;  ///< Document path of this position
  const TypeDef * target = nullptr;
  bool by_name = false;
  bool present = false;

  [[nodiscard]] bool is_set() const noexcept { return present; }
  [[nodiscard]] bool is_named() const noexcept { return present && by_name; }
  [[nodiscard]] bool is_inline() const noexcept { return present && !by_name; }
  [[nodiscard]] bool is_resolved() const noexcept { return target != nullptr; }

  /// The referenced definition (nullptr until resolved)
  [[nodiscard]] const TypeDef * get() const noexcept { return target; }
};

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all type definitions.
 *
 * Every node has a TypeKind for RTTI, the document path it was declared at,
 * an optional name and an optional note (opaque JSON object kept verbatim).
 */
class TypeDef
{
public:
  const TypeKind kind;
  std::string_view name;  ///< Empty for anonymous definitions
  std::string_view path;
  const nlohmann::json * note = nullptr;
  bool top_level = false;  ///< Declared directly in Root.types

  // Non-copyable, non-movable (managed by SchemaContext)
  TypeDef(const TypeDef &) = delete;
  TypeDef & operator=(const TypeDef &) = delete;
  TypeDef(TypeDef &&) = delete;
  TypeDef & operator=(TypeDef &&) = delete;

  [[nodiscard]] TypeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] bool has_name() const noexcept { return !name.empty(); }
  [[nodiscard]] std::string_view get_name() const noexcept { return name; }
  [[nodiscard]] std::string_view get_path() const noexcept { return path; }
  [[nodiscard]] const nlohmann::json * get_note() const noexcept { return note; }
  [[nodiscard]] bool is_top_level() const noexcept { return top_level; }

  /// Name if present, document path otherwise
  [[nodiscard]] std::string_view display_name() const noexcept { return has_name() ? name : path; }

protected:
  TypeDef(TypeKind k, std::string_view p) : kind(k), path(p) {}
  ~TypeDef() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof().
 */
template <typename Derived, TypeKind K>
class TypeDefBase : public TypeDef
{
public:
  static constexpr TypeKind kind = K;

  static bool classof(const TypeDef * def) { return def->get_kind() == K; }

protected:
  explicit TypeDefBase(std::string_view p) : TypeDef(K, p) {}
};

// ============================================================================
// Scalar Kinds
// ============================================================================

class ByteType : public TypeDefBase<ByteType, TypeKind::Byte>
{
public:
  explicit ByteType(std::string_view p) : TypeDefBase(p) {}
};

class BoolType : public TypeDefBase<BoolType, TypeKind::Bool>
{
public:
  explicit BoolType(std::string_view p) : TypeDefBase(p) {}
};

/// Integer; absent bits means arbitrary precision.
class IntType : public TypeDefBase<IntType, TypeKind::Int>
{
public:
  std::optional<int64_t> bits;
  bool is_unsigned = false;
  std::string_view encoding;  ///< Legacy generation only

  explicit IntType(std::string_view p) : TypeDefBase(p) {}
};

/// Floating point number; the model is advisory.
class FloatType : public TypeDefBase<FloatType, TypeKind::Float>
{
public:
  std::optional<FloatModel> model;
  std::string_view encoding;  ///< Legacy generation only

  explicit FloatType(std::string_view p) : TypeDefBase(p) {}
};

/// Fixed-point number: `digits` digits in radix `base`, `scale` of them fractional.
class FixedType : public TypeDefBase<FixedType, TypeKind::Fixed>
{
public:
  int64_t base = 0;
  int64_t digits = 0;
  int64_t scale = 0;
  std::string_view encoding;  ///< Legacy generation only

  explicit FixedType(std::string_view p) : TypeDefBase(p) {}
};

/// Character string. size is authoritative; capacity is an advisory upper bound.
class StringType : public TypeDefBase<StringType, TypeKind::String>
{
public:
  std::optional<int64_t> size;
  std::optional<int64_t> capacity;
  std::string_view encoding;  ///< Legacy generation only

  explicit StringType(std::string_view p) : TypeDefBase(p) {}
};

/// Single character (legacy generation).
class RuneType : public TypeDefBase<RuneType, TypeKind::Rune>
{
public:
  std::string_view encoding;

  explicit RuneType(std::string_view p) : TypeDefBase(p) {}
};

// ============================================================================
// Sequence
// ============================================================================

class SequenceType : public TypeDefBase<SequenceType, TypeKind::Sequence>
{
public:
  TypeRef element;
  SizeForm size_form = SizeForm::None;
  int64_t size = 0;                        ///< SizeForm::Scalar
  gsl::span<const int64_t> dimensions;     ///< SizeForm::Dimensions
  std::optional<int64_t> capacity;

  explicit SequenceType(std::string_view p) : TypeDefBase(p) {}

  /// Number of elements if the size is fixed and well-formed, nullopt otherwise.
  /// A product of dimensions beyond uint64_t saturates at its maximum.
  [[nodiscard]] std::optional<uint64_t> fixed_element_count() const noexcept
  {
    if (size_form == SizeForm::Scalar) {
      return size >= 0 ? std::optional<uint64_t>(static_cast<uint64_t>(size)) : std::nullopt;
    }
    if (size_form == SizeForm::Dimensions) {
      if (dimensions.empty()) return std::nullopt;
      constexpr uint64_t k_max = std::numeric_limits<uint64_t>::max();
      uint64_t count = 1;
      for (const int64_t d : dimensions) {
        if (d <= 0) return std::nullopt;
        const auto dim = static_cast<uint64_t>(d);
        count = count > k_max / dim ? k_max : count * dim;
      }
      return count;
    }
    return std::nullopt;
  }

  /// Whether every value holds at least one element
  [[nodiscard]] bool has_nonempty_fixed_size() const noexcept
  {
    if (size_form == SizeForm::Scalar) return size > 0;
    if (size_form == SizeForm::Dimensions) {
      if (dimensions.empty()) return false;
      for (const int64_t d : dimensions) {
        if (d <= 0) return false;
      }
      return true;
    }
    return false;
  }
};

// ============================================================================
// Record
// ============================================================================

struct Field
{
  std::string_view name;
  std::string_view path;
  TypeRef type;
  bool optional = false;
  const nlohmann::json * note = nullptr;
};

class RecordType : public TypeDefBase<RecordType, TypeKind::Record>
{
public:
  gsl::span<Field> fields;

  explicit RecordType(std::string_view p) : TypeDefBase(p) {}

  [[nodiscard]] const Field * find_field(std::string_view field_name) const noexcept
  {
    for (const auto & f : fields) {
      if (f.name == field_name) return &f;
    }
    return nullptr;
  }
};

// ============================================================================
// Union
// ============================================================================

struct UnionField
{
  std::string_view name;
  std::string_view path;
  TypeRef type;
  gsl::span<const LabelValue> labels;  ///< Empty: this is the default field
  const nlohmann::json * note = nullptr;

  [[nodiscard]] bool is_default() const noexcept { return labels.empty(); }
};

class UnionType : public TypeDefBase<UnionType, TypeKind::Union>
{
public:
  TypeRef discriminator;
  gsl::span<UnionField> fields;

  explicit UnionType(std::string_view p) : TypeDefBase(p) {}

  /// The field with an empty label set, if any
  [[nodiscard]] const UnionField * default_field() const noexcept
  {
    for (const auto & f : fields) {
      if (f.is_default()) return &f;
    }
    return nullptr;
  }

  [[nodiscard]] const UnionField * find_field(std::string_view field_name) const noexcept
  {
    for (const auto & f : fields) {
      if (f.name == field_name) return &f;
    }
    return nullptr;
  }
};

// ============================================================================
// Legacy Enum / Bitset
// ============================================================================

struct EnumValue
{
  std::string_view name;
  std::string_view path;
  IntValue value;
  const nlohmann::json * note = nullptr;
};

class EnumType : public TypeDefBase<EnumType, TypeKind::Enum>
{
public:
  TypeRef underlying;  ///< Optional; must be an int or byte when set
  gsl::span<EnumValue> values;

  explicit EnumType(std::string_view p) : TypeDefBase(p) {}

  [[nodiscard]] const EnumValue * find_value(std::string_view value_name) const noexcept
  {
    for (const auto & v : values) {
      if (v.name == value_name) return &v;
    }
    return nullptr;
  }

  [[nodiscard]] const EnumValue * find_value(const IntValue & value) const noexcept
  {
    for (const auto & v : values) {
      if (v.value == value) return &v;
    }
    return nullptr;
  }
};

struct BitsetFlag
{
  std::string_view name;
  std::string_view path;
  int64_t bit = 0;
  const nlohmann::json * note = nullptr;
};

class BitsetType : public TypeDefBase<BitsetType, TypeKind::Bitset>
{
public:
  std::optional<int64_t> size;  ///< Width in bits
  gsl::span<BitsetFlag> flags;

  explicit BitsetType(std::string_view p) : TypeDefBase(p) {}
};

}  // namespace itl
