// itl/sema/analysis/bounds_checker.cpp - Numeric parameter sanity
#include "itl/sema/analysis/bounds_checker.hpp"

#include <string>

#include "itl/basic/casting.hpp"
#include "itl/basic/document_path.hpp"

namespace itl
{

namespace
{

/// Path of a member of a definition
std::string member(const TypeDef & def, std::string_view key) { return join_path(def.path, key); }

}  // namespace

bool BoundsChecker::check(const Schema & schema)
{
  reset();
  for (const TypeDef * def : schema.all_types()) {
    visit(def);
  }
  return !has_errors();
}

// ============================================================================
// Scalars
// ============================================================================

void BoundsChecker::visit_int(const IntType * def)
{
  if (def->bits && *def->bits <= 0) {
    report_error(
      "int-bits", member(*def, "bits"),
      "integer width must be positive, found " + std::to_string(*def->bits));
  }

  if (const auto enc = parse_int_encoding(def->encoding)) {
    if (def->bits != enc->bits || def->is_unsigned != enc->is_unsigned) {
      const std::string declared =
        std::string(def->is_unsigned ? "uint" : "int") +
        (def->bits ? std::to_string(*def->bits) : std::string("<unbounded>"));
      report_error(
        "encoding-conflict", member(*def, "encoding"),
        "encoding '" + std::string(def->encoding) + "' contradicts the declared " + declared);
    }
  }
}

void BoundsChecker::visit_float(const FloatType * def)
{
  const auto model = float_model_from_string(def->encoding);
  if (model && def->model && *model != *def->model) {
    report_error(
      "encoding-conflict", member(*def, "encoding"),
      "encoding '" + std::string(def->encoding) + "' contradicts model '" +
        std::string(to_string(*def->model)) + "'");
  }
}

void BoundsChecker::visit_fixed(const FixedType * def)
{
  if (def->digits <= 0) {
    report_error(
      "fixed-digits", member(*def, "digits"),
      "digits must be positive, found " + std::to_string(def->digits));
  }
  if (def->scale < 0 || (def->digits > 0 && def->scale > def->digits)) {
    report_error(
      "fixed-scale", member(*def, "scale"),
      "scale must be between 0 and digits (" + std::to_string(def->digits) + "), found " +
        std::to_string(def->scale));
  }
  if (def->base < 2) {
    report_error(
      "fixed-base", member(*def, "base"),
      "base must be at least 2, found " + std::to_string(def->base));
  }
}

void BoundsChecker::visit_string(const StringType * def)
{
  check_size_capacity(*def, def->size, def->capacity);
}

// ============================================================================
// Sequence
// ============================================================================

void BoundsChecker::visit_sequence(const SequenceType * def)
{
  switch (def->size_form) {
    case SizeForm::None:
      check_size_capacity(*def, std::nullopt, def->capacity);
      break;
    case SizeForm::Scalar:
      check_size_capacity(*def, def->size, def->capacity);
      break;
    case SizeForm::Dimensions: {
      // Multi-dimensional sizes are not ordered against capacity.
      check_size_capacity(*def, std::nullopt, def->capacity);
      const std::string size_path = member(*def, "size");
      if (def->dimensions.empty()) {
        report_error("invalid-dimension", size_path, "size must list at least one dimension");
      }
      for (size_t i = 0; i < def->dimensions.size(); ++i) {
        const int64_t d = def->dimensions[i];
        if (d <= 0) {
          report_error(
            "invalid-dimension", index_path(size_path, i),
            "dimension must be a positive integer, found " + std::to_string(d));
        }
      }
      break;
    }
  }
}

void BoundsChecker::check_size_capacity(
  const TypeDef & def, const std::optional<int64_t> & size,
  const std::optional<int64_t> & capacity)
{
  bool valid = true;
  if (size && *size < 0) {
    report_error(
      "invalid-size", member(def, "size"),
      "size must not be negative, found " + std::to_string(*size));
    valid = false;
  }
  if (capacity && *capacity < 0) {
    report_error(
      "invalid-size", member(def, "capacity"),
      "capacity must not be negative, found " + std::to_string(*capacity));
    valid = false;
  }
  if (valid && size && capacity && *size > *capacity) {
    report_error(
      "size-exceeds-capacity", member(def, "size"),
      "size " + std::to_string(*size) + " exceeds capacity " + std::to_string(*capacity))
      .with_secondary_label(member(def, "capacity"), "capacity declared here");
  }
}

// ============================================================================
// Legacy Enum / Bitset
// ============================================================================

void BoundsChecker::visit_enum(const EnumType * def)
{
  if (!def->underlying.is_set()) return;

  const TypeDef * target = def->underlying.get();
  if (target == nullptr) return;

  uint64_t bits = 0;
  bool is_unsigned = false;
  if (isa<ByteType>(target)) {
    bits = 8;
    is_unsigned = true;
  } else if (const auto * int_type = dyn_cast<IntType>(target)) {
    is_unsigned = int_type->is_unsigned;
    if (int_type->bits) {
      // Non-positive widths are int-bits errors of the integer itself.
      if (*int_type->bits <= 0) return;
      bits = static_cast<uint64_t>(*int_type->bits);
    }
  } else {
    report_error(
      "enum-type", std::string(def->underlying.path),
      "enum values must be stored in an int or byte, found " +
        std::string(to_string(target->get_kind())));
    return;
  }

  for (const auto & value : def->values) {
    const bool fits = bits > 0 ? value.value.fits_bits(bits, is_unsigned)
                               : !(is_unsigned && value.value.is_negative());
    if (!fits) {
      report_error(
        "enum-value-range", join_path(value.path, "value"),
        "value " + value.value.to_string() + " of '" + std::string(value.name) +
          "' does not fit the enum's underlying type");
    }
  }
}

void BoundsChecker::visit_bitset(const BitsetType * def)
{
  const bool size_valid = !def->size || *def->size > 0;
  if (!size_valid) {
    report_error(
      "bitset-size", member(*def, "size"),
      "bitset width must be positive, found " + std::to_string(*def->size));
  }

  for (const auto & flag : def->flags) {
    const bool out_of_range =
      flag.bit < 0 || (def->size && size_valid && flag.bit >= *def->size);
    if (out_of_range) {
      std::string message = "bit " + std::to_string(flag.bit) + " of flag '" +
                            std::string(flag.name) + "' is out of range";
      if (def->size && size_valid) {
        message += " for a " + std::to_string(*def->size) + "-bit set";
      }
      report_error("flag-bit-range", join_path(flag.path, "bit"), std::move(message));
    }
  }
}

}  // namespace itl
