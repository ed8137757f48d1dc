// itl/sema/analysis/union_checker.cpp - Union discriminator and label rules
#include "itl/sema/analysis/union_checker.hpp"

#include <set>
#include <string_view>
#include <vector>

#include "itl/basic/casting.hpp"
#include "itl/basic/document_path.hpp"

namespace itl
{

namespace
{

constexpr uint32_t k_max_code_point = 0x10FFFF;

[[nodiscard]] constexpr bool is_surrogate(uint64_t cp) noexcept
{
  return cp >= 0xD800 && cp <= 0xDFFF;
}

/// Decode UTF-8 into code points. Returns false on malformed input.
bool decode_utf8(std::string_view text, std::vector<uint32_t> & out)
{
  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    uint32_t cp = 0;
    size_t extra = 0;
    if (lead < 0x80) {
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
      cp = lead & 0x07;
      extra = 3;
    } else {
      return false;
    }
    if (i + extra >= text.size()) {
      return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }
    out.push_back(cp);
    i += extra + 1;
  }
  return true;
}

/// Display name of a discriminator type for messages ("uint8", "Color", ...)
std::string describe_discriminator(const TypeDef & def)
{
  if (def.has_name()) {
    return std::string(def.name);
  }
  if (const auto * int_type = dyn_cast<IntType>(&def)) {
    std::string out = int_type->is_unsigned ? "uint" : "int";
    if (int_type->bits) out += std::to_string(*int_type->bits);
    return out;
  }
  return std::string(to_string(def.get_kind()));
}

std::optional<LabelValue> normalize_integer(
  const LabelValue & label, uint64_t bits, bool is_unsigned, std::string & reason)
{
  if (!label.is_integer()) {
    reason = "expected an integer label";
    return std::nullopt;
  }
  const IntValue & v = label.as_integer();
  const bool fits = bits > 0 ? v.fits_bits(bits, is_unsigned) : !(is_unsigned && v.is_negative());
  if (!fits) {
    reason = "value is out of range";
    return std::nullopt;
  }
  return label;
}

std::optional<LabelValue> normalize_string(
  const LabelValue & label, const StringType & def, std::string & reason)
{
  if (!label.is_string()) {
    reason = "expected a string label";
    return std::nullopt;
  }
  const std::optional<int64_t> limit = def.size ? def.size : def.capacity;
  if (limit && *limit >= 0) {
    std::vector<uint32_t> cps;
    const size_t length = decode_utf8(label.as_string(), cps) ? cps.size() : label.as_string().size();
    if (length > static_cast<uint64_t>(*limit)) {
      reason = "string is longer than " + std::to_string(*limit) + " characters";
      return std::nullopt;
    }
  }
  return label;
}

std::optional<LabelValue> normalize_rune(const LabelValue & label, std::string & reason)
{
  if (label.is_integer()) {
    const IntValue & v = label.as_integer();
    if (v.is_negative() || v.magnitude() > k_max_code_point || is_surrogate(v.magnitude())) {
      reason = "not a Unicode scalar value";
      return std::nullopt;
    }
    return label;
  }
  if (label.is_string()) {
    std::vector<uint32_t> cps;
    if (!decode_utf8(label.as_string(), cps) || cps.size() != 1) {
      reason = "a rune label must hold exactly one character";
      return std::nullopt;
    }
    return LabelValue::make_integer(IntValue::from_unsigned(cps.front()));
  }
  reason = "expected a code point or a one-character string";
  return std::nullopt;
}

std::optional<LabelValue> normalize_enum(
  const LabelValue & label, const EnumType & def, std::string & reason)
{
  if (label.is_string()) {
    if (const EnumValue * v = def.find_value(label.as_string())) {
      return LabelValue::make_integer(v->value);
    }
    reason = "no enum value is named " + label.to_string();
    return std::nullopt;
  }
  if (label.is_integer()) {
    if (def.find_value(label.as_integer()) != nullptr) {
      return label;
    }
    reason = "no enum value equals " + label.to_string();
    return std::nullopt;
  }
  reason = "expected an enum value name or integer";
  return std::nullopt;
}

std::string join_labels(const std::vector<LabelValue> & labels)
{
  std::string out;
  for (size_t i = 0; i < labels.size(); ++i) {
    if (i > 0) out += ", ";
    out += labels[i].to_string();
  }
  return out;
}

}  // namespace

// ============================================================================
// Label Legality
// ============================================================================

bool UnionChecker::is_discriminator_kind(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Byte:
    case TypeKind::Bool:
    case TypeKind::Int:
    case TypeKind::String:
    case TypeKind::Rune:
    case TypeKind::Enum:
      return true;
    default:
      return false;
  }
}

std::optional<LabelValue> UnionChecker::normalize_label(
  const LabelValue & label, const TypeDef & discriminator, std::string & reason)
{
  switch (discriminator.get_kind()) {
    case TypeKind::Byte:
      return normalize_integer(label, 8, true, reason);
    case TypeKind::Int: {
      const auto & def = *cast<IntType>(&discriminator);
      // A non-positive width is reported by the bounds checker; any integer passes here.
      const uint64_t bits = (def.bits && *def.bits > 0) ? static_cast<uint64_t>(*def.bits) : 0;
      return normalize_integer(label, bits, def.is_unsigned, reason);
    }
    case TypeKind::Bool:
      if (!label.is_bool()) {
        reason = "expected a boolean label";
        return std::nullopt;
      }
      return label;
    case TypeKind::String:
      return normalize_string(label, *cast<StringType>(&discriminator), reason);
    case TypeKind::Rune:
      return normalize_rune(label, reason);
    case TypeKind::Enum:
      return normalize_enum(label, *cast<EnumType>(&discriminator), reason);
    default:
      reason = "the discriminator has no enumerable values";
      return std::nullopt;
  }
}

// ============================================================================
// Entry Point
// ============================================================================

bool UnionChecker::check(const Schema & schema)
{
  reset();
  for (const TypeDef * def : schema.all_types()) {
    if (const auto * un = dyn_cast<UnionType>(def)) {
      check_union(*un);
    }
  }
  return !has_errors();
}

void UnionChecker::check_union(const UnionType & def)
{
  if (def.fields.empty()) {
    report_error(
      "empty-union", join_path(def.path, "fields"), "union must declare at least one field");
    return;
  }

  check_defaults(def);

  const TypeDef * disc = def.discriminator.get();
  if (disc == nullptr) return;
  if (!is_discriminator_kind(disc->get_kind())) {
    report_error(
      "discriminator-type", std::string(def.discriminator.path),
      "a " + std::string(to_string(disc->get_kind())) + " cannot discriminate a union")
      .with_help("use a byte, bool, int or string discriminator");
    return;
  }

  // Normalized label set per field (legal labels only)
  std::vector<std::set<LabelValue>> label_sets(def.fields.size());
  for (size_t i = 0; i < def.fields.size(); ++i) {
    const UnionField & field = def.fields[i];
    const std::string labels_path = join_path(field.path, "labels");
    for (size_t j = 0; j < field.labels.size(); ++j) {
      const LabelValue & label = field.labels[j];
      std::string reason;
      const std::optional<LabelValue> normal = normalize_label(label, *disc, reason);
      if (!normal) {
        report_error(
          "label-type", index_path(labels_path, j),
          "label " + label.to_string() + " is not a value of " + describe_discriminator(*disc) +
            ": " + reason);
        continue;
      }
      if (!label_sets[i].insert(*normal).second) {
        report_warning(
          "duplicate-label", index_path(labels_path, j),
          "label " + label.to_string() + " is listed more than once for field '" +
            std::string(field.name) + "'");
      }
    }
  }

  // Disjointness: one error per overlapping pair, reported at the later field
  for (size_t j = 1; j < def.fields.size(); ++j) {
    for (size_t i = 0; i < j; ++i) {
      std::vector<LabelValue> shared;
      for (const LabelValue & label : label_sets[j]) {
        if (label_sets[i].count(label) != 0) {
          shared.push_back(label);
        }
      }
      if (shared.empty()) continue;

      report_error(
        "label-overlap", std::string(def.fields[j].path),
        "labels of field '" + std::string(def.fields[j].name) + "' overlap with field '" +
          std::string(def.fields[i].name) + "': " + join_labels(shared))
        .with_secondary_label(std::string(def.fields[i].path), "overlapping field declared here");
    }
  }
}

void UnionChecker::check_defaults(const UnionType & def)
{
  const UnionField * first_default = nullptr;
  for (const auto & field : def.fields) {
    if (!field.is_default()) continue;
    if (first_default == nullptr) {
      first_default = &field;
      continue;
    }
    report_error(
      "ambiguous-default", std::string(field.path),
      "field '" + std::string(field.name) + "' is a second default field (empty labels)")
      .with_secondary_label(std::string(first_default->path), "first default field")
      .with_help("at most one field of a union may have an empty label set");
  }
}

}  // namespace itl
