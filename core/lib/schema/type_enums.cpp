// itl/schema/type_enums.cpp - Keyword tables for the type model
#include "itl/schema/type_enums.hpp"

#include <array>
#include <utility>

namespace itl
{

namespace
{

constexpr std::array<std::pair<std::string_view, FloatModel>, 7> k_float_models = {{
  {"binary16", FloatModel::Binary16},
  {"binary32", FloatModel::Binary32},
  {"binary64", FloatModel::Binary64},
  {"binary128", FloatModel::Binary128},
  {"decimal32", FloatModel::Decimal32},
  {"decimal64", FloatModel::Decimal64},
  {"decimal128", FloatModel::Decimal128},
}};

}  // namespace

std::string_view to_string(TypeKind kind) noexcept
{
  switch (kind) {
#define ITL_TYPE_KIND(Class, Kind, Snake, Keyword) \
  case TypeKind::Kind:                            \
    return Keyword;
#include "itl/schema/type_kinds.def"
  }
  return "<invalid>";
}

std::optional<TypeKind> type_kind_from_keyword(std::string_view keyword) noexcept
{
#define ITL_TYPE_KIND(Class, Kind, Snake, Keyword) \
  if (keyword == Keyword) {                       \
    return TypeKind::Kind;                        \
  }
#include "itl/schema/type_kinds.def"
  return std::nullopt;
}

std::string_view to_string(FloatModel model) noexcept
{
  for (const auto & [text, value] : k_float_models) {
    if (value == model) {
      return text;
    }
  }
  return "<invalid>";
}

std::optional<FloatModel> float_model_from_string(std::string_view text) noexcept
{
  for (const auto & [name, value] : k_float_models) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<IntEncoding> parse_int_encoding(std::string_view text) noexcept
{
  IntEncoding enc;
  if (text.substr(0, 4) == "uint") {
    enc.is_unsigned = true;
    text.remove_prefix(4);
  } else if (text.substr(0, 3) == "int") {
    text.remove_prefix(3);
  } else {
    return std::nullopt;
  }

  if (text.empty() || text.size() > 9) {
    return std::nullopt;
  }
  int64_t bits = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    bits = bits * 10 + (c - '0');
  }
  if (bits <= 0) {
    return std::nullopt;
  }
  enc.bits = bits;
  return enc;
}

}  // namespace itl
