// itl/sema/analysis/name_uniqueness_checker.cpp - Member name uniqueness
#include "itl/sema/analysis/name_uniqueness_checker.hpp"

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

#include "itl/basic/casting.hpp"

namespace itl
{

namespace
{

/// First position at which each name was seen
using FirstSeen = std::unordered_map<std::string_view, std::string_view>;

}  // namespace

bool NameUniquenessChecker::check(const Schema & schema)
{
  reset();

  for (const TypeDef * def : schema.all_types()) {
    if (const auto * rec = dyn_cast<RecordType>(def)) {
      check_record(*rec);
    } else if (const auto * un = dyn_cast<UnionType>(def)) {
      check_union(*un);
    } else if (const auto * en = dyn_cast<EnumType>(def)) {
      check_enum(*en);
    } else if (const auto * bits = dyn_cast<BitsetType>(def)) {
      check_bitset(*bits);
    }
  }

  return !has_errors();
}

void NameUniquenessChecker::check_record(const RecordType & def)
{
  FirstSeen seen;
  for (const auto & field : def.fields) {
    auto [it, inserted] = seen.emplace(field.name, field.path);
    if (!inserted) {
      report_error(
        "duplicate-field-name", std::string(field.path),
        "field '" + std::string(field.name) + "' is declared more than once in this record")
        .with_secondary_label(std::string(it->second), "first declared here");
    }
  }
}

void NameUniquenessChecker::check_union(const UnionType & def)
{
  FirstSeen seen;
  for (const auto & field : def.fields) {
    auto [it, inserted] = seen.emplace(field.name, field.path);
    if (!inserted) {
      report_error(
        "duplicate-field-name", std::string(field.path),
        "field '" + std::string(field.name) + "' is declared more than once in this union")
        .with_secondary_label(std::string(it->second), "first declared here");
    }
  }
}

void NameUniquenessChecker::check_enum(const EnumType & def)
{
  FirstSeen names;
  std::map<IntValue, std::string_view> values;
  for (const auto & value : def.values) {
    auto [name_it, name_inserted] = names.emplace(value.name, value.path);
    if (!name_inserted) {
      report_error(
        "duplicate-enum-name", std::string(value.path),
        "enum value '" + std::string(value.name) + "' is declared more than once")
        .with_secondary_label(std::string(name_it->second), "first declared here");
    }

    auto [value_it, value_inserted] = values.emplace(value.value, value.path);
    if (!value_inserted) {
      report_error(
        "duplicate-enum-value", std::string(value.path),
        "enum value " + value.value.to_string() + " is used more than once")
        .with_secondary_label(std::string(value_it->second), "first used here");
    }
  }
}

void NameUniquenessChecker::check_bitset(const BitsetType & def)
{
  FirstSeen names;
  std::map<int64_t, std::string_view> bits;
  for (const auto & flag : def.flags) {
    auto [name_it, name_inserted] = names.emplace(flag.name, flag.path);
    if (!name_inserted) {
      report_error(
        "duplicate-flag-name", std::string(flag.path),
        "flag '" + std::string(flag.name) + "' is declared more than once")
        .with_secondary_label(std::string(name_it->second), "first declared here");
    }

    auto [bit_it, bit_inserted] = bits.emplace(flag.bit, flag.path);
    if (!bit_inserted) {
      report_error(
        "duplicate-flag-bit", std::string(flag.path),
        "bit " + std::to_string(flag.bit) + " is assigned to more than one flag")
        .with_secondary_label(std::string(bit_it->second), "first assigned here");
    }
  }
}

}  // namespace itl
