// itl/sema/type_graph_builder.cpp - Type graph construction implementation
//
#include "itl/sema/type_graph_builder.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include "itl/basic/document_path.hpp"

namespace itl
{

using nlohmann::json;

namespace
{

/// JSON value kind as named in messages
std::string describe(const json & value)
{
  if (value.is_number_integer()) return "an integer";
  if (value.is_number_float()) return "a non-integer number";
  if (value.is_string()) return "a string";
  if (value.is_boolean()) return "a boolean";
  if (value.is_array()) return "an array";
  if (value.is_object()) return "an object";
  return "null";
}

}  // namespace

// ============================================================================
// Constructor
// ============================================================================

TypeGraphBuilder::TypeGraphBuilder(DiagnosticBag * diags, GrammarOptions options)
: diags_(diags), options_(options)
{
}

// ============================================================================
// Entry Point
// ============================================================================

std::unique_ptr<Schema> TypeGraphBuilder::build(const json & root)
{
  has_errors_ = false;
  error_count_ = 0;
  context_ = std::make_unique<SchemaContext>();
  registry_ = TypeRegistry();
  pending_refs_.clear();
  inline_named_.clear();
  failed_names_.clear();
  depth_ = 0;

  if (!root.is_object()) {
    report_error(
      "invalid-root", std::string(), "document must be an object, found " + describe(root))
      .with_help("an ITL document has the shape {\"types\": [...]}");
    return nullptr;
  }

  check_keys(root, std::string(), {"types"});
  const json * note = read_note(root, std::string());

  // Pass 1: build definitions, registering named top-level ones
  std::vector<const TypeDef *> types;
  if (const json * list = require_key(root, std::string(), "types")) {
    if (!list->is_array()) {
      report_wrong_kind("types", "an array", *list);
    } else {
      types.reserve(list->size());
      for (size_t i = 0; i < list->size(); ++i) {
        TypeDef * def = build_type_def((*list)[i], index_path("types", i));
        if (def == nullptr) continue;
        def->top_level = true;
        types.push_back(def);
        register_name(def, true);
      }
    }
  }

  // Named inline definitions join the namespace after every top-level name
  for (TypeDef * def : inline_named_) {
    register_name(def, false);
  }

  // Pass 2: link by-name references
  resolve_references();

  if (has_errors_) {
    return nullptr;
  }
  return std::make_unique<Schema>(
    std::move(context_), std::move(registry_), std::move(types), note);
}

// ============================================================================
// Definitions
// ============================================================================

TypeDef * TypeGraphBuilder::build_type_def(const json & obj, const std::string & path)
{
  if (!obj.is_object()) {
    report_wrong_kind(path, "a type definition object", obj);
    return nullptr;
  }

  std::string_view name;
  if (const json * n = find_key(obj, "name")) {
    name = read_name(*n, join_path(path, "name"));
  }

  const auto fail = [&]() -> TypeDef * {
    if (!name.empty()) {
      failed_names_.emplace(name);
    }
    return nullptr;
  };

  const json * kind_value = require_key(obj, path, "kind");
  if (kind_value == nullptr) {
    return fail();
  }
  const std::string kind_path = join_path(path, "kind");
  if (!kind_value->is_string()) {
    report_wrong_kind(kind_path, "a string", *kind_value);
    return fail();
  }

  const auto & keyword = kind_value->get_ref<const std::string &>();
  const std::optional<TypeKind> kind = type_kind_from_keyword(keyword);
  if (!kind) {
    report_error("unknown-kind", kind_path, "unknown kind '" + keyword + "'")
      .with_help("expected one of byte, bool, int, float, fixed, sequence, string, record, union");
    return fail();
  }
  if (is_legacy_kind(*kind) && !options_.legacy_kinds) {
    report_error(
      "legacy-kind", kind_path, "kind '" + keyword + "' belongs to the legacy grammar generation")
      .with_help("enable legacy kinds to accept rune, enum and bitset");
    return fail();
  }

  TypeDef * def = build_kind(*kind, obj, path);
  if (def == nullptr) {
    return fail();
  }
  def->name = name;
  def->note = read_note(obj, path);
  return def;
}

TypeDef * TypeGraphBuilder::build_kind(TypeKind kind, const json & obj, const std::string & path)
{
  const std::string_view p = intern(path);
  switch (kind) {
    case TypeKind::Byte:
      check_keys(obj, path, {"kind", "name"});
      return context_->create<ByteType>(p);
    case TypeKind::Bool:
      check_keys(obj, path, {"kind", "name"});
      return context_->create<BoolType>(p);
    case TypeKind::Int: {
      auto * def = context_->create<IntType>(p);
      build_int(*def, obj, path);
      return def;
    }
    case TypeKind::Float: {
      auto * def = context_->create<FloatType>(p);
      build_float(*def, obj, path);
      return def;
    }
    case TypeKind::Fixed: {
      auto * def = context_->create<FixedType>(p);
      build_fixed(*def, obj, path);
      return def;
    }
    case TypeKind::Sequence: {
      auto * def = context_->create<SequenceType>(p);
      build_sequence(*def, obj, path);
      return def;
    }
    case TypeKind::String: {
      auto * def = context_->create<StringType>(p);
      build_string(*def, obj, path);
      return def;
    }
    case TypeKind::Record: {
      auto * def = context_->create<RecordType>(p);
      build_record(*def, obj, path);
      return def;
    }
    case TypeKind::Union: {
      auto * def = context_->create<UnionType>(p);
      build_union(*def, obj, path);
      return def;
    }
    case TypeKind::Rune: {
      auto * def = context_->create<RuneType>(p);
      build_rune(*def, obj, path);
      return def;
    }
    case TypeKind::Enum: {
      auto * def = context_->create<EnumType>(p);
      build_enum(*def, obj, path);
      return def;
    }
    case TypeKind::Bitset: {
      auto * def = context_->create<BitsetType>(p);
      build_bitset(*def, obj, path);
      return def;
    }
  }
  return nullptr;
}

void TypeGraphBuilder::build_int(IntType & def, const json & obj, const std::string & path)
{
  std::vector<std::string_view> keys{"kind", "name", "bits", "unsigned"};
  if (options_.legacy_kinds) keys.emplace_back("encoding");
  check_keys(obj, path, keys);

  if (const json * v = find_key(obj, "bits")) {
    def.bits = read_int64(*v, join_path(path, "bits"));
  }
  const json * unsigned_value = find_key(obj, "unsigned");
  if (unsigned_value != nullptr) {
    def.is_unsigned = read_bool(*unsigned_value, join_path(path, "unsigned")).value_or(false);
  }

  if (options_.legacy_kinds) {
    def.encoding = read_encoding(obj, path);
    // "intN"/"uintN" fills in what the model-centric keys leave unsaid
    if (const auto enc = parse_int_encoding(def.encoding)) {
      if (!def.bits) def.bits = enc->bits;
      if (unsigned_value == nullptr) def.is_unsigned = enc->is_unsigned;
    }
  }
}

void TypeGraphBuilder::build_float(FloatType & def, const json & obj, const std::string & path)
{
  std::vector<std::string_view> keys{"kind", "name", "model"};
  if (options_.legacy_kinds) keys.emplace_back("encoding");
  check_keys(obj, path, keys);

  if (const json * v = find_key(obj, "model")) {
    const std::string model_path = join_path(path, "model");
    if (const auto text = read_string(*v, model_path)) {
      def.model = float_model_from_string(*text);
      if (!def.model) {
        report_error("invalid-model", model_path, "unknown float model '" + std::string(*text) + "'")
          .with_help(
            "expected one of binary16, binary32, binary64, binary128, decimal32, decimal64, "
            "decimal128");
      }
    }
  }

  if (options_.legacy_kinds) {
    def.encoding = read_encoding(obj, path);
    if (!def.model) {
      def.model = float_model_from_string(def.encoding);
    }
  }
}

void TypeGraphBuilder::build_fixed(FixedType & def, const json & obj, const std::string & path)
{
  std::vector<std::string_view> keys{"kind", "name", "base", "digits", "scale"};
  if (options_.legacy_kinds) keys.emplace_back("encoding");
  check_keys(obj, path, keys);

  if (const json * v = require_key(obj, path, "base")) {
    def.base = read_int64(*v, join_path(path, "base")).value_or(0);
  }
  if (const json * v = require_key(obj, path, "digits")) {
    def.digits = read_int64(*v, join_path(path, "digits")).value_or(0);
  }
  if (const json * v = require_key(obj, path, "scale")) {
    def.scale = read_int64(*v, join_path(path, "scale")).value_or(0);
  }
  if (options_.legacy_kinds) {
    def.encoding = read_encoding(obj, path);
  }
}

void TypeGraphBuilder::build_sequence(
  SequenceType & def, const json & obj, const std::string & path)
{
  check_keys(obj, path, {"kind", "name", "type", "size", "capacity"});

  if (const json * v = require_key(obj, path, "type")) {
    build_type_ref(*v, join_path(path, "type"), def.element);
  }

  if (const json * v = find_key(obj, "size")) {
    const std::string size_path = join_path(path, "size");
    if (v->is_array()) {
      std::vector<int64_t> dims;
      dims.reserve(v->size());
      for (size_t i = 0; i < v->size(); ++i) {
        if (const auto d = read_int64((*v)[i], index_path(size_path, i))) {
          dims.push_back(*d);
        }
      }
      def.size_form = SizeForm::Dimensions;
      def.dimensions = context_->copy_to_arena(dims);
    } else if (v->is_number_integer()) {
      if (const auto s = read_int64(*v, size_path)) {
        def.size_form = SizeForm::Scalar;
        def.size = *s;
      }
    } else {
      report_wrong_kind(size_path, "an integer or an array of integers", *v);
    }
  }

  if (const json * v = find_key(obj, "capacity")) {
    def.capacity = read_int64(*v, join_path(path, "capacity"));
  }
}

void TypeGraphBuilder::build_string(StringType & def, const json & obj, const std::string & path)
{
  std::vector<std::string_view> keys{"kind", "name", "size", "capacity"};
  if (options_.legacy_kinds) keys.emplace_back("encoding");
  check_keys(obj, path, keys);

  if (const json * v = find_key(obj, "size")) {
    def.size = read_int64(*v, join_path(path, "size"));
  }
  if (const json * v = find_key(obj, "capacity")) {
    def.capacity = read_int64(*v, join_path(path, "capacity"));
  }
  if (options_.legacy_kinds) {
    def.encoding = read_encoding(obj, path);
  }
}

void TypeGraphBuilder::build_record(RecordType & def, const json & obj, const std::string & path)
{
  check_keys(obj, path, {"kind", "name", "fields"});

  const json * list = require_key(obj, path, "fields");
  if (list == nullptr) return;
  const std::string list_path = join_path(path, "fields");
  if (!list->is_array()) {
    report_wrong_kind(list_path, "an array of fields", *list);
    return;
  }

  // Allocated up front: pending references point into this array.
  def.fields = context_->allocate_array<Field>(list->size());
  for (size_t i = 0; i < list->size(); ++i) {
    const json & item = (*list)[i];
    const std::string field_path = index_path(list_path, i);
    Field & field = def.fields[i];
    field.path = intern(field_path);

    if (!item.is_object()) {
      report_wrong_kind(field_path, "a field object", item);
      continue;
    }
    check_keys(item, field_path, {"name", "type", "optional"});

    if (const json * v = require_key(item, field_path, "name")) {
      field.name = read_name(*v, join_path(field_path, "name"));
    }
    if (const json * v = require_key(item, field_path, "type")) {
      build_type_ref(*v, join_path(field_path, "type"), field.type);
    }
    if (const json * v = find_key(item, "optional")) {
      field.optional = read_bool(*v, join_path(field_path, "optional")).value_or(false);
    }
    field.note = read_note(item, field_path);
  }
}

void TypeGraphBuilder::build_union(UnionType & def, const json & obj, const std::string & path)
{
  check_keys(obj, path, {"kind", "name", "discriminator", "fields"});

  if (const json * v = require_key(obj, path, "discriminator")) {
    build_type_ref(*v, join_path(path, "discriminator"), def.discriminator);
  }

  const json * list = require_key(obj, path, "fields");
  if (list == nullptr) return;
  const std::string list_path = join_path(path, "fields");
  if (!list->is_array()) {
    report_wrong_kind(list_path, "an array of union fields", *list);
    return;
  }

  def.fields = context_->allocate_array<UnionField>(list->size());
  for (size_t i = 0; i < list->size(); ++i) {
    const json & item = (*list)[i];
    const std::string field_path = index_path(list_path, i);
    UnionField & field = def.fields[i];
    field.path = intern(field_path);

    if (!item.is_object()) {
      report_wrong_kind(field_path, "a union field object", item);
      continue;
    }
    check_keys(item, field_path, {"name", "type", "labels"});

    if (const json * v = require_key(item, field_path, "name")) {
      field.name = read_name(*v, join_path(field_path, "name"));
    }
    if (const json * v = require_key(item, field_path, "type")) {
      build_type_ref(*v, join_path(field_path, "type"), field.type);
    }

    if (const json * v = require_key(item, field_path, "labels")) {
      const std::string labels_path = join_path(field_path, "labels");
      if (!v->is_array()) {
        report_wrong_kind(labels_path, "an array of labels", *v);
      } else {
        std::vector<LabelValue> labels;
        labels.reserve(v->size());
        for (size_t j = 0; j < v->size(); ++j) {
          const json & label = (*v)[j];
          const std::string label_path = index_path(labels_path, j);
          if (label.is_boolean()) {
            labels.push_back(LabelValue::make_bool(label.get<bool>()));
          } else if (label.is_string()) {
            labels.push_back(LabelValue::make_string(intern(label.get_ref<const std::string &>())));
          } else if (label.is_number_integer()) {
            if (const auto value = read_integer(label, label_path)) {
              labels.push_back(LabelValue::make_integer(*value));
            }
          } else {
            report_wrong_kind(label_path, "an integer, boolean or string label", label);
          }
        }
        field.labels = context_->copy_to_arena(labels);
      }
    }
    field.note = read_note(item, field_path);
  }
}

void TypeGraphBuilder::build_rune(RuneType & def, const json & obj, const std::string & path)
{
  check_keys(obj, path, {"kind", "name", "encoding"});
  def.encoding = read_encoding(obj, path);
}

void TypeGraphBuilder::build_enum(EnumType & def, const json & obj, const std::string & path)
{
  check_keys(obj, path, {"kind", "name", "values", "type"});

  if (const json * v = find_key(obj, "type")) {
    build_type_ref(*v, join_path(path, "type"), def.underlying);
  }

  const json * list = require_key(obj, path, "values");
  if (list == nullptr) return;
  const std::string list_path = join_path(path, "values");
  if (!list->is_array()) {
    report_wrong_kind(list_path, "an array of enum values", *list);
    return;
  }

  def.values = context_->allocate_array<EnumValue>(list->size());
  for (size_t i = 0; i < list->size(); ++i) {
    const json & item = (*list)[i];
    const std::string value_path = index_path(list_path, i);
    EnumValue & value = def.values[i];
    value.path = intern(value_path);

    if (!item.is_object()) {
      report_wrong_kind(value_path, "an enum value object", item);
      continue;
    }
    check_keys(item, value_path, {"name", "value"});

    if (const json * v = require_key(item, value_path, "name")) {
      value.name = read_name(*v, join_path(value_path, "name"));
    }
    if (const json * v = require_key(item, value_path, "value")) {
      value.value = read_integer(*v, join_path(value_path, "value")).value_or(IntValue());
    }
    value.note = read_note(item, value_path);
  }
}

void TypeGraphBuilder::build_bitset(BitsetType & def, const json & obj, const std::string & path)
{
  check_keys(obj, path, {"kind", "name", "flags", "size"});

  if (const json * v = find_key(obj, "size")) {
    def.size = read_int64(*v, join_path(path, "size"));
  }

  const json * list = require_key(obj, path, "flags");
  if (list == nullptr) return;
  const std::string list_path = join_path(path, "flags");
  if (!list->is_array()) {
    report_wrong_kind(list_path, "an array of flags", *list);
    return;
  }

  def.flags = context_->allocate_array<BitsetFlag>(list->size());
  for (size_t i = 0; i < list->size(); ++i) {
    const json & item = (*list)[i];
    const std::string flag_path = index_path(list_path, i);
    BitsetFlag & flag = def.flags[i];
    flag.path = intern(flag_path);

    if (!item.is_object()) {
      report_wrong_kind(flag_path, "a flag object", item);
      continue;
    }
    check_keys(item, flag_path, {"name", "bit"});

    if (const json * v = require_key(item, flag_path, "name")) {
      flag.name = read_name(*v, join_path(flag_path, "name"));
    }
    if (const json * v = require_key(item, flag_path, "bit")) {
      flag.bit = read_int64(*v, join_path(flag_path, "bit")).value_or(0);
    }
    flag.note = read_note(item, flag_path);
  }
}

void TypeGraphBuilder::build_type_ref(const json & value, const std::string & path, TypeRef & ref)
{
  ref.path = intern(path);

  if (value.is_string()) {
    const auto & name = value.get_ref<const std::string &>();
    if (name.empty()) {
      report_error("invalid-name", path, "type reference must not be an empty name");
      return;
    }
    ref.present = true;
    ref.by_name = true;
    ref.name = intern(name);
    pending_refs_.push_back(&ref);
    return;
  }

  if (value.is_object()) {
    if (depth_ >= k_max_nesting_depth) {
      report_error(
        "nesting-too-deep", path,
        "inline definitions nest deeper than " + std::to_string(k_max_nesting_depth) + " levels")
        .with_help("declare the inner type at the top level and refer to it by name");
      return;
    }
    ++depth_;
    TypeDef * def = build_type_def(value, path);
    --depth_;
    if (def == nullptr) return;
    ref.present = true;
    ref.target = def;
    if (def->has_name()) {
      inline_named_.push_back(def);
    }
    return;
  }

  report_wrong_kind(path, "a type name or an inline type definition", value);
}

// ============================================================================
// Registration / Resolution
// ============================================================================

void TypeGraphBuilder::register_name(TypeDef * def, bool top_level)
{
  if (!def->has_name()) return;

  if (const TypeSymbol * existing = registry_.lookup(def->name)) {
    report_error(
      "duplicate-type-name", join_path(def->path, "name"),
      "type '" + std::string(def->name) + "' is already defined")
      .with_secondary_label(join_path(existing->decl->path, "name"), "first defined here");
    return;
  }

  TypeSymbol sym;
  sym.name = def->name;
  sym.decl = def;
  sym.top_level = top_level;
  (void)registry_.define(sym);
}

void TypeGraphBuilder::resolve_references()
{
  for (TypeRef * ref : pending_refs_) {
    if (const TypeDef * target = registry_.find(ref->name)) {
      ref->target = target;
      continue;
    }
    // The definition exists but was malformed; it has been reported already.
    if (failed_names_.count(std::string(ref->name)) != 0) {
      continue;
    }
    report_error(
      "unknown-type-reference", std::string(ref->path),
      "unknown type '" + std::string(ref->name) + "'")
      .with_help("no type with this name is declared in the document");
  }
}

// ============================================================================
// Shape Helpers
// ============================================================================

void TypeGraphBuilder::check_keys(
  const json & obj, const std::string & path, std::initializer_list<std::string_view> allowed)
{
  check_keys(obj, path, std::vector<std::string_view>(allowed));
}

void TypeGraphBuilder::check_keys(
  const json & obj, const std::string & path, const std::vector<std::string_view> & allowed)
{
  for (const auto & item : obj.items()) {
    const std::string & key = item.key();
    if (key == "note" || std::find(allowed.begin(), allowed.end(), key) != allowed.end()) {
      continue;
    }

    DiagnosticBag & bag = diags_ ? *diags_ : silent_;
    std::string message = "unexpected key '" + key + "'";
    std::optional<DiagnosticBuilder> builder;
    if (options_.strict_keys) {
      builder.emplace(report_error("unexpected-key", join_path(path, key), std::move(message)));
    } else {
      builder.emplace(
        bag.report_warning(Stage::Structure, "unexpected-key", join_path(path, key), message));
    }
    if (key == "encoding" && !options_.legacy_kinds) {
      builder->with_help("'encoding' belongs to the legacy grammar generation");
    }
  }
}

const json * TypeGraphBuilder::require_key(
  const json & obj, const std::string & path, std::string_view key)
{
  if (const json * v = find_key(obj, key)) {
    return v;
  }
  report_error("missing-key", path, "missing required key '" + std::string(key) + "'");
  return nullptr;
}

const json * TypeGraphBuilder::find_key(const json & obj, std::string_view key)
{
  const auto it = obj.find(std::string(key));
  return it != obj.end() ? &*it : nullptr;
}

std::optional<int64_t> TypeGraphBuilder::read_int64(const json & value, const std::string & path)
{
  if (value.is_number_unsigned()) {
    const auto u = value.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      report_error(
        "integer-out-of-range", path,
        "integer " + std::to_string(u) + " does not fit in a signed 64-bit value");
      return std::nullopt;
    }
    return static_cast<int64_t>(u);
  }
  if (value.is_number_integer()) {
    return value.get<int64_t>();
  }
  report_wrong_kind(path, "an integer", value);
  return std::nullopt;
}

std::optional<IntValue> TypeGraphBuilder::read_integer(
  const json & value, const std::string & path)
{
  if (value.is_number_unsigned()) {
    return IntValue::from_unsigned(value.get<uint64_t>());
  }
  if (value.is_number_integer()) {
    return IntValue::from_signed(value.get<int64_t>());
  }
  report_wrong_kind(path, "an integer", value);
  return std::nullopt;
}

std::optional<bool> TypeGraphBuilder::read_bool(const json & value, const std::string & path)
{
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  report_wrong_kind(path, "a boolean", value);
  return std::nullopt;
}

std::optional<std::string_view> TypeGraphBuilder::read_string(
  const json & value, const std::string & path)
{
  if (value.is_string()) {
    return intern(value.get_ref<const std::string &>());
  }
  report_wrong_kind(path, "a string", value);
  return std::nullopt;
}

std::string_view TypeGraphBuilder::read_name(const json & value, const std::string & path)
{
  const auto name = read_string(value, path);
  if (!name) {
    return {};
  }
  if (name->empty()) {
    report_error("invalid-name", path, "name must not be empty");
    return {};
  }
  return *name;
}

const json * TypeGraphBuilder::read_note(const json & obj, const std::string & path)
{
  const json * note = find_key(obj, "note");
  if (note == nullptr) {
    return nullptr;
  }
  if (!note->is_object()) {
    report_wrong_kind(join_path(path, "note"), "an object", *note);
    return nullptr;
  }
  return context_->keep_note(*note);
}

std::string_view TypeGraphBuilder::read_encoding(const json & obj, const std::string & path)
{
  if (const json * v = find_key(obj, "encoding")) {
    return read_string(*v, join_path(path, "encoding")).value_or(std::string_view());
  }
  return {};
}

// ============================================================================
// Reporting
// ============================================================================

DiagnosticBuilder TypeGraphBuilder::report_error(
  std::string rule, std::string path, std::string message)
{
  has_errors_ = true;
  ++error_count_;
  DiagnosticBag & bag = diags_ ? *diags_ : silent_;
  return bag.report_error(Stage::Structure, std::move(rule), std::move(path), std::move(message));
}

void TypeGraphBuilder::report_wrong_kind(
  const std::string & path, std::string_view expected, const json & value)
{
  report_error(
    "wrong-value-kind", path,
    "expected " + std::string(expected) + ", found " + describe(value));
}

}  // namespace itl
