// itl/schema/json_writer.cpp - Canonical ITL serialization implementation
//
#include "itl/schema/json_writer.hpp"

#include <cstdint>
#include <string>

#include "itl/schema/visitor.hpp"

namespace itl
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_int(const IntValue & v)
{
  if (v.is_negative()) {
    // Negative values were read from int64 and always fit back.
    return json(v.as_int64().value_or(0));
  }
  return json(v.magnitude());
}

json j_label(const LabelValue & label)
{
  switch (label.kind()) {
    case LabelKind::Integer:
      return j_int(label.as_integer());
    case LabelKind::Bool:
      return json(label.as_bool());
    case LabelKind::String:
      return json(std::string(label.as_string()));
  }
  return json();
}

void put_note(json & j, const nlohmann::json * note)
{
  if (note) {
    j["note"] = *note;
  }
}

void put_encoding(json & j, std::string_view encoding)
{
  if (!encoding.empty()) {
    j["encoding"] = std::string(encoding);
  }
}

// ============================================================================
// JsonWriter
// ============================================================================

class JsonWriter : public ConstTypeVisitor<JsonWriter, json>
{
public:
  json write(const TypeDef * def)
  {
    json j = json::object();
    if (def->has_name()) {
      j["name"] = std::string(def->name);
    }
    j["kind"] = std::string(to_string(def->get_kind()));
    json body = visit(def);
    for (const auto & item : body.items()) {
      j[item.key()] = item.value();
    }
    put_note(j, def->note);
    return j;
  }

  json visit_int(const IntType * def)
  {
    json j = json::object();
    if (def->bits) j["bits"] = *def->bits;
    if (def->is_unsigned) j["unsigned"] = true;
    put_encoding(j, def->encoding);
    return j;
  }

  json visit_float(const FloatType * def)
  {
    json j = json::object();
    if (def->model) j["model"] = std::string(to_string(*def->model));
    put_encoding(j, def->encoding);
    return j;
  }

  json visit_fixed(const FixedType * def)
  {
    json j{{"base", def->base}, {"digits", def->digits}, {"scale", def->scale}};
    put_encoding(j, def->encoding);
    return j;
  }

  json visit_sequence(const SequenceType * def)
  {
    json j{{"type", to_json(def->element)}};
    if (def->size_form == SizeForm::Scalar) {
      j["size"] = def->size;
    } else if (def->size_form == SizeForm::Dimensions) {
      json dims = json::array();
      for (const int64_t d : def->dimensions) {
        dims.push_back(d);
      }
      j["size"] = std::move(dims);
    }
    if (def->capacity) j["capacity"] = *def->capacity;
    return j;
  }

  json visit_string(const StringType * def)
  {
    json j = json::object();
    if (def->size) j["size"] = *def->size;
    if (def->capacity) j["capacity"] = *def->capacity;
    put_encoding(j, def->encoding);
    return j;
  }

  json visit_record(const RecordType * def)
  {
    json fields = json::array();
    for (const auto & f : def->fields) {
      json jf{{"name", std::string(f.name)}, {"type", to_json(f.type)}};
      if (f.optional) jf["optional"] = true;
      put_note(jf, f.note);
      fields.push_back(std::move(jf));
    }
    return json{{"fields", std::move(fields)}};
  }

  json visit_union(const UnionType * def)
  {
    json fields = json::array();
    for (const auto & f : def->fields) {
      json labels = json::array();
      for (const auto & label : f.labels) {
        labels.push_back(j_label(label));
      }
      json jf{
        {"name", std::string(f.name)}, {"type", to_json(f.type)}, {"labels", std::move(labels)}};
      put_note(jf, f.note);
      fields.push_back(std::move(jf));
    }
    return json{{"discriminator", to_json(def->discriminator)}, {"fields", std::move(fields)}};
  }

  json visit_rune(const RuneType * def)
  {
    json j = json::object();
    put_encoding(j, def->encoding);
    return j;
  }

  json visit_enum(const EnumType * def)
  {
    json values = json::array();
    for (const auto & v : def->values) {
      json jv{{"name", std::string(v.name)}, {"value", j_int(v.value)}};
      put_note(jv, v.note);
      values.push_back(std::move(jv));
    }
    json j{{"values", std::move(values)}};
    if (def->underlying.is_set()) j["type"] = to_json(def->underlying);
    return j;
  }

  json visit_bitset(const BitsetType * def)
  {
    json flags = json::array();
    for (const auto & f : def->flags) {
      json jf{{"name", std::string(f.name)}, {"bit", f.bit}};
      put_note(jf, f.note);
      flags.push_back(std::move(jf));
    }
    json j{{"flags", std::move(flags)}};
    if (def->size) j["size"] = *def->size;
    return j;
  }

  /// byte, bool: no kind-specific keys
  json visit_type(const TypeDef * /*def*/) { return json::object(); }
};

}  // namespace

json to_json(const TypeDef * def)
{
  if (!def) return json();
  JsonWriter writer;
  return writer.write(def);
}

json to_json(const TypeRef & ref)
{
  if (!ref.is_set()) return json();
  if (ref.is_named()) return json(std::string(ref.name));
  return to_json(ref.get());
}

json to_json(const Schema & schema)
{
  json types = json::array();
  for (const TypeDef * def : schema.types()) {
    types.push_back(to_json(def));
  }
  json root{{"types", std::move(types)}};
  put_note(root, schema.note());
  return root;
}

}  // namespace itl
