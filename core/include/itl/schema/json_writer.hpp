// itl/schema/json_writer.hpp - Canonical ITL serialization of a type graph
//
// Writes TypeDefs back in the document grammar: named references as strings,
// inline definitions inline, notes verbatim. Only keys that carry a value
// are written.
//
#pragma once

#include <nlohmann/json.hpp>

#include "itl/schema/schema.hpp"
#include "itl/schema/type_def.hpp"

namespace itl
{

/**
 * Serialize one definition (including its inline children) as a TypeDef
 * object.
 *
 * @param def The definition to serialize
 * @return JSON object, or null for nullptr
 */
[[nodiscard]] nlohmann::json to_json(const TypeDef * def);

/**
 * Serialize a Type position: a string for by-name references, an object for
 * inline definitions.
 */
[[nodiscard]] nlohmann::json to_json(const TypeRef & ref);

/**
 * Serialize a whole schema as a Root document.
 *
 * Parsing the result yields a schema with the same types.
 */
[[nodiscard]] nlohmann::json to_json(const Schema & schema);

}  // namespace itl
