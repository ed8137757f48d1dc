// itl/schema/schema.hpp - Read-only type graph of one ITL document
//
// A Schema owns the arena holding every TypeDef of a document together with
// the frozen name registry. Nothing in the public API mutates it, so a
// Schema handed out by the loader may be read from several threads at once.
//
#pragma once

#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string_view>
#include <vector>

#include "itl/schema/schema_context.hpp"
#include "itl/schema/type_def.hpp"
#include "itl/schema/type_registry.hpp"

namespace itl
{

class Schema
{
public:
  /**
   * @param context Arena owning every node reachable from `types`
   * @param registry Name registry (frozen on construction)
   * @param types Root.types in document order
   * @param note Root-level note, or nullptr
   */
  Schema(
    std::unique_ptr<SchemaContext> context, TypeRegistry registry,
    std::vector<const TypeDef *> types, const nlohmann::json * note);

  Schema(const Schema &) = delete;
  Schema & operator=(const Schema &) = delete;
  Schema(Schema &&) = default;
  Schema & operator=(Schema &&) = default;
  ~Schema() = default;

  /// Root.types in document order (named and anonymous)
  [[nodiscard]] const std::vector<const TypeDef *> & types() const noexcept { return types_; }

  /// Named top-level types in declaration order
  [[nodiscard]] std::vector<const TypeDef *> named_types() const;

  /// Every node of the graph, inline definitions included, in document order
  [[nodiscard]] std::vector<const TypeDef *> all_types() const;

  /**
   * Resolve a name to its definition.
   *
   * Named inline definitions are found too.
   *
   * @return The definition, or nullptr if no type has that name
   */
  [[nodiscard]] const TypeDef * lookup(std::string_view name) const;

  [[nodiscard]] const TypeRegistry & registry() const noexcept { return registry_; }

  /// Root-level note, or nullptr
  [[nodiscard]] const nlohmann::json * note() const noexcept { return note_; }

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  std::unique_ptr<SchemaContext> context_;
  TypeRegistry registry_;
  std::vector<const TypeDef *> types_;
  const nlohmann::json * note_ = nullptr;
};

}  // namespace itl
