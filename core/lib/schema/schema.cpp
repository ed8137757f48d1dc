// itl/schema/schema.cpp - Schema implementation
#include "itl/schema/schema.hpp"

#include <utility>

namespace itl
{

Schema::Schema(
  std::unique_ptr<SchemaContext> context, TypeRegistry registry,
  std::vector<const TypeDef *> types, const nlohmann::json * note)
: context_(std::move(context)),
  registry_(std::move(registry)),
  types_(std::move(types)),
  note_(note)
{
  registry_.freeze();
}

std::vector<const TypeDef *> Schema::named_types() const
{
  std::vector<const TypeDef *> result;
  for (const TypeDef * def : types_) {
    if (def->has_name()) {
      result.push_back(def);
    }
  }
  return result;
}

std::vector<const TypeDef *> Schema::all_types() const
{
  std::vector<const TypeDef *> result;
  if (!context_) return result;
  result.reserve(context_->all_types().size());
  for (const TypeDef * def : context_->all_types()) {
    result.push_back(def);
  }
  return result;
}

const TypeDef * Schema::lookup(std::string_view name) const { return registry_.find(name); }

}  // namespace itl
