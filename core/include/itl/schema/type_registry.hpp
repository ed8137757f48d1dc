// itl/schema/type_registry.hpp - Named type symbol table
//
// Maps every named definition of a schema (top-level or inline) to its node.
//
#pragma once

#include <string_view>
#include <unordered_map>
#include <vector>

#include "itl/schema/type_def.hpp"

namespace itl
{

// ============================================================================
// Type Symbol
// ============================================================================

/**
 * A symbol in the type namespace.
 */
struct TypeSymbol
{
  std::string_view name;
  const TypeDef * decl = nullptr;
  bool top_level = false;  ///< Declared directly in Root.types

  [[nodiscard]] bool is_top_level() const noexcept { return top_level; }
};

// ============================================================================
// Type Registry
// ============================================================================

/// Transparent hash functor for string_view heterogeneous lookup
struct TypeRegistryHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct TypeRegistryEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * Type namespace symbol table.
 *
 * Filled during the registration pass of the builder, then frozen. A frozen
 * registry is never modified again and may be read from any thread.
 */
class TypeRegistry
{
public:
  TypeRegistry() = default;

  // ===========================================================================
  // Symbol Definition
  // ===========================================================================

  /**
   * Define a type symbol.
   *
   * @param symbol The symbol to define (name must be interned)
   * @return true if defined successfully, false if the name already exists
   *         or the registry is frozen
   */
  bool define(TypeSymbol symbol)
  {
    if (frozen_) return false;
    auto [it, inserted] = symbols_.emplace(symbol.name, symbol);
    if (inserted) {
      order_.push_back(symbol.name);
    }
    return inserted;
  }

  /// Disallow further definitions
  void freeze() noexcept { frozen_ = true; }
  [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }

  // ===========================================================================
  // Symbol Lookup
  // ===========================================================================

  /**
   * Look up a symbol by name.
   *
   * @return Pointer to symbol if found, nullptr otherwise
   */
  [[nodiscard]] const TypeSymbol * lookup(std::string_view name) const
  {
    auto it = symbols_.find(name);
    return it != symbols_.end() ? &it->second : nullptr;
  }

  /// Definition registered under the name, or nullptr
  [[nodiscard]] const TypeDef * find(std::string_view name) const
  {
    const TypeSymbol * sym = lookup(name);
    return sym ? sym->decl : nullptr;
  }

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }

  /// Names in registration order
  [[nodiscard]] const std::vector<std::string_view> & names() const noexcept { return order_; }

private:
  std::unordered_map<std::string_view, TypeSymbol, TypeRegistryHash, TypeRegistryEqual> symbols_;
  std::vector<std::string_view> order_;
  bool frozen_ = false;
};

}  // namespace itl
