// itl/schema/visitor.hpp - CRTP Visitor pattern over TypeDef nodes
//
// Dispatch is generated from type_kinds.def, so adding a kind there adds a
// visit_<snake> hook here.
//
#pragma once

#include <type_traits>

#include "itl/basic/casting.hpp"
#include "itl/schema/type_def.hpp"

namespace itl
{

namespace detail
{

/// Helper to propagate const from DefPtrT to derived node types
template <typename DefPtrT, typename DerivedDef>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<DefPtrT>>, const DerivedDef *, DerivedDef *>;

}  // namespace detail

// ============================================================================
// TypeVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for TypeDef nodes.
 *
 * The derived class implements visit_<kind> for the kinds it cares about;
 * every other kind falls through to visit_type().
 *
 * Usage:
 * @code
 *   class Printer : public ConstTypeVisitor<Printer, std::string> {
 *   public:
 *     std::string visit_int(const IntType* def) { return "int"; }
 *     std::string visit_type(const TypeDef*) { return "?"; }
 *   };
 * @endcode
 *
 * The visitor does not follow TypeRefs: the graph may be cyclic, so
 * traversal policy belongs to the derived class.
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam DefPtrT The node pointer type (TypeDef* or const TypeDef*)
 */
template <typename Derived, typename ReturnType = void, typename DefPtrT = TypeDef *>
class TypeVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(DefPtrT def)
  {
    if (!def) {
      return ReturnType();
    }

    switch (def->get_kind()) {
#define ITL_TYPE_KIND(Class, Kind, Snake, Keyword) \
  case TypeKind::Kind:                            \
    return get_derived().visit_##Snake(cast<Class>(def));
#include "itl/schema/type_kinds.def"
    }

    return ReturnType();
  }

#define ITL_TYPE_KIND(Class, Kind, Snake, Keyword)                          \
  ReturnType visit_##Snake(detail::propagate_const_t<DefPtrT, Class> def) \
  {                                                                       \
    return get_derived().visit_type(def);                                 \
  }
#include "itl/schema/type_kinds.def"

  /// Base case - does nothing by default
  ReturnType visit_type(DefPtrT /*def*/) { return ReturnType(); }
};

/// Alias for const traversal
template <typename Derived, typename ReturnType = void>
using ConstTypeVisitor = TypeVisitor<Derived, ReturnType, const TypeDef *>;

}  // namespace itl
