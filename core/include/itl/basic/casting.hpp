// itl/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any class hierarchy that implements the `classof` static method
// pattern (TypeDef and its kind-specific subclasses).
//
// Usage:
//   if (isa<RecordType>(def)) { ... }
//   if (isa<RecordType, UnionType>(def)) { ... }      // any of the listed kinds
//   auto* rec = cast<RecordType>(def);            // asserts on failure
//   if (auto* rec = dyn_cast<RecordType>(def)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>

namespace itl
{

namespace detail
{

/// Check if T has a classof static method
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

// ============================================================================
// isa<T>
// ============================================================================

/**
 * Check if a node is of type T.
 *
 * @return true if node is of type T, false otherwise (including nullptr)
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

/// True if the node is any one of the listed types
template <typename T1, typename T2, typename... Rest, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  return isa<T1>(node) || isa<T2, Rest...>(node);
}

// ============================================================================
// cast<T> - Unchecked cast (asserts on failure)
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

// ============================================================================
// dyn_cast<T> - Safe dynamic cast (returns nullptr on failure)
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace itl
