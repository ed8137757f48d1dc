// itl/schema/schema_context.hpp - Type graph arena allocator and string pool
//
// SchemaContext owns every TypeDef of one schema, the interned names and
// paths they refer to, and the notes copied out of the document.
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <deque>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <nlohmann/json.hpp>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "itl/schema/type_def.hpp"

namespace itl
{

// ============================================================================
// SchemaContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Context that owns all TypeDef nodes, interned strings and notes.
 *
 * Everything created through this context is valid as long as the context
 * is alive. Nodes are never individually freed.
 *
 * Example:
 * @code
 *   SchemaContext ctx;
 *   auto* rec = ctx.create<RecordType>(ctx.intern("types[0]"));
 *   rec->fields = ctx.allocate_array<Field>(2);
 * @endcode
 */
class SchemaContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit SchemaContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~SchemaContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  SchemaContext(const SchemaContext &) = delete;
  SchemaContext & operator=(const SchemaContext &) = delete;
  SchemaContext(SchemaContext &&) = delete;
  SchemaContext & operator=(SchemaContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a new TypeDef of type T.
   *
   * The context takes ownership of the node and records it in creation
   * order (see all_types()).
   *
   * @tparam T The concrete node type to create (must derive from TypeDef)
   * @param args Arguments forwarded to T's constructor
   * @return Non-owning pointer to the created node
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<TypeDef, T>, "T must derive from TypeDef");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "TypeDef must be trivially destructible to be managed by the arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    T * const node = new (mem) T(std::forward<Args>(args)...);
    nodes_.push_back(node);
    return node;
  }

  /// All nodes in creation order (declaration order of the document)
  [[nodiscard]] const std::vector<TypeDef *> & all_types() const noexcept { return nodes_; }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a stable string_view.
   *
   * The returned string_view is valid as long as the context is alive.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    string_pool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return string_pool_.find(s) != string_pool_.end();
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /**
   * Allocate a value-initialized array of type T from the arena.
   *
   * @param size Number of elements to allocate
   * @return A span over the allocated memory
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    static_assert(std::is_trivially_destructible_v<T>, "Arena arrays are never destroyed");
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy elements from a vector to an arena-allocated array.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_destructible_v<T>, "Arena arrays are never destroyed");
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  // ===========================================================================
  // Notes
  // ===========================================================================

  /**
   * Keep a copy of a "note" object alive for the lifetime of the context.
   *
   * @return Stable pointer to the stored copy
   */
  const nlohmann::json * keep_note(const nlohmann::json & note)
  {
    notes_.push_back(note);
    return &notes_.back();
  }

  [[nodiscard]] size_t get_note_count() const noexcept { return notes_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;

  /// Interned strings - keys are string_views pointing to arena memory
  std::pmr::unordered_set<std::string_view> string_pool_;

  /// Nodes in creation order
  std::vector<TypeDef *> nodes_;

  /// Notes (deque keeps element addresses stable)
  std::deque<nlohmann::json> notes_;
};

}  // namespace itl
