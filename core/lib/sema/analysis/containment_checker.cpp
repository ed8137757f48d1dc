// itl/sema/analysis/containment_checker.cpp - Finite representation check
#include "itl/sema/analysis/containment_checker.hpp"

#include <gsl/span>
#include <string>
#include <unordered_map>
#include <vector>

#include "itl/basic/casting.hpp"

namespace itl
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

/// Whether `def` has a finite value, given what is known so far
bool is_representable(
  const TypeDef * def, const std::unordered_set<const TypeDef *> & representable)
{
  const auto known = [&](const TypeRef & ref) {
    // Unresolved references never reach validation; do not hold them against the type.
    return ref.get() == nullptr || representable.count(ref.get()) != 0;
  };

  if (const auto * rec = dyn_cast<RecordType>(def)) {
    for (const auto & field : rec->fields) {
      if (!field.optional && !known(field.type)) return false;
    }
    return true;
  }
  if (const auto * un = dyn_cast<UnionType>(def)) {
    // An empty union is reported as empty-union.
    if (un->fields.empty()) return true;
    for (const auto & field : un->fields) {
      if (known(field.type)) return true;
    }
    return false;
  }
  if (const auto * seq = dyn_cast<SequenceType>(def)) {
    if (!seq->has_nonempty_fixed_size()) return true;
    return known(seq->element);
  }
  return true;
}

/// Definitions a value of `def` must contain
std::vector<const TypeDef *> required_children(const TypeDef * def)
{
  std::vector<const TypeDef *> out;
  if (!isa<RecordType, UnionType, SequenceType>(def)) {
    return out;
  }
  const auto add = [&out](const TypeRef & ref) {
    if (ref.get() != nullptr) out.push_back(ref.get());
  };

  if (const auto * rec = dyn_cast<RecordType>(def)) {
    for (const auto & field : rec->fields) {
      if (!field.optional) add(field.type);
    }
  } else if (const auto * un = dyn_cast<UnionType>(def)) {
    for (const auto & field : un->fields) {
      add(field.type);
    }
  } else if (const auto * seq = dyn_cast<SequenceType>(def)) {
    add(seq->element);
  }
  return out;
}

std::string cycle_message(gsl::span<const TypeDef * const> stack, const TypeDef * target)
{
  std::string msg = "type has no finite representation: ";

  size_t start = 0;
  for (; start < stack.size(); ++start) {
    if (stack[start] == target) {
      break;
    }
  }
  if (start >= stack.size()) {
    start = 0;
  }

  for (size_t i = start; i < stack.size(); ++i) {
    if (i > start) msg += " -> ";
    msg += std::string(stack[i]->display_name());
  }
  msg += " -> ";
  msg += std::string(target->display_name());
  return msg;
}

}  // namespace

std::unordered_set<const TypeDef *> ContainmentChecker::representable_types(const Schema & schema)
{
  const std::vector<const TypeDef *> all = schema.all_types();
  std::unordered_set<const TypeDef *> representable;
  representable.reserve(all.size());

  bool changed = true;
  while (changed) {
    changed = false;
    for (const TypeDef * def : all) {
      if (representable.count(def) != 0) continue;
      if (is_representable(def, representable)) {
        representable.insert(def);
        changed = true;
      }
    }
  }
  return representable;
}

bool ContainmentChecker::check(const Schema & schema)
{
  reset();

  const std::unordered_set<const TypeDef *> representable = representable_types(schema);

  // Restrict the graph to unrepresentable definitions; every one of them
  // reaches a cycle made only of unrepresentable definitions.
  std::unordered_map<const TypeDef *, std::vector<const TypeDef *>> adj;
  std::vector<const TypeDef *> roots;
  for (const TypeDef * def : schema.all_types()) {
    if (representable.count(def) != 0) continue;
    std::vector<const TypeDef *> edges;
    for (const TypeDef * child : required_children(def)) {
      if (representable.count(child) == 0) {
        edges.push_back(child);
      }
    }
    adj.emplace(def, std::move(edges));
    roots.push_back(def);
  }

  std::unordered_map<const TypeDef *, Color> color;
  color.reserve(roots.size());
  for (const TypeDef * r : roots) {
    color.emplace(r, Color::White);
  }

  // Iterative DFS; `stack` is the current path, `next` the edge to try next per frame
  std::vector<const TypeDef *> stack;
  std::vector<size_t> next;

  for (const TypeDef * r : roots) {
    if (color[r] != Color::White) continue;

    color[r] = Color::Gray;
    stack.push_back(r);
    next.push_back(0);

    while (!stack.empty()) {
      const TypeDef * u = stack.back();
      const std::vector<const TypeDef *> & edges = adj[u];
      if (next.back() == edges.size()) {
        color[u] = Color::Black;
        stack.pop_back();
        next.pop_back();
        continue;
      }

      const TypeDef * v = edges[next.back()++];
      const auto it = color.find(v);
      const Color c = (it == color.end()) ? Color::Black : it->second;
      if (c == Color::Gray) {
        const gsl::span<const TypeDef * const> stack_view(stack.data(), stack.size());
        report_error("infinite-type", std::string(v->path), cycle_message(stack_view, v))
          .with_help(
            "break the cycle with an optional field or a non-recursive union alternative");
      } else if (c == Color::White) {
        color[v] = Color::Gray;
        stack.push_back(v);
        next.push_back(0);
      }
    }
  }

  return !has_errors();
}

}  // namespace itl
