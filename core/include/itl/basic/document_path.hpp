// itl/basic/document_path.hpp - Document path helpers
//
// Diagnostics locate problems by their path in the document, written the way
// a reader would index the JSON value: "types[3].fields[1].type".
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace itl
{

/// Rendering of the empty path (the document itself)
inline constexpr std::string_view k_root_path = "<root>";

/**
 * Join a document path and a key: ("types[3]", "fields") -> "types[3].fields".
 * An empty parent yields the key itself.
 */
[[nodiscard]] std::string join_path(std::string_view parent, std::string_view key);

/// Append an array index: ("types", 3) -> "types[3]"
[[nodiscard]] std::string index_path(std::string_view parent, size_t index);

/// Path as shown to users ("<root>" for the empty path)
[[nodiscard]] std::string display_path(std::string_view path);

}  // namespace itl
