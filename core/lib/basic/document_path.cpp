// itl/basic/document_path.cpp - Document path helpers
#include "itl/basic/document_path.hpp"

namespace itl
{

std::string join_path(std::string_view parent, std::string_view key)
{
  std::string out(parent);
  if (!out.empty()) out += '.';
  out += key;
  return out;
}

std::string index_path(std::string_view parent, size_t index)
{
  std::string out(parent);
  out += '[';
  out += std::to_string(index);
  out += ']';
  return out;
}

std::string display_path(std::string_view path)
{
  return path.empty() ? std::string(k_root_path) : std::string(path);
}

}  // namespace itl
