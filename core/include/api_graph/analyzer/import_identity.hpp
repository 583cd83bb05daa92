// api_graph/analyzer/import_identity.hpp - Identity of an external export
//
#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace api_graph
{

/**
 * "The same export of the same external package".
 *
 * Several local aliases may import one external export; they all collapse
 * onto the SymbolNode registered for its ImportIdentity.
 */
struct ImportIdentity
{
  /// Name as exported by the package entry point
  std::string export_name;

  /// Bare module specifier, e.g. "some-lib" or "some-lib/sub"
  std::string module_path;

  /// Textual key ("some-lib:Widget")
  [[nodiscard]] std::string key() const { return module_path + ":" + export_name; }

  [[nodiscard]] bool operator==(const ImportIdentity & other) const noexcept
  {
    return export_name == other.export_name && module_path == other.module_path;
  }
  [[nodiscard]] bool operator!=(const ImportIdentity & other) const noexcept
  {
    return !(*this == other);
  }
};

struct ImportIdentityHash
{
  size_t operator()(const ImportIdentity & id) const noexcept
  {
    const size_t h1 = std::hash<std::string>{}(id.export_name);
    const size_t h2 = std::hash<std::string>{}(id.module_path);
    return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
  }
};

}  // namespace api_graph
