// api_graph/analyzer/module_entry.hpp - Export surface of one source module
//
#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "api_graph/oracle/handles.hpp"

namespace api_graph
{

class SymbolNode;

// ============================================================================
// Module Entry
// ============================================================================

/**
 * The exports of a single module, as seen by the analyzer.
 *
 * Entries are created and populated by SymbolTable::fetch_module() and live
 * as long as the table. Direct exports are resolved when the entry is
 * created; names reachable only through `export * from` are found by walking
 * star_exported_modules at lookup time.
 */
struct ModuleEntry
{
  explicit ModuleEntry(ModuleId module) : source_module(module) {}

  ModuleEntry(const ModuleEntry &) = delete;
  ModuleEntry & operator=(const ModuleEntry &) = delete;

  /// Module this entry describes
  ModuleId source_module;

  /// Bare specifier through which an external package entry point was reached
  std::optional<std::string> external_path;

  /// Exported name -> canonical symbol (sorted by name)
  std::map<std::string, SymbolNode *> exported_symbols;

  /// Targets of `export * from` declarations, in declaration order
  std::vector<ModuleEntry *> star_exported_modules;

  /// Check if this entry is an external package entry point
  [[nodiscard]] bool is_external() const noexcept { return external_path.has_value(); }

  /// Add a wildcard re-export target; duplicates are ignored
  void add_star_export(ModuleEntry & target)
  {
    if (std::find(star_exported_modules.begin(), star_exported_modules.end(), &target) ==
        star_exported_modules.end()) {
      star_exported_modules.push_back(&target);
    }
  }

  /// Direct export only (no wildcard traversal)
  [[nodiscard]] SymbolNode * find_direct_export(const std::string & name) const
  {
    auto it = exported_symbols.find(name);
    return it != exported_symbols.end() ? it->second : nullptr;
  }
};

}  // namespace api_graph
