// api_graph/report/graph_json.hpp - JSON dump of the declaration graph
//
// Serializes the graph reachable from a module entry for inspection. The
// output is a debugging aid with a stable shape, not an API report.
//
#pragma once

#include <nlohmann/json.hpp>

#include "api_graph/analyzer/module_entry.hpp"
#include "api_graph/analyzer/symbol_table.hpp"

namespace api_graph
{

/**
 * Serialize everything reachable from a module entry.
 *
 * Shape:
 *   {
 *     "module": "src/index.d.ts",
 *     "external_path": null,
 *     "exports": { "Widget": 0, ... },
 *     "symbols": [ { "id": 0, "name": "Widget", "declarations": [...] }, ... ]
 *   }
 *
 * "exports" holds every visible name, including names reached only through
 * `export *`. Symbols are numbered in discovery order: exports (sorted by
 * name) first,
 * then parents, nested declarations and references breadth first.
 *
 * @param table The table that built the graph
 * @param entry Entry to serialize
 */
[[nodiscard]] nlohmann::json to_json(const SymbolTable & table, const ModuleEntry & entry);

/**
 * Serialize a single symbol without following its references.
 */
[[nodiscard]] nlohmann::json to_json(const SymbolTable & table, const SymbolNode & symbol);

}  // namespace api_graph
