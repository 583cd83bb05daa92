// api_graph/report/graph_json.cpp - Graph serialization implementation
//
#include "api_graph/report/graph_json.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace api_graph
{
namespace
{

using nlohmann::json;

// ============================================================================
// GraphWriter
// ============================================================================

class GraphWriter
{
public:
  explicit GraphWriter(const SymbolTable & table) : oracle_(table.oracle()) {}

  size_t id_of(const SymbolNode & symbol)
  {
    auto [it, inserted] = ids_.emplace(&symbol, order_.size());
    if (inserted) {
      order_.push_back(&symbol);
    }
    return it->second;
  }

  /// Serialize queued symbols until no new ones are discovered
  json drain()
  {
    json symbols = json::array();
    for (size_t i = 0; i < order_.size(); ++i) {
      symbols.push_back(symbol_json(*order_[i]));
    }
    return symbols;
  }

  json symbol_json(const SymbolNode & symbol)
  {
    json j{
      {"id", id_of(symbol)},
      {"name", symbol.local_name()},
      {"module", module_name(symbol)},
      {"parent", nullptr},
      {"import", nullptr},
      {"nominal", symbol.nominal()},
      {"analyzed", symbol.analyzed()}};

    if (symbol.parent()) {
      j["parent"] = id_of(*symbol.parent());
    }
    if (const auto & import = symbol.import_identity()) {
      j["import"] = json{{"module_path", import->module_path}, {"export_name", import->export_name}};
    }

    json declarations = json::array();
    for (const DeclarationNode * decl : symbol.declarations()) {
      declarations.push_back(declaration_json(*decl));
    }
    j["declarations"] = std::move(declarations);
    return j;
  }

  json declaration_json(const DeclarationNode & decl)
  {
    json references = json::array();
    for (const SymbolNode * ref : decl.referenced_symbols()) {
      references.push_back(id_of(*ref));
    }

    json children = json::array();
    for (const DeclarationNode * child : decl.children()) {
      json c = declaration_json(*child);
      c["symbol"] = id_of(child->symbol());
      children.push_back(std::move(c));
    }

    return json{
      {"kind", std::string(to_string(decl.kind()))},
      {"references", std::move(references)},
      {"children", std::move(children)}};
  }

private:
  std::string module_name(const SymbolNode & symbol) const
  {
    const auto declarations = oracle_.declarations_of(symbol.followed_symbol());
    if (declarations.empty()) {
      return {};
    }
    return oracle_.module_file_name(oracle_.module_of(declarations.front()));
  }

  const TypeOracle & oracle_;
  std::unordered_map<const SymbolNode *, size_t> ids_;
  std::vector<const SymbolNode *> order_;
};

}  // namespace

nlohmann::json to_json(const SymbolTable & table, const ModuleEntry & entry)
{
  GraphWriter writer(table);

  json exports = json::object();
  for (const auto & [name, symbol] : table.visible_exports(entry)) {
    exports[name] = writer.id_of(*symbol);
  }

  json star_exports = json::array();
  for (const ModuleEntry * star : entry.star_exported_modules) {
    star_exports.push_back(table.oracle().module_file_name(star->source_module));
  }

  json j{
    {"module", table.oracle().module_file_name(entry.source_module)},
    {"external_path", nullptr},
    {"exports", std::move(exports)},
    {"star_exports", std::move(star_exports)}};
  if (entry.external_path) {
    j["external_path"] = *entry.external_path;
  }
  j["symbols"] = writer.drain();
  return j;
}

nlohmann::json to_json(const SymbolTable & table, const SymbolNode & symbol)
{
  GraphWriter writer(table);
  return writer.symbol_json(symbol);
}

}  // namespace api_graph
