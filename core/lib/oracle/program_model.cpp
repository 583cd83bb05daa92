// api_graph/oracle/program_model.cpp - In-memory program model implementation
//
#include "api_graph/oracle/program_model.hpp"

#include <fstream>

namespace api_graph
{

// ============================================================================
// Record Access
// ============================================================================

const ProgramModel::NodeRecord & ProgramModel::node_record(NodeId id) const
{
  return nodes_.at(id.value);
}

ProgramModel::NodeRecord & ProgramModel::node_record(NodeId id) { return nodes_.at(id.value); }

const ProgramModel::SymbolRecord & ProgramModel::symbol_record(SymbolId id) const
{
  return symbols_.at(id.value);
}

ProgramModel::SymbolRecord & ProgramModel::symbol_record(SymbolId id)
{
  return symbols_.at(id.value);
}

const ProgramModel::ModuleRecord & ProgramModel::module_record(ModuleId id) const
{
  return modules_.at(id.value);
}

ProgramModel::ModuleRecord & ProgramModel::module_record(ModuleId id)
{
  return modules_.at(id.value);
}

// ============================================================================
// Building
// ============================================================================

ModuleId ProgramModel::add_module(std::string file_name)
{
  const ModuleId id(static_cast<uint32_t>(modules_.size()));

  NodeRecord source_file;
  source_file.kind = SyntaxKind::SourceFile;
  source_file.text = file_name;
  source_file.module = id;
  const NodeId node_id(static_cast<uint32_t>(nodes_.size()));
  nodes_.push_back(std::move(source_file));

  const SymbolId symbol_id = add_symbol("\"" + file_name + "\"");
  add_declaration(symbol_id, node_id);

  ModuleRecord record;
  record.file_name = std::move(file_name);
  record.node = node_id;
  record.symbol = symbol_id;
  modules_.push_back(std::move(record));
  return id;
}

NodeId ProgramModel::add_node(NodeId parent, SyntaxKind kind, std::string text)
{
  const NodeId id(static_cast<uint32_t>(nodes_.size()));

  NodeRecord record;
  record.kind = kind;
  record.parent = parent;
  record.text = std::move(text);
  record.module = node_record(parent).module;
  nodes_.push_back(std::move(record));

  node_record(parent).children.push_back(id);
  return id;
}

SymbolId ProgramModel::add_symbol(std::string name, SymbolFlags flags)
{
  const SymbolId id(static_cast<uint32_t>(symbols_.size()));
  SymbolRecord record;
  record.name = std::move(name);
  record.flags = flags;
  symbols_.push_back(std::move(record));
  return id;
}

void ProgramModel::add_declaration(SymbolId symbol, NodeId node)
{
  symbol_record(symbol).declarations.push_back(node);
  node_record(node).declares = symbol;
}

void ProgramModel::set_alias_target(SymbolId alias, SymbolId target)
{
  SymbolRecord & record = symbol_record(alias);
  record.alias_target = target;
  record.flags = record.flags | SymbolFlags::Alias;
}

void ProgramModel::set_ambient(SymbolId symbol, bool ambient)
{
  symbol_record(symbol).ambient = ambient;
}

void ProgramModel::bind_identifier(NodeId identifier, SymbolId symbol)
{
  node_record(identifier).refers_to = symbol;
}

void ProgramModel::set_module_specifier(NodeId declaration, std::string specifier)
{
  node_record(declaration).module_specifier = std::move(specifier);
}

void ProgramModel::set_export_specifier(
  NodeId specifier, std::string name, std::optional<std::string> property_name)
{
  node_record(specifier).export_names =
    ExportSpecifierNames{std::move(name), std::move(property_name)};
}

void ProgramModel::add_export(ModuleId module, SymbolId symbol)
{
  module_record(module).exports.push_back(symbol);
}

void ProgramModel::add_export_star(ModuleId module, NodeId export_declaration)
{
  if (!module_record(module).export_star.is_valid()) {
    const SymbolId aggregate = add_symbol("__export", SymbolFlags::ExportStar);
    module_record(module).export_star = aggregate;
    add_export(module, aggregate);
  }
  symbol_record(module_record(module).export_star).declarations.push_back(export_declaration);
}

void ProgramModel::add_resolution(ModuleId from, std::string specifier, ModuleId to)
{
  module_record(from).resolutions.insert_or_assign(std::move(specifier), to);
}

// ============================================================================
// Lookup helpers
// ============================================================================

std::optional<ModuleId> ProgramModel::find_module(std::string_view file_name) const
{
  for (size_t i = 0; i < modules_.size(); ++i) {
    if (modules_[i].file_name == file_name) {
      return ModuleId(static_cast<uint32_t>(i));
    }
  }
  return std::nullopt;
}

NodeId ProgramModel::module_node(ModuleId module) const { return module_record(module).node; }

// ============================================================================
// TypeOracle: Symbols
// ============================================================================

std::string ProgramModel::symbol_name(SymbolId symbol) const { return symbol_record(symbol).name; }

SymbolFlags ProgramModel::symbol_flags(SymbolId symbol) const
{
  return symbol_record(symbol).flags;
}

std::vector<NodeId> ProgramModel::declarations_of(SymbolId symbol) const
{
  return symbol_record(symbol).declarations;
}

SymbolId ProgramModel::alias_target_of(SymbolId symbol) const
{
  const SymbolRecord & record = symbol_record(symbol);
  if (!has_any(record.flags, SymbolFlags::Alias) || !record.alias_target.is_valid()) {
    return symbol;
  }
  return record.alias_target;
}

bool ProgramModel::is_ambient(SymbolId symbol) const { return symbol_record(symbol).ambient; }

// ============================================================================
// TypeOracle: Syntax
// ============================================================================

SyntaxKind ProgramModel::kind_of(NodeId node) const { return node_record(node).kind; }

NodeId ProgramModel::parent_of(NodeId node) const { return node_record(node).parent; }

std::vector<NodeId> ProgramModel::children_of(NodeId node) const
{
  return node_record(node).children;
}

std::string ProgramModel::text_of(NodeId node) const { return node_record(node).text; }

SymbolId ProgramModel::identity_of(NodeId node) const { return node_record(node).declares; }

SymbolId ProgramModel::symbol_at(NodeId identifier) const
{
  return node_record(identifier).refers_to;
}

NodeId ProgramModel::first_identifier_in(NodeId node) const
{
  const NodeRecord & record = node_record(node);
  if (record.kind == SyntaxKind::Identifier) {
    return node;
  }
  for (const NodeId child : record.children) {
    const NodeId found = first_identifier_in(child);
    if (found.is_valid()) {
      return found;
    }
  }
  return NodeId::invalid();
}

std::optional<std::string> ProgramModel::module_specifier_of(NodeId declaration) const
{
  return node_record(declaration).module_specifier;
}

ExportSpecifierNames ProgramModel::export_specifier_of(NodeId specifier) const
{
  const NodeRecord & record = node_record(specifier);
  if (record.export_names) {
    return *record.export_names;
  }
  return ExportSpecifierNames{record.text, std::nullopt};
}

bool ProgramModel::is_declaration_bearing(SyntaxKind kind) const
{
  return is_declaration_kind(kind);
}

// ============================================================================
// TypeOracle: Modules
// ============================================================================

ModuleId ProgramModel::module_of(NodeId node) const { return node_record(node).module; }

SymbolId ProgramModel::module_symbol(ModuleId module) const
{
  return module_record(module).symbol;
}

std::string ProgramModel::module_file_name(ModuleId module) const
{
  return module_record(module).file_name;
}

std::vector<SymbolId> ProgramModel::export_table_of(ModuleId module) const
{
  return module_record(module).exports;
}

std::vector<SymbolId> ProgramModel::exports_of(ModuleId module) const
{
  std::vector<SymbolId> out;
  std::unordered_set<std::string> seen_names;
  std::unordered_set<ModuleId> visited;
  collect_exports(module, out, seen_names, visited);
  return out;
}

void ProgramModel::collect_exports(
  ModuleId module, std::vector<SymbolId> & out, std::unordered_set<std::string> & seen_names,
  std::unordered_set<ModuleId> & visited) const
{
  if (!visited.insert(module).second) {
    return;
  }

  const ModuleRecord & record = module_record(module);

  // Local names shadow anything reached through `export *`
  for (const SymbolId exported : record.exports) {
    const SymbolRecord & sym = symbol_record(exported);
    if (has_any(sym.flags, SymbolFlags::ExportStar)) {
      continue;
    }
    if (seen_names.insert(sym.name).second) {
      out.push_back(exported);
    }
  }

  if (!record.export_star.is_valid()) {
    return;
  }
  for (const NodeId decl : symbol_record(record.export_star).declarations) {
    const std::optional<std::string> & specifier = node_record(decl).module_specifier;
    if (!specifier) {
      continue;
    }
    if (const std::optional<ModuleId> target = resolve_specifier(module, *specifier)) {
      collect_exports(*target, out, seen_names, visited);
    }
  }
}

std::optional<ModuleId> ProgramModel::resolve_specifier(
  ModuleId base, std::string_view specifier) const
{
  const ModuleRecord & record = module_record(base);
  auto it = record.resolutions.find(std::string(specifier));
  if (it == record.resolutions.end()) {
    return std::nullopt;
  }
  return it->second;
}

// ============================================================================
// Serialization
// ============================================================================

namespace
{

using nlohmann::json;

/// Look up a string id in a name table, reporting unknown references
template <typename Id>
std::optional<Id> lookup_id(
  const std::unordered_map<std::string, Id> & table, const std::string & key,
  std::string_view what, std::string & error)
{
  auto it = table.find(key);
  if (it == table.end()) {
    error = "unknown " + std::string(what) + " '" + key + "'";
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

ModelLoadResult ProgramModel::from_json(const json & doc)
{
  if (!doc.is_object()) {
    return ModelLoadResult::fail("program model must be a JSON object");
  }

  auto model = std::make_unique<ProgramModel>();
  std::unordered_map<std::string, ModuleId> modules_by_file;
  std::unordered_map<std::string, SymbolId> symbols_by_id;
  std::unordered_map<std::string, NodeId> nodes_by_id;
  std::string error;

  try {
    // Modules
    for (const auto & m : doc.value("modules", json::array())) {
      const std::string file = m.at("file").get<std::string>();
      const ModuleId id = model->add_module(file);
      modules_by_file.emplace(file, id);
      nodes_by_id.emplace(file, model->module_node(id));
    }

    // Symbols (aliases are linked after every symbol exists)
    const json symbols = doc.value("symbols", json::array());
    for (const auto & s : symbols) {
      SymbolFlags flags = SymbolFlags::None;
      for (const auto & f : s.value("flags", json::array())) {
        const auto flag = symbol_flag_from_string(f.get<std::string>());
        if (!flag) {
          return ModelLoadResult::fail("unknown symbol flag '" + f.get<std::string>() + "'");
        }
        flags = flags | *flag;
      }
      const SymbolId id = model->add_symbol(s.at("name").get<std::string>(), flags);
      model->set_ambient(id, s.value("ambient", false));
      if (!symbols_by_id.emplace(s.at("id").get<std::string>(), id).second) {
        return ModelLoadResult::fail("duplicate symbol id '" + s.at("id").get<std::string>() + "'");
      }
    }
    for (const auto & s : symbols) {
      if (!s.contains("alias_of")) {
        continue;
      }
      const auto alias = symbols_by_id.at(s.at("id").get<std::string>());
      const auto target =
        lookup_id(symbols_by_id, s.at("alias_of").get<std::string>(), "symbol", error);
      if (!target) {
        return ModelLoadResult::fail(error);
      }
      model->set_alias_target(alias, *target);
    }

    // Nodes (parents must precede their children)
    for (const auto & n : doc.value("nodes", json::array())) {
      const std::string id = n.at("id").get<std::string>();
      const std::string kind_name = n.at("kind").get<std::string>();
      const auto kind = syntax_kind_from_string(kind_name);
      if (!kind) {
        return ModelLoadResult::fail("node '" + id + "' has unknown kind '" + kind_name + "'");
      }
      const auto parent = lookup_id(nodes_by_id, n.at("parent").get<std::string>(), "node", error);
      if (!parent) {
        return ModelLoadResult::fail("node '" + id + "': " + error);
      }

      const NodeId node = model->add_node(*parent, *kind, n.value("text", std::string{}));
      if (!nodes_by_id.emplace(id, node).second) {
        return ModelLoadResult::fail("duplicate node id '" + id + "'");
      }

      if (n.contains("declares")) {
        const auto sym =
          lookup_id(symbols_by_id, n.at("declares").get<std::string>(), "symbol", error);
        if (!sym) {
          return ModelLoadResult::fail("node '" + id + "': " + error);
        }
        model->add_declaration(*sym, node);
      }
      if (n.contains("refers_to")) {
        const auto sym =
          lookup_id(symbols_by_id, n.at("refers_to").get<std::string>(), "symbol", error);
        if (!sym) {
          return ModelLoadResult::fail("node '" + id + "': " + error);
        }
        model->bind_identifier(node, *sym);
      }
      if (n.contains("module_specifier")) {
        model->set_module_specifier(node, n.at("module_specifier").get<std::string>());
      }
      if (n.contains("export_name")) {
        std::optional<std::string> property_name;
        if (n.contains("property_name")) {
          property_name = n.at("property_name").get<std::string>();
        }
        model->set_export_specifier(
          node, n.at("export_name").get<std::string>(), std::move(property_name));
      }
    }

    // Export tables
    for (const auto & e : doc.value("exports", json::array())) {
      const auto module =
        lookup_id(modules_by_file, e.at("module").get<std::string>(), "module", error);
      if (!module) {
        return ModelLoadResult::fail(error);
      }
      for (const auto & s : e.at("symbols")) {
        const auto sym = lookup_id(symbols_by_id, s.get<std::string>(), "symbol", error);
        if (!sym) {
          return ModelLoadResult::fail(error);
        }
        model->add_export(*module, *sym);
      }
    }

    for (const auto & e : doc.value("export_stars", json::array())) {
      const auto module =
        lookup_id(modules_by_file, e.at("module").get<std::string>(), "module", error);
      const auto decl =
        module ? lookup_id(nodes_by_id, e.at("declaration").get<std::string>(), "node", error)
               : std::nullopt;
      if (!module || !decl) {
        return ModelLoadResult::fail(error);
      }
      model->add_export_star(*module, *decl);
    }

    // Specifier resolutions
    for (const auto & r : doc.value("resolutions", json::array())) {
      const auto from =
        lookup_id(modules_by_file, r.at("from").get<std::string>(), "module", error);
      const auto to =
        from ? lookup_id(modules_by_file, r.at("to").get<std::string>(), "module", error)
             : std::nullopt;
      if (!from || !to) {
        return ModelLoadResult::fail(error);
      }
      model->add_resolution(*from, r.at("specifier").get<std::string>(), *to);
    }
  } catch (const json::exception & e) {
    return ModelLoadResult::fail("malformed program model: " + std::string(e.what()));
  }

  return ModelLoadResult::ok(std::move(model));
}

ModelLoadResult load_program_model(const std::filesystem::path & path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    return ModelLoadResult::fail("cannot open program model: " + path.string());
  }

  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::exception & e) {
    return ModelLoadResult::fail("failed to parse program model: " + std::string(e.what()));
  }
  return ProgramModel::from_json(doc);
}

}  // namespace api_graph
