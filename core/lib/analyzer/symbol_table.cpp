// api_graph/analyzer/symbol_table.cpp - Declaration graph construction
//
#include "api_graph/analyzer/symbol_table.hpp"

#include <spdlog/spdlog.h>

#include "api_graph/basic/error.hpp"
#include "api_graph/package/package_metadata.hpp"

namespace api_graph
{

SymbolTable::SymbolTable(const TypeOracle & oracle, PackageMetadata & package_metadata)
: oracle_(oracle), package_metadata_(package_metadata)
{
}

bool SymbolTable::is_relative_specifier(std::string_view specifier)
{
  if (specifier == "." || specifier == "..") {
    return true;
  }
  return specifier.substr(0, 2) == "./" || specifier.substr(0, 3) == "../" ||
         specifier.substr(0, 1) == "/";
}

// ============================================================================
// Modules
// ============================================================================

ModuleEntry & SymbolTable::fetch_module(ModuleId module, std::optional<std::string_view> specifier)
{
  if (auto it = modules_.find(module); it != modules_.end()) {
    return *it->second;
  }

  // Register before populating so that export cycles see this entry
  auto [it, inserted] = modules_.emplace(module, std::make_unique<ModuleEntry>(module));
  ModuleEntry & entry = *it->second;

  try {
    populate_module(entry, specifier);
  } catch (Error & e) {
    e.note_module(oracle_.module_file_name(module));
    throw;
  }
  return entry;
}

void SymbolTable::populate_module(ModuleEntry & entry, std::optional<std::string_view> specifier)
{
  const ModuleId module = entry.source_module;
  if (specifier && !is_relative_specifier(*specifier)) {
    entry.external_path = std::string(*specifier);
    spdlog::debug(
      "module '{}' is the entry point of package '{}'", oracle_.module_file_name(module),
      *entry.external_path);

    for (const SymbolId exported : oracle_.exports_of(module)) {
      const std::string name = oracle_.symbol_name(exported);
      FetchOptions options;
      options.import_identity = ImportIdentity{name, *entry.external_path};

      SymbolNode * node = fetch_symbol_impl(follow_aliases(exported), options);
      if (!node) {
        throw ConfigurationError(error_code::k_unsupported_export, "unsupported export: " + name);
      }
      entry.exported_symbols[name] = node;
    }
  } else {
    spdlog::debug("module '{}'", oracle_.module_file_name(module));

    for (const SymbolId exported : oracle_.export_table_of(module)) {
      if (has_any(oracle_.symbol_flags(exported), SymbolFlags::ExportStar)) {
        collect_exports_from_export_star(exported, entry);
      } else {
        collect_export(oracle_.symbol_name(exported), exported, entry);
      }
    }
  }
}

void SymbolTable::collect_exports_from_export_star(SymbolId export_star, ModuleEntry & entry)
{
  for (const NodeId declaration : oracle_.declarations_of(export_star)) {
    if (oracle_.kind_of(declaration) != SyntaxKind::ExportDeclaration) {
      spdlog::warn(
        "ignoring unsupported wildcard export '{}' in '{}'", oracle_.text_of(declaration),
        oracle_.module_file_name(entry.source_module));
      continue;
    }
    if (ModuleEntry * target = fetch_specifier_module(declaration)) {
      entry.add_star_export(*target);
    }
  }
}

void SymbolTable::collect_export(
  const std::string & export_name, SymbolId export_symbol, ModuleEntry & entry)
{
  SymbolId current = export_symbol;

  while (true) {
    // Re-exports from another module: `export { A as B } from "./m"`
    for (const NodeId declaration : oracle_.declarations_of(current)) {
      NodeId export_declaration = oracle_.parent_of(declaration);
      while (export_declaration.is_valid() &&
             oracle_.kind_of(export_declaration) != SyntaxKind::ExportDeclaration) {
        export_declaration = oracle_.parent_of(export_declaration);
      }
      if (!export_declaration.is_valid()) {
        continue;
      }

      if (oracle_.kind_of(declaration) != SyntaxKind::ExportSpecifier) {
        throw ConfigurationError(
          error_code::k_unsupported_export_declaration,
          "unimplemented export declaration kind: " + oracle_.text_of(declaration));
      }

      const ExportSpecifierNames names = oracle_.export_specifier_of(declaration);
      if (ModuleEntry * source = fetch_specifier_module(export_declaration)) {
        entry.exported_symbols[export_name] = &get_export(names.original_name(), *source);
        return;
      }
    }

    if (!has_any(oracle_.symbol_flags(current), SymbolFlags::Alias)) {
      break;
    }
    const SymbolId next = oracle_.alias_target_of(current);
    if (!next.is_valid() || next == current) {
      break;
    }
    current = next;
  }

  if (SymbolNode * node = fetch_symbol_impl(current, FetchOptions{})) {
    entry.exported_symbols[export_name] = node;
  }
}

ModuleEntry * SymbolTable::fetch_specifier_module(NodeId import_or_export)
{
  const auto specifier = oracle_.module_specifier_of(import_or_export);
  if (!specifier) {
    return nullptr;
  }

  const ModuleId base = oracle_.module_of(import_or_export);
  const auto target = oracle_.resolve_specifier(base, *specifier);
  if (!target) {
    throw InternalError(
      error_code::k_unresolved_specifier, "unable to resolve module specifier \"" + *specifier +
                                            "\" from " + oracle_.module_file_name(base));
  }
  return &fetch_module(*target, *specifier);
}

SymbolNode * SymbolTable::try_get_export(const std::string & name, const ModuleEntry & entry) const
{
  std::unordered_set<const ModuleEntry *> visited;
  return try_get_export_impl(name, entry, visited);
}

SymbolNode * SymbolTable::try_get_export_impl(
  const std::string & name, const ModuleEntry & entry,
  std::unordered_set<const ModuleEntry *> & visited) const
{
  if (!visited.insert(&entry).second) {
    return nullptr;
  }

  if (SymbolNode * direct = entry.find_direct_export(name)) {
    return direct;
  }

  for (const ModuleEntry * star : entry.star_exported_modules) {
    if (SymbolNode * found = try_get_export_impl(name, *star, visited)) {
      return found;
    }
  }
  return nullptr;
}

std::map<std::string, SymbolNode *> SymbolTable::visible_exports(const ModuleEntry & entry) const
{
  std::map<std::string, SymbolNode *> out;
  std::unordered_set<const ModuleEntry *> visited;
  collect_visible_exports(entry, out, visited);
  return out;
}

void SymbolTable::collect_visible_exports(
  const ModuleEntry & entry, std::map<std::string, SymbolNode *> & out,
  std::unordered_set<const ModuleEntry *> & visited) const
{
  if (!visited.insert(&entry).second) {
    return;
  }
  for (const auto & [name, symbol] : entry.exported_symbols) {
    out.emplace(name, symbol);
  }
  for (const ModuleEntry * star : entry.star_exported_modules) {
    collect_visible_exports(*star, out, visited);
  }
}

SymbolNode & SymbolTable::get_export(const std::string & name, const ModuleEntry & entry) const
{
  SymbolNode * symbol = try_get_export(name, entry);
  if (!symbol) {
    throw InternalError(
      error_code::k_export_not_found, "unable to analyze the export \"" + name + "\"");
  }
  return *symbol;
}

// ============================================================================
// Symbols
// ============================================================================

SymbolNode * SymbolTable::fetch_symbol(SymbolId followed_symbol, bool add_if_missing)
{
  FetchOptions options;
  options.add_if_missing = add_if_missing;
  return fetch_symbol_impl(followed_symbol, options);
}

SymbolNode * SymbolTable::try_get_symbol(SymbolId followed_symbol) const
{
  if (is_filtered(followed_symbol)) {
    return nullptr;
  }
  auto it = symbols_.find(followed_symbol);
  return it != symbols_.end() ? it->second : nullptr;
}

SymbolId SymbolTable::follow_aliases(SymbolId symbol) const
{
  SymbolId current = symbol;
  while (has_any(oracle_.symbol_flags(current), SymbolFlags::Alias)) {
    const SymbolId next = oracle_.alias_target_of(current);
    if (!next.is_valid() || next == current) {
      break;
    }
    current = next;
  }
  return current;
}

bool SymbolTable::is_filtered(SymbolId symbol) const
{
  constexpr SymbolFlags ignored =
    SymbolFlags::TypeParameter | SymbolFlags::TypeLiteral | SymbolFlags::Transient;
  return has_any(oracle_.symbol_flags(symbol), ignored) || oracle_.is_ambient(symbol);
}

SymbolNode * SymbolTable::fetch_symbol_impl(SymbolId followed_symbol, const FetchOptions & options)
{
  if (is_filtered(followed_symbol)) {
    return nullptr;
  }

  SymbolNode * node = nullptr;
  if (auto it = symbols_.find(followed_symbol); it != symbols_.end()) {
    node = it->second;
  }

  // Another path to an external export that is already known
  if (!node && options.import_identity) {
    if (auto it = imports_.find(*options.import_identity); it != imports_.end()) {
      node = it->second;
      symbols_.emplace(followed_symbol, node);
    }
  }

  if (!node) {
    if (!options.add_if_missing) {
      return nullptr;
    }
    node = &create_symbol(followed_symbol, options);
  }

  if (options.import_identity && !node->imported()) {
    throw InternalError(
      error_code::k_import_after_registration,
      "the symbol " + node->local_name() +
        " is being imported after it was already registered as non-imported");
  }

  return node;
}

bool SymbolTable::is_nominal(
  SymbolId followed_symbol, const std::vector<NodeId> & declarations,
  const FetchOptions & options) const
{
  // A module referenced as a whole, e.g. through `import * as ns from "lib"`
  if (declarations.size() == 1 && oracle_.kind_of(declarations.front()) == SyntaxKind::SourceFile) {
    return true;
  }

  if (options.import_identity) {
    const std::string file = oracle_.module_file_name(oracle_.module_of(declarations.front()));
    if (!package_metadata_.supports_documentation_metadata(file)) {
      spdlog::debug(
        "'{}' comes from a package without documentation metadata",
        oracle_.symbol_name(followed_symbol));
      return true;
    }
  }
  return false;
}

SymbolNode & SymbolTable::create_symbol(SymbolId followed_symbol, const FetchOptions & options)
{
  const std::vector<NodeId> declarations = oracle_.declarations_of(followed_symbol);
  const std::string name = oracle_.symbol_name(followed_symbol);
  if (declarations.empty()) {
    throw InternalError(
      error_code::k_symbol_without_declarations,
      "followed the symbol " + name + " which has no declarations");
  }

  const bool nominal = is_nominal(followed_symbol, declarations, options);

  SymbolNode * parent = nullptr;
  if (!nominal) {
    for (const NodeId declaration : declarations) {
      const SyntaxKind kind = oracle_.kind_of(declaration);
      if (!oracle_.is_declaration_bearing(kind)) {
        throw InternalError(
          error_code::k_unsupported_declaration, "the \"" + name + "\" symbol uses the construct \"" +
                                                   std::string(to_string(kind)) +
                                                   "\" which may be an unimplemented language feature");
      }
    }

    // Merged declarations share one parent symbol; resolve it from the first
    const NodeId parent_declaration = try_find_first_declaration_parent(declarations.front());
    if (parent_declaration.is_valid()) {
      const SymbolId parent_symbol = oracle_.identity_of(parent_declaration);
      if (parent_symbol.is_valid()) {
        parent = fetch_symbol_impl(parent_symbol, FetchOptions{});
      }
      if (!parent) {
        throw InternalError(
          error_code::k_missing_parent_declaration,
          "unable to construct a parent symbol for " + name);
      }
    }
  }

  SymbolNodeOptions node_options;
  node_options.local_name = name;
  node_options.followed_symbol = followed_symbol;
  node_options.import_identity = options.import_identity;
  node_options.parent = parent;
  node_options.nominal = nominal;

  symbol_arena_.push_back(std::make_unique<SymbolNode>(std::move(node_options)));
  SymbolNode & node = *symbol_arena_.back();

  symbols_.emplace(followed_symbol, &node);
  if (options.import_identity) {
    imports_.emplace(*options.import_identity, &node);
  }

  spdlog::debug(
    "symbol '{}'{}{}", name,
    options.import_identity ? " imported as " + options.import_identity->key() : std::string(),
    nominal ? " (nominal)" : "");

  if (nominal) {
    return node;
  }

  for (const NodeId declaration : declarations) {
    DeclarationNode * parent_node = nullptr;
    if (parent) {
      const NodeId parent_declaration = try_find_first_declaration_parent(declaration);
      if (!parent_declaration.is_valid()) {
        throw InternalError(
          error_code::k_missing_parent_declaration, "missing parent declaration of " + name);
      }
      parent_node = find_declaration(parent_declaration);
      if (!parent_node) {
        throw InternalError(
          error_code::k_missing_parent_declaration,
          "missing parent declaration node of " + name);
      }
    }

    DeclarationNode & decl = node.add_declaration(declaration, oracle_.kind_of(declaration), parent_node);
    declarations_.emplace(declaration, &decl);
  }

  return node;
}

NodeId SymbolTable::try_find_first_declaration_parent(NodeId node) const
{
  NodeId current = oracle_.parent_of(node);
  while (current.is_valid()) {
    if (oracle_.is_declaration_bearing(oracle_.kind_of(current))) {
      return current;
    }
    current = oracle_.parent_of(current);
  }
  return NodeId::invalid();
}

// ============================================================================
// Analysis
// ============================================================================

void SymbolTable::analyze(SymbolNode & symbol)
{
  if (symbol.analyzed() || symbol.nominal()) {
    return;
  }

  SymbolNode & root = symbol.root();
  spdlog::debug("analyzing '{}'", root.local_name());

  try {
    analyze_root(root, !symbol.import_identity());
  } catch (Error & e) {
    const NodeId first = root.declarations().front()->declaration();
    e.note_module(oracle_.module_file_name(oracle_.module_of(first)));
    e.note_symbol(root.local_name());
    throw;
  }
}

void SymbolTable::analyze_root(SymbolNode & root, bool expand_forgotten_exports)
{
  for (DeclarationNode * declaration : root.declarations()) {
    analyze_child_tree(declaration->declaration(), *declaration);
  }
  root.notify_analyzed();

  if (!expand_forgotten_exports) {
    return;
  }

  // Expand forgotten exports: local types reachable only through references
  std::vector<SymbolNode *> referenced;
  root.for_each_declaration_recursive([&referenced](const DeclarationNode & declaration) {
    for (SymbolNode * ref : declaration.referenced_symbols()) {
      if (!ref->imported()) {
        referenced.push_back(ref);
      }
    }
  });
  for (SymbolNode * ref : referenced) {
    analyze(*ref);
  }
}

void SymbolTable::analyze_child_tree(NodeId node, DeclarationNode & governing)
{
  switch (oracle_.kind_of(node)) {
    case SyntaxKind::DocComment:
      return;

    case SyntaxKind::TypeReference:
    case SyntaxKind::ExpressionWithTypeArguments:
    case SyntaxKind::ComputedPropertyName:
      record_reference(node, governing);
      break;

    default:
      break;
  }

  DeclarationNode * next = fetch_declaration_for_node(node);
  for (const NodeId child : oracle_.children_of(node)) {
    analyze_child_tree(child, next ? *next : governing);
  }
}

void SymbolTable::record_reference(NodeId reference, DeclarationNode & governing)
{
  // For "a.b.C" only the leading identifier matters
  const NodeId identifier = oracle_.first_identifier_in(reference);
  if (!identifier.is_valid()) {
    return;
  }

  const SymbolId symbol = oracle_.symbol_at(identifier);
  if (!symbol.is_valid()) {
    throw InternalError(
      error_code::k_unresolved_reference,
      "symbol not found for identifier: " + oracle_.text_of(identifier));
  }

  if (SymbolNode * referenced = fetch_symbol_impl(follow_aliases(symbol), FetchOptions{})) {
    spdlog::trace("'{}' references '{}'", governing.symbol().local_name(), referenced->local_name());
    governing.notify_referenced_symbol(*referenced);
  }
}

DeclarationNode * SymbolTable::fetch_declaration_for_node(NodeId node)
{
  if (!oracle_.is_declaration_bearing(oracle_.kind_of(node))) {
    return nullptr;
  }

  const SymbolId symbol = oracle_.identity_of(node);
  if (!symbol.is_valid()) {
    throw InternalError(
      error_code::k_declaration_lookup, "unable to find symbol for node: " + oracle_.text_of(node));
  }

  if (!fetch_symbol_impl(symbol, FetchOptions{})) {
    return nullptr;
  }

  DeclarationNode * declaration = find_declaration(node);
  if (!declaration) {
    throw InternalError(
      error_code::k_declaration_lookup,
      "unable to find constructed declaration for: " + oracle_.text_of(node));
  }
  return declaration;
}

DeclarationNode * SymbolTable::find_declaration(NodeId node) const
{
  auto it = declarations_.find(node);
  return it != declarations_.end() ? it->second : nullptr;
}

DeclarationNode & SymbolTable::child_declaration(NodeId node, const DeclarationNode & parent) const
{
  if (!parent.symbol().analyzed()) {
    throw InternalError(
      error_code::k_declaration_lookup,
      "child declarations of '" + parent.symbol().local_name() +
        "' cannot be looked up before it is analyzed");
  }

  DeclarationNode * child = find_declaration(node);
  if (!child) {
    throw InternalError(
      error_code::k_declaration_lookup, "child declaration not found for the specified node");
  }
  if (child->parent() != &parent) {
    throw InternalError(
      error_code::k_declaration_lookup,
      "the found child is not attached to the parent declaration");
  }
  return *child;
}

}  // namespace api_graph
