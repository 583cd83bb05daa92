// api_graph/analyzer/symbol_table.hpp - Canonical declaration graph builder
//
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "api_graph/analyzer/declaration_node.hpp"
#include "api_graph/analyzer/import_identity.hpp"
#include "api_graph/analyzer/module_entry.hpp"
#include "api_graph/analyzer/symbol_node.hpp"
#include "api_graph/oracle/type_oracle.hpp"

namespace api_graph
{

class PackageMetadata;

// ============================================================================
// SymbolTable
// ============================================================================

/**
 * Builds and caches the declaration graph of one analysis run.
 *
 * The table owns every SymbolNode and ModuleEntry it creates. Nodes are
 * created lazily: fetch_module() resolves a module's export surface, and
 * analyze() expands a symbol's declaration tree and everything it
 * references.
 *
 * All errors are thrown (ConfigurationError / InternalError) and are fatal
 * to the run.
 *
 * Usage:
 *   SymbolTable table(oracle, packages);
 *   ModuleEntry & entry = table.fetch_module(entry_module);
 *   for (auto & [name, symbol] : entry.exported_symbols) {
 *     table.analyze(*symbol);
 *   }
 */
class SymbolTable
{
public:
  SymbolTable(const TypeOracle & oracle, PackageMetadata & package_metadata);

  SymbolTable(const SymbolTable &) = delete;
  SymbolTable & operator=(const SymbolTable &) = delete;
  SymbolTable(SymbolTable &&) = delete;
  SymbolTable & operator=(SymbolTable &&) = delete;

  // ===========================================================================
  // Modules
  // ===========================================================================

  /**
   * Get or create the entry of a module.
   *
   * @param module Module to resolve
   * @param specifier Specifier the module was reached through; a bare
   *        (non-relative) specifier marks the module as an external package
   *        entry point
   */
  ModuleEntry & fetch_module(
    ModuleId module, std::optional<std::string_view> specifier = std::nullopt);

  /// Look up an export, following `export *` chains; nullptr if not found
  [[nodiscard]] SymbolNode * try_get_export(const std::string & name, const ModuleEntry & entry) const;

  /**
   * Every name visible through an entry, `export *` targets included.
   *
   * Direct exports shadow wildcard ones, and earlier wildcard targets shadow
   * later ones, matching try_get_export().
   */
  [[nodiscard]] std::map<std::string, SymbolNode *> visible_exports(const ModuleEntry & entry) const;

  /// Like try_get_export(), but a missing export is an InternalError
  [[nodiscard]] SymbolNode & get_export(const std::string & name, const ModuleEntry & entry) const;

  // ===========================================================================
  // Symbols
  // ===========================================================================

  /**
   * Get or create the node of an alias-followed symbol.
   *
   * @param add_if_missing When false, an unknown symbol yields nullptr
   *        instead of a new node
   * @return nullptr for symbols that are never represented (type parameters,
   *         type literals, transient and ambient symbols)
   */
  SymbolNode * fetch_symbol(SymbolId followed_symbol, bool add_if_missing = true);

  /// Cached node of a symbol; never creates one
  [[nodiscard]] SymbolNode * try_get_symbol(SymbolId followed_symbol) const;

  /**
   * Expand the declaration tree of a symbol's root and record references.
   *
   * Local (non-imported) symbols also get every non-imported symbol they
   * reference analyzed. Calling this on an analyzed symbol is a no-op.
   */
  void analyze(SymbolNode & symbol);

  /**
   * Find the declaration of `node` nested directly under `parent`.
   *
   * Only valid after the parent's symbol has been analyzed.
   */
  [[nodiscard]] DeclarationNode & child_declaration(NodeId node, const DeclarationNode & parent) const;

  /// Cached declaration of a syntax node, or nullptr
  [[nodiscard]] DeclarationNode * find_declaration(NodeId node) const;

  /// True for "." and ".." and specifiers starting with "./", "../" or "/"
  [[nodiscard]] static bool is_relative_specifier(std::string_view specifier);

  // ===========================================================================
  // Statistics
  // ===========================================================================

  [[nodiscard]] size_t symbol_count() const noexcept { return symbol_arena_.size(); }
  [[nodiscard]] size_t module_count() const noexcept { return modules_.size(); }
  [[nodiscard]] size_t declaration_count() const noexcept { return declarations_.size(); }

  [[nodiscard]] const TypeOracle & oracle() const noexcept { return oracle_; }

private:
  struct FetchOptions
  {
    bool add_if_missing = true;
    std::optional<ImportIdentity> import_identity;
  };

  // Module resolution
  void populate_module(ModuleEntry & entry, std::optional<std::string_view> specifier);
  void collect_export(const std::string & export_name, SymbolId export_symbol, ModuleEntry & entry);
  void collect_exports_from_export_star(SymbolId export_star, ModuleEntry & entry);
  ModuleEntry * fetch_specifier_module(NodeId import_or_export);
  SymbolNode * try_get_export_impl(
    const std::string & name, const ModuleEntry & entry,
    std::unordered_set<const ModuleEntry *> & visited) const;
  void collect_visible_exports(
    const ModuleEntry & entry, std::map<std::string, SymbolNode *> & out,
    std::unordered_set<const ModuleEntry *> & visited) const;

  // Symbol construction
  SymbolId follow_aliases(SymbolId symbol) const;
  bool is_filtered(SymbolId symbol) const;
  SymbolNode * fetch_symbol_impl(SymbolId followed_symbol, const FetchOptions & options);
  SymbolNode & create_symbol(SymbolId followed_symbol, const FetchOptions & options);
  bool is_nominal(SymbolId followed_symbol, const std::vector<NodeId> & declarations,
                  const FetchOptions & options) const;
  NodeId try_find_first_declaration_parent(NodeId node) const;

  // Analysis
  void analyze_root(SymbolNode & root, bool expand_forgotten_exports);
  void analyze_child_tree(NodeId node, DeclarationNode & governing);
  void record_reference(NodeId reference, DeclarationNode & governing);
  DeclarationNode * fetch_declaration_for_node(NodeId node);

  const TypeOracle & oracle_;
  PackageMetadata & package_metadata_;

  std::vector<std::unique_ptr<SymbolNode>> symbol_arena_;
  std::unordered_map<SymbolId, SymbolNode *> symbols_;
  std::unordered_map<NodeId, DeclarationNode *> declarations_;
  std::unordered_map<ImportIdentity, SymbolNode *, ImportIdentityHash> imports_;
  std::unordered_map<ModuleId, std::unique_ptr<ModuleEntry>> modules_;
};

}  // namespace api_graph
