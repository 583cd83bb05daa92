// api_graph/analyzer/symbol_node.hpp - Canonical node for an alias-followed symbol
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api_graph/analyzer/declaration_node.hpp"
#include "api_graph/analyzer/import_identity.hpp"
#include "api_graph/analyzer/one_shot_flag.hpp"
#include "api_graph/oracle/handles.hpp"

namespace api_graph
{

/**
 * Construction parameters of a SymbolNode.
 */
struct SymbolNodeOptions
{
  std::string local_name;
  SymbolId followed_symbol;
  std::optional<ImportIdentity> import_identity;
  SymbolNode * parent = nullptr;
  bool nominal = false;
};

// ============================================================================
// SymbolNode
// ============================================================================

/**
 * The canonical graph node for "this name, once aliases are followed".
 *
 * At most one SymbolNode exists per followed symbol (and per ImportIdentity)
 * within a SymbolTable. The node owns its DeclarationNodes. The parent link
 * mirrors syntactic nesting (a class member's parent is the class) and is
 * not an ownership relation.
 *
 * Analysis always happens at root granularity, so `analyzed()` reports the
 * state of the root symbol.
 */
class SymbolNode
{
public:
  explicit SymbolNode(SymbolNodeOptions options);

  SymbolNode(const SymbolNode &) = delete;
  SymbolNode & operator=(const SymbolNode &) = delete;

  // ===========================================================================
  // Identity
  // ===========================================================================

  [[nodiscard]] const std::string & local_name() const noexcept { return local_name_; }

  /// Oracle symbol after following aliases
  [[nodiscard]] SymbolId followed_symbol() const noexcept { return followed_symbol_; }

  /// Set iff the symbol was reached through an external package entry point
  [[nodiscard]] const std::optional<ImportIdentity> & import_identity() const noexcept
  {
    return import_identity_;
  }

  // ===========================================================================
  // Nesting
  // ===========================================================================

  [[nodiscard]] SymbolNode * parent() const noexcept { return parent_; }

  /// Outermost ancestor (this symbol if it has no parent)
  [[nodiscard]] SymbolNode & root() const noexcept { return *root_; }

  [[nodiscard]] bool is_root() const noexcept { return parent_ == nullptr; }

  // ===========================================================================
  // State
  // ===========================================================================

  /// Left unexpanded; only usable as an opaque reference
  [[nodiscard]] bool nominal() const noexcept { return nominal_; }

  [[nodiscard]] bool imported() const noexcept { return imported_.is_set(); }

  [[nodiscard]] bool analyzed() const noexcept { return root_->analyzed_.is_set(); }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  /// One entry per merged declaration, in oracle order
  [[nodiscard]] std::vector<DeclarationNode *> declarations() const;

  [[nodiscard]] size_t declaration_count() const noexcept { return declarations_.size(); }

  /// Visit every declaration of this symbol and all nested declarations
  template <typename Fn>
  void for_each_declaration_recursive(Fn && fn) const
  {
    for (const auto & decl : declarations_) {
      decl->for_each_declaration_recursive(fn);
    }
  }

private:
  friend class SymbolTable;

  DeclarationNode & add_declaration(NodeId declaration, SyntaxKind kind, DeclarationNode * parent);

  /// Mark the (root) symbol analyzed
  void notify_analyzed();

  std::string local_name_;
  SymbolId followed_symbol_;
  std::optional<ImportIdentity> import_identity_;
  SymbolNode * parent_;
  SymbolNode * root_;
  bool nominal_;
  OneShotFlag imported_;
  OneShotFlag analyzed_;
  std::vector<std::unique_ptr<DeclarationNode>> declarations_;
};

}  // namespace api_graph
