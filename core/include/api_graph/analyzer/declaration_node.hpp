// api_graph/analyzer/declaration_node.hpp - One syntactic declaration site
//
#pragma once

#include <unordered_set>
#include <vector>

#include "api_graph/oracle/handles.hpp"
#include "api_graph/oracle/syntax_kind.hpp"

namespace api_graph
{

class SymbolNode;

// ============================================================================
// DeclarationNode
// ============================================================================

/**
 * Wraps one declaration of a SymbolNode.
 *
 * A symbol with merged declarations (e.g. an interface declared twice) owns
 * one DeclarationNode per declaration. The parent link mirrors lexical
 * nesting and is fixed at construction; children attach themselves to their
 * parent as their own SymbolNodes are constructed.
 *
 * References to other symbols are collected while the owning root symbol is
 * analyzed and never change afterwards.
 */
class DeclarationNode
{
public:
  DeclarationNode(NodeId declaration, SyntaxKind kind, SymbolNode & symbol, DeclarationNode * parent);

  DeclarationNode(const DeclarationNode &) = delete;
  DeclarationNode & operator=(const DeclarationNode &) = delete;

  /// The syntax node of this declaration
  [[nodiscard]] NodeId declaration() const noexcept { return declaration_; }

  [[nodiscard]] SyntaxKind kind() const noexcept { return kind_; }

  /// The symbol this declaration belongs to
  [[nodiscard]] SymbolNode & symbol() const noexcept { return symbol_; }

  /// Enclosing declaration, or nullptr for a root declaration
  [[nodiscard]] DeclarationNode * parent() const noexcept { return parent_; }

  /// Nested declarations, in construction order
  [[nodiscard]] const std::vector<DeclarationNode *> & children() const noexcept
  {
    return children_;
  }

  /// Symbols referenced from this declaration (excluding nested declarations)
  [[nodiscard]] const std::vector<SymbolNode *> & referenced_symbols() const noexcept
  {
    return referenced_symbols_;
  }

  [[nodiscard]] bool references(const SymbolNode & symbol) const
  {
    return referenced_set_.count(&symbol) > 0;
  }

  /// Visit this declaration and all nested declarations, depth first
  template <typename Fn>
  void for_each_declaration_recursive(Fn && fn) const
  {
    fn(*this);
    for (const DeclarationNode * child : children_) {
      child->for_each_declaration_recursive(fn);
    }
  }

private:
  friend class SymbolTable;

  /// Record a reference; duplicates are ignored
  void notify_referenced_symbol(SymbolNode & symbol);

  NodeId declaration_;
  SyntaxKind kind_;
  SymbolNode & symbol_;
  DeclarationNode * parent_;
  std::vector<DeclarationNode *> children_;
  std::vector<SymbolNode *> referenced_symbols_;
  std::unordered_set<const SymbolNode *> referenced_set_;
};

}  // namespace api_graph
