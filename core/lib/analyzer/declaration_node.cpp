// api_graph/analyzer/declaration_node.cpp - Declaration node implementation
//
#include "api_graph/analyzer/declaration_node.hpp"

#include "api_graph/analyzer/symbol_node.hpp"
#include "api_graph/basic/error.hpp"

namespace api_graph
{

DeclarationNode::DeclarationNode(
  NodeId declaration, SyntaxKind kind, SymbolNode & symbol, DeclarationNode * parent)
: declaration_(declaration), kind_(kind), symbol_(symbol), parent_(parent)
{
  if (parent_) {
    parent_->children_.push_back(this);
  }
}

void DeclarationNode::notify_referenced_symbol(SymbolNode & symbol)
{
  if (symbol_.analyzed()) {
    throw InternalError(
      error_code::k_state_transition,
      "reference to '" + symbol.local_name() + "' recorded after '" + symbol_.local_name() +
        "' was analyzed");
  }
  if (referenced_set_.insert(&symbol).second) {
    referenced_symbols_.push_back(&symbol);
  }
}

}  // namespace api_graph
