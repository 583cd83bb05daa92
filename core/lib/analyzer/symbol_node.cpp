// api_graph/analyzer/symbol_node.cpp - Symbol node implementation
//
#include "api_graph/analyzer/symbol_node.hpp"

namespace api_graph
{

SymbolNode::SymbolNode(SymbolNodeOptions options)
: local_name_(std::move(options.local_name)),
  followed_symbol_(options.followed_symbol),
  import_identity_(std::move(options.import_identity)),
  parent_(options.parent),
  root_(options.parent ? &options.parent->root() : this),
  nominal_(options.nominal)
{
  if (import_identity_) {
    imported_.set("imported state of '" + local_name_ + "'");
  }

  // Nominal symbols are never expanded, so they start out analyzed
  if (nominal_) {
    notify_analyzed();
  }
}

std::vector<DeclarationNode *> SymbolNode::declarations() const
{
  std::vector<DeclarationNode *> result;
  result.reserve(declarations_.size());
  for (const auto & decl : declarations_) {
    result.push_back(decl.get());
  }
  return result;
}

DeclarationNode & SymbolNode::add_declaration(
  NodeId declaration, SyntaxKind kind, DeclarationNode * parent)
{
  declarations_.push_back(std::make_unique<DeclarationNode>(declaration, kind, *this, parent));
  return *declarations_.back();
}

void SymbolNode::notify_analyzed()
{
  if (!is_root()) {
    throw InternalError(
      error_code::k_state_transition,
      "'" + local_name_ + "' is not a root symbol and cannot be marked analyzed");
  }
  analyzed_.set("analyzed state of '" + local_name_ + "'");
}

}  // namespace api_graph
