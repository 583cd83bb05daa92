// api_graph/oracle/type_oracle.hpp - Type resolution oracle interface
//
// The analyzer sits on top of a type system it does not own. Everything it
// knows about symbols, syntax and modules comes from a TypeOracle, which is
// treated as ground truth.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "api_graph/oracle/handles.hpp"
#include "api_graph/oracle/syntax_kind.hpp"

namespace api_graph
{

/**
 * Names written in an export specifier.
 *
 * For `export { A as B } from "./m"` the name is "B" and the property name
 * is "A". For `export { A } from "./m"` there is no property name.
 */
struct ExportSpecifierNames
{
  std::string name;
  std::optional<std::string> property_name;

  /// The name as exported by the target module
  [[nodiscard]] const std::string & original_name() const noexcept
  {
    return property_name ? *property_name : name;
  }
};

// ============================================================================
// TypeOracle
// ============================================================================

/**
 * Read-only query interface over an analyzed program.
 *
 * All queries are deterministic and side-effect free. Handles passed in must
 * have been produced by the same oracle instance.
 */
class TypeOracle
{
public:
  virtual ~TypeOracle() = default;

  // ===========================================================================
  // Symbols
  // ===========================================================================

  [[nodiscard]] virtual std::string symbol_name(SymbolId symbol) const = 0;

  [[nodiscard]] virtual SymbolFlags symbol_flags(SymbolId symbol) const = 0;

  /// All merged declarations of a symbol, in declaration order
  [[nodiscard]] virtual std::vector<NodeId> declarations_of(SymbolId symbol) const = 0;

  /**
   * Follow one alias step.
   *
   * @return The immediately aliased symbol, or `symbol` itself when it is
   *         not an alias (or the alias cannot be followed)
   */
  [[nodiscard]] virtual SymbolId alias_target_of(SymbolId symbol) const = 0;

  /// Declared without a defining body (global or foreign declarations)
  [[nodiscard]] virtual bool is_ambient(SymbolId symbol) const = 0;

  // ===========================================================================
  // Syntax
  // ===========================================================================

  [[nodiscard]] virtual SyntaxKind kind_of(NodeId node) const = 0;

  /// Lexical parent, or NodeId::invalid() for a SourceFile node
  [[nodiscard]] virtual NodeId parent_of(NodeId node) const = 0;

  [[nodiscard]] virtual std::vector<NodeId> children_of(NodeId node) const = 0;

  /// Source text of a node (used for names and error messages)
  [[nodiscard]] virtual std::string text_of(NodeId node) const = 0;

  /// Identity declared by a declaration node, or invalid when none
  [[nodiscard]] virtual SymbolId identity_of(NodeId node) const = 0;

  /// Identity an identifier refers to, or invalid when unresolved
  [[nodiscard]] virtual SymbolId symbol_at(NodeId identifier) const = 0;

  /// First Identifier in a depth-first walk of `node` (including itself)
  [[nodiscard]] virtual NodeId first_identifier_in(NodeId node) const = 0;

  /// Module specifier text of an import/export declaration, if written
  [[nodiscard]] virtual std::optional<std::string> module_specifier_of(NodeId declaration) const = 0;

  /// Names of an ExportSpecifier node
  [[nodiscard]] virtual ExportSpecifierNames export_specifier_of(NodeId specifier) const = 0;

  [[nodiscard]] virtual bool is_declaration_bearing(SyntaxKind kind) const = 0;

  // ===========================================================================
  // Modules
  // ===========================================================================

  /// Module containing a node
  [[nodiscard]] virtual ModuleId module_of(NodeId node) const = 0;

  /// Identity of the module itself (declared by its SourceFile node)
  [[nodiscard]] virtual SymbolId module_symbol(ModuleId module) const = 0;

  [[nodiscard]] virtual std::string module_file_name(ModuleId module) const = 0;

  /**
   * The module's own export table.
   *
   * Contains one entry per locally written export plus, when present, a
   * single aggregate symbol flagged ExportStar whose declarations are the
   * module's `export * from` declarations.
   */
  [[nodiscard]] virtual std::vector<SymbolId> export_table_of(ModuleId module) const = 0;

  /// The resolved export surface of a module (wildcards expanded)
  [[nodiscard]] virtual std::vector<SymbolId> exports_of(ModuleId module) const = 0;

  /**
   * Resolve a module specifier the way the front end did.
   *
   * @param base Module containing the import/export declaration
   * @param specifier Specifier text (e.g. "./file" or "some-package")
   * @return The target module, or nullopt if it cannot be resolved
   */
  [[nodiscard]] virtual std::optional<ModuleId> resolve_specifier(
    ModuleId base, std::string_view specifier) const = 0;
};

}  // namespace api_graph
