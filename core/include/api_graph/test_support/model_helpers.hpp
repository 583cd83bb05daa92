// api_graph/test_support/model_helpers.hpp - helpers for unit tests
//
// Builds declaration-shaped syntax in a ProgramModel with a few calls per
// construct, and provides a scripted PackageMetadata.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "api_graph/oracle/program_model.hpp"
#include "api_graph/package/package_metadata.hpp"

namespace api_graph::test_support
{

/**
 * PackageMetadata with a fixed answer that records every queried file.
 */
class FakePackageMetadata : public PackageMetadata
{
public:
  explicit FakePackageMetadata(bool supported = true) : supported_(supported) {}

  bool supports_documentation_metadata(const std::filesystem::path & file_path) override
  {
    queried_files.push_back(file_path.generic_string());
    return supported_;
  }

  void set_supported(bool supported) { supported_ = supported; }

  std::vector<std::string> queried_files;

private:
  bool supported_;
};

/// A declaration node together with the symbol it declares
struct Decl
{
  NodeId node;
  SymbolId symbol;
};

/**
 * Thin builder over ProgramModel for the shapes tests need.
 */
class ModelBuilder
{
public:
  ProgramModel & model() noexcept { return model_; }

  ModuleId module(std::string file_name) { return model_.add_module(std::move(file_name)); }

  NodeId root(ModuleId module) const { return model_.module_node(module); }

  /// `kind name` under `parent`, declaring a fresh symbol
  Decl declare(
    NodeId parent, SyntaxKind kind, const std::string & name,
    SymbolFlags flags = SymbolFlags::None)
  {
    const SymbolId symbol = model_.add_symbol(name, flags);
    return Decl{declare_merged(parent, kind, symbol), symbol};
  }

  /// Another declaration of an existing symbol
  NodeId declare_merged(NodeId parent, SyntaxKind kind, SymbolId symbol)
  {
    const NodeId node = model_.add_node(parent, kind, model_.symbol_name(symbol));
    model_.add_declaration(symbol, node);
    return node;
  }

  /// A reference construct (TypeReference by default) whose identifier refers to `target`
  NodeId reference(
    NodeId parent, SymbolId target, SyntaxKind kind = SyntaxKind::TypeReference)
  {
    const std::string name = model_.symbol_name(target);
    const NodeId ref = model_.add_node(parent, kind, name);
    const NodeId identifier = model_.add_node(ref, SyntaxKind::Identifier, name);
    model_.bind_identifier(identifier, target);
    return ref;
  }

  /// Declare `kind name` at module level and export it
  Decl exported(ModuleId module, SyntaxKind kind, const std::string & name)
  {
    const Decl decl = declare(root(module), kind, name);
    model_.add_export(module, decl.symbol);
    return decl;
  }

  /**
   * `export { property_name as name } from "specifier"` in `module`.
   *
   * @param original Symbol the alias resolves to, when the front end knows it
   * @return The alias symbol written in the export table
   */
  SymbolId re_export(
    ModuleId module, const std::string & specifier, ModuleId target, const std::string & name,
    std::optional<std::string> property_name = std::nullopt,
    SymbolId original = SymbolId::invalid())
  {
    const NodeId declaration = model_.add_node(root(module), SyntaxKind::ExportDeclaration);
    model_.set_module_specifier(declaration, specifier);
    model_.add_resolution(module, specifier, target);

    const SymbolId alias = model_.add_symbol(name, SymbolFlags::Alias);
    const NodeId spec = model_.add_node(declaration, SyntaxKind::ExportSpecifier, name);
    model_.set_export_specifier(spec, name, std::move(property_name));
    model_.add_declaration(alias, spec);
    if (original.is_valid()) {
      model_.set_alias_target(alias, original);
    }
    model_.add_export(module, alias);
    return alias;
  }

  /// `export { name }` of a local symbol
  SymbolId export_local(ModuleId module, SymbolId target)
  {
    const std::string name = model_.symbol_name(target);
    const NodeId declaration = model_.add_node(root(module), SyntaxKind::ExportDeclaration);
    const SymbolId alias = model_.add_symbol(name, SymbolFlags::Alias);
    const NodeId spec = model_.add_node(declaration, SyntaxKind::ExportSpecifier, name);
    model_.add_declaration(alias, spec);
    model_.set_alias_target(alias, target);
    model_.add_export(module, alias);
    return alias;
  }

  /// `export * from "specifier"` in `module`
  NodeId export_star(ModuleId module, const std::string & specifier, ModuleId target)
  {
    const NodeId declaration =
      model_.add_node(root(module), SyntaxKind::ExportDeclaration, "export * from '" + specifier + "'");
    model_.set_module_specifier(declaration, specifier);
    model_.add_resolution(module, specifier, target);
    model_.add_export_star(module, declaration);
    return declaration;
  }

  /**
   * `import { name } from "specifier"` in `module`.
   *
   * @return The local alias symbol (its target is `target`)
   */
  SymbolId import_named(
    ModuleId module, const std::string & specifier, ModuleId target_module, SymbolId target)
  {
    const std::string name = model_.symbol_name(target);
    const NodeId declaration = model_.add_node(root(module), SyntaxKind::ImportDeclaration);
    model_.set_module_specifier(declaration, specifier);
    model_.add_resolution(module, specifier, target_module);

    const SymbolId alias = model_.add_symbol(name, SymbolFlags::Alias);
    const NodeId spec = model_.add_node(declaration, SyntaxKind::ImportSpecifier, name);
    model_.add_declaration(alias, spec);
    model_.set_alias_target(alias, target);
    return alias;
  }

  /// `import * as name from "specifier"` in `module`
  SymbolId import_namespace(
    ModuleId module, const std::string & specifier, ModuleId target_module, const std::string & name)
  {
    const NodeId declaration = model_.add_node(root(module), SyntaxKind::ImportDeclaration);
    model_.set_module_specifier(declaration, specifier);
    model_.add_resolution(module, specifier, target_module);

    const SymbolId alias = model_.add_symbol(name, SymbolFlags::Alias);
    const NodeId ns = model_.add_node(declaration, SyntaxKind::NamespaceImport, name);
    model_.add_declaration(alias, ns);
    model_.set_alias_target(alias, model_.module_symbol(target_module));
    return alias;
  }

private:
  ProgramModel model_;
};

}  // namespace api_graph::test_support
