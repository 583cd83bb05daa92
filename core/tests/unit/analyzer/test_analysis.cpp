// tests/unit/analyzer/test_analysis.cpp - Declaration tree expansion
//
// Tests SymbolTable::analyze(): declaration nesting, reference recording,
// nominal symbols, filtered symbols and the errors raised on malformed
// programs.
//

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "api_graph/analyzer/symbol_table.hpp"
#include "api_graph/basic/error.hpp"
#include "api_graph/test_support/model_helpers.hpp"

using namespace api_graph;
using api_graph::test_support::FakePackageMetadata;
using api_graph::test_support::ModelBuilder;

namespace
{

template <typename ErrorT, typename Fn>
void expect_error_code(Fn && fn, const std::string & code)
{
  try {
    fn();
    FAIL() << "expected an error with code " << code;
  } catch (const ErrorT & e) {
    EXPECT_EQ(e.code(), code) << e.what();
  }
}

}  // namespace

// ============================================================================
// Declaration trees
// ============================================================================

TEST(AnalyzerAnalysis, MemberReferenceExpandsForgottenExport)
{
  // export interface Widget { prop: Options }
  // interface Options {}
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto prop = b.declare(widget.node, SyntaxKind::PropertySignature, "prop");
  const auto options = b.declare(b.root(index), SyntaxKind::InterfaceDeclaration, "Options");
  b.reference(prop.node, options.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");

  EXPECT_EQ(table.try_get_symbol(options.symbol), nullptr);
  EXPECT_EQ(table.fetch_symbol(options.symbol, false), nullptr);
  table.analyze(widget_node);
  EXPECT_TRUE(widget_node.analyzed());

  const DeclarationNode & widget_decl = *widget_node.declarations()[0];
  ASSERT_EQ(widget_decl.children().size(), 1U);
  const DeclarationNode & prop_decl = *widget_decl.children()[0];
  EXPECT_EQ(prop_decl.kind(), SyntaxKind::PropertySignature);
  EXPECT_EQ(prop_decl.declaration(), prop.node);
  EXPECT_EQ(prop_decl.parent(), &widget_decl);
  EXPECT_EQ(prop_decl.symbol().parent(), &widget_node);
  EXPECT_EQ(&prop_decl.symbol().root(), &widget_node);
  EXPECT_TRUE(prop_decl.symbol().analyzed());

  SymbolNode * options_node = table.try_get_symbol(options.symbol);
  ASSERT_NE(options_node, nullptr);
  EXPECT_TRUE(prop_decl.references(*options_node));
  EXPECT_FALSE(widget_decl.references(*options_node));
  EXPECT_TRUE(options_node->analyzed());
  EXPECT_TRUE(options_node->is_root());
  EXPECT_EQ(table.fetch_symbol(options.symbol, false), options_node);

  EXPECT_EQ(table.symbol_count(), 3U);
  EXPECT_EQ(table.declaration_count(), 3U);
}

TEST(AnalyzerAnalysis, AnalyzeIsIdempotent)
{
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto prop = b.declare(widget.node, SyntaxKind::PropertySignature, "prop");
  const auto options = b.declare(b.root(index), SyntaxKind::InterfaceDeclaration, "Options");
  b.reference(prop.node, options.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");

  table.analyze(widget_node);
  const size_t symbols = table.symbol_count();
  const size_t declarations = table.declaration_count();
  const size_t references = widget_node.declarations()[0]->children()[0]->referenced_symbols().size();

  EXPECT_NO_THROW(table.analyze(widget_node));
  EXPECT_EQ(table.symbol_count(), symbols);
  EXPECT_EQ(table.declaration_count(), declarations);
  EXPECT_EQ(
    widget_node.declarations()[0]->children()[0]->referenced_symbols().size(), references);
}

TEST(AnalyzerAnalysis, AnalyzingMemberAnalyzesRoot)
{
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::ClassDeclaration, "Widget");
  const auto method = b.declare(widget.node, SyntaxKind::MethodDeclaration, "render");

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);

  // Fetching a member constructs its parent chain first
  SymbolNode * method_node = table.fetch_symbol(method.symbol);
  ASSERT_NE(method_node, nullptr);
  SymbolNode * widget_node = table.try_get_symbol(widget.symbol);
  ASSERT_NE(widget_node, nullptr);
  EXPECT_EQ(method_node->parent(), widget_node);
  EXPECT_FALSE(method_node->is_root());

  table.analyze(*method_node);
  EXPECT_TRUE(widget_node->analyzed());
  EXPECT_TRUE(method_node->analyzed());
}

TEST(AnalyzerAnalysis, MergedNamespaceDeclarations)
{
  // export namespace NS { export interface Inner {} }
  // namespace NS { export interface Inner {} }
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto ns = b.exported(index, SyntaxKind::ModuleDeclaration, "NS");
  const NodeId ns2 = b.declare_merged(b.root(index), SyntaxKind::ModuleDeclaration, ns.symbol);
  const NodeId block1 = b.model().add_node(ns.node, SyntaxKind::Block);
  const NodeId block2 = b.model().add_node(ns2, SyntaxKind::Block);
  const auto inner = b.declare(block1, SyntaxKind::InterfaceDeclaration, "Inner");
  const NodeId inner2 = b.declare_merged(block2, SyntaxKind::InterfaceDeclaration, inner.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & ns_node = *table.fetch_module(index).exported_symbols.at("NS");
  ASSERT_EQ(ns_node.declaration_count(), 2U);

  table.analyze(ns_node);

  SymbolNode * inner_node = table.try_get_symbol(inner.symbol);
  ASSERT_NE(inner_node, nullptr);
  EXPECT_EQ(inner_node->parent(), &ns_node);
  EXPECT_EQ(&inner_node->root(), &ns_node);
  EXPECT_TRUE(inner_node->analyzed());
  ASSERT_EQ(inner_node->declaration_count(), 2U);

  const auto ns_decls = ns_node.declarations();
  const auto inner_decls = inner_node->declarations();
  EXPECT_EQ(inner_decls[0]->parent(), ns_decls[0]);
  EXPECT_EQ(inner_decls[1]->parent(), ns_decls[1]);
  ASSERT_EQ(ns_decls[0]->children().size(), 1U);
  ASSERT_EQ(ns_decls[1]->children().size(), 1U);
  EXPECT_EQ(ns_decls[0]->children()[0], inner_decls[0]);
  EXPECT_EQ(ns_decls[1]->children()[0], inner_decls[1]);

  EXPECT_EQ(&table.child_declaration(inner.node, *ns_decls[0]), inner_decls[0]);
  EXPECT_EQ(&table.child_declaration(inner2, *ns_decls[1]), inner_decls[1]);
  expect_error_code<InternalError>(
    [&] { (void)table.child_declaration(inner.node, *ns_decls[1]); }, error_code::k_declaration_lookup);
}

TEST(AnalyzerAnalysis, ChildDeclarationRequiresAnalyzedParent)
{
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto prop = b.declare(widget.node, SyntaxKind::PropertySignature, "prop");

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");
  const DeclarationNode & widget_decl = *widget_node.declarations()[0];

  expect_error_code<InternalError>(
    [&] { (void)table.child_declaration(prop.node, widget_decl); }, error_code::k_declaration_lookup);

  table.analyze(widget_node);
  EXPECT_EQ(table.child_declaration(prop.node, widget_decl).declaration(), prop.node);

  // A node that declares nothing under the parent
  const NodeId stray = b.model().add_node(b.root(index), SyntaxKind::Other);
  expect_error_code<InternalError>(
    [&] { (void)table.child_declaration(stray, widget_decl); }, error_code::k_declaration_lookup);
}

// ============================================================================
// References
// ============================================================================

TEST(AnalyzerAnalysis, ReferenceIsRecordedOnGoverningDeclaration)
{
  // export class Widget { render(arg: Options): void }
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::ClassDeclaration, "Widget");
  const auto method = b.declare(widget.node, SyntaxKind::MethodDeclaration, "render");
  const NodeId param = b.model().add_node(method.node, SyntaxKind::Parameter, "arg");
  const auto options = b.declare(b.root(index), SyntaxKind::InterfaceDeclaration, "Options");
  b.reference(param, options.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");
  table.analyze(widget_node);

  SymbolNode * options_node = table.try_get_symbol(options.symbol);
  ASSERT_NE(options_node, nullptr);

  const DeclarationNode & widget_decl = *widget_node.declarations()[0];
  const DeclarationNode & method_decl = table.child_declaration(method.node, widget_decl);
  EXPECT_TRUE(method_decl.references(*options_node));
  EXPECT_TRUE(widget_decl.referenced_symbols().empty());
}

TEST(AnalyzerAnalysis, DuplicateReferencesAreRecordedOnce)
{
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::TypeAliasDeclaration, "Pair");
  const auto options = b.declare(b.root(index), SyntaxKind::InterfaceDeclaration, "Options");
  b.reference(widget.node, options.symbol);
  b.reference(widget.node, options.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & pair_node = *table.fetch_module(index).exported_symbols.at("Pair");
  table.analyze(pair_node);

  EXPECT_EQ(pair_node.declarations()[0]->referenced_symbols().size(), 1U);
}

TEST(AnalyzerAnalysis, ReferenceThroughLocalImportIsFollowed)
{
  // util.ts: export interface Options {}
  // index.ts: import { Options } from "./util"; export interface Widget { prop: Options }
  ModelBuilder b;
  const ModuleId util = b.module("src/util.ts");
  const auto options = b.exported(util, SyntaxKind::InterfaceDeclaration, "Options");
  const ModuleId index = b.module("src/index.ts");
  const SymbolId alias = b.import_named(index, "./util", util, options.symbol);
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto prop = b.declare(widget.node, SyntaxKind::PropertySignature, "prop");
  b.reference(prop.node, alias);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");
  table.analyze(widget_node);

  EXPECT_EQ(table.try_get_symbol(alias), nullptr);
  SymbolNode * options_node = table.try_get_symbol(options.symbol);
  ASSERT_NE(options_node, nullptr);
  EXPECT_EQ(options_node->followed_symbol(), options.symbol);
  EXPECT_FALSE(options_node->imported());
  EXPECT_TRUE(options_node->analyzed());
  EXPECT_TRUE(table.child_declaration(prop.node, *widget_node.declarations()[0]).references(*options_node));
}

TEST(AnalyzerAnalysis, ImportedSymbolsAreNotExpanded)
{
  // lib: export interface Base { helper: LibHelper }  interface LibHelper {}
  // index.ts: import { Base } from "lib"; export { Base } from "lib";
  //           export class Widget extends Base {}
  ModelBuilder b;
  const ModuleId lib = b.module("node_modules/lib/index.d.ts");
  const auto base = b.exported(lib, SyntaxKind::InterfaceDeclaration, "Base");
  const auto helper = b.declare(base.node, SyntaxKind::PropertySignature, "helper");
  const auto lib_helper = b.declare(b.root(lib), SyntaxKind::InterfaceDeclaration, "LibHelper");
  b.reference(helper.node, lib_helper.symbol);

  const ModuleId index = b.module("src/index.ts");
  const SymbolId base_alias = b.import_named(index, "lib", lib, base.symbol);
  b.re_export(index, "lib", lib, "Base", std::nullopt, base.symbol);
  const auto widget = b.exported(index, SyntaxKind::ClassDeclaration, "Widget");
  const NodeId heritage = b.model().add_node(widget.node, SyntaxKind::HeritageClause);
  b.reference(heritage, base_alias, SyntaxKind::ExpressionWithTypeArguments);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  ModuleEntry & entry = table.fetch_module(index);
  SymbolNode & widget_node = *entry.exported_symbols.at("Widget");
  SymbolNode & base_node = *entry.exported_symbols.at("Base");
  ASSERT_TRUE(base_node.imported());

  table.analyze(widget_node);

  EXPECT_TRUE(widget_node.declarations()[0]->references(base_node));
  EXPECT_FALSE(base_node.analyzed());
  EXPECT_EQ(table.try_get_symbol(lib_helper.symbol), nullptr);

  // Expanding the imported symbol records its references without following them
  table.analyze(base_node);
  EXPECT_TRUE(base_node.analyzed());
  SymbolNode * lib_helper_node = table.try_get_symbol(lib_helper.symbol);
  ASSERT_NE(lib_helper_node, nullptr);
  EXPECT_FALSE(lib_helper_node->analyzed());
  EXPECT_FALSE(lib_helper_node->imported());
}

TEST(AnalyzerAnalysis, OnlyLeadingIdentifierIsResolved)
{
  // import * as util from "./util"; export interface Widget { prop: util.Options }
  ModelBuilder b;
  const ModuleId util = b.module("src/util.ts");
  const auto options = b.exported(util, SyntaxKind::InterfaceDeclaration, "Options");
  const ModuleId index = b.module("src/index.ts");
  const SymbolId ns = b.import_namespace(index, "./util", util, "util");
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto prop = b.declare(widget.node, SyntaxKind::PropertySignature, "prop");
  const NodeId ref = b.reference(prop.node, ns);
  const NodeId qualified = b.model().add_node(ref, SyntaxKind::Identifier, "Options");
  b.model().bind_identifier(qualified, options.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");
  table.analyze(widget_node);

  // The namespace resolves to the module itself, which stays nominal
  SymbolNode * module_node = table.try_get_symbol(b.model().module_symbol(util));
  ASSERT_NE(module_node, nullptr);
  EXPECT_TRUE(module_node->nominal());
  EXPECT_TRUE(module_node->analyzed());
  EXPECT_EQ(module_node->declaration_count(), 0U);
  EXPECT_EQ(table.try_get_symbol(options.symbol), nullptr);
  EXPECT_TRUE(packages.queried_files.empty());

  const DeclarationNode & prop_decl = table.child_declaration(prop.node, *widget_node.declarations()[0]);
  ASSERT_EQ(prop_decl.referenced_symbols().size(), 1U);
  EXPECT_EQ(prop_decl.referenced_symbols()[0], module_node);
}

TEST(AnalyzerAnalysis, DocCommentsAreSkipped)
{
  // /** See {@link Linked} */ export interface Widget { [Keys.id]: string }
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto linked = b.declare(b.root(index), SyntaxKind::InterfaceDeclaration, "Linked");
  const NodeId doc = b.model().add_node(widget.node, SyntaxKind::DocComment);
  b.reference(doc, linked.symbol);
  const auto keys = b.declare(b.root(index), SyntaxKind::EnumDeclaration, "Keys");
  const auto member = b.declare(widget.node, SyntaxKind::PropertySignature, "[Keys.id]");
  b.reference(member.node, keys.symbol, SyntaxKind::ComputedPropertyName);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");
  table.analyze(widget_node);

  EXPECT_EQ(table.try_get_symbol(linked.symbol), nullptr);
  EXPECT_TRUE(widget_node.declarations()[0]->referenced_symbols().empty());

  SymbolNode * keys_node = table.try_get_symbol(keys.symbol);
  ASSERT_NE(keys_node, nullptr);
  EXPECT_TRUE(
    table.child_declaration(member.node, *widget_node.declarations()[0]).references(*keys_node));
}

// ============================================================================
// Nominal and filtered symbols
// ============================================================================

TEST(AnalyzerAnalysis, PackageWithoutDocumentationMetadataIsNominal)
{
  ModelBuilder b;
  const ModuleId lib = b.module("node_modules/lib/index.d.ts");
  const auto base = b.exported(lib, SyntaxKind::InterfaceDeclaration, "Base");
  b.declare(base.node, SyntaxKind::PropertySignature, "helper");
  const ModuleId index = b.module("src/index.ts");
  b.re_export(index, "lib", lib, "Base", std::nullopt, base.symbol);

  FakePackageMetadata packages(false);
  SymbolTable table(b.model(), packages);
  SymbolNode & base_node = *table.fetch_module(index).exported_symbols.at("Base");

  EXPECT_TRUE(base_node.nominal());
  EXPECT_TRUE(base_node.imported());
  EXPECT_TRUE(base_node.analyzed());
  EXPECT_EQ(base_node.declaration_count(), 0U);
  ASSERT_EQ(packages.queried_files.size(), 1U);
  EXPECT_EQ(packages.queried_files[0], "node_modules/lib/index.d.ts");

  table.analyze(base_node);
  EXPECT_EQ(table.symbol_count(), 1U);
  EXPECT_EQ(table.declaration_count(), 0U);
}

TEST(AnalyzerAnalysis, AmbientSymbolsAreNotRepresented)
{
  // export interface Widget { task: Promise }  (Promise from the standard library)
  ModelBuilder b;
  const ModuleId stdlib = b.module("lib.es5.d.ts");
  const auto promise = b.declare(b.root(stdlib), SyntaxKind::InterfaceDeclaration, "Promise");
  b.model().set_ambient(promise.symbol);
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto task = b.declare(widget.node, SyntaxKind::PropertySignature, "task");
  b.reference(task.node, promise.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");
  table.analyze(widget_node);

  EXPECT_EQ(table.fetch_symbol(promise.symbol), nullptr);
  EXPECT_EQ(table.try_get_symbol(promise.symbol), nullptr);
  EXPECT_TRUE(
    table.child_declaration(task.node, *widget_node.declarations()[0]).referenced_symbols().empty());
}

TEST(AnalyzerAnalysis, TypeParametersAndTransientSymbolsAreFiltered)
{
  // export interface Box<T> { value: T; shape: { x: number }; extra: <synthesized> }
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto box = b.exported(index, SyntaxKind::InterfaceDeclaration, "Box");
  const auto t = b.declare(box.node, SyntaxKind::TypeParameter, "T", SymbolFlags::TypeParameter);
  const auto value = b.declare(box.node, SyntaxKind::PropertySignature, "value");
  b.reference(value.node, t.symbol);

  const auto shape = b.declare(box.node, SyntaxKind::PropertySignature, "shape");
  const auto literal = b.declare(shape.node, SyntaxKind::TypeLiteral, "__type", SymbolFlags::TypeLiteral);
  b.reference(shape.node, literal.symbol);

  const auto synthesized = b.declare(b.root(index), SyntaxKind::Other, "__synthetic", SymbolFlags::Transient);
  const auto extra = b.declare(box.node, SyntaxKind::PropertySignature, "extra");
  b.reference(extra.node, synthesized.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & box_node = *table.fetch_module(index).exported_symbols.at("Box");
  table.analyze(box_node);

  EXPECT_EQ(table.fetch_symbol(t.symbol), nullptr);
  EXPECT_EQ(table.fetch_symbol(literal.symbol), nullptr);
  EXPECT_EQ(table.fetch_symbol(synthesized.symbol), nullptr);

  const DeclarationNode & box_decl = *box_node.declarations()[0];
  EXPECT_EQ(box_decl.children().size(), 3U);
  box_node.for_each_declaration_recursive([](const DeclarationNode & decl) {
    EXPECT_TRUE(decl.referenced_symbols().empty()) << decl.symbol().local_name();
  });
}

// ============================================================================
// Identity
// ============================================================================

TEST(AnalyzerAnalysis, OneNodePerFollowedSymbol)
{
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto other = b.exported(index, SyntaxKind::InterfaceDeclaration, "Other");
  const auto a = b.declare(other.node, SyntaxKind::PropertySignature, "a");
  const auto c = b.declare(other.node, SyntaxKind::PropertySignature, "c");
  b.reference(a.node, widget.symbol);
  b.reference(c.node, widget.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  ModuleEntry & entry = table.fetch_module(index);
  SymbolNode * widget_node = entry.exported_symbols.at("Widget");
  table.analyze(*entry.exported_symbols.at("Other"));

  EXPECT_EQ(table.fetch_symbol(widget.symbol), widget_node);
  EXPECT_EQ(table.try_get_symbol(widget.symbol), widget_node);

  SymbolNode * other_node = entry.exported_symbols.at("Other");
  const auto & members = other_node->declarations()[0]->children();
  ASSERT_EQ(members.size(), 2U);
  EXPECT_EQ(members[0]->referenced_symbols()[0], widget_node);
  EXPECT_EQ(members[1]->referenced_symbols()[0], widget_node);
  EXPECT_EQ(table.symbol_count(), 4U);
}

// ============================================================================
// Errors
// ============================================================================

TEST(AnalyzerAnalysis, UnsupportedDeclarationKind)
{
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  b.exported(index, SyntaxKind::VariableStatement, "config");

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  expect_error_code<InternalError>(
    [&] { table.fetch_module(index); }, error_code::k_unsupported_declaration);
}

TEST(AnalyzerAnalysis, SymbolWithoutDeclarations)
{
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const SymbolId ghost = b.model().add_symbol("ghost");
  b.model().add_export(index, ghost);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  expect_error_code<InternalError>(
    [&] { table.fetch_module(index); }, error_code::k_symbol_without_declarations);
}

TEST(AnalyzerAnalysis, MissingParentSymbol)
{
  // A member nested in a declaration the front end gave no identity
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const NodeId anonymous = b.model().add_node(b.root(index), SyntaxKind::ClassDeclaration);
  const auto method = b.declare(anonymous, SyntaxKind::MethodDeclaration, "run");
  b.model().add_export(index, method.symbol);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  expect_error_code<InternalError>(
    [&] { table.fetch_module(index); }, error_code::k_missing_parent_declaration);
}

TEST(AnalyzerAnalysis, UnresolvedReference)
{
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto prop = b.declare(widget.node, SyntaxKind::PropertySignature, "prop");
  const NodeId ref = b.model().add_node(prop.node, SyntaxKind::TypeReference, "Missing");
  b.model().add_node(ref, SyntaxKind::Identifier, "Missing");

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");

  try {
    table.analyze(widget_node);
    FAIL() << "expected an unresolved reference";
  } catch (const InternalError & e) {
    EXPECT_EQ(e.code(), error_code::k_unresolved_reference);
    EXPECT_EQ(std::string(e.what()), "internal error: symbol not found for identifier: Missing");
  }
}

TEST(AnalyzerAnalysis, DeclarationWithoutIdentity)
{
  ModelBuilder b;
  const ModuleId index = b.module("src/index.ts");
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  b.model().add_node(widget.node, SyntaxKind::PropertySignature, "orphan");

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");
  expect_error_code<InternalError>(
    [&] { table.analyze(widget_node); }, error_code::k_declaration_lookup);
}

TEST(AnalyzerAnalysis, ErrorRecordsModuleAndAnalysisChain)
{
  // helper.ts: export interface Helper { value: Missing }
  // index.ts: import { Helper } from "./helper"; export interface Widget { prop: Helper }
  ModelBuilder b;
  const ModuleId helper = b.module("src/helper.ts");
  const auto helper_decl = b.exported(helper, SyntaxKind::InterfaceDeclaration, "Helper");
  const auto value = b.declare(helper_decl.node, SyntaxKind::PropertySignature, "value");
  const NodeId ref = b.model().add_node(value.node, SyntaxKind::TypeReference, "Missing");
  b.model().add_node(ref, SyntaxKind::Identifier, "Missing");

  const ModuleId index = b.module("src/index.ts");
  const SymbolId alias = b.import_named(index, "./helper", helper, helper_decl.symbol);
  const auto widget = b.exported(index, SyntaxKind::InterfaceDeclaration, "Widget");
  const auto prop = b.declare(widget.node, SyntaxKind::PropertySignature, "prop");
  b.reference(prop.node, alias);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  SymbolNode & widget_node = *table.fetch_module(index).exported_symbols.at("Widget");

  try {
    table.analyze(widget_node);
    FAIL() << "expected an unresolved reference";
  } catch (const InternalError & e) {
    EXPECT_EQ(e.code(), error_code::k_unresolved_reference);
    EXPECT_EQ(e.module_file(), "src/helper.ts");
    EXPECT_EQ(e.analysis_chain(), (std::vector<std::string>{"Widget", "Helper"}));
  }
}

TEST(AnalyzerAnalysis, ModuleErrorRecordsModule)
{
  ModelBuilder b;
  const ModuleId shapes = b.module("src/shapes.ts");
  b.re_export(shapes, "./missing", shapes, "Ghost");
  const ModuleId index = b.module("src/index.ts");
  b.export_star(index, "./shapes", shapes);

  FakePackageMetadata packages;
  SymbolTable table(b.model(), packages);
  try {
    table.fetch_module(index);
    FAIL() << "expected a missing export";
  } catch (const InternalError & e) {
    EXPECT_EQ(e.code(), error_code::k_export_not_found);
    EXPECT_EQ(e.module_file(), "src/shapes.ts");
    EXPECT_TRUE(e.analysis_chain().empty());
  }
}
