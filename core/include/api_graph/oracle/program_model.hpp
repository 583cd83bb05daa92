// api_graph/oracle/program_model.hpp - In-memory program model
//
// A concrete TypeOracle backed by plain tables. Front ends export the program
// they analyzed as JSON; tests build models directly through the builder API.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "api_graph/oracle/type_oracle.hpp"

namespace api_graph
{

struct ModelLoadResult;

// ============================================================================
// ProgramModel
// ============================================================================

/**
 * Table-backed TypeOracle.
 *
 * Entities are appended through the builder methods and addressed by the
 * handles those methods return. Once handed to a SymbolTable the model must
 * not be modified.
 */
class ProgramModel final : public TypeOracle
{
public:
  ProgramModel() = default;

  ProgramModel(const ProgramModel &) = delete;
  ProgramModel & operator=(const ProgramModel &) = delete;

  // ===========================================================================
  // Building
  // ===========================================================================

  /**
   * Add a module.
   *
   * Creates the module's SourceFile node and the symbol it declares.
   */
  ModuleId add_module(std::string file_name);

  /// Add a syntax node as the last child of `parent`
  NodeId add_node(NodeId parent, SyntaxKind kind, std::string text = {});

  SymbolId add_symbol(std::string name, SymbolFlags flags = SymbolFlags::None);

  /// Register `node` as a (merged) declaration of `symbol`
  void add_declaration(SymbolId symbol, NodeId node);

  void set_alias_target(SymbolId alias, SymbolId target);

  void set_ambient(SymbolId symbol, bool ambient = true);

  /// Bind an identifier node to the symbol it refers to
  void bind_identifier(NodeId identifier, SymbolId symbol);

  void set_module_specifier(NodeId declaration, std::string specifier);

  void set_export_specifier(
    NodeId specifier, std::string name, std::optional<std::string> property_name = std::nullopt);

  /// Append a symbol to a module's own export table
  void add_export(ModuleId module, SymbolId symbol);

  /**
   * Record an `export * from` declaration of a module.
   *
   * The declaration is attached to the module's ExportStar aggregate symbol,
   * which is created (and exported) on first use.
   */
  void add_export_star(ModuleId module, NodeId export_declaration);

  /// Record how `specifier`, written in module `from`, resolves
  void add_resolution(ModuleId from, std::string specifier, ModuleId to);

  // ===========================================================================
  // Lookup helpers
  // ===========================================================================

  [[nodiscard]] std::optional<ModuleId> find_module(std::string_view file_name) const;

  /// The SourceFile node of a module
  [[nodiscard]] NodeId module_node(ModuleId module) const;

  [[nodiscard]] size_t module_count() const noexcept { return modules_.size(); }
  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] size_t symbol_count() const noexcept { return symbols_.size(); }

  // ===========================================================================
  // TypeOracle
  // ===========================================================================

  [[nodiscard]] std::string symbol_name(SymbolId symbol) const override;
  [[nodiscard]] SymbolFlags symbol_flags(SymbolId symbol) const override;
  [[nodiscard]] std::vector<NodeId> declarations_of(SymbolId symbol) const override;
  [[nodiscard]] SymbolId alias_target_of(SymbolId symbol) const override;
  [[nodiscard]] bool is_ambient(SymbolId symbol) const override;

  [[nodiscard]] SyntaxKind kind_of(NodeId node) const override;
  [[nodiscard]] NodeId parent_of(NodeId node) const override;
  [[nodiscard]] std::vector<NodeId> children_of(NodeId node) const override;
  [[nodiscard]] std::string text_of(NodeId node) const override;
  [[nodiscard]] SymbolId identity_of(NodeId node) const override;
  [[nodiscard]] SymbolId symbol_at(NodeId identifier) const override;
  [[nodiscard]] NodeId first_identifier_in(NodeId node) const override;
  [[nodiscard]] std::optional<std::string> module_specifier_of(NodeId declaration) const override;
  [[nodiscard]] ExportSpecifierNames export_specifier_of(NodeId specifier) const override;
  [[nodiscard]] bool is_declaration_bearing(SyntaxKind kind) const override;

  [[nodiscard]] ModuleId module_of(NodeId node) const override;
  [[nodiscard]] SymbolId module_symbol(ModuleId module) const override;
  [[nodiscard]] std::string module_file_name(ModuleId module) const override;
  [[nodiscard]] std::vector<SymbolId> export_table_of(ModuleId module) const override;
  [[nodiscard]] std::vector<SymbolId> exports_of(ModuleId module) const override;
  [[nodiscard]] std::optional<ModuleId> resolve_specifier(
    ModuleId base, std::string_view specifier) const override;

  // ===========================================================================
  // Serialization
  // ===========================================================================

  /**
   * Build a model from its JSON form.
   *
   * Never throws; malformed input is reported through the result.
   */
  [[nodiscard]] static ModelLoadResult from_json(const nlohmann::json & doc);

private:
  struct NodeRecord
  {
    SyntaxKind kind = SyntaxKind::Other;
    NodeId parent;
    std::vector<NodeId> children;
    std::string text;
    SymbolId declares;
    SymbolId refers_to;
    ModuleId module;
    std::optional<std::string> module_specifier;
    std::optional<ExportSpecifierNames> export_names;
  };

  struct SymbolRecord
  {
    std::string name;
    SymbolFlags flags = SymbolFlags::None;
    std::vector<NodeId> declarations;
    SymbolId alias_target;
    bool ambient = false;
  };

  struct ModuleRecord
  {
    std::string file_name;
    NodeId node;
    SymbolId symbol;
    SymbolId export_star;
    std::vector<SymbolId> exports;
    std::unordered_map<std::string, ModuleId> resolutions;
  };

  void collect_exports(
    ModuleId module, std::vector<SymbolId> & out, std::unordered_set<std::string> & seen_names,
    std::unordered_set<ModuleId> & visited) const;

  [[nodiscard]] const NodeRecord & node_record(NodeId id) const;
  [[nodiscard]] NodeRecord & node_record(NodeId id);
  [[nodiscard]] const SymbolRecord & symbol_record(SymbolId id) const;
  [[nodiscard]] SymbolRecord & symbol_record(SymbolId id);
  [[nodiscard]] const ModuleRecord & module_record(ModuleId id) const;
  [[nodiscard]] ModuleRecord & module_record(ModuleId id);

  std::vector<NodeRecord> nodes_;
  std::vector<SymbolRecord> symbols_;
  std::vector<ModuleRecord> modules_;
};

/**
 * Result of loading a program model.
 */
struct ModelLoadResult
{
  /// Loaded model (only valid if success == true)
  std::unique_ptr<ProgramModel> model;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ModelLoadResult ok(std::unique_ptr<ProgramModel> m)
  {
    ModelLoadResult r;
    r.model = std::move(m);
    r.success = true;
    return r;
  }

  static ModelLoadResult fail(std::string msg)
  {
    ModelLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Load a program model from a JSON file.
 *
 * @param path Path to the model document
 * @return ModelLoadResult with the model or an error message
 */
[[nodiscard]] ModelLoadResult load_program_model(const std::filesystem::path & path);

}  // namespace api_graph
