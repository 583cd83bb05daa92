// api_graph/driver/extractor.hpp - Analysis driver
//
// Single entry point for an analysis run.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api_graph/analyzer/symbol_table.hpp"
#include "api_graph/basic/diagnostic.hpp"
#include "api_graph/oracle/program_model.hpp"
#include "api_graph/package/package_metadata.hpp"
#include "api_graph/project/project_config.hpp"

namespace api_graph
{

// ============================================================================
// Extract Mode
// ============================================================================

enum class ExtractMode {
  Check,  ///< Build and analyze the graph only
  Dump,   ///< Also write the graph as JSON
};

// ============================================================================
// Extract Options
// ============================================================================

struct ExtractOptions
{
  ExtractMode mode = ExtractMode::Check;

  /// Output file for the JSON dump (overrides project config)
  std::optional<std::filesystem::path> output;
};

struct ExtractResult;

// ============================================================================
// Extractor
// ============================================================================

/**
 * Resolves an entry module and analyzes every symbol it exports.
 */
class Extractor
{
public:
  Extractor(const TypeOracle & oracle, PackageMetadata & package_metadata);

  /**
   * Analyze an entry module.
   *
   * Every exported name, including names re-exported through `export *`,
   * is analyzed. A fatal analysis error is reported to `diags`.
   *
   * @return The entry, or nullptr if the run failed
   */
  ModuleEntry * run(ModuleId entry_module, DiagnosticBag & diags);

  [[nodiscard]] SymbolTable & symbol_table() noexcept { return table_; }
  [[nodiscard]] const SymbolTable & symbol_table() const noexcept { return table_; }

  /**
   * Analyze a project defined by a ProjectConfig.
   *
   * @param config Project configuration (from apigraph.yaml)
   * @param options Extract options (may override config settings)
   */
  [[nodiscard]] static ExtractResult extract_project(
    const ProjectConfig & config, const ExtractOptions & options);

  /**
   * Analyze a program model file directly, without a project configuration.
   *
   * @param model_path Program model JSON
   * @param entry_point Entry module file name, as written in the model
   * @param options Extract options
   */
  [[nodiscard]] static ExtractResult extract_model(
    const std::filesystem::path & model_path, const std::string & entry_point,
    const ExtractOptions & options);

  /**
   * Delete the files a project's dump writes.
   *
   * @return true if nothing was left behind
   */
  static bool clean_project(const ProjectConfig & config, DiagnosticBag & diags);

  /// Write the graph of `entry` as JSON
  static bool write_graph(
    const SymbolTable & table, const ModuleEntry & entry,
    const std::filesystem::path & output_path, DiagnosticBag & diags);

private:
  SymbolTable table_;
};

// ============================================================================
// Extract Result
// ============================================================================

struct ExtractResult
{
  /// Whether the run succeeded (no errors)
  bool success = false;

  /// Collected diagnostics
  DiagnosticBag diagnostics;

  /// Written files (only populated in Dump mode)
  std::vector<std::filesystem::path> generated_files;

  // Declared in dependency order: the extractor refers to both
  std::unique_ptr<ProgramModel> model;
  std::unique_ptr<PackageMetadataManager> package_metadata;
  std::unique_ptr<Extractor> extractor;

  /// Analyzed entry (owned by the extractor's symbol table)
  ModuleEntry * entry = nullptr;
};

}  // namespace api_graph
