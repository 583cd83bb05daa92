// api_graph/driver/extractor.cpp - Analysis driver implementation
//
#include "api_graph/driver/extractor.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

#include "api_graph/basic/error.hpp"
#include "api_graph/report/graph_json.hpp"

namespace api_graph
{

namespace
{

namespace fs = std::filesystem;

std::optional<ModuleId> find_entry_module(
  const ProgramModel & model, const std::string & entry_point, const fs::path & project_root)
{
  if (auto module = model.find_module(entry_point)) {
    return module;
  }
  if (!project_root.empty()) {
    const fs::path resolved = (project_root / entry_point).lexically_normal();
    return model.find_module(resolved.generic_string());
  }
  return std::nullopt;
}

/// Shared pipeline of extract_project() and extract_model()
ExtractResult extract(
  const fs::path & model_path, const std::string & entry_point, const fs::path & project_root,
  const std::vector<PackageOverride> & packages, const std::optional<fs::path> & output,
  ExtractMode mode)
{
  ExtractResult result;

  ModelLoadResult loaded = load_program_model(model_path);
  if (!loaded.success) {
    result.diagnostics.report_error("failed to load program model")
      .with_label(model_path.generic_string(), loaded.error);
    return result;
  }
  result.model = std::move(loaded.model);

  const auto entry_module = find_entry_module(*result.model, entry_point, project_root);
  if (!entry_module) {
    result.diagnostics.report_error("entry point not found in program model: " + entry_point)
      .with_label(model_path.generic_string(), "")
      .with_help("the entry point must match a module file name in the program model");
    return result;
  }

  result.package_metadata = std::make_unique<PackageMetadataManager>(project_root);
  for (const auto & pkg : packages) {
    result.package_metadata->set_override(pkg.folder, pkg.documentation_metadata);
  }

  result.extractor = std::make_unique<Extractor>(*result.model, *result.package_metadata);
  result.entry = result.extractor->run(*entry_module, result.diagnostics);
  if (!result.entry) {
    return result;
  }

  if (mode == ExtractMode::Dump) {
    if (!output) {
      result.diagnostics.report_error("no output file for the graph dump")
        .with_help("set analysis.output in apigraph.yaml or pass -o <file>");
      return result;
    }
    if (Extractor::write_graph(
          result.extractor->symbol_table(), *result.entry, *output, result.diagnostics)) {
      result.generated_files.push_back(*output);
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace

Extractor::Extractor(const TypeOracle & oracle, PackageMetadata & package_metadata)
: table_(oracle, package_metadata)
{
}

ModuleEntry * Extractor::run(ModuleId entry_module, DiagnosticBag & diags)
{
  const std::string file = table_.oracle().module_file_name(entry_module);

  try {
    ModuleEntry & entry = table_.fetch_module(entry_module);

    const auto exported = table_.visible_exports(entry);
    for (const auto & [name, symbol] : exported) {
      table_.analyze(*symbol);
    }
    if (exported.empty()) {
      diags.report_warning("the entry point exports nothing")
        .with_label(file, "no exports were found in this module");
    }

    spdlog::info(
      "analyzed '{}': {} exports, {} symbols, {} declarations, {} modules", file, exported.size(),
      table_.symbol_count(), table_.declaration_count(), table_.module_count());
    return &entry;
  } catch (const Error & e) {
    diags.report(e).with_label(file, "while analyzing this entry point");
    return nullptr;
  }
}

ExtractResult Extractor::extract_project(const ProjectConfig & config, const ExtractOptions & options)
{
  spdlog::info(
    "project '{}' {}", config.project.name.empty() ? config.project_root.generic_string()
                                                   : config.project.name,
    config.project.version);

  return extract(
    config.analysis.program_model, config.analysis.entry_point, config.project_root,
    config.packages, options.output ? options.output : config.analysis.output, options.mode);
}

ExtractResult Extractor::extract_model(
  const fs::path & model_path, const std::string & entry_point, const ExtractOptions & options)
{
  return extract(model_path, entry_point, fs::path{}, {}, options.output, options.mode);
}

bool Extractor::clean_project(const ProjectConfig & config, DiagnosticBag & diags)
{
  if (!config.analysis.output) {
    return true;
  }

  std::error_code ec;
  if (fs::remove(*config.analysis.output, ec)) {
    spdlog::info("removed '{}'", config.analysis.output->generic_string());
  }
  if (ec) {
    diags.report_error("failed to remove output file")
      .with_label(config.analysis.output->generic_string(), ec.message());
    return false;
  }
  return true;
}

bool Extractor::write_graph(
  const SymbolTable & table, const ModuleEntry & entry, const fs::path & output_path,
  DiagnosticBag & diags)
{
  std::error_code ec;
  if (output_path.has_parent_path()) {
    fs::create_directories(output_path.parent_path(), ec);
    if (ec) {
      diags.report_error("failed to create output directory")
        .with_label(output_path.parent_path().generic_string(), ec.message());
      return false;
    }
  }

  std::ofstream out(output_path);
  if (!out.is_open()) {
    diags.report_error("failed to open output file: " + output_path.generic_string());
    return false;
  }

  out << to_json(table, entry).dump(2) << "\n";
  spdlog::info("wrote '{}'", output_path.generic_string());
  return true;
}

}  // namespace api_graph
