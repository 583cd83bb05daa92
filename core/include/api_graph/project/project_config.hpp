// api_graph/project/project_config.hpp - Project configuration (apigraph.yaml)
//
// Parses and validates apigraph.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace api_graph
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Project metadata section.
 */
struct ProjectInfo
{
  std::string name;
  std::string version;
};

/**
 * Analysis section.
 */
struct AnalysisConfig
{
  /// Program model produced by the front end (resolved against the project root)
  std::filesystem::path program_model;

  /// Entry module, as named in the program model
  std::string entry_point;

  /// Where `apigraph dump` writes the graph (resolved against the project root)
  std::optional<std::filesystem::path> output;
};

/**
 * Documentation metadata override for one package.
 */
struct PackageOverride
{
  /// Package folder (resolved against the project root)
  std::filesystem::path folder;

  bool documentation_metadata = false;
};

/**
 * Complete project configuration (apigraph.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;
  AnalysisConfig analysis;
  std::vector<PackageOverride> packages;

  /// Project folder (the folder above config/, or the folder of a legacy file)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an apigraph.yaml file.
 *
 * @param config_path Path to apigraph.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * In each directory, config/apigraph.yaml is preferred. A legacy
 * apigraph.yaml next to the project is still accepted, with a warning.
 *
 * @param start_dir Directory to start searching from
 * @return Path to the configuration file if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "apigraph.yaml";

/**
 * Folder holding the configuration file, relative to the project root.
 */
inline constexpr const char * k_project_config_folder = "config";

}  // namespace api_graph
