// api_graph/project/project_config.cpp - Project configuration implementation
//
#include "api_graph/project/project_config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace api_graph
{

namespace
{

namespace fs = std::filesystem;

fs::path resolve_against(const fs::path & root, const fs::path & path)
{
  if (path.is_absolute()) {
    return path.lexically_normal();
  }
  return (root / path).lexically_normal();
}

/// Parse a single package override entry
std::optional<PackageOverride> parse_package(
  const YAML::Node & node, const fs::path & project_root, std::string & error)
{
  if (!node.IsMap()) {
    error = "package entry must be a map";
    return std::nullopt;
  }

  if (!node["folder"]) {
    error = "package entry must have a 'folder'";
    return std::nullopt;
  }
  if (!node["documentation_metadata"]) {
    error = "package entry must have 'documentation_metadata'";
    return std::nullopt;
  }

  PackageOverride pkg;
  pkg.folder = resolve_against(project_root, node["folder"].as<std::string>());
  pkg.documentation_metadata = node["documentation_metadata"].as<bool>();
  return pkg;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  const fs::path config_dir = fs::absolute(config_path).parent_path();
  config.project_root =
    config_dir.filename() == fs::path(k_project_config_folder) ? config_dir.parent_path() : config_dir;

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());

    // Parse 'project' section
    if (root["project"]) {
      const auto & project = root["project"];
      if (project["name"]) {
        config.project.name = project["name"].as<std::string>();
      }
      if (project["version"]) {
        config.project.version = project["version"].as<std::string>();
      }
    }

    // Parse 'analysis' section
    const auto & analysis = root["analysis"];
    if (!analysis || !analysis.IsMap()) {
      return ConfigLoadResult::fail("missing 'analysis' section");
    }
    if (!analysis["program_model"]) {
      return ConfigLoadResult::fail("analysis.program_model is required");
    }
    if (!analysis["entry_point"]) {
      return ConfigLoadResult::fail("analysis.entry_point is required");
    }
    config.analysis.program_model =
      resolve_against(config.project_root, analysis["program_model"].as<std::string>());
    config.analysis.entry_point = analysis["entry_point"].as<std::string>();
    if (config.analysis.entry_point.empty()) {
      return ConfigLoadResult::fail("analysis.entry_point cannot be empty");
    }
    if (analysis["output"]) {
      config.analysis.output =
        resolve_against(config.project_root, analysis["output"].as<std::string>());
    }

    // Parse 'packages' section
    if (root["packages"]) {
      if (!root["packages"].IsSequence()) {
        return ConfigLoadResult::fail("packages must be a list");
      }
      for (const auto & pkg_node : root["packages"]) {
        std::string pkg_error;
        auto pkg = parse_package(pkg_node, config.project_root, pkg_error);
        if (!pkg) {
          return ConfigLoadResult::fail("invalid package: " + pkg_error);
        }
        config.packages.push_back(std::move(*pkg));
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_project_config_folder / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path legacy = current / k_project_config_file_name;
    if (fs::exists(legacy)) {
      spdlog::warn(
        "the \"{}\" configuration file path is deprecated; please move it to \"{}/{}\"",
        legacy.generic_string(), k_project_config_folder, k_project_config_file_name);
      return legacy;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace api_graph
