// api_graph/package/package_metadata.cpp - package.json inspection
//
#include "api_graph/package/package_metadata.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace api_graph
{

namespace
{

bool equals_ignore_case(const std::string & a, const std::string & b)
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace

PackageMetadataManager::PackageMetadataManager(fs::path base_directory)
: base_directory_(std::move(base_directory))
{
}

fs::path PackageMetadataManager::resolve(const fs::path & file_path) const
{
  if (file_path.is_relative() && !base_directory_.empty()) {
    return base_directory_ / file_path;
  }
  return file_path;
}

std::string PackageMetadataManager::normalize(const fs::path & folder)
{
  std::error_code ec;
  fs::path abs = fs::weakly_canonical(fs::absolute(folder, ec), ec);
  if (ec) {
    abs = folder;
  }
  return abs.lexically_normal().generic_string();
}

void PackageMetadataManager::set_override(const fs::path & package_folder, bool supported)
{
  overrides_[normalize(package_folder)] = supported;
}

std::optional<fs::path> PackageMetadataManager::find_package_folder(const fs::path & file_path) const
{
  std::error_code ec;
  fs::path current = fs::absolute(resolve(file_path), ec);
  if (ec) {
    return std::nullopt;
  }
  current = current.lexically_normal().parent_path();

  while (!current.empty()) {
    if (fs::exists(current / k_package_json, ec)) {
      return current;
    }
    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }
  return std::nullopt;
}

bool PackageMetadataManager::supports_documentation_metadata(const fs::path & file_path)
{
  const std::string containing = normalize(resolve(file_path).parent_path());
  if (folders_without_package_.count(containing) != 0) {
    return false;
  }

  const auto folder = find_package_folder(file_path);
  if (!folder) {
    spdlog::warn("no {} found for '{}'", k_package_json, file_path.generic_string());
    folders_without_package_.insert(containing);
    return false;
  }

  const std::string key = normalize(*folder);
  if (auto it = overrides_.find(key); it != overrides_.end()) {
    return it->second;
  }
  if (auto it = cache_.find(key); it != cache_.end()) {
    return it->second;
  }

  const bool supported = inspect_package(*folder);
  spdlog::debug("package '{}' documentation metadata: {}", key, supported ? "yes" : "no");
  cache_.emplace(key, supported);
  return supported;
}

bool PackageMetadataManager::inspect_package(const fs::path & package_folder) const
{
  const fs::path package_json = package_folder / k_package_json;
  std::ifstream in(package_json);
  if (!in) {
    spdlog::warn("cannot read '{}'", package_json.generic_string());
    return false;
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::exception & e) {
    spdlog::warn("cannot parse '{}': {}", package_json.generic_string(), e.what());
    return false;
  }
  if (!doc.is_object()) {
    spdlog::warn("'{}' is not a JSON object", package_json.generic_string());
    return false;
  }

  // "tsdoc": { "tsdocFlavor": "AEDoc" }
  if (auto tsdoc = doc.find("tsdoc"); tsdoc != doc.end() && tsdoc->is_object()) {
    auto flavor = tsdoc->find("tsdocFlavor");
    if (flavor != tsdoc->end() && flavor->is_string() &&
        equals_ignore_case(flavor->get<std::string>(), "AEDoc")) {
      return true;
    }
  }

  std::error_code ec;
  if (auto metadata = doc.find("tsdocMetadata"); metadata != doc.end() && metadata->is_string()) {
    if (fs::is_regular_file(package_folder / metadata->get<std::string>(), ec)) {
      return true;
    }
  }

  return fs::is_regular_file(package_folder / k_default_metadata_file, ec);
}

}  // namespace api_graph
