// api_graph/package/package_metadata.hpp - Package documentation metadata lookup
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace api_graph
{

// ============================================================================
// PackageMetadata
// ============================================================================

/**
 * Answers whether the package containing a file ships documentation
 * metadata. Symbols imported from a package that does not are kept nominal.
 */
class PackageMetadata
{
public:
  virtual ~PackageMetadata() = default;

  [[nodiscard]] virtual bool supports_documentation_metadata(
    const std::filesystem::path & file_path) = 0;
};

// ============================================================================
// PackageMetadataManager
// ============================================================================

/**
 * Package metadata read from the nearest enclosing package.json.
 *
 * A package supports documentation metadata when its package.json declares
 * `"tsdoc": { "tsdocFlavor": "AEDoc" }`, names an existing `tsdocMetadata`
 * file, or when `tsdoc-metadata.json` exists at the package root.
 *
 * Relative file names are resolved against the base directory (the project
 * root), or against the working directory when none is given.
 *
 * Results are cached per package folder, and files without any enclosing
 * package.json are remembered per containing folder. Overrides registered
 * through set_override() take precedence over file inspection.
 */
class PackageMetadataManager : public PackageMetadata
{
public:
  static constexpr const char * k_package_json = "package.json";
  static constexpr const char * k_default_metadata_file = "tsdoc-metadata.json";

  PackageMetadataManager() = default;
  explicit PackageMetadataManager(std::filesystem::path base_directory);

  bool supports_documentation_metadata(const std::filesystem::path & file_path) override;

  /**
   * Force the answer for one package folder.
   *
   * @param package_folder Folder containing package.json
   * @param supported Answer returned for every file inside the package
   */
  void set_override(const std::filesystem::path & package_folder, bool supported);

  [[nodiscard]] const std::filesystem::path & base_directory() const noexcept
  {
    return base_directory_;
  }

  /// Nearest ancestor folder of `file_path` that contains package.json
  [[nodiscard]] std::optional<std::filesystem::path> find_package_folder(
    const std::filesystem::path & file_path) const;

private:
  bool inspect_package(const std::filesystem::path & package_folder) const;
  std::filesystem::path resolve(const std::filesystem::path & file_path) const;

  static std::string normalize(const std::filesystem::path & folder);

  std::unordered_map<std::string, bool> overrides_;
  std::unordered_map<std::string, bool> cache_;
  std::unordered_set<std::string> folders_without_package_;
  std::filesystem::path base_directory_;
};

}  // namespace api_graph
