// xelogen/driver/project_config.hpp - Project configuration (xelogen.yaml)
//
// Parses and validates xelogen.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace xelogen
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Node catalog section.
 */
struct CatalogConfig
{
  /// Register the standard node catalog
  bool builtin = true;

  /// Additional catalog files (relative paths are resolved against project_root)
  std::vector<std::filesystem::path> files;
};

/**
 * Lint section.
 */
struct LintConfig
{
  /// Names of lint passes to skip
  std::vector<std::string> disabled;

  /// Treat lint warnings as a failing result
  bool warnings_as_errors = false;
};

/**
 * Complete project configuration (xelogen.yaml).
 */
struct ProjectConfig
{
  std::string name;
  CatalogConfig catalog;
  LintConfig lint;

  /// Directory containing xelogen.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Catalog files as absolute paths
  [[nodiscard]] std::vector<std::filesystem::path> catalog_paths() const;
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

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

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
 * Load a project configuration from an xelogen.yaml file.
 *
 * @param config_path Path to xelogen.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to xelogen.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "xelogen.yaml";

}  // namespace xelogen
