// kleis/project/project_config.hpp - Project configuration (kleis.yaml)
//
// Parses and validates kleis.yaml project configuration files.
// Used by the kleisc CLI and the TypeChecker facade.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "kleis/sema/inference_driver.hpp"

namespace kleis
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Checker configuration section.
 */
struct CheckerConfig
{
  /// Pre-load the bundled standard library
  bool stdlib = true;

  /// Standard library directory overriding auto-detection
  std::optional<std::filesystem::path> stdlib_path;

  /// Structure files loaded after the standard library, in order
  std::vector<std::filesystem::path> load;

  /// Candidate selection for overloaded operations
  DispatchPolicy dispatch = DispatchPolicy::FirstMatch;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (kleis.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CheckerConfig checker;

  /// Directory containing kleis.yaml (relative paths above are already resolved against it)
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
 * Load a project configuration from a kleis.yaml file.
 *
 * @param config_path Path to kleis.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to kleis.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "kleis.yaml";

}  // namespace kleis
