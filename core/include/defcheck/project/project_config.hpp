// defcheck/project/project_config.hpp - Project configuration (defcheck.yaml)
//
// Parses and validates defcheck.yaml project configuration files.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace defcheck
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Per-file analysis settings.
 */
struct AnalysisConfig
{
  /// Roots to analyze (relative to defcheck.yaml)
  std::vector<std::filesystem::path> paths;

  /// Path fragments to exclude (directory or file names, or relative paths)
  std::vector<std::string> exclude;

  /// Skip test_*.py files and tests/ directories
  bool skip_tests = true;

  /// Worker count (0 = hardware concurrency)
  unsigned jobs = 0;

  /// Number of lines searched above a statement for a prior check
  uint32_t lookback_lines = 5;

  uint64_t max_file_bytes = 2U * 1024U * 1024U;
};

/**
 * Integration prediction settings.
 */
struct IntegrationConfig
{
  std::filesystem::path components_dir = "components";
  std::filesystem::path contracts_dir = "contracts";

  /// Seconds a caller needs on top of its callee's timeout
  int timeout_overhead = 5;
};

/**
 * Complete project configuration (defcheck.yaml).
 */
struct ProjectConfig
{
  AnalysisConfig analysis;
  IntegrationConfig integration;

  /// Rule file (YAML or JSON); empty = built-in rules
  std::optional<std::filesystem::path> patterns;

  /// Directory containing defcheck.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Resolve a configured path against the project root
  [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path & p) const
  {
    return p.is_absolute() ? p : project_root / p;
  }
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
 * Load a project configuration from a defcheck.yaml file.
 *
 * @param config_path Path to defcheck.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Default configuration rooted at a directory (used when no file exists).
 */
[[nodiscard]] ProjectConfig default_project_config(const std::filesystem::path & root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to defcheck.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "defcheck.yaml";

}  // namespace defcheck
