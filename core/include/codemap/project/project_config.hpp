// codemap/project/project_config.hpp - Project configuration (codemap.yaml)
//
// Parses and validates codemap.yaml project configuration files.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codemap/syntax/adapter_registry.hpp"
#include "codemap/syntax/language.hpp"

namespace codemap
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct ProjectInfo
{
  std::string name;
};

/**
 * Module lookup section.
 */
struct ResolverConfig
{
  /// Directories tried for non-relative module references
  std::vector<std::filesystem::path> search_paths;

  /// Package name -> directory
  std::map<std::string, std::filesystem::path> packages;
};

struct AnalysisConfig
{
  /// Worker tasks (0 = hardware concurrency)
  size_t jobs = 0;

  /// Fold string-literal concatenations in call-form imports
  bool fold_constant_imports = true;
};

/**
 * Additional marker decorators for one language.
 */
struct MarkerConfig
{
  LanguageId language = LanguageId::Unknown;
  std::vector<std::string> class_method;
  std::vector<std::string> static_method;
};

struct LoggingConfig
{
  /// spdlog level name
  std::string level = "warn";
};

/**
 * Complete project configuration (codemap.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;

  /// Files and directories to analyze (absolute)
  std::vector<std::filesystem::path> sources;

  /// Glob patterns relative to the project root (`*`, `**`, `?`)
  std::vector<std::string> exclude;

  ResolverConfig resolver;
  AnalysisConfig analysis;
  std::vector<MarkerConfig> markers;
  LoggingConfig logging;

  /// Directory containing codemap.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

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
 * Load a project configuration from a codemap.yaml file.
 *
 * @param config_path Path to codemap.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text.
 *
 * @param text YAML document
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @return Path to codemap.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Register the configured marker decorators.
 *
 * Stops at the first marker the registry rejects.
 */
[[nodiscard]] RegistrationResult apply_marker_config(
  const ProjectConfig & config, AdapterRegistry & registry);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "codemap.yaml";

}  // namespace codemap
