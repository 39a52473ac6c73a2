// codemap/project/project_config.cpp - Project configuration implementation
//
#include "codemap/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include "codemap/basic/logging.hpp"

namespace codemap
{

namespace
{

std::filesystem::path resolve_against(
  const std::filesystem::path & root, const std::string & value)
{
  const std::filesystem::path p(value);
  return p.is_absolute() ? p.lexically_normal() : (root / p).lexically_normal();
}

/// Read a list of strings; a scalar is accepted as a one-element list.
bool read_string_list(
  const YAML::Node & node, std::string_view key, std::vector<std::string> & out,
  std::string & error)
{
  if (node.IsScalar()) {
    out.push_back(node.as<std::string>());
    return true;
  }
  if (!node.IsSequence()) {
    error = std::string(key) + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

/// Parse 'markers' section: {<language>: {class_method: [...], static_method: [...]}}
bool parse_markers(const YAML::Node & node, ProjectConfig & config, std::string & error)
{
  if (!node.IsMap()) {
    error = "markers must be a map of language names";
    return false;
  }
  for (const auto & entry : node) {
    const std::string lang_name = entry.first.as<std::string>();
    const auto language = language_from_name(lang_name);
    if (!language) {
      error = "markers: unknown language '" + lang_name + "'";
      return false;
    }
    const YAML::Node & roles = entry.second;
    if (!roles.IsMap()) {
      error = "markers." + lang_name + " must be a map";
      return false;
    }

    MarkerConfig markers;
    markers.language = *language;
    if (roles["class_method"] &&
        !read_string_list(
          roles["class_method"], "markers." + lang_name + ".class_method", markers.class_method,
          error)) {
      return false;
    }
    if (roles["static_method"] &&
        !read_string_list(
          roles["static_method"], "markers." + lang_name + ".static_method",
          markers.static_method, error)) {
      return false;
    }
    config.markers.push_back(std::move(markers));
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;

  // Parse 'project' section
  if (root["project"]) {
    const auto & project = root["project"];
    if (project["name"]) {
      config.project.name = project["name"].as<std::string>();
    }
  }

  // Parse 'sources'
  if (root["sources"]) {
    std::vector<std::string> sources;
    if (!read_string_list(root["sources"], "sources", sources, error)) {
      return ConfigLoadResult::fail(error);
    }
    for (const auto & s : sources) {
      config.sources.push_back(resolve_against(project_root, s));
    }
  }

  // Parse 'exclude'
  if (root["exclude"] && !read_string_list(root["exclude"], "exclude", config.exclude, error)) {
    return ConfigLoadResult::fail(error);
  }

  // Parse 'resolver' section
  if (root["resolver"]) {
    const auto & resolver = root["resolver"];
    if (resolver["search_paths"]) {
      std::vector<std::string> dirs;
      if (!read_string_list(resolver["search_paths"], "resolver.search_paths", dirs, error)) {
        return ConfigLoadResult::fail(error);
      }
      for (const auto & d : dirs) {
        config.resolver.search_paths.push_back(resolve_against(project_root, d));
      }
    }
    if (resolver["packages"]) {
      if (!resolver["packages"].IsMap()) {
        return ConfigLoadResult::fail("resolver.packages must be a map of name to path");
      }
      for (const auto & entry : resolver["packages"]) {
        config.resolver.packages[entry.first.as<std::string>()] =
          resolve_against(project_root, entry.second.as<std::string>());
      }
    }
  }

  // Parse 'analysis' section
  if (root["analysis"]) {
    const auto & analysis = root["analysis"];
    if (analysis["jobs"]) {
      const int jobs = analysis["jobs"].as<int>();
      if (jobs < 0) {
        return ConfigLoadResult::fail("analysis.jobs must not be negative");
      }
      config.analysis.jobs = static_cast<size_t>(jobs);
    }
    if (analysis["fold_constant_imports"]) {
      config.analysis.fold_constant_imports = analysis["fold_constant_imports"].as<bool>();
    }
  }

  // Parse 'markers' section
  if (root["markers"] && !parse_markers(root["markers"], config, error)) {
    return ConfigLoadResult::fail(error);
  }

  // Parse 'logging' section
  if (root["logging"]) {
    const auto & log = root["logging"];
    if (log["level"]) {
      config.logging.level = log["level"].as<std::string>();
      if (!logging::parse_level(config.logging.level)) {
        return ConfigLoadResult::fail(
          "invalid logging.level: '" + config.logging.level +
          "' (must be trace, debug, info, warn, error, critical or off)");
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  std::string_view text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(std::string(text)), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

RegistrationResult apply_marker_config(const ProjectConfig & config, AdapterRegistry & registry)
{
  for (const auto & markers : config.markers) {
    for (const auto & name : markers.class_method) {
      auto result = registry.add_marker(markers.language, name, MarkerRole::ClassMethod);
      if (!result.success) {
        return result;
      }
    }
    for (const auto & name : markers.static_method) {
      auto result = registry.add_marker(markers.language, name, MarkerRole::StaticMethod);
      if (!result.success) {
        return result;
      }
    }
  }
  return RegistrationResult::ok();
}

}  // namespace codemap
