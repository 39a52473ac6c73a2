// codemap/project/source_collector.hpp - Source file discovery
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "codemap/project/project_config.hpp"

namespace codemap
{

/**
 * Match a path against a glob pattern.
 *
 * `*` matches within one path segment, `**` across segments, `?` one
 * character. Separators are always '/'.
 */
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view path) noexcept;

/**
 * Files of a recognized language below `roots`, sorted and de-duplicated.
 *
 * A root that is a file is taken as is. Directories are walked recursively;
 * hidden directories (leading '.') are skipped. `exclude` patterns are
 * matched against paths relative to `base`.
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_source_files(
  const std::vector<std::filesystem::path> & roots, const std::vector<std::string> & exclude,
  const std::filesystem::path & base);

/// Sources of a project: `sources` (or the project root when empty) minus `exclude`.
[[nodiscard]] std::vector<std::filesystem::path> collect_source_files(const ProjectConfig & config);

}  // namespace codemap
