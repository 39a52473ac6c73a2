// codemap/project/source_collector.cpp - Source file discovery
#include "codemap/project/source_collector.hpp"

#include <algorithm>
#include <system_error>

#include "codemap/basic/logging.hpp"
#include "codemap/syntax/language.hpp"

namespace codemap
{

namespace
{

/// Patterns without '/' apply to every path component.
bool is_excluded(const std::vector<std::string> & exclude, const fs::path & relative)
{
  const std::string rel = relative.generic_string();
  for (const auto & pattern : exclude) {
    if (glob_match(pattern, rel)) {
      return true;
    }
    if (pattern.find('/') != std::string::npos) {
      continue;
    }
    for (const auto & part : relative) {
      if (glob_match(pattern, part.generic_string())) {
        return true;
      }
    }
  }
  return false;
}

bool is_hidden(const fs::path & p)
{
  const std::string name = p.filename().string();
  return name.size() > 1 && name.front() == '.' && name != "..";
}

fs::path relative_to(const fs::path & p, const fs::path & base)
{
  if (base.empty()) {
    return p;
  }
  const fs::path rel = p.lexically_relative(base);
  return rel.empty() ? p : rel;
}

}  // namespace

bool glob_match(std::string_view pattern, std::string_view path) noexcept
{
  while (!pattern.empty()) {
    if (pattern.substr(0, 2) == "**") {
      pattern.remove_prefix(2);
      if (!pattern.empty() && pattern.front() == '/') {
        // "**/" spans zero or more whole segments
        pattern.remove_prefix(1);
        if (glob_match(pattern, path)) {
          return true;
        }
        for (size_t i = 0; i < path.size(); ++i) {
          if (path[i] == '/' && glob_match(pattern, path.substr(i + 1))) {
            return true;
          }
        }
        return false;
      }
      for (size_t i = 0; i <= path.size(); ++i) {
        if (glob_match(pattern, path.substr(i))) {
          return true;
        }
      }
      return false;
    }

    const char c = pattern.front();
    if (c == '*') {
      pattern.remove_prefix(1);
      for (size_t i = 0; i <= path.size(); ++i) {
        if (glob_match(pattern, path.substr(i))) {
          return true;
        }
        if (i < path.size() && path[i] == '/') {
          break;
        }
      }
      return false;
    }

    if (path.empty()) {
      return false;
    }
    if (c == '?') {
      if (path.front() == '/') {
        return false;
      }
    } else if (c != path.front()) {
      return false;
    }
    pattern.remove_prefix(1);
    path.remove_prefix(1);
  }
  return path.empty();
}

std::vector<fs::path> collect_source_files(
  const std::vector<fs::path> & roots, const std::vector<std::string> & exclude,
  const fs::path & base)
{
  std::vector<fs::path> out;

  for (const auto & root : roots) {
    std::error_code ec;
    if (fs::is_regular_file(root, ec)) {
      out.push_back(root.lexically_normal());
      continue;
    }
    if (!fs::is_directory(root, ec)) {
      logging::logger()->warn("source path does not exist: {}", root.string());
      continue;
    }

    fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      logging::logger()->warn("cannot walk {}: {}", root.string(), ec.message());
      continue;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        logging::logger()->warn("cannot walk {}: {}", root.string(), ec.message());
        break;
      }
      const fs::path p = it->path();
      if (it->is_directory(ec)) {
        if (is_hidden(p) || is_excluded(exclude, relative_to(p, base))) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (!it->is_regular_file(ec) || language_for_path(p) == LanguageId::Unknown) {
        continue;
      }
      if (!is_excluded(exclude, relative_to(p, base))) {
        out.push_back(p.lexically_normal());
      }
    }
  }

  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::vector<fs::path> collect_source_files(const ProjectConfig & config)
{
  std::vector<fs::path> roots = config.sources;
  if (roots.empty()) {
    roots.push_back(config.project_root);
  }
  return collect_source_files(roots, config.exclude, config.project_root);
}

}  // namespace codemap
