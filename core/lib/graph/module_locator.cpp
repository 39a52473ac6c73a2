// codemap/graph/module_locator.cpp - Filesystem module lookup
#include "codemap/graph/module_locator.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

#include "codemap/basic/logging.hpp"
#include "codemap/syntax/grammar_adapter.hpp"

namespace codemap
{

namespace
{

bool is_path_relative(std::string_view module)
{
  return module == "." || module == ".." || module.substr(0, 2) == "./" ||
         module.substr(0, 3) == "../";
}

/// Append the module path, its extension variants and its index files.
void expand_candidate(
  const fs::path & base, const ModuleLayout & layout, std::vector<fs::path> & out)
{
  const fs::path p = base.lexically_normal();
  if (p.has_filename()) {
    out.push_back(p);
    for (const std::string_view ext : layout.extensions) {
      out.emplace_back(p.string() + std::string(ext));
    }
  }
  for (const std::string_view index : layout.index_files) {
    out.push_back(p / fs::path(index));
  }
}

/// Path of a module reference below its package: `pkg/sub/x.h` -> `sub/x.h`.
fs::path strip_first_segment(const fs::path & rel)
{
  fs::path rest;
  bool first = true;
  for (const auto & part : rel) {
    if (first) {
      first = false;
      continue;
    }
    rest /= part;
  }
  return rest;
}

}  // namespace

std::vector<fs::path> FilesystemModuleLocator::candidates(const LocateRequest & request) const
{
  std::vector<fs::path> out;
  const GrammarAdapter * adapter = registry_.find(request.language);
  if (adapter == nullptr || request.module.empty()) {
    return out;
  }

  const ModuleLayout & layout = adapter->capabilities().module_layout;
  const fs::path from_dir = request.from_file.parent_path();
  fs::path rel;

  if (layout.separator == '.') {
    const std::string_view module = request.module;
    size_t dots = 0;
    while (dots < module.size() && module[dots] == '.') {
      ++dots;
    }
    std::string rest(module.substr(dots));
    std::replace(rest.begin(), rest.end(), '.', '/');
    rel = fs::path(rest);

    if (dots > 0 && layout.dotted_relative) {
      // one dot is the importing package itself
      fs::path base = from_dir;
      for (size_t i = 1; i < dots; ++i) {
        base = base.parent_path();
      }
      if (rel.empty()) {
        // `from . import x` names the package itself, never a sibling module
        for (const std::string_view index : layout.index_files) {
          out.push_back(base.lexically_normal() / fs::path(index));
        }
      } else {
        expand_candidate(base / rel, layout, out);
      }
      return out;
    }
  } else {
    rel = fs::path(request.module);
    if (is_path_relative(request.module)) {
      expand_candidate(from_dir / rel, layout, out);
      return out;
    }
    if (rel.is_absolute()) {
      expand_candidate(rel, layout, out);
      return out;
    }
  }

  if (rel.empty()) {
    return out;
  }

  if (layout.bare_from_importer) {
    expand_candidate(from_dir / rel, layout, out);
  }

  const std::string package = rel.begin()->string();
  if (auto it = packages_.find(package); it != packages_.end()) {
    const fs::path rest = strip_first_segment(rel);
    expand_candidate(rest.empty() ? it->second : it->second / rest, layout, out);
  }

  for (const auto & dir : search_paths_) {
    expand_candidate(dir / rel, layout, out);
  }
  return out;
}

LocateResult FilesystemModuleLocator::locate_now(const LocateRequest & request) const
{
  if (registry_.find(request.language) == nullptr) {
    return LocateResult::not_found(
      "no module layout for language '" + std::string(to_string(request.language)) + "'");
  }

  const std::vector<fs::path> paths = candidates(request);
  for (const auto & candidate : paths) {
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) {
      continue;
    }
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec) {
      resolved = candidate.lexically_normal();
    }
    logging::logger()->trace("located '{}' at {}", request.module, resolved.string());
    return LocateResult::found_at(std::move(resolved));
  }

  logging::logger()->trace(
    "'{}' not found from {} ({} candidates)", request.module, request.from_file.string(),
    paths.size());
  return LocateResult::not_found(
    "module '" + request.module + "' not found (" + std::to_string(paths.size()) +
    " candidate paths tried)");
}

std::future<LocateResult> FilesystemModuleLocator::locate(const LocateRequest & request) const
{
  std::promise<LocateResult> promise;
  try {
    promise.set_value(locate_now(request));
  } catch (const std::exception &) {
    promise.set_exception(std::current_exception());
  }
  return promise.get_future();
}

}  // namespace codemap
