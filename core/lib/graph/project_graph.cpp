// codemap/graph/project_graph.cpp - Cross-file dependency graph
#include "codemap/graph/project_graph.hpp"

#include <algorithm>
#include <system_error>
#include <tuple>

namespace codemap
{

std::string_view to_string(EdgeResolution resolution) noexcept
{
  switch (resolution) {
    case EdgeResolution::Resolved:
      return "resolved";
    case EdgeResolution::External:
      return "external";
    case EdgeResolution::ModuleNotFound:
      return "module-not-found";
    case EdgeResolution::Unresolved:
      return "unresolved";
  }
  return "unknown";
}

fs::path ProjectGraph::normalize(const fs::path & path)
{
  std::error_code ec;
  const fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  fs::path canonical = fs::weakly_canonical(absolute, ec);
  if (ec) {
    return absolute.lexically_normal();
  }
  return canonical;
}

void ProjectGraph::add_file(FileMap map)
{
  fs::path key = normalize(map.file_path);
  map.file_path = key;
  files_.insert_or_assign(std::move(key), std::move(map));
}

void ProjectGraph::sort_edges()
{
  std::stable_sort(edges_.begin(), edges_.end(), [](const auto & a, const auto & b) {
    return std::tie(a.from_file, a.import_index, a.module_reference) <
           std::tie(b.from_file, b.import_index, b.module_reference);
  });
}

const FileMap * ProjectGraph::file(const fs::path & path) const
{
  auto it = files_.find(normalize(path));
  return it != files_.end() ? &it->second : nullptr;
}

std::vector<const DependencyEdge *> ProjectGraph::outgoing(const fs::path & path) const
{
  const fs::path key = normalize(path);
  std::vector<const DependencyEdge *> out;
  for (const auto & e : edges_) {
    if (e.from_file == key) {
      out.push_back(&e);
    }
  }
  return out;
}

std::vector<const DependencyEdge *> ProjectGraph::incoming(const fs::path & path) const
{
  const fs::path key = normalize(path);
  std::vector<const DependencyEdge *> out;
  for (const auto & e : edges_) {
    if (e.resolution == EdgeResolution::Resolved && e.to_file && *e.to_file == key) {
      out.push_back(&e);
    }
  }
  return out;
}

std::vector<const DependencyEdge *> ProjectGraph::unknown_edges() const
{
  std::vector<const DependencyEdge *> out;
  for (const auto & e : edges_) {
    if (e.is_unknown()) {
      out.push_back(&e);
    }
  }
  return out;
}

}  // namespace codemap
