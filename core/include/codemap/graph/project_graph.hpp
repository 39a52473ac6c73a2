// codemap/graph/project_graph.hpp - Cross-file dependency graph
//
// Owns the FileMaps of one unit of work and the edges linking their import
// records to files. Every edge that does not land on a file of the unit
// points at the unknown sentinel and records why.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codemap/model/file_map.hpp"

namespace codemap
{

// ============================================================================
// Edges
// ============================================================================

enum class EdgeResolution : uint8_t {
  Resolved,        ///< lands on a file of the unit
  External,        ///< located on disk, outside the unit
  ModuleNotFound,  ///< the locator found nothing or failed
  Unresolved,      ///< dynamic import without a static module
};

[[nodiscard]] std::string_view to_string(EdgeResolution resolution) noexcept;

/// Target of every edge that does not land on a file of the unit.
inline constexpr std::string_view k_unknown_node = "<external/unknown>";

struct DependencyEdge
{
  std::filesystem::path from_file;
  size_t import_index = 0;  ///< index into the source FileMap's imports
  std::string module_reference;
  EdgeResolution resolution = EdgeResolution::Unresolved;
  /// Target file for Resolved edges; the located file for External ones.
  std::optional<std::filesystem::path> to_file;
  /// Why an edge points at the unknown sentinel.
  std::string detail;

  [[nodiscard]] bool is_unknown() const noexcept { return resolution != EdgeResolution::Resolved; }
};

// ============================================================================
// ProjectGraph
// ============================================================================

/**
 * Files keyed by normalized path plus their dependency edges.
 *
 * Edges are kept sorted by (from_file, import_index, module_reference), so
 * two builds over the same input compare equal. Cycles are allowed.
 */
class ProjectGraph
{
public:
  ProjectGraph() = default;

  ProjectGraph(const ProjectGraph &) = delete;
  ProjectGraph & operator=(const ProjectGraph &) = delete;
  ProjectGraph(ProjectGraph &&) = default;
  ProjectGraph & operator=(ProjectGraph &&) = default;

  // ===========================================================================
  // Construction (used by GraphBuilder)
  // ===========================================================================

  /// Insert or replace a file.
  void add_file(FileMap map);

  void add_edge(DependencyEdge edge) { edges_.push_back(std::move(edge)); }

  /// Restore the canonical edge order.
  void sort_edges();

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] const FileMap * file(const std::filesystem::path & path) const;
  [[nodiscard]] bool contains(const std::filesystem::path & path) const
  {
    return file(path) != nullptr;
  }

  /// All files in path order.
  [[nodiscard]] const std::map<std::filesystem::path, FileMap> & files() const noexcept
  {
    return files_;
  }

  [[nodiscard]] const std::vector<DependencyEdge> & edges() const noexcept { return edges_; }

  /// Edges leaving `path`, in import order.
  [[nodiscard]] std::vector<const DependencyEdge *> outgoing(const std::filesystem::path & path) const;

  /// Resolved edges landing on `path`.
  [[nodiscard]] std::vector<const DependencyEdge *> incoming(const std::filesystem::path & path) const;

  /// Edges pointing at the unknown sentinel.
  [[nodiscard]] std::vector<const DependencyEdge *> unknown_edges() const;

  [[nodiscard]] size_t file_count() const noexcept { return files_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }

  /// Normalized form used as the file key.
  [[nodiscard]] static std::filesystem::path normalize(const std::filesystem::path & path);

private:
  std::map<std::filesystem::path, FileMap> files_;
  std::vector<DependencyEdge> edges_;
};

}  // namespace codemap
