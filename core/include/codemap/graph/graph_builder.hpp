// codemap/graph/graph_builder.hpp - Links FileMaps into a ProjectGraph
#pragma once

#include "codemap/graph/module_locator.hpp"
#include "codemap/graph/project_graph.hpp"
#include "codemap/model/file_map.hpp"

namespace codemap
{

/**
 * Collects the FileMaps of one unit of work and links their imports.
 *
 * The builder is the single owner of the maps it is handed; feed it from one
 * thread. `build()` issues every module lookup first and then collects the
 * results in edge order, so lookups may complete asynchronously while the
 * output stays deterministic.
 */
class GraphBuilder
{
public:
  explicit GraphBuilder(const ModuleLocator & locator) : locator_(locator) {}

  /// Hand over a finished FileMap. A later map for the same path replaces the earlier one.
  void add_file(FileMap map) { graph_.add_file(std::move(map)); }

  [[nodiscard]] size_t file_count() const noexcept { return graph_.file_count(); }

  /**
   * Link every module reference and return the graph.
   *
   * Never fails: a lookup that throws becomes a ModuleNotFound edge. The
   * builder is empty afterwards.
   */
  [[nodiscard]] ProjectGraph build();

private:
  const ModuleLocator & locator_;
  ProjectGraph graph_;
};

}  // namespace codemap
