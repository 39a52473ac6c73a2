// codemap/graph/graph_builder.cpp - Links FileMaps into a ProjectGraph
#include "codemap/graph/graph_builder.hpp"

#include <exception>
#include <future>
#include <utility>
#include <vector>

#include "codemap/basic/logging.hpp"

namespace codemap
{

namespace
{

struct PendingLookup
{
  DependencyEdge edge;
  std::future<LocateResult> result;
};

}  // namespace

ProjectGraph GraphBuilder::build()
{
  std::vector<PendingLookup> pending;

  for (const auto & [path, map] : graph_.files()) {
    for (size_t i = 0; i < map.imports.size(); ++i) {
      const ImportRecord & record = map.imports[i];
      const std::vector<std::string> references = record.module_references();

      if (references.empty()) {
        DependencyEdge edge;
        edge.from_file = path;
        edge.import_index = i;
        edge.module_reference = std::string(k_unresolved_module);
        edge.resolution = EdgeResolution::Unresolved;
        edge.detail = "module is computed at runtime";
        graph_.add_edge(std::move(edge));
        continue;
      }

      for (const auto & reference : references) {
        PendingLookup lookup;
        lookup.edge.from_file = path;
        lookup.edge.import_index = i;
        lookup.edge.module_reference = reference;
        const LocateRequest request{
          .from_file = path,
          .language = map.language,
          .module = reference,
          .relative_depth = record.relative_depth,
        };
        try {
          lookup.result = locator_.locate(request);
        } catch (const std::exception &) {
          // Reported with the deferred failures below.
          std::promise<LocateResult> failed;
          failed.set_exception(std::current_exception());
          lookup.result = failed.get_future();
        }
        pending.push_back(std::move(lookup));
      }
    }
  }

  for (auto & lookup : pending) {
    DependencyEdge & edge = lookup.edge;
    try {
      const LocateResult result = lookup.result.get();
      if (result.found()) {
        fs::path target = ProjectGraph::normalize(result.path);
        if (graph_.contains(target)) {
          edge.resolution = EdgeResolution::Resolved;
        } else {
          edge.resolution = EdgeResolution::External;
          edge.detail = "located outside the analyzed files";
        }
        edge.to_file = std::move(target);
      } else {
        edge.resolution = EdgeResolution::ModuleNotFound;
        edge.detail = result.reason;
      }
    } catch (const std::exception & e) {
      edge.resolution = EdgeResolution::ModuleNotFound;
      edge.detail = std::string("module lookup failed: ") + e.what();
      logging::logger()->debug(
        "{}: lookup of '{}' failed: {}", edge.from_file.string(), edge.module_reference, e.what());
    }
    graph_.add_edge(std::move(edge));
  }

  graph_.sort_edges();
  logging::logger()->debug(
    "linked {} files: {} edges, {} unknown", graph_.file_count(), graph_.edge_count(),
    graph_.unknown_edges().size());
  return std::exchange(graph_, ProjectGraph{});
}

}  // namespace codemap
