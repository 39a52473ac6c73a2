// codemap/report/json_export.hpp - JSON serialization of analysis results
//
// Returns nlohmann::json objects for FileMaps and ProjectGraphs. Output is
// deterministic: identical input yields an identical dump.
//
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "codemap/basic/diagnostic.hpp"
#include "codemap/graph/project_graph.hpp"
#include "codemap/model/file_map.hpp"

namespace codemap
{

/**
 * Serialize one file: symbols (with their arena ids), imports and diagnostics.
 */
[[nodiscard]] nlohmann::json to_json(const FileMap & map);

/**
 * Serialize a graph: every file in path order followed by the edges.
 *
 * Edges that do not land on an analyzed file carry `"to": "<external/unknown>"`
 * and a `detail` string.
 */
[[nodiscard]] nlohmann::json to_json(const ProjectGraph & graph);

[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag);

/**
 * Render `j` as text. Strings that are not valid UTF-8 (source text in a
 * legacy encoding) have each bad byte replaced by U+FFFD.
 */
[[nodiscard]] std::string dump_json(const nlohmann::json & j, int indent = -1);

}  // namespace codemap
