// codemap/report/json_export.cpp - JSON serialization implementation
//
#include "codemap/report/json_export.hpp"

#include <nlohmann/json.hpp>

namespace codemap
{

namespace
{

using nlohmann::json;

json j_span(const Span & s)
{
  if (!s.is_valid()) {
    return nullptr;
  }
  return json{
    {"start_line", s.start_line}, {"start_column", s.start_column},
    {"end_line", s.end_line},     {"end_column", s.end_column},
    {"start_byte", s.start_byte}, {"end_byte", s.end_byte},
  };
}

json j_scope(const std::optional<SymbolId> & id)
{
  return id ? json(id->value) : json(nullptr);
}

json j_symbol(const SymbolRecord & s, size_t id)
{
  json modifiers = json::array();
  for (const Modifier m : s.modifiers.list()) {
    modifiers.push_back(std::string(to_string(m)));
  }
  return json{
    {"id", id},
    {"name", s.name},
    {"kind", std::string(to_string(s.kind))},
    {"modifiers", std::move(modifiers)},
    {"scope", j_scope(s.enclosing_scope)},
    {"decorators", s.decorators},
    {"bases", s.bases},
    {"doc", s.doc_comment ? json(*s.doc_comment) : json(nullptr)},
    {"span", j_span(s.span)},
  };
}

json j_target(const ImportTarget & t)
{
  json j{
    {"name", t.imported_name},
    {"alias", t.local_alias.empty() ? json(nullptr) : json(t.local_alias)},
    {"wildcard", t.is_wildcard},
  };
  if (!t.module.empty()) {
    j["module"] = t.module;
  }
  return j;
}

json j_import(const ImportRecord & r)
{
  json targets = json::array();
  for (const auto & t : r.targets) {
    targets.push_back(j_target(t));
  }
  return json{
    {"raw", r.raw_statement},
    {"kind", std::string(to_string(r.kind))},
    {"module", r.resolved_module.value_or(std::string(k_unresolved_module))},
    {"targets", std::move(targets)},
    {"relative_depth", r.relative_depth},
    {"scope", j_scope(r.scope)},
    {"guarded", r.guarded},
    {"span", j_span(r.span)},
  };
}

json j_edge(const DependencyEdge & e)
{
  json j{
    {"from", e.from_file.generic_string()},
    {"import_index", e.import_index},
    {"module", e.module_reference},
    {"resolution", std::string(to_string(e.resolution))},
  };
  if (e.resolution == EdgeResolution::Resolved && e.to_file) {
    j["to"] = e.to_file->generic_string();
  } else {
    j["to"] = std::string(k_unknown_node);
  }
  if (e.resolution == EdgeResolution::External && e.to_file) {
    j["located"] = e.to_file->generic_string();
  }
  if (!e.detail.empty()) {
    j["detail"] = e.detail;
  }
  return j;
}

}  // namespace

nlohmann::json to_json(const Diagnostic & diag)
{
  json j{
    {"severity", std::string(to_string(diag.severity))},
    {"kind", std::string(to_string(diag.kind))},
    {"code", diag.code},
    {"message", diag.message},
    {"span", j_span(diag.primary_span())},
  };
  if (diag.help_message) {
    j["help"] = *diag.help_message;
  }
  return j;
}

nlohmann::json to_json(const FileMap & map)
{
  json symbols = json::array();
  for (size_t i = 0; i < map.symbols.size(); ++i) {
    symbols.push_back(j_symbol(map.symbols[i], i));
  }
  json imports = json::array();
  for (const auto & r : map.imports) {
    imports.push_back(j_import(r));
  }
  json diagnostics = json::array();
  for (const auto & d : map.diagnostics) {
    diagnostics.push_back(to_json(d));
  }
  return json{
    {"path", map.file_path.generic_string()},
    {"language", std::string(to_string(map.language))},
    {"symbols", std::move(symbols)},
    {"imports", std::move(imports)},
    {"diagnostics", std::move(diagnostics)},
  };
}

std::string dump_json(const nlohmann::json & j, int indent)
{
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

nlohmann::json to_json(const ProjectGraph & graph)
{
  json files = json::array();
  for (const auto & [path, map] : graph.files()) {
    files.push_back(to_json(map));
  }
  json edges = json::array();
  for (const auto & e : graph.edges()) {
    edges.push_back(j_edge(e));
  }
  return json{{"files", std::move(files)}, {"edges", std::move(edges)}};
}

}  // namespace codemap
