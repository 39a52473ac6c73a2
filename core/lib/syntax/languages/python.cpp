// codemap/syntax/languages/python.cpp - Python grammar adapter
#include "codemap/syntax/grammar_adapter.hpp"

extern "C" const TSLanguage * tree_sitter_python();

namespace codemap
{

namespace
{

GrammarCapabilities python_capabilities()
{
  return GrammarCapabilities{
    .function_kinds = {"function_definition"},
    .class_kinds = {"class_definition"},
    .anonymous_class_kinds = {},
    .lambda_kinds = {"lambda"},
    .constructor_kinds = {},
    .wrapper_kinds = {"decorated_definition"},
    .decorator_kinds = {"decorator"},
    .modifier_container_kinds = {},
    .comment_kinds = {"comment"},
    .heritage_kinds = {"argument_list"},
    .heritage_skip_kinds = {"keyword_argument", "dictionary_splat"},
    .suspension_kinds = {"yield"},
    .await_kinds = {},
    .generator_kinds = {},
    .import_kinds = {"import_statement", "import_from_statement", "future_import_statement"},
    .call_kinds = {"call"},
    .import_call_functions = {"__import__", "importlib.import_module", "import_module"},
    .string_kinds = {"string"},
    .interpolation_kinds = {"interpolation"},
    .concat_kinds = {"concatenated_string", "binary_operator"},
    .guard_kinds = {"try_statement", "if_statement", "conditional_expression"},
    .binding_kinds = {"assignment"},
    .async_token = "async",
    .static_token = {},
    .generator_token = {},
    .constructor_names = {"__init__"},
    .constructor_matches_class_name = false,
    .docstring_in_body = true,
    .name_field = "name",
    .body_field = "body",
    .module_layout =
      ModuleLayout{
        .separator = '.',
        .dotted_relative = true,
        .bare_from_importer = true,
        .extensions = {".py", ".pyi"},
        .index_files = {"__init__.py"},
      },
    .markers =
      {
        {"classmethod", MarkerRole::ClassMethod},
        {"staticmethod", MarkerRole::StaticMethod},
      },
  };
}

class PythonAdapter final : public GrammarAdapter
{
public:
  PythonAdapter() : GrammarAdapter(LanguageId::Python, tree_sitter_python(), python_capabilities())
  {
  }

  std::optional<ImportShape> decode_import(
    ts_ll::Node node, const SourceFile & source) const override
  {
    const std::string_view kind = node.kind();
    if (kind == "import_statement") {
      return decode_plain_import(node, source);
    }
    if (kind == "import_from_statement" || kind == "future_import_statement") {
      return decode_from_import(node, source);
    }
    return std::nullopt;
  }

private:
  /// `dotted_name` or `aliased_import` attached under the `name` field.
  static std::optional<ImportTarget> decode_name(ts_ll::Node n, const SourceFile & source)
  {
    if (n.kind() == "aliased_import") {
      const ts_ll::Node name = n.child_by_field("name");
      const ts_ll::Node alias = n.child_by_field("alias");
      if (name.is_null() || name.is_missing()) {
        return std::nullopt;
      }
      ImportTarget t;
      t.imported_name = std::string(name.text(source));
      if (!alias.is_null() && !alias.is_missing()) {
        t.local_alias = std::string(alias.text(source));
      }
      return t;
    }
    if (n.kind() == "dotted_name" || n.kind() == "identifier") {
      ImportTarget t;
      t.imported_name = std::string(n.text(source));
      return t;
    }
    return std::nullopt;
  }

  static std::vector<ImportTarget> decode_names(ts_ll::Node node, const SourceFile & source)
  {
    std::vector<ImportTarget> targets;
    const uint32_t n = node.child_count();
    for (uint32_t i = 0; i < n; ++i) {
      if (node.field_name_for_child(i) != "name") {
        continue;
      }
      if (auto t = decode_name(node.child(i), source)) {
        targets.push_back(std::move(*t));
      }
    }
    return targets;
  }

  // import a, b.c as d
  static std::optional<ImportShape> decode_plain_import(
    ts_ll::Node node, const SourceFile & source)
  {
    ImportShape shape;
    shape.targets = decode_names(node, source);
    if (shape.targets.empty()) {
      return std::nullopt;
    }
    for (auto & t : shape.targets) {
      t.module = t.imported_name;
    }
    shape.module = shape.targets.front().module;
    if (shape.targets.size() == 1) {
      shape.targets.front().module.clear();
    }
    return shape;
  }

  // from ..pkg import a as b, c / from x import * / from __future__ import y
  std::optional<ImportShape> decode_from_import(ts_ll::Node node, const SourceFile & source) const
  {
    ImportShape shape;
    const ts_ll::Node module = node.child_by_field("module_name");
    if (node.kind() == "future_import_statement") {
      shape.module = "__future__";
    } else if (module.is_null() || module.is_missing()) {
      return std::nullopt;
    } else {
      shape.module = std::string(module.text(source));
    }

    const RelativePath rel = classify_module_path(shape.module);
    shape.relative = rel.relative;
    shape.relative_depth = rel.depth;

    if (!first_named_child_of_kind(node, {"wildcard_import"}).is_null()) {
      shape.wildcard = true;
      return shape;
    }

    shape.targets = decode_names(node, source);
    if (shape.targets.empty()) {
      return std::nullopt;
    }
    return shape;
  }
};

}  // namespace

std::unique_ptr<GrammarAdapter> make_python_adapter() { return std::make_unique<PythonAdapter>(); }

}  // namespace codemap
