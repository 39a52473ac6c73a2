// codemap/syntax/languages/ecmascript.cpp - JavaScript and TypeScript grammar adapters
#include "codemap/syntax/grammar_adapter.hpp"

extern "C" const TSLanguage * tree_sitter_javascript();
extern "C" const TSLanguage * tree_sitter_typescript();
extern "C" const TSLanguage * tree_sitter_tsx();

namespace codemap
{

namespace
{

GrammarCapabilities ecmascript_capabilities(bool typescript)
{
  GrammarCapabilities caps{
    .function_kinds = {"function_declaration", "generator_function_declaration", "method_definition"},
    .class_kinds = {"class_declaration", "class"},
    .anonymous_class_kinds = {"class"},
    .lambda_kinds = {"arrow_function", "function_expression", "function", "generator_function"},
    .constructor_kinds = {},
    .wrapper_kinds = {"export_statement"},
    .decorator_kinds = {"decorator"},
    .modifier_container_kinds = {},
    .comment_kinds = {"comment"},
    .heritage_kinds = {"class_heritage"},
    .heritage_skip_kinds = {},
    .suspension_kinds = {"yield_expression"},
    .await_kinds = {},
    .generator_kinds = {"generator_function_declaration", "generator_function"},
    .import_kinds = {"import_statement", "export_statement"},
    .call_kinds = {"call_expression"},
    .import_call_functions = {"require", "import"},
    .string_kinds = {"string", "template_string"},
    .interpolation_kinds = {"template_substitution"},
    .concat_kinds = {"binary_expression"},
    .guard_kinds = {"try_statement", "if_statement", "ternary_expression"},
    .binding_kinds = {"variable_declarator", "assignment_expression"},
    .async_token = "async",
    .static_token = "static",
    .generator_token = "*",
    .constructor_names = {"constructor"},
    .constructor_matches_class_name = false,
    .docstring_in_body = false,
    .name_field = "name",
    .body_field = "body",
    .module_layout =
      ModuleLayout{
        .separator = '/',
        .dotted_relative = false,
        .extensions = {".js", ".mjs", ".cjs", ".jsx", ".ts", ".tsx"},
        .index_files = {"index.js", "index.ts"},
      },
    .markers = {},
  };

  if (typescript) {
    caps.class_kinds = {"class_declaration", "abstract_class_declaration", "class"};
    caps.heritage_kinds = {"class_heritage", "extends_clause", "implements_clause"};
    caps.heritage_skip_kinds = {"type_arguments"};
    caps.module_layout.extensions = {".ts", ".tsx", ".d.ts", ".js", ".jsx"};
    caps.module_layout.index_files = {"index.ts", "index.tsx", "index.js"};
  }
  return caps;
}

class EcmaScriptAdapter final : public GrammarAdapter
{
public:
  EcmaScriptAdapter(LanguageId id, const TSLanguage * language)
  : GrammarAdapter(id, language, ecmascript_capabilities(id != LanguageId::JavaScript))
  {
  }

  std::optional<ImportShape> decode_import(
    ts_ll::Node node, const SourceFile & source) const override
  {
    if (node.kind() == "import_statement") {
      return decode_import_statement(node, source);
    }
    if (node.kind() == "export_statement") {
      return decode_reexport(node, source);
    }
    return std::nullopt;
  }

  bool is_import_statement(ts_ll::Node node) const override
  {
    if (node.kind() != "export_statement") {
      return GrammarAdapter::is_import_statement(node);
    }
    if (!node.child_by_field("source").is_null()) {
      return true;
    }
    const uint32_t n = node.child_count();
    for (uint32_t i = 0; i < n; ++i) {
      if (node.child(i).kind() == "from") {
        return true;
      }
    }
    return false;
  }

private:
  std::optional<ImportShape> shape_for_source(ts_ll::Node source_node, const SourceFile & source) const
  {
    if (source_node.is_null() || source_node.is_missing()) {
      return std::nullopt;
    }
    ImportShape shape;
    if (auto value = string_value(source_node, source)) {
      shape.module = std::move(*value);
    } else {
      return std::nullopt;
    }
    const RelativePath rel = classify_module_path(shape.module);
    shape.relative = rel.relative;
    shape.relative_depth = rel.depth;
    return shape;
  }

  static ImportTarget specifier_target(ts_ll::Node spec, const SourceFile & source)
  {
    ImportTarget t;
    const ts_ll::Node name = spec.child_by_field("name");
    const ts_ll::Node alias = spec.child_by_field("alias");
    if (!name.is_null()) {
      t.imported_name = strip_quotes(name.text(source));
    }
    if (!alias.is_null()) {
      t.local_alias = std::string(alias.text(source));
    }
    return t;
  }

  // import d, {a as b} from "m" / import * as ns from "m" / import "m"
  std::optional<ImportShape> decode_import_statement(
    ts_ll::Node node, const SourceFile & source) const
  {
    // TypeScript: import x = require("m")
    if (const ts_ll::Node req = first_named_child_of_kind(node, {"import_require_clause"});
        !req.is_null()) {
      auto shape = shape_for_source(req.child_by_field("source"), source);
      if (!shape) {
        return std::nullopt;
      }
      if (const ts_ll::Node id = first_named_child_of_kind(req, {"identifier"}); !id.is_null()) {
        shape->targets.push_back(ImportTarget{std::string(id.text(source)), "", false, ""});
      }
      return shape;
    }

    auto shape = shape_for_source(node.child_by_field("source"), source);
    if (!shape) {
      return std::nullopt;
    }

    const ts_ll::Node clause = first_named_child_of_kind(node, {"import_clause"});
    if (clause.is_null()) {
      return shape;  // side-effect import
    }

    const uint32_t n = clause.named_child_count();
    for (uint32_t i = 0; i < n; ++i) {
      const ts_ll::Node part = clause.named_child(i);
      const std::string_view kind = part.kind();
      if (kind == "identifier") {
        shape->targets.push_back(ImportTarget{std::string(part.text(source)), "", false, ""});
      } else if (kind == "namespace_import") {
        const ts_ll::Node id = first_named_child_of_kind(part, {"identifier"});
        shape->targets.push_back(
          ImportTarget{"*", id.is_null() ? "" : std::string(id.text(source)), false, ""});
      } else if (kind == "named_imports") {
        const uint32_t m = part.named_child_count();
        for (uint32_t j = 0; j < m; ++j) {
          const ts_ll::Node spec = part.named_child(j);
          if (spec.kind() == "import_specifier") {
            shape->targets.push_back(specifier_target(spec, source));
          }
        }
      }
    }
    return shape;
  }

  // export * from "m" / export * as ns from "m" / export {a as b} from "m"
  std::optional<ImportShape> decode_reexport(ts_ll::Node node, const SourceFile & source) const
  {
    auto shape = shape_for_source(node.child_by_field("source"), source);
    if (!shape) {
      return std::nullopt;
    }

    if (const ts_ll::Node ns = first_named_child_of_kind(node, {"namespace_export"});
        !ns.is_null()) {
      const ts_ll::Node id = first_named_child_of_kind(ns, {"identifier", "string"});
      shape->targets.push_back(
        ImportTarget{"*", id.is_null() ? "" : strip_quotes(id.text(source)), false, ""});
      return shape;
    }

    if (const ts_ll::Node clause = first_named_child_of_kind(node, {"export_clause"});
        !clause.is_null()) {
      const uint32_t n = clause.named_child_count();
      for (uint32_t i = 0; i < n; ++i) {
        const ts_ll::Node spec = clause.named_child(i);
        if (spec.kind() == "export_specifier") {
          shape->targets.push_back(specifier_target(spec, source));
        }
      }
      return shape;
    }

    shape->wildcard = true;
    return shape;
  }
};

}  // namespace

std::unique_ptr<GrammarAdapter> make_javascript_adapter()
{
  return std::make_unique<EcmaScriptAdapter>(LanguageId::JavaScript, tree_sitter_javascript());
}

std::unique_ptr<GrammarAdapter> make_typescript_adapter()
{
  return std::make_unique<EcmaScriptAdapter>(LanguageId::TypeScript, tree_sitter_typescript());
}

std::unique_ptr<GrammarAdapter> make_tsx_adapter()
{
  return std::make_unique<EcmaScriptAdapter>(LanguageId::Tsx, tree_sitter_tsx());
}

}  // namespace codemap
