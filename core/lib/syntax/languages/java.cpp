// codemap/syntax/languages/java.cpp - Java grammar adapter
#include "codemap/syntax/grammar_adapter.hpp"

extern "C" const TSLanguage * tree_sitter_java();

namespace codemap
{

namespace
{

GrammarCapabilities java_capabilities()
{
  return GrammarCapabilities{
    .function_kinds =
      {"method_declaration", "constructor_declaration", "compact_constructor_declaration"},
    .class_kinds =
      {"class_declaration", "interface_declaration", "enum_declaration", "record_declaration",
       "annotation_type_declaration"},
    .anonymous_class_kinds = {},
    .lambda_kinds = {"lambda_expression"},
    .constructor_kinds = {"constructor_declaration", "compact_constructor_declaration"},
    .wrapper_kinds = {},
    .decorator_kinds = {"marker_annotation", "annotation"},
    .modifier_container_kinds = {"modifiers"},
    .comment_kinds = {"line_comment", "block_comment"},
    .heritage_kinds = {"superclass", "super_interfaces", "extends_interfaces", "type_list"},
    .heritage_skip_kinds = {},
    .suspension_kinds = {},
    .await_kinds = {},
    .generator_kinds = {},
    .import_kinds = {"import_declaration"},
    .call_kinds = {},
    .import_call_functions = {},
    .string_kinds = {"string_literal"},
    .interpolation_kinds = {},
    .concat_kinds = {},
    .guard_kinds = {},
    .binding_kinds = {},
    .async_token = {},
    .static_token = "static",
    .generator_token = {},
    .constructor_names = {},
    .constructor_matches_class_name = false,
    .docstring_in_body = false,
    .name_field = "name",
    .body_field = "body",
    .module_layout =
      ModuleLayout{
        .separator = '.',
        .dotted_relative = false,
        .extensions = {".java"},
        .index_files = {},
      },
    .markers = {},
  };
}

class JavaAdapter final : public GrammarAdapter
{
public:
  JavaAdapter() : GrammarAdapter(LanguageId::Java, tree_sitter_java(), java_capabilities()) {}

  // import a.b.C; / import a.b.*; / import static a.b.C.m;
  std::optional<ImportShape> decode_import(
    ts_ll::Node node, const SourceFile & source) const override
  {
    if (node.kind() != "import_declaration") {
      return std::nullopt;
    }

    bool is_static = false;
    bool asterisk = false;
    ts_ll::Node name;
    const uint32_t n = node.child_count();
    for (uint32_t i = 0; i < n; ++i) {
      const ts_ll::Node c = node.child(i);
      const std::string_view kind = c.kind();
      if (kind == "static") {
        is_static = true;
      } else if (kind == "asterisk" || kind == "*") {
        asterisk = true;
      } else if ((kind == "identifier" || kind == "scoped_identifier") && name.is_null()) {
        name = c;
      }
    }
    if (name.is_null() || name.is_missing()) {
      return std::nullopt;
    }

    ImportShape shape;
    const std::string full(name.text(source));
    if (asterisk) {
      shape.module = full;
      shape.wildcard = true;
      return shape;
    }

    const auto dot = full.rfind('.');
    const std::string last = dot == std::string::npos ? full : full.substr(dot + 1);
    // A static import names a member; its module is the declaring class.
    shape.module = (is_static && dot != std::string::npos) ? full.substr(0, dot) : full;
    shape.targets.push_back(ImportTarget{last, "", false, ""});
    return shape;
  }
};

}  // namespace

std::unique_ptr<GrammarAdapter> make_java_adapter() { return std::make_unique<JavaAdapter>(); }

}  // namespace codemap
