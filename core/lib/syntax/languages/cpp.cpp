// codemap/syntax/languages/cpp.cpp - C/C++ grammar adapter
#include "codemap/syntax/grammar_adapter.hpp"

extern "C" const TSLanguage * tree_sitter_cpp();

namespace codemap
{

namespace
{

GrammarCapabilities cpp_capabilities()
{
  return GrammarCapabilities{
    .function_kinds = {"function_definition"},
    .class_kinds = {"class_specifier", "struct_specifier", "union_specifier"},
    .anonymous_class_kinds = {"class_specifier", "struct_specifier", "union_specifier"},
    .lambda_kinds = {"lambda_expression"},
    .constructor_kinds = {},
    .wrapper_kinds = {"template_declaration"},
    .decorator_kinds = {"attribute_declaration"},
    .modifier_container_kinds = {"storage_class_specifier"},
    .comment_kinds = {"comment"},
    .heritage_kinds = {"base_class_clause"},
    .heritage_skip_kinds = {"access_specifier", "virtual"},
    .suspension_kinds = {"co_yield_statement"},
    .await_kinds = {"co_await_expression"},
    .generator_kinds = {},
    .import_kinds = {"preproc_include"},
    .call_kinds = {},
    .import_call_functions = {},
    .string_kinds = {"string_literal", "raw_string_literal"},
    .interpolation_kinds = {},
    .concat_kinds = {},
    .guard_kinds = {"preproc_if", "preproc_ifdef", "preproc_elif", "preproc_elifdef", "preproc_else"},
    .binding_kinds = {},
    .async_token = {},
    .static_token = "static",
    .generator_token = {},
    .constructor_names = {},
    .constructor_matches_class_name = true,
    .docstring_in_body = false,
    .name_field = "name",
    .body_field = "body",
    .module_layout =
      ModuleLayout{
        .separator = '/',
        .dotted_relative = false,
        .bare_from_importer = true,
        .extensions = {},
        .index_files = {},
      },
    .markers = {},
  };
}

bool is_name_kind(std::string_view kind)
{
  return kind == "identifier" || kind == "field_identifier" || kind == "qualified_identifier" ||
         kind == "destructor_name" || kind == "operator_name" || kind == "template_function" ||
         kind == "type_identifier";
}

class CppAdapter final : public GrammarAdapter
{
public:
  CppAdapter() : GrammarAdapter(LanguageId::Cpp, tree_sitter_cpp(), cpp_capabilities()) {}

  // #include "x.h" / #include <x>
  std::optional<ImportShape> decode_import(
    ts_ll::Node node, const SourceFile & source) const override
  {
    if (node.kind() != "preproc_include") {
      return std::nullopt;
    }
    const ts_ll::Node path = node.child_by_field("path");
    if (path.is_null() || path.is_missing()) {
      return std::nullopt;
    }

    ImportShape shape;
    const std::string_view text = path.text(source);
    if (path.kind() == "system_lib_string") {
      shape.module = std::string(text.size() >= 2 ? text.substr(1, text.size() - 2) : text);
    } else if (path.kind() == "string_literal") {
      shape.module = strip_quotes(text);
    } else {
      // #include MACRO
      shape.literal = false;
      return shape;
    }

    const RelativePath rel = classify_module_path(shape.module);
    shape.relative = rel.relative;
    shape.relative_depth = rel.depth;
    shape.targets.push_back(ImportTarget{shape.module, "", false, ""});
    return shape;
  }

  /// Functions carry their name inside a declarator chain
  /// (`int *Foo::bar(int)` -> pointer_declarator -> function_declarator -> qualified_identifier).
  std::string declaration_name(ts_ll::Node decl, const SourceFile & source) const override
  {
    if (decl.kind() != "function_definition") {
      return GrammarAdapter::declaration_name(decl, source);
    }

    ts_ll::Node d = decl.child_by_field("declarator");
    while (!d.is_null()) {
      if (d.is_missing() || d.is_error()) {
        return {};
      }
      if (is_name_kind(d.kind())) {
        return std::string(d.text(source));
      }
      ts_ll::Node next = d.child_by_field("declarator");
      if (next.is_null()) {
        // reference_declarator and parenthesized_declarator have no field
        next = d.named_child_count() > 0 ? d.named_child(d.named_child_count() - 1) : ts_ll::Node();
      }
      d = next;
    }
    return {};
  }

  bool is_guard_branch(ts_ll::Node node, const SourceFile & source) const override
  {
    if (!capabilities().guard_kinds.contains(node.kind())) {
      return false;
    }
    return !is_include_guard(node, source);
  }

private:
  /// Outermost `#ifndef X` immediately followed by `#define X`.
  static bool is_include_guard(ts_ll::Node node, const SourceFile & source)
  {
    if (node.kind() != "preproc_ifdef") {
      return false;
    }
    const ts_ll::Node parent = node.parent();
    if (parent.is_null() || parent.kind() != "translation_unit") {
      return false;
    }
    if (node.child_count() == 0 || node.child(0).kind() != "#ifndef") {
      return false;
    }
    const ts_ll::Node name = node.child_by_field("name");
    if (name.is_null()) {
      return false;
    }

    ts_ll::Node next = name.next_named_sibling();
    while (!next.is_null() && next.kind() == "comment") {
      next = next.next_named_sibling();
    }
    if (next.is_null() || next.kind() != "preproc_def") {
      return false;
    }
    const ts_ll::Node defined = next.child_by_field("name");
    return !defined.is_null() && defined.text(source) == name.text(source);
  }
};

}  // namespace

std::unique_ptr<GrammarAdapter> make_cpp_adapter() { return std::make_unique<CppAdapter>(); }

}  // namespace codemap
