// codemap/syntax/grammar_adapter.hpp - Per-language capability tables and hooks
//
// A GrammarAdapter wraps one tree-sitter grammar and describes, as data, how
// its node kinds map onto the normalized vocabulary used by the extractor and
// the import resolver. Syntax that cannot be expressed as a table (import
// statement shapes, C++ declarators, include guards) goes through the virtual
// hooks.
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codemap/basic/source_file.hpp"
#include "codemap/model/import.hpp"
#include "codemap/syntax/language.hpp"
#include "codemap/syntax/ts_ll.hpp"

namespace codemap
{

// ============================================================================
// KindSet
// ============================================================================

/**
 * Small set of node kinds or tokens. Entries point at string literals.
 */
class KindSet
{
public:
  KindSet() = default;
  KindSet(std::initializer_list<std::string_view> items) : items_(items) {}

  [[nodiscard]] bool contains(std::string_view item) const noexcept
  {
    for (const auto & i : items_) {
      if (i == item) {
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
  [[nodiscard]] auto begin() const noexcept { return items_.begin(); }
  [[nodiscard]] auto end() const noexcept { return items_.end(); }

private:
  std::vector<std::string_view> items_;
};

// ============================================================================
// MarkerTable
// ============================================================================

/// Classification carried by a marker decorator.
enum class MarkerRole : uint8_t {
  ClassMethod,
  StaticMethod,
};

[[nodiscard]] std::string_view to_string(MarkerRole role) noexcept;

/**
 * Decorator names that change a method's kind (`classmethod`, `staticmethod`).
 *
 * Names are matched after normalization: `@`, call arguments and whitespace
 * are removed, then the full dotted name and its last segment are tried.
 */
class MarkerTable
{
public:
  MarkerTable() = default;
  MarkerTable(std::initializer_list<std::pair<std::string, MarkerRole>> entries)
  : entries_(entries)
  {
  }

  void add(std::string name, MarkerRole role);

  [[nodiscard]] std::optional<MarkerRole> lookup(std::string_view normalized_name) const;

  /// A name mapped to two different roles, if any.
  [[nodiscard]] std::optional<std::string> find_conflict() const;

  [[nodiscard]] const std::vector<std::pair<std::string, MarkerRole>> & entries() const noexcept
  {
    return entries_;
  }

  /// Strip `@`, call arguments and whitespace from a decorator's source text.
  [[nodiscard]] static std::string normalize(std::string_view decorator_text);

private:
  std::vector<std::pair<std::string, MarkerRole>> entries_;
};

// ============================================================================
// Capabilities
// ============================================================================

/**
 * How module references of a language map onto files.
 */
struct ModuleLayout
{
  /// Separator between module name segments ('.' for Python/Java, '/' for paths).
  char separator = '/';
  /// Leading dots encode parent-package hops (`from ..x import y`).
  bool dotted_relative = false;
  /// Non-relative references are also looked up beside the importing file
  /// (`#include "util.h"`, sibling Python modules).
  bool bare_from_importer = false;
  /// Appended to a module path that does not exist as written.
  std::vector<std::string_view> extensions;
  /// Entry files of a package directory (`__init__.py`, `index.js`).
  std::vector<std::string_view> index_files;
};

/**
 * Native node kinds and tokens of one grammar, grouped by the role they play.
 */
struct GrammarCapabilities
{
  // --- Declarations ---------------------------------------------------------
  KindSet function_kinds;
  KindSet class_kinds;
  KindSet anonymous_class_kinds;  ///< class kinds that may legitimately lack a name
  KindSet lambda_kinds;
  KindSet constructor_kinds;      ///< function kinds that always declare a constructor
  KindSet wrapper_kinds;          ///< decorated_definition, export_statement, ...
  KindSet decorator_kinds;
  KindSet modifier_container_kinds;
  KindSet comment_kinds;
  KindSet heritage_kinds;       ///< clauses naming base classes (`extends`, `: public`)
  KindSet heritage_skip_kinds;  ///< children of a clause that are not bases

  // --- Body analysis --------------------------------------------------------
  KindSet suspension_kinds;  ///< yield forms that make a body a generator
  KindSet await_kinds;       ///< suspension forms that make a body async (co_await)
  KindSet generator_kinds;   ///< declaration kinds that are generators by form

  // --- Imports --------------------------------------------------------------
  KindSet import_kinds;
  KindSet call_kinds;
  KindSet import_call_functions;  ///< callee texts of call-form imports
  KindSet string_kinds;
  KindSet interpolation_kinds;
  KindSet concat_kinds;
  KindSet guard_kinds;
  KindSet binding_kinds;  ///< assignment forms naming the result of a call-form import

  // --- Tokens and names -----------------------------------------------------
  std::string_view async_token;
  std::string_view static_token;
  std::string_view generator_token;
  std::vector<std::string_view> constructor_names;
  bool constructor_matches_class_name = false;
  bool docstring_in_body = false;
  std::string_view name_field = "name";
  std::string_view body_field = "body";

  ModuleLayout module_layout;
  MarkerTable markers;
};

// ============================================================================
// Adapter results
// ============================================================================

/**
 * Decoded shape of one import statement, before classification.
 */
struct ImportShape
{
  std::string module;  ///< as written; empty when not a literal
  std::vector<ImportTarget> targets;
  uint32_t relative_depth = 0;
  bool relative = false;
  bool wildcard = false;
  bool literal = true;
};

/**
 * Relative-ness of a module reference as written.
 */
struct RelativePath
{
  bool relative = false;
  uint32_t depth = 0;
};

struct ParseResult
{
  ts_ll::Tree tree;
  /// Set when no usable tree exists for the file.
  std::optional<std::string> error;

  [[nodiscard]] bool ok() const noexcept { return !error && !tree.is_null(); }

  static ParseResult success(ts_ll::Tree tree)
  {
    ParseResult r;
    r.tree = std::move(tree);
    return r;
  }

  static ParseResult failure(std::string msg, ts_ll::Tree tree = ts_ll::Tree())
  {
    ParseResult r;
    r.tree = std::move(tree);
    r.error = std::move(msg);
    return r;
  }
};

// ============================================================================
// GrammarAdapter
// ============================================================================

/**
 * Base class of the per-language adapters.
 *
 * Adapters are immutable once registered and may be shared across threads:
 * `parse()` creates a fresh parser per call.
 */
class GrammarAdapter
{
public:
  GrammarAdapter(LanguageId id, const TSLanguage * language, GrammarCapabilities caps);
  virtual ~GrammarAdapter() = default;

  GrammarAdapter(const GrammarAdapter &) = delete;
  GrammarAdapter & operator=(const GrammarAdapter &) = delete;

  [[nodiscard]] LanguageId id() const noexcept { return id_; }
  [[nodiscard]] const TSLanguage * ts_language() const noexcept { return language_; }
  [[nodiscard]] const GrammarCapabilities & capabilities() const noexcept { return caps_; }
  [[nodiscard]] GrammarCapabilities & capabilities() noexcept { return caps_; }

  /**
   * Parse source text.
   *
   * Fails when the grammar cannot be loaded, no tree is produced, or every
   * top-level node of a non-blank file is an error.
   */
  [[nodiscard]] ParseResult parse(std::string_view source) const;

  /**
   * Decode an import statement node (one of `import_kinds`).
   *
   * @return nullopt when the node is not an import in this form (e.g. an
   *         `export` without `from`)
   */
  [[nodiscard]] virtual std::optional<ImportShape> decode_import(
    ts_ll::Node node, const SourceFile & source) const = 0;

  /**
   * True when a node of one of `import_kinds` names a module.
   *
   * Only such nodes are reported as malformed when they fail to decode; the
   * rest (an `export` of a local declaration) are walked like any statement.
   */
  [[nodiscard]] virtual bool is_import_statement(ts_ll::Node node) const;

  /**
   * Base classes and implemented interfaces of a class declaration, as
   * written and in source order.
   */
  [[nodiscard]] std::vector<std::string> base_classes(
    ts_ll::Node cls, const SourceFile & source) const;

  /// Name of a function or class declaration; empty when it cannot be recovered.
  [[nodiscard]] virtual std::string declaration_name(
    ts_ll::Node decl, const SourceFile & source) const;

  /// True when `node` opens a conditional branch for import guarding.
  [[nodiscard]] virtual bool is_guard_branch(ts_ll::Node node, const SourceFile & source) const;

  /// Classify a module reference as written (`./x`, `..pkg`).
  [[nodiscard]] virtual RelativePath classify_module_path(std::string_view module) const;

  /// Value of a string literal node without quotes or prefixes; nullopt when interpolated.
  [[nodiscard]] virtual std::optional<std::string> string_value(
    ts_ll::Node node, const SourceFile & source) const;

protected:
  [[nodiscard]] static RelativePath classify_path_style(std::string_view module);
  [[nodiscard]] static RelativePath classify_dotted(std::string_view module);

  void collect_bases(
    ts_ll::Node clause, const SourceFile & source, std::vector<std::string> & out) const;

  /// First named child of `node` whose kind is in `kinds`; null when absent.
  [[nodiscard]] static ts_ll::Node first_named_child_of_kind(
    ts_ll::Node node, std::initializer_list<std::string_view> kinds);

private:
  LanguageId id_;
  const TSLanguage * language_;
  GrammarCapabilities caps_;
};

/// Remove surrounding quotes (', ", `, triple quotes) and Python string prefixes.
[[nodiscard]] std::string strip_quotes(std::string_view literal);

// ============================================================================
// Built-in adapters
// ============================================================================

[[nodiscard]] std::unique_ptr<GrammarAdapter> make_python_adapter();
[[nodiscard]] std::unique_ptr<GrammarAdapter> make_javascript_adapter();
[[nodiscard]] std::unique_ptr<GrammarAdapter> make_typescript_adapter();
[[nodiscard]] std::unique_ptr<GrammarAdapter> make_tsx_adapter();
[[nodiscard]] std::unique_ptr<GrammarAdapter> make_java_adapter();
[[nodiscard]] std::unique_ptr<GrammarAdapter> make_cpp_adapter();

}  // namespace codemap
