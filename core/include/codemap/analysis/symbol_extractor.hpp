// codemap/analysis/symbol_extractor.hpp - Declaration classification
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "codemap/basic/diagnostic.hpp"
#include "codemap/basic/source_file.hpp"
#include "codemap/model/symbol.hpp"
#include "codemap/syntax/grammar_adapter.hpp"
#include "codemap/syntax/ts_ll.hpp"

namespace codemap
{

/**
 * Walks one syntax tree in document order and emits a SymbolRecord for every
 * function, method, class, lambda and constructor.
 *
 * Classification is driven entirely by the adapter's capability table:
 * - nearest enclosing named declaration is a class -> Method
 * - marker decorator or static keyword             -> ClassMethod / StaticMethod
 * - constructor name or constructor node kind      -> Constructor
 * (markers and static take precedence over constructor, constructor over method)
 *
 * A declaration whose name or body cannot be recovered is reported as a
 * DeclarationAnomaly and its subtree is skipped.
 */
class SymbolExtractor
{
public:
  SymbolExtractor(const GrammarAdapter & adapter, const SourceFile & source, DiagnosticBag & diags);

  /**
   * Extract all symbols below `root`.
   *
   * @throws std::invalid_argument if `root` is a null node
   */
  [[nodiscard]] std::vector<SymbolRecord> extract(ts_ll::Node root);

private:
  enum class Role { None, Function, Class, Lambda };

  struct Frame
  {
    SymbolId id;
    SymbolKind kind;
  };

  void visit(ts_ll::Node node);
  void visit_children(ts_ll::Node node);

  [[nodiscard]] Role role_of(ts_ll::Node node) const;
  [[nodiscard]] std::optional<SymbolRecord> build_record(ts_ll::Node node, Role role);

  [[nodiscard]] SymbolKind classify_function(
    ts_ll::Node node, const std::string & name, const std::vector<std::string> & decorators,
    ModifierSet & modifiers) const;

  [[nodiscard]] std::vector<std::string> collect_decorators(ts_ll::Node node) const;
  [[nodiscard]] bool has_static_keyword(ts_ll::Node node) const;
  [[nodiscard]] bool has_token_child(ts_ll::Node node, std::string_view token) const;
  [[nodiscard]] bool body_contains(ts_ll::Node node, const KindSet & kinds) const;
  [[nodiscard]] std::optional<std::string> doc_comment(ts_ll::Node node) const;
  [[nodiscard]] std::optional<std::string> body_docstring(ts_ll::Node node) const;
  [[nodiscard]] std::optional<std::string> leading_comment(ts_ll::Node node) const;
  [[nodiscard]] bool is_constructor(ts_ll::Node node, const std::string & name) const;

  /// Innermost frame of any kind.
  [[nodiscard]] const Frame * innermost() const noexcept;
  /// Innermost frame that is not a lambda.
  [[nodiscard]] const Frame * innermost_named() const noexcept;

  void report_anomaly(ts_ll::Node node, std::string message);

  const GrammarAdapter & adapter_;
  const GrammarCapabilities & caps_;
  const SourceFile & source_;
  DiagnosticBag & diags_;

  std::vector<SymbolRecord> records_;
  std::vector<Frame> frames_;
};

/// Clean a comment block: strip comment markers (`//`, `#`, `/**`, `*`),
/// trim each line, drop leading and trailing blank lines.
[[nodiscard]] std::string clean_comment_text(std::string_view raw);

}  // namespace codemap
