// codemap/analysis/import_resolver.hpp - Import/include normalization
#pragma once

#include <gsl/span>
#include <optional>
#include <string>
#include <vector>

#include "codemap/basic/diagnostic.hpp"
#include "codemap/basic/source_file.hpp"
#include "codemap/model/import.hpp"
#include "codemap/model/symbol.hpp"
#include "codemap/syntax/grammar_adapter.hpp"
#include "codemap/syntax/ts_ll.hpp"

namespace codemap
{

struct ResolverOptions
{
  /// Resolve call-form imports whose argument is a concatenation of string literals.
  bool fold_constant_imports = true;
};

/**
 * Innermost enclosing SymbolRecord lookup by byte-span containment.
 */
class ScopeIndex
{
public:
  explicit ScopeIndex(gsl::span<const SymbolRecord> symbols) : symbols_(symbols) {}

  [[nodiscard]] std::optional<SymbolId> innermost(SourceRange range) const noexcept;

private:
  gsl::span<const SymbolRecord> symbols_;
};

/**
 * Walks one syntax tree and emits an ImportRecord for every import, include,
 * re-export and call-form import (`require`, `import()`, `__import__`).
 *
 * Kind precedence:
 *   Dynamic > Conditional > Wildcard > Relative > SelectiveMultiple > Aliased > Direct
 *
 * Non-literal call-form targets are recorded as Dynamic with an unresolved
 * module; they are never an error.
 */
class ImportResolver
{
public:
  ImportResolver(
    const GrammarAdapter & adapter, const SourceFile & source,
    gsl::span<const SymbolRecord> symbols, DiagnosticBag & diags, ResolverOptions options = {});

  /**
   * Resolve all imports below `root`, in document order.
   *
   * @throws std::invalid_argument if `root` is a null node
   */
  [[nodiscard]] std::vector<ImportRecord> resolve(ts_ll::Node root);

private:
  void visit(ts_ll::Node node, bool guarded);

  [[nodiscard]] std::optional<ImportShape> decode_call(ts_ll::Node call) const;
  [[nodiscard]] std::optional<std::string> literal_value(ts_ll::Node node) const;
  [[nodiscard]] std::vector<ImportTarget> bound_targets(ts_ll::Node call) const;

  void emit(ts_ll::Node node, ImportShape shape, bool guarded);

  const GrammarAdapter & adapter_;
  const GrammarCapabilities & caps_;
  const SourceFile & source_;
  ScopeIndex scopes_;
  DiagnosticBag & diags_;
  ResolverOptions options_;

  std::vector<ImportRecord> records_;
};

/// Apply the kind precedence to a decoded shape.
[[nodiscard]] ImportKind classify_import(const ImportShape & shape, bool guarded) noexcept;

}  // namespace codemap
