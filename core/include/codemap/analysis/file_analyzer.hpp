// codemap/analysis/file_analyzer.hpp - Per-file analysis pipeline
//
// Parses one source file through its grammar adapter, runs the symbol
// extractor and the import resolver, and assembles a FileMap.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "codemap/basic/source_file.hpp"
#include "codemap/model/file_map.hpp"
#include "codemap/syntax/adapter_registry.hpp"
#include "codemap/syntax/grammar_adapter.hpp"
#include "codemap/syntax/ts_ll.hpp"

namespace codemap
{

struct AnalysisOptions
{
  /// Fold `require("a" + "b")` style arguments into a static module reference.
  bool fold_constant_imports = true;

  /// Upper bound of SyntaxError diagnostics reported per file.
  size_t max_syntax_diagnostics = 64;
};

/**
 * Stateless per-file analysis.
 *
 * Safe to call concurrently: each call parses with its own parser and
 * returns a FileMap it does not share.
 */
class FileAnalyzer
{
public:
  explicit FileAnalyzer(const AdapterRegistry & registry, AnalysisOptions options = {})
  : registry_(registry), options_(options)
  {
  }

  /**
   * Analyze a file, detecting the language from its extension.
   */
  [[nodiscard]] FileMap analyze(const fs::path & path, std::string source) const;

  /**
   * Analyze a file in an explicit language.
   *
   * An unregistered language yields a FileMap with a single
   * UnsupportedLanguage diagnostic; a file the grammar cannot parse at all
   * yields a FileMap with a single UnparseableFile diagnostic. Neither has
   * records.
   */
  [[nodiscard]] FileMap analyze(const fs::path & path, LanguageId language, std::string source) const;

  /**
   * Run extraction and import resolution over an already-parsed tree.
   *
   * @throws std::invalid_argument if `tree` is null
   */
  [[nodiscard]] FileMap analyze_tree(
    const GrammarAdapter & adapter, const SourceFile & source, const ts_ll::Tree & tree) const;

  [[nodiscard]] const AnalysisOptions & options() const noexcept { return options_; }

private:
  void collect_syntax_diagnostics(
    ts_ll::Node root, const SourceFile & source, DiagnosticBag & diags) const;

  const AdapterRegistry & registry_;
  AnalysisOptions options_;
};

}  // namespace codemap
