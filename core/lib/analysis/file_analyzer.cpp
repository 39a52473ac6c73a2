// codemap/analysis/file_analyzer.cpp - Per-file analysis pipeline
#include "codemap/analysis/file_analyzer.hpp"

#include <stdexcept>
#include <vector>

#include "codemap/analysis/import_resolver.hpp"
#include "codemap/analysis/symbol_extractor.hpp"
#include "codemap/basic/logging.hpp"

namespace codemap
{

FileMap FileAnalyzer::analyze(const fs::path & path, std::string source) const
{
  return analyze(path, language_for_path(path), std::move(source));
}

FileMap FileAnalyzer::analyze(const fs::path & path, LanguageId language, std::string source) const
{
  const GrammarAdapter * adapter = registry_.find(language);
  if (adapter == nullptr) {
    FileMap map;
    map.file_path = path;
    map.language = language;
    map.diagnostics
      .report_error(
        DiagnosticKind::UnsupportedLanguage, Span{},
        language == LanguageId::Unknown
          ? "cannot determine the language of '" + path.filename().string() + "'"
          : "no grammar registered for language '" + std::string(to_string(language)) + "'")
      .with_help("supported languages: python, javascript, typescript, tsx, java, cpp");
    logging::logger()->debug("{}: unsupported language", path.string());
    return map;
  }

  const SourceFile file(path, std::move(source));
  ParseResult parsed = adapter->parse(file.content());
  if (!parsed.ok()) {
    FileMap map;
    map.file_path = path;
    map.language = language;
    map.diagnostics.report_error(
      DiagnosticKind::UnparseableFile, file.get_span(SourceRange{0, file.size()}),
      "file could not be parsed: " + parsed.error.value_or("no syntax tree"));
    logging::logger()->debug("{}: unparseable ({})", path.string(), parsed.error.value_or(""));
    return map;
  }

  return analyze_tree(*adapter, file, parsed.tree);
}

FileMap FileAnalyzer::analyze_tree(
  const GrammarAdapter & adapter, const SourceFile & source, const ts_ll::Tree & tree) const
{
  if (tree.is_null()) {
    throw std::invalid_argument("FileAnalyzer::analyze_tree: null tree");
  }

  FileMap map;
  map.file_path = source.path();
  map.language = adapter.id();

  const ts_ll::Node root = tree.root_node();
  collect_syntax_diagnostics(root, source, map.diagnostics);

  SymbolExtractor extractor(adapter, source, map.diagnostics);
  map.symbols = extractor.extract(root);

  ImportResolver resolver(
    adapter, source, map.symbols, map.diagnostics,
    ResolverOptions{.fold_constant_imports = options_.fold_constant_imports});
  map.imports = resolver.resolve(root);

  logging::logger()->debug(
    "{}: {} symbols, {} imports, {} diagnostics", source.path().string(), map.symbols.size(),
    map.imports.size(), map.diagnostics.size());
  return map;
}

void FileAnalyzer::collect_syntax_diagnostics(
  ts_ll::Node root, const SourceFile & source, DiagnosticBag & diags) const
{
  if (!root.has_error()) {
    return;
  }

  size_t reported = 0;
  std::vector<ts_ll::Node> stack{root};
  while (!stack.empty() && reported < options_.max_syntax_diagnostics) {
    const ts_ll::Node node = stack.back();
    stack.pop_back();

    if (node.is_missing()) {
      diags.report_warning(
        DiagnosticKind::SyntaxError, node.span(),
        "syntax error: missing '" + std::string(node.kind()) + "'", "expected here");
      ++reported;
      continue;
    }
    if (node.is_error()) {
      diags.report_warning(
        DiagnosticKind::SyntaxError, node.span(), "syntax error: unexpected input",
        "could not be parsed");
      ++reported;
      // nested errors of one region are reported once
      continue;
    }

    // push in reverse to report in document order
    const uint32_t n = node.child_count();
    for (uint32_t i = n; i > 0; --i) {
      const ts_ll::Node child = node.child(i - 1);
      if (child.has_error() || child.is_missing()) {
        stack.push_back(child);
      }
    }
  }

  if (reported == options_.max_syntax_diagnostics && !stack.empty()) {
    logging::logger()->debug(
      "{}: syntax diagnostics capped at {}", source.path().string(),
      options_.max_syntax_diagnostics);
  }
}

}  // namespace codemap
