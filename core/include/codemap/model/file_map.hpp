// codemap/model/file_map.hpp - Per-file analysis result
#pragma once

#include <filesystem>
#include <vector>

#include "codemap/basic/diagnostic.hpp"
#include "codemap/model/import.hpp"
#include "codemap/model/symbol.hpp"
#include "codemap/syntax/language.hpp"

namespace codemap
{

/**
 * Symbols, imports and diagnostics of one source file.
 *
 * Owns its records; SymbolIds index `symbols`.
 */
struct FileMap
{
  std::filesystem::path file_path;
  LanguageId language = LanguageId::Unknown;
  std::vector<SymbolRecord> symbols;
  std::vector<ImportRecord> imports;
  DiagnosticBag diagnostics;

  [[nodiscard]] const SymbolRecord * symbol(SymbolId id) const noexcept
  {
    return id.value < symbols.size() ? &symbols[id.value] : nullptr;
  }

  [[nodiscard]] const SymbolRecord * scope_of(const SymbolRecord & record) const noexcept
  {
    return record.enclosing_scope ? symbol(*record.enclosing_scope) : nullptr;
  }

  /// Records whose enclosing scope is `id`, in arena order.
  [[nodiscard]] std::vector<SymbolId> children_of(SymbolId id) const;

  [[nodiscard]] bool is_unparseable() const
  {
    return diagnostics.contains(DiagnosticKind::UnparseableFile) ||
           diagnostics.contains(DiagnosticKind::UnsupportedLanguage) ||
           diagnostics.contains(DiagnosticKind::FileReadError);
  }
};

}  // namespace codemap
