// codemap/model/import.hpp - Normalized import/include records
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codemap/basic/source_file.hpp"
#include "codemap/model/symbol.hpp"

namespace codemap
{

enum class ImportKind : uint8_t {
  Direct,
  Aliased,
  Relative,
  Wildcard,
  Conditional,
  Dynamic,
  SelectiveMultiple,
};

[[nodiscard]] std::string_view to_string(ImportKind kind) noexcept;

/// Text used for an unresolved module reference in exports and logs.
inline constexpr std::string_view k_unresolved_module = "<unresolved>";

/**
 * One imported name: `from m import a as b` yields {"a", "b", false}.
 */
struct ImportTarget
{
  std::string imported_name;
  std::string local_alias;
  bool is_wildcard = false;
  /// Module this target comes from when a statement names several modules
  /// (`import a, b`); empty means the record's module.
  std::string module;

  bool operator==(const ImportTarget &) const = default;
};

struct ImportRecord
{
  std::string raw_statement;
  ImportKind kind = ImportKind::Direct;
  std::vector<ImportTarget> targets;
  /// Module reference as written (leading dots and `./` kept); nullopt when
  /// the target is computed at runtime.
  std::optional<std::string> resolved_module;
  uint32_t relative_depth = 0;
  std::optional<SymbolId> scope;
  bool guarded = false;
  Span span;

  [[nodiscard]] bool is_unresolved() const noexcept { return !resolved_module.has_value(); }

  /**
   * Distinct module references named by this record, in target order.
   * Empty for unresolved records.
   */
  [[nodiscard]] std::vector<std::string> module_references() const;

  bool operator==(const ImportRecord &) const = default;
};

}  // namespace codemap
