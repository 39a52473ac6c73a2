// codemap/model/symbol.hpp - Normalized declaration records
#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codemap/basic/source_file.hpp"

namespace codemap
{

// ============================================================================
// SymbolId
// ============================================================================

/**
 * Index of a SymbolRecord in its FileMap's symbol arena.
 */
struct SymbolId
{
  uint32_t value = 0;

  constexpr bool operator==(const SymbolId &) const noexcept = default;
  constexpr auto operator<=>(const SymbolId &) const noexcept = default;
};

// ============================================================================
// Kinds and Modifiers
// ============================================================================

enum class SymbolKind : uint8_t {
  Function,
  Method,
  ClassMethod,
  StaticMethod,
  Lambda,
  Class,
  Constructor,
};

[[nodiscard]] std::string_view to_string(SymbolKind kind) noexcept;

/// True for kinds that must be enclosed by a Class record.
[[nodiscard]] constexpr bool is_member_kind(SymbolKind kind) noexcept
{
  return kind == SymbolKind::Method || kind == SymbolKind::ClassMethod ||
         kind == SymbolKind::StaticMethod || kind == SymbolKind::Constructor;
}

enum class Modifier : uint8_t {
  Async = 1U << 0,
  Generator = 1U << 1,
  Decorated = 1U << 2,
  Static = 1U << 3,
  ClassBound = 1U << 4,
};

[[nodiscard]] std::string_view to_string(Modifier modifier) noexcept;

/**
 * Orthogonal set of Modifier flags.
 */
class ModifierSet
{
public:
  constexpr ModifierSet() noexcept = default;

  [[nodiscard]] constexpr bool has(Modifier m) const noexcept
  {
    return (bits_ & static_cast<uint8_t>(m)) != 0;
  }

  constexpr void set(Modifier m) noexcept { bits_ |= static_cast<uint8_t>(m); }

  [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
  [[nodiscard]] constexpr uint8_t bits() const noexcept { return bits_; }

  /// Members in declaration order of Modifier.
  [[nodiscard]] std::vector<Modifier> list() const;

  constexpr bool operator==(const ModifierSet &) const noexcept = default;

private:
  uint8_t bits_ = 0;
};

// ============================================================================
// SymbolRecord
// ============================================================================

/**
 * One declared symbol of a file.
 *
 * Identity within a file is (kind, span); two records never share a span.
 */
struct SymbolRecord
{
  /// Identifier as written; `<lambda>@L:C` / `<class>@L:C` for anonymous forms.
  std::string name;
  SymbolKind kind = SymbolKind::Function;
  ModifierSet modifiers;
  /// Innermost enclosing record (for lambdas: nearest named declaration).
  std::optional<SymbolId> enclosing_scope;
  /// Decorator and annotation texts, verbatim, in source order.
  std::vector<std::string> decorators;
  /// Classes only: base classes and implemented interfaces as written.
  std::vector<std::string> bases;
  std::optional<std::string> doc_comment;
  Span span;

  [[nodiscard]] bool has(Modifier m) const noexcept { return modifiers.has(m); }

  bool operator==(const SymbolRecord &) const = default;
};

}  // namespace codemap
