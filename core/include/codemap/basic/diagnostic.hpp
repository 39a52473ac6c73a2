// codemap/basic/diagnostic.hpp - Diagnostic types attached to analyzed files
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codemap/basic/source_file.hpp"

namespace codemap
{

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

/**
 * What went wrong. Diagnostics never abort a run; they are attached to the
 * FileMap of the file they concern.
 */
enum class DiagnosticKind : uint8_t {
  SyntaxError,          ///< ERROR or MISSING node recovered by the parser
  DeclarationAnomaly,   ///< declaration whose name or body could not be recovered
  MalformedImport,      ///< import statement that could not be decoded
  UnparseableFile,      ///< no usable tree for the whole file
  UnsupportedLanguage,  ///< no grammar adapter registered for the file
  FileReadError,        ///< source text could not be read
  InternalError,        ///< analysis of a single file threw
};

[[nodiscard]] std::string_view to_string(DiagnosticKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/// Stable diagnostic code for a kind ("C001".."C007").
[[nodiscard]] std::string_view default_code(DiagnosticKind kind) noexcept;

/// Location a diagnostic points at, with an optional inline message.
struct Label
{
  Span span;
  std::string message;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagnosticKind kind = DiagnosticKind::SyntaxError;
  std::string code;  // e.g., "C001"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  /// Span of the first label; invalid when the diagnostic has none.
  [[nodiscard]] Span primary_span() const noexcept
  {
    return labels.empty() ? Span{} : labels.front().span;
  }
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Adds its diagnostic to the bag when it goes out of scope, so callers can
 * chain `.with_help(...)` onto `report_*`.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag * bag_;
  Diagnostic diagnostic_;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Ordered diagnostics of one file (or one run).
 */
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    DiagnosticKind kind, Span span, std::string message, std::string label_message = "")
  {
    return report(Severity::Error, kind, span, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_warning(
    DiagnosticKind kind, Span span, std::string message, std::string label_message = "")
  {
    return report(Severity::Warning, kind, span, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_info(
    DiagnosticKind kind, Span span, std::string message, std::string label_message = "")
  {
    return report(Severity::Info, kind, span, std::move(message), std::move(label_message));
  }

  void add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  /// Copies of the diagnostics with the given severity, in report order.
  [[nodiscard]] std::vector<Diagnostic> of_severity(Severity severity) const;
  [[nodiscard]] bool has(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return has(Severity::Error); }
  [[nodiscard]] bool has_warnings() const { return has(Severity::Warning); }

  [[nodiscard]] size_t count(DiagnosticKind kind) const;
  [[nodiscard]] bool contains(DiagnosticKind kind) const { return count(kind) > 0; }

  /// Append `other`'s diagnostics after this bag's.
  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, DiagnosticKind kind, Span span, std::string message,
    std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace codemap
