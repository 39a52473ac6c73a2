// codemap/basic/diagnostic.cpp - Diagnostic kinds, builder and bag
#include "codemap/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace codemap
{

std::string_view to_string(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::SyntaxError:
      return "syntax-error";
    case DiagnosticKind::DeclarationAnomaly:
      return "declaration-anomaly";
    case DiagnosticKind::MalformedImport:
      return "malformed-import";
    case DiagnosticKind::UnparseableFile:
      return "unparseable-file";
    case DiagnosticKind::UnsupportedLanguage:
      return "unsupported-language";
    case DiagnosticKind::FileReadError:
      return "file-read-error";
    case DiagnosticKind::InternalError:
      return "internal-error";
  }
  return "unknown";
}

std::string_view default_code(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::SyntaxError:
      return "C001";
    case DiagnosticKind::DeclarationAnomaly:
      return "C002";
    case DiagnosticKind::MalformedImport:
      return "C003";
    case DiagnosticKind::UnparseableFile:
      return "C004";
    case DiagnosticKind::UnsupportedLanguage:
      return "C005";
    case DiagnosticKind::FileReadError:
      return "C006";
    case DiagnosticKind::InternalError:
      return "C007";
  }
  return "";
}

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
  }
  return "unknown";
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(std::exchange(other.bag_, nullptr)), diagnostic_(std::move(other.diagnostic_))
{
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_ != nullptr) {
    bag_->add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, DiagnosticKind kind, Span span, std::string message,
  std::string label_message)
{
  Diagnostic d{
    .severity = severity,
    .kind = kind,
    .code = std::string(default_code(kind)),
    .message = std::move(message),
    .labels = {Label{span, std::move(label_message)}},
    .help_message = std::nullopt,
  };
  return {*this, std::move(d)};
}

std::vector<Diagnostic> DiagnosticBag::of_severity(Severity severity) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [severity](const Diagnostic & d) { return d.severity == severity; });
  return result;
}

bool DiagnosticBag::has(Severity severity) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [severity](const Diagnostic & d) {
    return d.severity == severity;
  });
}

size_t DiagnosticBag::count(DiagnosticKind kind) const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [kind](const Diagnostic & d) {
      return d.kind == kind;
    }));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  if (diagnostics_.empty()) {
    diagnostics_ = std::move(other.diagnostics_);
  } else {
    std::move(other.diagnostics_.begin(), other.diagnostics_.end(), std::back_inserter(diagnostics_));
  }
  other.diagnostics_.clear();
}

}  // namespace codemap
