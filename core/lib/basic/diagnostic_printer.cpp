// codemap/basic/diagnostic_printer.cpp - Terminal rendering of diagnostics
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "codemap/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace codemap
{

namespace
{

/// Path relative to the working directory when it is below it.
std::string display_path(const fs::path & file)
{
  if (file.empty()) {
    return "<unknown>";
  }
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  if (ec) {
    return file.string();
  }
  const fs::path rel = fs::relative(file, cwd, ec);
  if (ec || rel.empty() || *rel.begin() == "..") {
    return file.string();
  }
  return rel.string();
}

/// Expand tabs to four columns and drop line terminators.
std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out.append(4, ' ');
    } else if (c != '\r' && c != '\n') {
      out.push_back(c);
    }
  }
  return out;
}

/// Display width of the first `col - 1` bytes of `line`.
size_t display_offset(std::string_view line, uint32_t col)
{
  size_t width = 0;
  for (size_t i = 0; i + 1 < col && i < line.size(); ++i) {
    width += line[i] == '\t' ? 4 : 1;
  }
  return width;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::paint(Tone tone, std::string_view text, bool bold)
{
  if (!use_color_ || tone == Tone::Plain) {
    os_ << text;
    return;
  }
  if (bold) {
    os_ << rang::style::bold;
  }
  switch (tone) {
    case Tone::Error:
      os_ << rang::fg::red;
      break;
    case Tone::Warning:
      os_ << rang::fg::yellow;
      break;
    case Tone::Info:
    case Tone::Gutter:
      os_ << rang::fg::cyan;
      break;
    case Tone::Plain:
      break;
  }
  os_ << text << rang::fg::reset << rang::style::reset;
}

void DiagnosticPrinter::print(
  const Diagnostic & diag, const fs::path & file, const SourceFile * source)
{
  // Size the gutter to the largest line number shown.
  uint32_t last_line = 1;
  for (const auto & label : diag.labels) {
    last_line = std::max(last_line, label.span.end_line);
  }
  gutter_ = std::max<size_t>(2, fmt::formatted_size("{}", last_line));
  const std::string blank(gutter_, ' ');

  print_header(diag);

  const Span primary = diag.primary_span();
  paint(Tone::Gutter, blank + "--> ", true);
  if (primary.is_valid()) {
    fmt::print(os_, "{}:{}:{}\n", display_path(file), primary.start_line, primary.start_column);
  } else {
    fmt::print(os_, "{}\n", display_path(file));
  }

  for (const auto & label : diag.labels) {
    if (source != nullptr && label.span.is_valid()) {
      paint(Tone::Gutter, blank + " |\n", true);
      print_excerpt(label, *source);
    } else if (!label.message.empty()) {
      print_footer("note", label.message);
    }
  }

  if (diag.help_message) {
    print_footer("help", *diag.help_message);
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_all(
  const DiagnosticBag & diags, const fs::path & file, const SourceFile * source)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_span().start_byte < b->primary_span().start_byte;
  });

  for (const Diagnostic * d : ordered) {
    print(*d, file, source);
  }
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  Tone tone = Tone::Info;
  if (diag.severity == Severity::Error) {
    tone = Tone::Error;
  } else if (diag.severity == Severity::Warning) {
    tone = Tone::Warning;
  }

  std::string head(to_string(diag.severity));
  if (!diag.code.empty()) {
    head += fmt::format("[{}]", diag.code);
  }
  paint(tone, head, true);
  paint(Tone::Plain, ": ");
  paint(Tone::Plain, diag.message, true);
  os_ << "\n";
}

void DiagnosticPrinter::print_excerpt(const Label & label, const SourceFile & source)
{
  const Span & sp = label.span;
  const std::string_view first = source.get_line(sp.start_line - 1);

  if (sp.end_line <= sp.start_line) {
    const uint32_t to_col = sp.end_column > sp.start_column ? sp.end_column : sp.start_column + 1;
    print_marked_line(first, sp.start_line, sp.start_column, to_col, label, true);
    return;
  }

  // Multi-line: underline the rest of the first line and the head of the last.
  print_marked_line(
    first, sp.start_line, sp.start_column, static_cast<uint32_t>(first.size()) + 1, label, false);
  if (sp.end_line > sp.start_line + 1) {
    paint(Tone::Gutter, std::string(gutter_, '.') + "\n", true);
  }
  const std::string_view last = source.get_line(sp.end_line - 1);
  print_marked_line(last, sp.end_line, 1, std::max<uint32_t>(sp.end_column, 2), label, true);
}

void DiagnosticPrinter::print_marked_line(
  std::string_view line, uint32_t line_number, uint32_t from_col, uint32_t to_col,
  const Label & label, bool with_message)
{
  if (line.empty()) {
    return;
  }

  paint(Tone::Gutter, fmt::format("{:>{}} | ", line_number, gutter_), true);
  fmt::print(os_, "{}\n", expand_tabs(line));

  const size_t pad = display_offset(line, from_col);
  const size_t width = std::max<size_t>(1, display_offset(line, to_col) - pad);
  paint(Tone::Gutter, std::string(gutter_, ' ') + " | ", true);
  os_ << std::string(pad, ' ');
  std::string marker(width, '^');
  if (with_message && !label.message.empty()) {
    marker += " " + label.message;
  }
  paint(Tone::Error, marker, true);
  os_ << "\n";
}

void DiagnosticPrinter::print_footer(std::string_view tag, std::string_view message)
{
  const std::string blank(gutter_, ' ');
  paint(Tone::Gutter, blank + " |\n", true);
  paint(Tone::Gutter, blank + " = ", true);
  fmt::print(os_, "{}: {}\n", tag, message);
}

}  // namespace codemap
