// codemap/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
// Prints diagnostics with a source excerpt and caret markers:
//
//   warning[C002]: declaration without a recoverable name
//     --> src/app.py:5:1
//      |
//    5 | def (x):
//      | ^^^^^^^^ declaration skipped
//      |
//      = help: fix the syntax error to include this declaration
//
// Spans covering several lines (a whole function body, for instance) show
// their first and last line separated by `...`.
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "codemap/basic/diagnostic.hpp"
#include "codemap/basic/source_file.hpp"

namespace codemap
{

class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Emit terminal colors through rang
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * @param source Text of the file the diagnostic belongs to; when null only
   *               the header, location and label messages are printed.
   */
  void print(const Diagnostic & diag, const fs::path & file, const SourceFile * source);

  /**
   * Print all diagnostics of one file, ordered by start offset.
   */
  void print_all(const DiagnosticBag & diags, const fs::path & file, const SourceFile * source);

private:
  enum class Tone : uint8_t { Plain, Error, Warning, Info, Gutter };

  void print_header(const Diagnostic & diag);
  void print_excerpt(const Label & label, const SourceFile & source);
  void print_marked_line(
    std::string_view line, uint32_t line_number, uint32_t from_col, uint32_t to_col,
    const Label & label, bool with_message);
  void print_footer(std::string_view tag, std::string_view message);

  /// Write `text` in `tone`, bold when requested.
  void paint(Tone tone, std::string_view text, bool bold = false);

  std::ostream & os_;
  bool use_color_;
  /// Width of the line-number column for the diagnostic being printed.
  size_t gutter_ = 4;
};

}  // namespace codemap
