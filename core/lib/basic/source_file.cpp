// codemap/basic/source_file.cpp - Line table and span computation
#include "codemap/basic/source_file.hpp"

#include <algorithm>

namespace codemap
{

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  index_lines();
}

void SourceFile::index_lines()
{
  line_starts_.assign(1, 0);
  const std::string_view text = content_;
  for (size_t nl = text.find('\n'); nl != std::string_view::npos; nl = text.find('\n', nl + 1)) {
    line_starts_.push_back(static_cast<uint32_t>(nl + 1));
  }
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_starts_.empty()) {
    return {};
  }
  offset = std::min(offset, size());

  // Last line start not after `offset`; line_starts_[0] == 0 so it always exists.
  const auto next_line =
    std::partition_point(line_starts_.begin(), line_starts_.end(), [offset](uint32_t start) {
      return start <= offset;
    });
  const auto index = static_cast<uint32_t>(std::distance(line_starts_.begin(), next_line) - 1);
  return {index + 1, offset - line_starts_[index] + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_starts_.size()) {
    return {};
  }

  const uint32_t begin = line_starts_[line_index];
  const uint32_t end = line_index + 1 < line_starts_.size() ? line_starts_[line_index + 1] : size();

  std::string_view line = std::string_view(content_).substr(begin, end - begin);
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  return line;
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid() || range.get_begin() >= size()) {
    return {};
  }
  const uint32_t end = std::min(range.get_end(), size());
  return std::string_view(content_).substr(range.get_begin(), end - range.get_begin());
}

Span SourceFile::get_span(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }
  const LineColumn start = get_line_column(range.get_begin());
  const LineColumn end = get_line_column(range.get_end());
  return Span{
    .start_line = start.line,
    .start_column = start.column,
    .end_line = end.line,
    .end_column = end.column,
    .start_byte = range.get_begin(),
    .end_byte = range.get_end(),
  };
}

}  // namespace codemap
