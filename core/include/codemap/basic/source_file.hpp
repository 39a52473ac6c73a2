// codemap/basic/source_file.hpp - Source text, byte ranges and line/column spans
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace codemap
{

namespace fs = std::filesystem;

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Half-open byte range [begin, end) within a single source file.
 */
class SourceRange
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept : begin_(begin), end_(end) {}

  [[nodiscard]] constexpr uint32_t get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_ != k_invalid_offset && end_ != k_invalid_offset && begin_ <= end_;
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept { return is_valid() ? end_ - begin_ : 0; }

  [[nodiscard]] constexpr bool contains(uint32_t offset) const noexcept
  {
    return is_valid() && offset >= begin_ && offset < end_;
  }

  /// True when `other` lies entirely within this range (equal ranges contain each other).
  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return is_valid() && other.is_valid() && other.begin_ >= begin_ && other.end_ <= end_;
  }

  constexpr bool operator==(const SourceRange &) const noexcept = default;

private:
  uint32_t begin_ = k_invalid_offset;
  uint32_t end_ = k_invalid_offset;
};

// ============================================================================
// LineColumn / Span
// ============================================================================

/**
 * 1-based line and column (column counted in bytes).
 */
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return line > 0; }
};

/**
 * Complete location of a syntax element: 1-based line/column pairs plus byte offsets.
 */
struct Span
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }

  [[nodiscard]] SourceRange to_source_range() const noexcept
  {
    return is_valid() ? SourceRange(start_byte, end_byte) : SourceRange();
  }

  [[nodiscard]] bool contains(const Span & other) const noexcept
  {
    return to_source_range().contains(other.to_source_range());
  }

  bool operator==(const Span &) const noexcept = default;
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Owns the text of one source file and a line table for offset lookups.
 */
class SourceFile
{
public:
  SourceFile() = default;
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] uint32_t size() const noexcept { return static_cast<uint32_t>(content_.size()); }

  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /// Convert a byte offset into a 1-based line/column pair.
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Text of a 0-based line without its terminator.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] Span get_span(SourceRange range) const noexcept;

private:
  void index_lines();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_starts_;
};

}  // namespace codemap
