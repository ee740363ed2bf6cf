// defcheck/basic/source_file.hpp - Source ranges and line-table backed source files
//
// A SourceFile owns the text of one analyzed Python file and converts byte
// offsets into 1-indexed line/column positions.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace defcheck
{

// ============================================================================
// SourceRange - Half-open byte range
// ============================================================================

/**
 * A range of source bytes following the half-open convention [begin, end).
 */
class SourceRange
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept : begin_(begin), end_(end) {}

  [[nodiscard]] constexpr uint32_t begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_ != k_invalid_offset && end_ != k_invalid_offset && begin_ <= end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_ - begin_ : 0;
  }

  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return is_valid() && other.is_valid() && other.begin_ >= begin_ && other.end_ <= end_;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  uint32_t begin_ = k_invalid_offset;
  uint32_t end_ = k_invalid_offset;
};

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Text of a single source file with a pre-computed line table.
 */
class SourceFile
{
public:
  SourceFile() = default;
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string display_name() const { return path_.generic_string(); }

  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  /// Number of lines (a trailing newline does not open an extra line)
  [[nodiscard]] uint32_t line_count() const noexcept;

  /// Convert a byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a 0-indexed line without its terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Content of a 1-indexed line without its terminator
  [[nodiscard]] std::string_view line_text(uint32_t line) const noexcept
  {
    return line == 0 ? std::string_view() : get_line(line - 1);
  }

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace defcheck
