// ui_markup/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking source code locations and ranges.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ui_markup
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Internally stores a byte offset into the source text. Line and column
 * information can be computed on demand via SourceManager.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  /// Create an invalid location
  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}

  /// Create a location from byte offset
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  /// Get the byte offset
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return offset_ <= other.offset_;
  }
  [[nodiscard]] constexpr bool operator>(SourceLocation other) const noexcept
  {
    return offset_ > other.offset_;
  }
  [[nodiscard]] constexpr bool operator>=(SourceLocation other) const noexcept
  {
    return offset_ >= other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A range of source code defined by start and end locations.
 *
 * The range is inclusive of the start and exclusive of the end,
 * following the half-open interval convention [start, end).
 */
class SourceRange
{
public:
  /// Create an invalid range
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr bool is_invalid() const noexcept
  {
    return start_.is_invalid() || end_.is_invalid();
  }

  /// Check if a location is contained within this range
  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return loc >= start_ && loc < end_;
  }

  /// Check if another range is fully contained within this range
  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return other.start_ >= start_ && other.end_ <= end_;
  }

  /// Get the size in bytes
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - start_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

/// Smallest range covering both `a` and `b` (invalid inputs are ignored).
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

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
// FullSourceRange - Complete range with line/column info
// ============================================================================

/**
 * Extended source range including pre-computed line/column information.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] SourceRange to_source_range() const noexcept { return {start_byte, end_byte}; }

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceManager - Source text and location management
// ============================================================================

/**
 * Owns the text of one input (a host source file or a standalone markup
 * block) and provides location services for it.
 *
 * - Stores the file path (may be empty for in-memory input)
 * - Converts between byte offsets and line/column positions
 * - Pre-computes line start offsets for efficient lookup
 */
class SourceManager
{
public:
  SourceManager() { build_line_table(); }

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  // ===========================================================================
  // File Path Accessors
  // ===========================================================================

  void set_file_path(std::filesystem::path path) { file_path_ = std::move(path); }

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }

  [[nodiscard]] bool has_file_path() const noexcept { return !file_path_.empty(); }

  /// Display name used in diagnostics ("<input>" when there is no path)
  [[nodiscard]] std::string get_display_name() const;

  // ===========================================================================
  // Source Content Accessors
  // ===========================================================================

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }

  [[nodiscard]] size_t size() const noexcept { return source_.size(); }

  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  // ===========================================================================
  // Location Conversion
  // ===========================================================================

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept
  {
    return get_line_column(SourceLocation(offset));
  }

  /// Convert SourceLocation to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;

  /// Get the content of a specific line (0-indexed), without its line break
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Get a slice of source by range
  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept;

  /// Expand a SourceRange to include full line/column info
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace ui_markup
