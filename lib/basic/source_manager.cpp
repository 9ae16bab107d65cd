// ui_markup/basic/source_manager.cpp - Source text and location services
#include "ui_markup/basic/source_manager.hpp"

#include <algorithm>

namespace ui_markup
{

std::string SourceManager::get_display_name() const
{
  if (file_path_.empty()) {
    return "<input>";
  }
  std::error_code ec;
  auto rel_path = std::filesystem::relative(file_path_, std::filesystem::current_path(), ec);
  if (ec || rel_path.empty()) {
    return file_path_.string();
  }
  return rel_path.string();
}

LineColumn SourceManager::get_line_column(SourceLocation loc) const noexcept
{
  if (line_offsets_.empty() || loc.is_invalid()) {
    return {};
  }

  uint32_t offset = loc.get_offset();
  if (offset > source_.size()) {
    offset = static_cast<uint32_t>(source_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceManager::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(source_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && source_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && source_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(source_).substr(start, end - start);
}

std::string_view SourceManager::get_source_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) return {};
  const auto start = range.get_begin().get_offset();
  auto end = range.get_end().get_offset();
  if (start >= source_.size()) return {};
  if (end > source_.size()) end = static_cast<uint32_t>(source_.size());
  if (end < start) return {};
  return std::string_view(source_).substr(start, end - start);
}

FullSourceRange SourceManager::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (range.is_invalid()) {
    return result;
  }

  result.start_byte = range.get_begin().get_offset();
  result.end_byte = range.get_end().get_offset();

  const auto start_lc = get_line_column(result.start_byte);
  const auto end_lc = get_line_column(result.end_byte);

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

void SourceManager::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < source_.size(); ++i) {
    if (source_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace ui_markup
