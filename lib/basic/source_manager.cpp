// doculint/basic/source_manager.cpp - Go file text, line tables and the registry
//
// Columns are 1-based byte columns, matching go/token positions.
//
#include "doculint/basic/source_manager.hpp"

#include <algorithm>

namespace doculint
{

namespace
{

/// Registry key: the supplier's path, normalised without touching the disk.
std::string registry_key(const fs::path & path)
{
  return path.lexically_normal().generic_string();
}

}  // namespace

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

void SourceFile::build_line_table()
{
  line_offsets_.assign(1, 0);
  const std::string_view text(content_);
  for (auto nl = text.find('\n'); nl != std::string_view::npos; nl = text.find('\n', nl + 1)) {
    line_offsets_.push_back(static_cast<uint32_t>(nl + 1));
  }
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  // Without text every offset is unmappable; an offset one past the end is
  // still a valid position (end of file).
  if (!has_content() || offset > content_.size()) {
    return {};
  }

  const auto next_line = std::partition_point(
    line_offsets_.begin(), line_offsets_.end(),
    [offset](uint32_t line_start) { return line_start <= offset; });
  const auto line_index = static_cast<uint32_t>(next_line - line_offsets_.begin()) - 1;

  return {line_index + 1, offset - line_offsets_[line_index] + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (!has_content() || line_index >= line_offsets_.size()) {
    return {};
  }

  const std::string_view text(content_);
  const uint32_t begin = line_offsets_[line_index];
  std::string_view line = text.substr(begin);
  if (const auto nl = line.find('\n'); nl != std::string_view::npos) {
    line = line.substr(0, nl);
  }
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const uint32_t begin = range.get_begin().offset();
  const uint32_t end = range.get_end().offset();
  if (begin >= content_.size() || end < begin) {
    return {};
  }
  return std::string_view(content_).substr(begin, end - begin);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  FullSourceRange out;
  out.start_byte = range.get_begin().offset();
  out.end_byte = range.get_end().offset();

  const LineColumn begin = get_line_column(out.start_byte);
  const LineColumn end = get_line_column(out.end_byte);
  out.start_line = begin.line;
  out.start_column = begin.column;
  out.end_line = end.line;
  out.end_column = end.column;
  return out;
}

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  std::string key = registry_key(path);
  if (const auto it = path_to_id_.find(key); it != path_to_id_.end()) {
    return it->second;
  }

  // FileId::k_invalid is reserved for "no file"
  if (files_.size() >= FileId::k_invalid) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  path_to_id_.emplace(std::move(key), id);
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

const fs::path & SourceRegistry::get_path(FileId id) const noexcept
{
  static const fs::path k_no_path;
  const SourceFile * file = get_file(id);
  return file != nullptr ? file->path() : k_no_path;
}

LineColumn SourceRegistry::get_line_column(SourceLocation loc) const noexcept
{
  const SourceFile * file = loc.is_valid() ? get_file(loc.file_id()) : nullptr;
  return file != nullptr ? file->get_line_column(loc.offset()) : LineColumn{};
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_full_range(range) : FullSourceRange{};
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_slice(range) : std::string_view{};
}

}  // namespace doculint
