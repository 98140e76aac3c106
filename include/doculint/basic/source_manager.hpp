// doculint/basic/source_manager.hpp - Source locations, files and the file registry
//
// Go files are not read by the linter itself; the tree supplier hands over
// byte offsets and, when available, the file text so diagnostics can be
// mapped back to line/column.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace doculint
{

namespace fs = std::filesystem;

// ============================================================================
// FileId
// ============================================================================

/// Index of a file inside a SourceRegistry.
struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceLocation
// ============================================================================

/**
 * A byte offset inside one registered file.
 *
 * The default-constructed location is the "no position" sentinel used for
 * file-scoped and package-scoped diagnostics.
 */
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;

  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }

  /// Orders by file first, then offset. Invalid locations sort first.
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (is_valid() != other.is_valid()) return !is_valid();
    if (file_.value != other.file_.value) return file_.value < other.file_.value;
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange
// ============================================================================

/// Half-open byte range [begin, end) inside one file.
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : begin_(file, begin), end_(file, end)
  {
  }

  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return begin_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid() && begin_.file_id() == end_.file_id();
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
  SourceLocation begin_;
  SourceLocation end_;
};

/// 1-indexed line/column; {0, 0} when unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/// A SourceRange with its line/column information resolved.
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * One Go source file as known to the linter.
 *
 * `content` may be empty when the supplier provided no text; offsets are then
 * still valid but cannot be mapped to lines.
 */
class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] bool has_content() const noexcept { return !content_.empty(); }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Line text without its terminator (0-indexed line).
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/// Owns every SourceFile of a lint run and hands out FileIds.
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /**
   * Register a file. Registering the same (normalized) path twice returns the
   * existing id and keeps the first content.
   *
   * @return FileId::invalid() when the registry is full
   */
  FileId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace doculint
