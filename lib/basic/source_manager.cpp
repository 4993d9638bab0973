// kleis/basic/source_manager.cpp - Source file and registry implementation
#include "kleis/basic/source_manager.hpp"

#include <algorithm>
#include <iterator>

namespace fs = std::filesystem;

namespace kleis
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  // line_offsets_ starts with 0, so the bound is never the first entry.
  const auto next_line = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  const auto index = static_cast<uint32_t>(std::distance(line_offsets_.begin(), next_line) - 1);
  return {index + 1, offset - line_offsets_[index] + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  std::string_view line = std::string_view(content_).substr(line_offsets_[line_index]);
  line = line.substr(0, line.find('\n'));
  // Structure files saved on Windows keep their carriage returns.
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  const uint32_t size = static_cast<uint32_t>(content_.size());
  if (!range.is_valid() || range.get_begin().offset() >= size) {
    return {};
  }
  const uint32_t begin = range.get_begin().offset();
  const uint32_t end = std::min(range.get_end().offset(), size);
  return std::string_view(content_).substr(begin, end > begin ? end - begin : 0);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const uint32_t begin = range.get_begin().offset();
  const uint32_t end = range.get_end().offset();
  const LineColumn from = get_line_column(begin);
  const LineColumn to = get_line_column(end);
  return FullSourceRange{from.line, from.column, to.line, to.column, begin, end};
}

void SourceFile::build_line_table()
{
  line_offsets_.assign(1, 0);
  for (size_t nl = content_.find('\n'); nl != std::string::npos; nl = content_.find('\n', nl + 1)) {
    line_offsets_.push_back(static_cast<uint32_t>(nl + 1));
  }
}

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  // Every load keeps its own text, even under a path seen before: ranges of
  // earlier declarations still point into the text they were parsed from.
  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || static_cast<size_t>(id.value) >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

fs::path SourceRegistry::get_path(FileId id) const
{
  const SourceFile * file = get_file(id);
  return file != nullptr ? file->path() : fs::path{};
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_slice(range) : std::string_view{};
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_full_range(range) : FullSourceRange{};
}

}  // namespace kleis
