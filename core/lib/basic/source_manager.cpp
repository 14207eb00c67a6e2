// numcast/basic/source_manager.cpp - Script registry implementation
#include "numcast/basic/source_manager.hpp"

#include <algorithm>

namespace numcast
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

void SourceFile::set_content(std::string new_content)
{
  content_ = std::move(new_content);
  build_line_table();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  // line_offsets_ always starts with 0, so upper_bound never returns begin().
  const auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset) - 1;
  const auto line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  return {line, offset - *it + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  uint32_t end = (line_index + 1 < line_offsets_.size()) ? line_offsets_[line_index + 1] - 1
                                                         : static_cast<uint32_t>(content_.size());
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }
  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }
  const uint32_t start = range.get_begin().offset();
  if (start >= content_.size()) {
    return {};
  }
  const uint32_t end = std::min(range.get_end().offset(), static_cast<uint32_t>(content_.size()));
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange out;
  if (range.is_invalid()) {
    return out;
  }

  out.start_byte = range.get_begin().offset();
  out.end_byte = range.get_end().offset();

  const LineColumn start = get_line_column(out.start_byte);
  const LineColumn end = get_line_column(out.end_byte);
  out.start_line = start.line;
  out.start_column = start.column;
  out.end_line = end.line;
  out.end_column = end.column;
  return out;
}

void SourceFile::build_line_table()
{
  line_offsets_.assign(1, 0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

// ============================================================================
// SourceRegistry
// ============================================================================

std::string SourceRegistry::normalize_key(const fs::path & path)
{
  std::error_code ec;
  const fs::path canonical = fs::weakly_canonical(path, ec);
  return ec ? path.lexically_normal().string() : canonical.string();
}

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  const std::string key = normalize_key(path);
  if (const auto it = path_to_id_.find(key); it != path_to_id_.end()) {
    files_[it->second.value]->set_content(std::move(content));
    return it->second;
  }

  if (files_.size() >= FileId::k_invalid) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  path_to_id_.emplace(key, id);
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
  static const fs::path k_empty;
  const SourceFile * f = get_file(id);
  return f ? f->path() : k_empty;
}

LineColumn SourceRegistry::get_line_column(SourceLocation loc) const noexcept
{
  const SourceFile * f = get_file(loc.file_id());
  if (f == nullptr || !loc.is_valid()) {
    return {};
  }
  return f->get_line_column(loc.offset());
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const SourceFile * f = get_file(range.file_id());
  return f ? f->get_full_range(range) : FullSourceRange{};
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * f = get_file(range.file_id());
  return f ? f->get_slice(range) : std::string_view{};
}

}  // namespace numcast
