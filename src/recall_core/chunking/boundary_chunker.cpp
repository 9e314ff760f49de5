#include "recall_core/chunking/boundary_chunker.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace recall_core {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string_view trim_view(std::string_view s) {
  size_t start = 0;
  while (start < s.size() && is_space(s[start])) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && is_space(s[end - 1])) {
    --end;
  }
  return s.substr(start, end - start);
}

size_t utf8_sequence_length(char lead) {
  auto c = static_cast<unsigned char>(lead);
  if (c < 0x80)
    return 1;
  if ((c & 0xE0) == 0xC0)
    return 2;
  if ((c & 0xF0) == 0xE0)
    return 3;
  if ((c & 0xF8) == 0xF0)
    return 4;
  return 1;
}

bool is_caps_heading(const std::string& t) {
  if (t.size() < 3 || t.size() > 80) {
    return false;
  }
  size_t upper = 0;
  size_t letters = 0;
  size_t non_space = 0;
  for (char c : t) {
    if (c >= 'a' && c <= 'z') {
      return false;
    }
    if (c >= 'A' && c <= 'Z') {
      ++upper;
      ++letters;
    }
    if (!is_space(c)) {
      ++non_space;
    }
  }
  if (upper < 3) {
    return false;
  }
  return letters * 10 >= non_space * 6;
}

const std::regex& numbered_pattern() {
  static const std::regex pattern(R"(^\d{1,3}(?:\.\d{1,3})*\.?\s+[A-Z][^.!?]*$)");
  return pattern;
}

bool is_numbered_line(std::string_view t) {
  return !t.empty() && t.size() <= 100 && std::regex_match(t.begin(), t.end(), numbered_pattern());
}

enum class ChunkState { Empty, SeedOnly, HeadingOnly, Body };

// Mutable packing state for one chunk() call.
struct Packer {
  size_t max_size;
  size_t overlap;
  std::vector<TextChunk> out;
  std::string current;
  std::string section_title;
  ChunkState state = ChunkState::Empty;
  bool seed_mid_paragraph = false;

  void emit() {
    TextChunk chunk;
    chunk.text = current;
    chunk.section_title = section_title;
    chunk.chunk_index = static_cast<int>(out.size());
    out.push_back(std::move(chunk));
  }

  void flush(bool carry_seed) {
    bool emitted = false;
    if (state == ChunkState::Body || state == ChunkState::HeadingOnly) {
      emit();
      emitted = true;
    }
    if (carry_seed && emitted && state == ChunkState::Body && overlap > 0) {
      current = BoundaryChunker::tail_on_char_boundary(current, overlap);
      state = current.empty() ? ChunkState::Empty : ChunkState::SeedOnly;
    } else {
      current.clear();
      state = ChunkState::Empty;
    }
    seed_mid_paragraph = false;
  }

  void add_heading(const std::string& line, const std::string& title) {
    if (state == ChunkState::Body) {
      flush(false);
    } else if (state == ChunkState::SeedOnly) {
      current.clear();
      state = ChunkState::Empty;
    }
    section_title = title;

    if (state == ChunkState::HeadingOnly) {
      if (current.size() + 2 + line.size() <= max_size) {
        current += "\n\n";
        current += line;
        return;
      }
      flush(false);
    }
    if (line.size() <= max_size) {
      current = line;
      state = ChunkState::HeadingOnly;
      return;
    }
    add_paragraph(line);
  }

  void add_paragraph(std::string_view para) {
    para = trim_view(para);
    while (!para.empty()) {
      std::string_view sep;
      if (!current.empty()) {
        sep = (state == ChunkState::SeedOnly && seed_mid_paragraph) ? " " : "\n\n";
      }
      if (current.size() + sep.size() + para.size() <= max_size) {
        current += sep;
        current += para;
        state = ChunkState::Body;
        seed_mid_paragraph = false;
        return;
      }
      if (state == ChunkState::Body) {
        flush(true);
        continue;
      }
      if (current.size() + sep.size() >= max_size) {
        // No room beside the heading or seed.
        if (state == ChunkState::HeadingOnly) {
          flush(false);
        } else {
          current.clear();
          state = ChunkState::Empty;
          seed_mid_paragraph = false;
        }
        continue;
      }
      size_t room = max_size - current.size() - sep.size();
      size_t cut = BoundaryChunker::find_cut(para, room);
      std::string_view piece = trim_view(para.substr(0, cut));
      current += sep;
      current += piece;
      state = ChunkState::Body;
      flush(true);
      seed_mid_paragraph = true;
      para = trim_view(para.substr(cut));
    }
  }

  void finish() {
    if (state == ChunkState::Body || state == ChunkState::HeadingOnly) {
      emit();
    }
    current.clear();
    state = ChunkState::Empty;
  }
};

}  // namespace

std::optional<std::string> BoundaryChunker::heading_title(const std::string& line) {
  static const std::regex markdown(R"(^(#{1,6})\s+(\S.*)$)");

  std::string t(trim_view(line));
  if (t.empty()) {
    return std::nullopt;
  }
  std::smatch match;
  if (std::regex_match(t, match, markdown)) {
    return std::string(trim_view(match[2].str()));
  }
  if (is_numbered_line(t)) {
    return t;
  }
  if (is_caps_heading(t)) {
    return t;
  }
  return std::nullopt;
}

std::optional<std::string> BoundaryChunker::heading_at(const std::vector<std::string>& lines,
                                                       size_t index) {
  if (index >= lines.size()) {
    return std::nullopt;
  }
  auto title = heading_title(lines[index]);
  if (!title || !is_numbered_line(trim_view(lines[index]))) {
    return title;
  }
  if (index > 0 && !trim_view(lines[index - 1]).empty()) {
    return std::nullopt;
  }
  if (index + 1 < lines.size() && is_numbered_line(trim_view(lines[index + 1]))) {
    return std::nullopt;
  }
  return title;
}

std::string BoundaryChunker::tail_on_char_boundary(const std::string& text, size_t overlap) {
  if (overlap >= text.size()) {
    return text;
  }
  size_t start = text.size() - overlap;
  while (start < text.size() && is_continuation_byte(text[start])) {
    ++start;
  }
  return text.substr(start);
}

size_t BoundaryChunker::find_cut(std::string_view paragraph, size_t room) {
  if (room >= paragraph.size()) {
    return paragraph.size();
  }
  size_t limit = room;
  while (limit > 0 && is_continuation_byte(paragraph[limit])) {
    --limit;
  }
  if (limit == 0) {
    // A single character wider than the room.
    return std::min(paragraph.size(), utf8_sequence_length(paragraph[0]));
  }

  const size_t min_useful = limit / 2;
  for (size_t i = limit; i > min_useful; --i) {
    char c = paragraph[i - 1];
    if ((c == '.' || c == '!' || c == '?') && (i == paragraph.size() || is_space(paragraph[i]))) {
      return i;
    }
  }
  for (size_t i = limit; i > min_useful; --i) {
    if (is_space(paragraph[i - 1])) {
      return i - 1 > 0 ? i - 1 : i;
    }
  }
  return limit;
}

std::vector<TextChunk> BoundaryChunker::chunk(const std::string& text,
                                              size_t max_size,
                                              size_t overlap) const {
  if (max_size == 0) {
    throw std::invalid_argument("max_size must be greater than 0");
  }
  if (overlap * 2 >= max_size) {
    throw std::invalid_argument("overlap must be less than half of max_size");
  }

  Packer packer{max_size, overlap};

  std::string paragraph;
  auto flush_paragraph = [&]() {
    if (!trim_view(paragraph).empty()) {
      packer.add_paragraph(paragraph);
    }
    paragraph.clear();
  };

  std::vector<std::string> lines;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string::npos) {
      nl = text.size();
    }
    lines.push_back(text.substr(pos, nl - pos));
    pos = nl + 1;
  }

  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    if (trim_view(line).empty()) {
      flush_paragraph();
      continue;
    }
    if (auto title = heading_at(lines, i)) {
      flush_paragraph();
      packer.add_heading(std::string(trim_view(line)), *title);
      continue;
    }
    if (!paragraph.empty()) {
      paragraph += '\n';
    }
    paragraph += line;
  }
  flush_paragraph();
  packer.finish();
  return std::move(packer.out);
}

}  // namespace recall_core
