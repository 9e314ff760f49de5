#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recall_core {

struct TextChunk {
  std::string text;
  std::string section_title;
  int chunk_index = 0;
};

/**
 * @brief Splits normalized text into bounded, overlapping chunks.
 *
 * Boundaries, strongest first: markdown headings, numbered section headings,
 * ALL-CAPS heading lines, blank-line paragraph breaks. Numbered lines inside a
 * numbered list are body text, not headings. A heading always starts
 * a new chunk and no overlap is carried across it. Paragraphs are packed while
 * the chunk stays within max_size; the chunk after a size-driven split starts
 * with the trailing `overlap` bytes of the previous one. Paragraphs too long
 * for an empty chunk are cut at the last sentence end that fits, then at the
 * last whitespace, then at a UTF-8 character boundary.
 *
 * Sizes are in bytes. Output is a pure function of the inputs.
 */
class BoundaryChunker {
 public:
  // Throws std::invalid_argument unless max_size > 0 and overlap < max_size / 2.
  std::vector<TextChunk> chunk(const std::string& text, size_t max_size, size_t overlap) const;

  // Returns the section title when the line is a heading.
  static std::optional<std::string> heading_title(const std::string& line);

  // heading_title for lines[index], with numbered list items rejected: a
  // numbered heading must follow a blank line (or open the text) and must not
  // be followed by another numbered line.
  static std::optional<std::string> heading_at(const std::vector<std::string>& lines,
                                               size_t index);

  // Trailing `overlap` bytes of text, shortened to start on a character boundary.
  static std::string tail_on_char_boundary(const std::string& text, size_t overlap);

  // Cut position for a paragraph that must be split to fit `room` bytes.
  static size_t find_cut(std::string_view paragraph, size_t room);
};

}  // namespace recall_core
