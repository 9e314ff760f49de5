#pragma once

#include <string>
#include <vector>

namespace recall_core {

struct NormalizationResult {
  std::string text;
  // Set when the input could not be cleaned; text is then the untouched input.
  bool degraded = false;
  std::string reason;
};

/**
 * @brief Strips extraction boilerplate from raw document text.
 *
 * Removes isolated page numbers, "Page X of Y" markers, bare chapter/section
 * headers, figure and table captions, citation markers, bibliography entries
 * and legal boilerplate, then collapses whitespace so that at most one blank
 * line separates paragraphs. Markdown headings and prose lines are never
 * dropped by the line rules. A bibliography runs from its "References" line
 * to the next heading (markdown, numbered or ALL-CAPS) or prose line.
 *
 * Stateless and safe to share between threads.
 */
class TextNormalizer {
 public:
  NormalizationResult normalize_with_status(const std::string& raw_text) const;

  std::string normalize(const std::string& raw_text) const {
    return normalize_with_status(raw_text).text;
  }

  static bool is_markdown_heading(const std::string& line);
  static bool is_substantive(const std::string& line);

 private:
  std::vector<std::string> filter_lines(const std::vector<std::string>& lines) const;
  std::string strip_inline_markers(const std::string& line) const;
  std::string collapse_whitespace(const std::vector<std::string>& lines) const;
};

}  // namespace recall_core
