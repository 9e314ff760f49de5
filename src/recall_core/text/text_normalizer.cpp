#include "recall_core/text/text_normalizer.hpp"

#include "recall_core/chunking/boundary_chunker.hpp"

#include <utf8.h>

#include <regex>
#include <sstream>
#include <stdexcept>

namespace recall_core {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

std::string trim(const std::string& s) {
  const char* ws = " \t\f\v\r\n";
  auto start = s.find_first_not_of(ws);
  if (start == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

size_t count_words(const std::string& s) {
  std::istringstream iss(s);
  std::string word;
  size_t n = 0;
  while (iss >> word) {
    ++n;
  }
  return n;
}

bool is_page_number_line(const std::string& t) {
  static const std::regex pattern(R"(^(?:page\s+)?-?\s*\d{1,4}\s*-?$|^\d{1,4}\s*/\s*\d{1,4}$)",
                                  kIcase);
  return std::regex_match(t, pattern);
}

bool is_page_of_line(const std::string& t) {
  static const std::regex pattern(R"(^page\s+\d+\s+of\s+\d+$)", kIcase);
  return std::regex_match(t, pattern);
}

bool is_bare_chapter_header(const std::string& t) {
  static const std::regex pattern(R"(^(?:chapter|section|part)\s+(?:\d+|[ivxlcdm]+)\.?$)", kIcase);
  return std::regex_match(t, pattern);
}

bool is_caption_line(const std::string& t) {
  static const std::regex pattern(R"(^(?:figure|fig\.|table)\s*\d+(?:\.\d+)*(?:\s*[:.\-].*)?$)",
                                  kIcase);
  return std::regex_match(t, pattern);
}

bool is_legal_boilerplate(const std::string& t) {
  static const std::regex pattern(
      R"(all rights reserved|©|\(c\)\s*\d{4}|copyright\s+(?:\(c\)\s*)?\d{4}|^confidential\b|^disclaimer\b|proprietary and confidential|for internal use only)",
      kIcase);
  return std::regex_search(t, pattern);
}

bool is_references_heading(const std::string& t) {
  static const std::regex pattern(
      R"(^#{0,6}\s*(?:references|bibliography|works cited|literature cited)\s*:?$)", kIcase);
  return std::regex_match(t, pattern);
}

bool looks_like_reference_entry(const std::string& t) {
  static const std::regex pattern(
      R"(^\[\d+\]\s+.*\b(?:19|20)\d{2}[a-z]?\b|^(?:\d+\.\s+)?[A-Z][A-Za-z'\-]+,\s+(?:[A-Z]\.\s*)+.*\b(?:19|20)\d{2}[a-z]?\b)");
  return std::regex_search(t, pattern);
}

}  // namespace

bool TextNormalizer::is_markdown_heading(const std::string& line) {
  static const std::regex pattern(R"(^\s*#{1,6}\s+\S.*$)");
  return std::regex_match(line, pattern);
}

// Prose: at least eight words, a sentence end after a lowercase word, and not
// shaped like a bibliography entry.
bool TextNormalizer::is_substantive(const std::string& line) {
  static const std::regex sentence_end(R"([a-z0-9)][.!?](?:\s|$))");
  std::string t = trim(line);
  if (count_words(t) < 8) {
    return false;
  }
  if (!std::regex_search(t, sentence_end)) {
    return false;
  }
  return !looks_like_reference_entry(t);
}

NormalizationResult TextNormalizer::normalize_with_status(const std::string& raw_text) const {
  if (!utf8::is_valid(raw_text.begin(), raw_text.end())) {
    return {raw_text, true, "NormalizationDegraded: input is not valid UTF-8"};
  }

  try {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < raw_text.size(); ++i) {
      char c = raw_text[i];
      if (c == '\r') {
        if (i + 1 < raw_text.size() && raw_text[i + 1] == '\n') {
          ++i;
        }
        lines.push_back(std::move(current));
        current.clear();
      } else if (c == '\n') {
        lines.push_back(std::move(current));
        current.clear();
      } else {
        current.push_back(c);
      }
    }
    lines.push_back(std::move(current));

    std::vector<std::string> kept = filter_lines(lines);
    for (auto& line : kept) {
      line = strip_inline_markers(line);
    }
    return {collapse_whitespace(kept), false, ""};
  } catch (const std::exception& e) {
    return {raw_text, true, std::string("NormalizationDegraded: ") + e.what()};
  }
}

std::vector<std::string> TextNormalizer::filter_lines(const std::vector<std::string>& lines) const {
  std::vector<std::string> kept;
  kept.reserve(lines.size());
  bool in_references = false;

  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    std::string t = trim(line);
    if (t.empty()) {
      kept.push_back("");
      continue;
    }

    if (is_references_heading(t)) {
      in_references = true;
      if (is_markdown_heading(t)) {
        kept.push_back(line);
      }
      continue;
    }

    if (is_markdown_heading(t)) {
      in_references = false;
      kept.push_back(line);
      continue;
    }

    if (is_substantive(t)) {
      in_references = false;
      kept.push_back(line);
      continue;
    }

    // Any heading the chunker would split on closes the bibliography.
    if (in_references && !looks_like_reference_entry(t) && BoundaryChunker::heading_at(lines, i)) {
      in_references = false;
    }
    if (in_references) {
      continue;
    }

    if (is_page_number_line(t) || is_page_of_line(t) || is_bare_chapter_header(t) ||
        is_caption_line(t) || is_legal_boilerplate(t) || looks_like_reference_entry(t)) {
      continue;
    }
    kept.push_back(line);
  }
  return kept;
}

std::string TextNormalizer::strip_inline_markers(const std::string& line) const {
  static const std::regex page_of(R"(\s*\bpage\s+\d+\s+of\s+\d+\b)", kIcase);
  static const std::regex numeric_citation(R"([ \t]*\[\d+(?:\s*[,\-]\s*\d+)*\])");
  static const std::regex author_year(
      R"([ \t]*\((?:[A-Z][A-Za-z'\-]+(?:\s+et\s+al\.)?(?:\s+(?:and|&)\s+[A-Z][A-Za-z'\-]+)?,?\s+(?:19|20)\d{2}[a-z]?(?:;\s*)?)+\))");
  static const std::regex space_before_punct(R"([ \t]+([.,;:!?]))");

  std::string out = std::regex_replace(line, page_of, "");
  out = std::regex_replace(out, numeric_citation, "");
  out = std::regex_replace(out, author_year, "");
  if (out.size() != line.size()) {
    out = std::regex_replace(out, space_before_punct, "$1");
  }
  return out;
}

std::string TextNormalizer::collapse_whitespace(const std::vector<std::string>& lines) const {
  static const std::regex inner_ws(R"([ \t\f\v]+)");

  std::string out;
  bool pending_blank = false;
  for (const auto& line : lines) {
    std::string t = trim(std::regex_replace(line, inner_ws, " "));
    if (t.empty()) {
      pending_blank = !out.empty();
      continue;
    }
    if (!out.empty()) {
      out += pending_blank ? "\n\n" : "\n";
    }
    out += t;
    pending_blank = false;
  }
  return out;
}

}  // namespace recall_core
