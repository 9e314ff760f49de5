#include "recall_core/retrieval/result_consolidator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace recall_core {

namespace {

constexpr size_t kRepresentativeChunks = 2;
constexpr size_t kMinHighlightToken = 2;

char lower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::vector<std::string> highlight_tokens(const std::string& query) {
  std::vector<std::string> tokens;
  std::istringstream in(query);
  std::string word;
  while (in >> word) {
    size_t begin = 0;
    size_t end = word.size();
    while (begin < end && std::ispunct(static_cast<unsigned char>(word[begin]))) ++begin;
    while (end > begin && std::ispunct(static_cast<unsigned char>(word[end - 1]))) --end;
    std::string token = word.substr(begin, end - begin);
    std::transform(token.begin(), token.end(), token.begin(), lower);
    if (token.size() >= kMinHighlightToken &&
        std::find(tokens.begin(), tokens.end(), token) == tokens.end()) {
      tokens.push_back(std::move(token));
    }
  }
  // Longest first so overlapping tokens prefer the longer match.
  std::stable_sort(tokens.begin(), tokens.end(),
                   [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
  return tokens;
}

bool matches_at(const std::string& text, size_t pos, const std::string& token) {
  if (pos + token.size() > text.size()) {
    return false;
  }
  for (size_t i = 0; i < token.size(); ++i) {
    if (lower(text[pos + i]) != token[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string ResultConsolidator::source_identity(const ChunkHit& hit, size_t position) {
  if (hit.chunk.source_link && !hit.chunk.source_link->empty()) {
    return "link:" + *hit.chunk.source_link;
  }
  if (!hit.chunk.document_id.empty()) {
    return "doc:" + hit.chunk.document_id;
  }
  return "hit:" + std::to_string(position);
}

std::string ResultConsolidator::display_name_for(const Chunk& chunk) {
  if (!chunk.source_title.empty()) {
    return chunk.source_title;
  }
  return "Document (" + chunk.document_id.substr(0, 8) + "...)";
}

std::vector<SourceGroup> ResultConsolidator::consolidate(const std::vector<ChunkHit>& hits,
                                                         const std::string& highlight_query) const {
  struct Pending {
    SourceGroup group;
    std::vector<std::pair<float, std::string>> texts;
  };

  std::vector<Pending> pending;
  std::unordered_map<std::string, size_t> index_by_identity;

  for (size_t i = 0; i < hits.size(); ++i) {
    const ChunkHit& hit = hits[i];
    const std::string identity = source_identity(hit, i);
    auto it = index_by_identity.find(identity);
    if (it == index_by_identity.end()) {
      Pending entry;
      entry.group.display_name = display_name_for(hit.chunk);
      entry.group.url = hit.chunk.source_link;
      entry.group.score = hit.score;
      it = index_by_identity.emplace(identity, pending.size()).first;
      pending.push_back(std::move(entry));
    }
    Pending& entry = pending[it->second];
    entry.group.chunk_count += 1;
    entry.group.score = std::max(entry.group.score, hit.score);
    entry.group.chunk_ids.push_back(hit.chunk.chunk_id);
    entry.texts.emplace_back(hit.score, hit.chunk.text);
  }

  std::vector<SourceGroup> groups;
  groups.reserve(pending.size());
  for (auto& entry : pending) {
    std::stable_sort(entry.texts.begin(), entry.texts.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });
    std::string text;
    const size_t shown = std::min(kRepresentativeChunks, entry.texts.size());
    for (size_t i = 0; i < shown; ++i) {
      if (i > 0) {
        text += " | ";
      }
      text += highlight_query.empty() ? entry.texts[i].second
                                      : highlight(entry.texts[i].second, highlight_query);
    }
    if (entry.texts.size() > shown) {
      text += " (+" + std::to_string(entry.texts.size() - shown) + " more chunks)";
    }
    entry.group.text = std::move(text);
    groups.push_back(std::move(entry.group));
  }

  std::stable_sort(groups.begin(), groups.end(), [](const SourceGroup& a, const SourceGroup& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.chunk_count > b.chunk_count;
  });
  return groups;
}

DisplayPartition ResultConsolidator::partition_for_display(std::vector<SourceGroup> groups,
                                                           size_t always_shown) {
  DisplayPartition partition;
  const size_t split = std::min(always_shown, groups.size());
  partition.shown.assign(std::make_move_iterator(groups.begin()),
                         std::make_move_iterator(groups.begin() + split));
  partition.expandable.assign(std::make_move_iterator(groups.begin() + split),
                              std::make_move_iterator(groups.end()));
  return partition;
}

std::string ResultConsolidator::highlight(const std::string& text,
                                          const std::string& query,
                                          const std::string& open,
                                          const std::string& close) {
  const std::vector<std::string> tokens = highlight_tokens(query);
  if (tokens.empty()) {
    return text;
  }

  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    const std::string* match = nullptr;
    for (const auto& token : tokens) {
      if (matches_at(text, pos, token)) {
        match = &token;
        break;
      }
    }
    if (match) {
      out += open;
      out.append(text, pos, match->size());
      out += close;
      pos += match->size();
    } else {
      out += text[pos];
      ++pos;
    }
  }
  return out;
}

}  // namespace recall_core
