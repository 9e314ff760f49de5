#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/types/chunk.hpp"

namespace recall_core {

// All hits of one origin, collapsed into a single displayable entry.
struct SourceGroup {
  std::string display_name;
  // The two best chunk texts joined by " | ", plus " (+N more chunks)".
  std::string text;
  int chunk_count = 0;
  float score = 0.0f;
  std::optional<std::string> url;
  std::vector<std::string> chunk_ids;
};

struct DisplayPartition {
  std::vector<SourceGroup> shown;
  std::vector<SourceGroup> expandable;
};

/**
 * @brief Groups ranked chunk hits by origin and orders the groups.
 *
 * A hit's origin is its source_link when present, else its document_id, else
 * the hit itself. Group score is the best contributing score. Groups are
 * ordered by score, then by chunk_count, then by first appearance.
 */
class ResultConsolidator {
 public:
  static constexpr size_t kAlwaysShown = 2;

  // A non-empty highlight_query marks its words in each representative chunk
  // text before the texts are joined.
  std::vector<SourceGroup> consolidate(const std::vector<ChunkHit>& hits,
                                       const std::string& highlight_query = "") const;

  static DisplayPartition partition_for_display(std::vector<SourceGroup> groups,
                                                size_t always_shown = kAlwaysShown);

  // Wraps case-insensitive occurrences of the query's words in open/close.
  static std::string highlight(const std::string& text,
                               const std::string& query,
                               const std::string& open = "**",
                               const std::string& close = "**");

  static std::string source_identity(const ChunkHit& hit, size_t position);
  static std::string display_name_for(const Chunk& chunk);
};

}  // namespace recall_core
