#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/retrieval/result_consolidator.hpp"
#include "recall_core/retrieval/retriever.hpp"

namespace recall_core {

class SearchServiceException : public std::exception {
 public:
  explicit SearchServiceException(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct SearchResponse {
  std::vector<SourceGroup> results;
  size_t always_shown = ResultConsolidator::kAlwaysShown;
  size_t total = 0;
};

// Query entry point: retrieve chunks, collapse them per source, optionally highlight.
class SearchService {
 public:
  SearchService(std::shared_ptr<Retriever> retriever, int default_top_k);

  SearchResponse search(const std::string& owner_id,
                        const std::string& query,
                        std::optional<int> top_k = std::nullopt,
                        bool highlight = false,
                        const ChunkFilter& filter = {});

 private:
  std::shared_ptr<Retriever> retriever_;
  ResultConsolidator consolidator_;
  int default_top_k_;
};

}  // namespace recall_core
