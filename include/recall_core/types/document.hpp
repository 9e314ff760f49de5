#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/types/source.hpp"

namespace recall_core {

struct DocumentPage {
  std::string text;
  std::optional<int> page_number;
};

// Already-extracted document text handed to the ingestion pipeline.
struct IngestionRequest {
  std::string owner_id;
  std::string document_id;
  DocumentSource source;
  std::vector<DocumentPage> pages;
};

// Wire form: {owner_id, document_id, source: {type, ...}, pages: [{text, page_number?}]}
nlohmann::json to_json(const IngestionRequest& request);
IngestionRequest ingestion_request_from_json(const nlohmann::json& json);

}  // namespace recall_core
