#include "recall_core/types/document.hpp"

#include <stdexcept>

namespace recall_core {

namespace {

nlohmann::json source_to_json(const DocumentSource& source) {
  nlohmann::json json;
  json["type"] = to_string(source_type_of(source));
  if (const auto* file = std::get_if<UploadedFileSource>(&source)) {
    json["file_name"] = file->file_name;
    json["file_url"] = file->file_url;
  } else if (const auto* page = std::get_if<SyncedPageSource>(&source)) {
    json["page_id"] = page->page_id;
    json["page_url"] = page->page_url;
    json["title"] = page->title;
  } else if (const auto* text = std::get_if<PlainTextSource>(&source)) {
    json["label"] = text->label;
  }
  return json;
}

DocumentSource source_from_json(const nlohmann::json& json) {
  if (!json.is_object() || !json.contains("type")) {
    throw std::invalid_argument("source must be an object with a 'type' field");
  }
  SourceType type = source_type_from_string(json.at("type").get<std::string>());
  switch (type) {
    case SourceType::UploadedFile:
      return UploadedFileSource{json.value("file_name", std::string()),
                                json.value("file_url", std::string())};
    case SourceType::SyncedPage:
      return SyncedPageSource{json.value("page_id", std::string()),
                              json.value("page_url", std::string()),
                              json.value("title", std::string())};
    case SourceType::PlainText:
      return PlainTextSource{json.value("label", std::string())};
  }
  throw std::invalid_argument("Unhandled source type");
}

}  // namespace

nlohmann::json to_json(const IngestionRequest& request) {
  nlohmann::json json;
  json["owner_id"] = request.owner_id;
  json["document_id"] = request.document_id;
  json["source"] = source_to_json(request.source);
  json["pages"] = nlohmann::json::array();
  for (const auto& page : request.pages) {
    nlohmann::json page_json;
    page_json["text"] = page.text;
    if (page.page_number) {
      page_json["page_number"] = *page.page_number;
    }
    json["pages"].push_back(page_json);
  }
  return json;
}

IngestionRequest ingestion_request_from_json(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::invalid_argument("ingestion request must be a JSON object");
  }
  IngestionRequest request;
  request.owner_id = json.value("owner_id", std::string());
  request.document_id = json.value("document_id", std::string());
  if (request.owner_id.empty()) {
    throw std::invalid_argument("owner_id is required");
  }
  if (request.document_id.empty()) {
    throw std::invalid_argument("document_id is required");
  }
  if (json.contains("source")) {
    request.source = source_from_json(json.at("source"));
  } else {
    request.source = PlainTextSource{request.document_id};
  }
  if (json.contains("pages")) {
    const auto& pages = json.at("pages");
    if (!pages.is_array()) {
      throw std::invalid_argument("pages must be an array");
    }
    for (const auto& page_json : pages) {
      DocumentPage page;
      page.text = page_json.value("text", std::string());
      if (page_json.contains("page_number") && !page_json.at("page_number").is_null()) {
        page.page_number = page_json.at("page_number").get<int>();
      }
      request.pages.push_back(std::move(page));
    }
  }
  return request;
}

}  // namespace recall_core
