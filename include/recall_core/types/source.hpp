#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace recall_core {

enum class SourceType { UploadedFile, SyncedPage, PlainText };

inline std::string to_string(SourceType type) {
  switch (type) {
    case SourceType::UploadedFile:
      return "uploaded_file";
    case SourceType::SyncedPage:
      return "synced_page";
    case SourceType::PlainText:
      return "plain_text";
  }
  return "unknown";
}

inline SourceType source_type_from_string(const std::string& str) {
  if (str == "uploaded_file")
    return SourceType::UploadedFile;
  if (str == "synced_page")
    return SourceType::SyncedPage;
  if (str == "plain_text")
    return SourceType::PlainText;
  throw std::invalid_argument("Unknown SourceType: " + str);
}

struct UploadedFileSource {
  std::string file_name;
  std::string file_url;
};

struct SyncedPageSource {
  std::string page_id;
  std::string page_url;
  std::string title;
};

struct PlainTextSource {
  std::string label;
};

// Where a document came from. Each alternative carries only its own fields.
using DocumentSource = std::variant<UploadedFileSource, SyncedPageSource, PlainTextSource>;

SourceType source_type_of(const DocumentSource& source);

// Deep link for a chunk of this source. Uploaded files get a "#page=N" fragment
// when the chunk came from a paginated origin.
std::optional<std::string> source_link_for(const DocumentSource& source,
                                           std::optional<int> page_number);

std::string source_title_of(const DocumentSource& source);

}  // namespace recall_core
