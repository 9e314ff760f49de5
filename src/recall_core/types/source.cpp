#include "recall_core/types/source.hpp"

namespace recall_core {

namespace {
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}  // namespace

SourceType source_type_of(const DocumentSource& source) {
  return std::visit(overloaded{[](const UploadedFileSource&) { return SourceType::UploadedFile; },
                               [](const SyncedPageSource&) { return SourceType::SyncedPage; },
                               [](const PlainTextSource&) { return SourceType::PlainText; }},
                    source);
}

std::optional<std::string> source_link_for(const DocumentSource& source,
                                           std::optional<int> page_number) {
  return std::visit(
      overloaded{[&](const UploadedFileSource& file) -> std::optional<std::string> {
                   if (file.file_url.empty()) {
                     return std::nullopt;
                   }
                   if (page_number) {
                     return file.file_url + "#page=" + std::to_string(*page_number);
                   }
                   return file.file_url;
                 },
                 [](const SyncedPageSource& page) -> std::optional<std::string> {
                   if (page.page_url.empty()) {
                     return std::nullopt;
                   }
                   return page.page_url;
                 },
                 [](const PlainTextSource&) -> std::optional<std::string> { return std::nullopt; }},
      source);
}

std::string source_title_of(const DocumentSource& source) {
  return std::visit(overloaded{[](const UploadedFileSource& file) { return file.file_name; },
                               [](const SyncedPageSource& page) { return page.title; },
                               [](const PlainTextSource& text) { return text.label; }},
                    source);
}

}  // namespace recall_core
