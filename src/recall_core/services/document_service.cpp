#include "recall_core/services/document_service.hpp"

#include <iostream>
#include <stdexcept>

#include "recall_core/db/chunk_store.hpp"

namespace recall_core {

DocumentService::DocumentService(std::shared_ptr<ChunkStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("DocumentService requires a ChunkStore.");
  }
}

std::vector<DocumentSummary> DocumentService::list_documents(const std::string& owner_id) {
  return store_->list_documents(owner_id);
}

int DocumentService::delete_document(const std::string& owner_id,
                                     const std::string& document_id) {
  int removed = store_->delete_by_document(owner_id, document_id);
  std::cout << "Deleted " << removed << " chunks of document '" << document_id << "'."
            << std::endl;
  return removed;
}

int DocumentService::delete_owner(const std::string& owner_id) {
  int removed = store_->delete_by_owner(owner_id);
  std::cout << "Deleted " << removed << " chunks of owner '" << owner_id << "'." << std::endl;
  return removed;
}

}  // namespace recall_core
