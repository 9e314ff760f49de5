#pragma once

#include <memory>
#include <string>
#include <vector>

#include "recall_core/types/chunk.hpp"

namespace recall_core {
class ChunkStore;
}

namespace recall_core {

class DocumentService {
 public:
  explicit DocumentService(std::shared_ptr<ChunkStore> store);

  std::vector<DocumentSummary> list_documents(const std::string& owner_id);

  // Returns the number of chunks removed.
  int delete_document(const std::string& owner_id, const std::string& document_id);
  int delete_owner(const std::string& owner_id);

 private:
  std::shared_ptr<ChunkStore> store_;
};

}  // namespace recall_core
