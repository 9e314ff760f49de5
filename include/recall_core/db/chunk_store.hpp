#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "recall_core/db/database_manager.hpp"
#include "recall_core/types/chunk.hpp"

namespace recall_core {

class ChunkStoreError : public std::exception {
 public:
  explicit ChunkStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A write or read tried to cross the owner boundary. Indicates a caller bug.
class OwnerIsolationViolation : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// Rejected before any write: empty text, wrong embedding length, missing ids.
class InvalidChunkError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

struct UpsertStats {
  int inserted = 0;
  int updated = 0;
};

/**
 * @brief Owner-scoped persistent store of chunks and their embeddings.
 *
 * Chunks live in the encrypted SQLite database; similarity search loads the
 * owner's vectors into a temporary FAISS inner-product index over
 * L2-normalized vectors, which yields cosine similarity.
 */
class ChunkStore {
 public:
  ChunkStore(DatabaseManager &db_manager, int dimension);

  ChunkStore(const ChunkStore &) = delete;
  ChunkStore &operator=(const ChunkStore &) = delete;

  /**
   * Inserts or replaces chunks keyed by chunk_id inside one transaction.
   * Empty chunk_ids are derived from (owner, document, chunk_index).
   * Re-upserting keeps created_at and strictly advances updated_at.
   *
   * @throws InvalidChunkError if any chunk fails validation; nothing is written.
   * @throws OwnerIsolationViolation if a chunk names another owner or its
   *         chunk_id already belongs to one; the whole batch is rolled back.
   * @throws ChunkStoreError on database failure.
   */
  UpsertStats upsert(const std::string &owner_id, std::vector<Chunk> chunks);

  /**
   * Top-k chunks of one owner by cosine similarity, best first. Equal scores
   * are ordered by newer created_at.
   */
  std::vector<ChunkHit> search(const std::string &owner_id,
                               const std::vector<float> &query_vector,
                               int top_k,
                               const ChunkFilter &filter = {});

  int delete_by_document(const std::string &owner_id, const std::string &document_id);
  // Removes chunks with chunk_index >= keep_below_index left over from a longer earlier version.
  int delete_stale_chunks(const std::string &owner_id,
                          const std::string &document_id,
                          int keep_below_index);
  int delete_by_owner(const std::string &owner_id);

  std::optional<Chunk> get_chunk(const std::string &owner_id, const std::string &chunk_id);
  int count_chunks(const std::string &owner_id,
                   const std::optional<std::string> &document_id = std::nullopt);
  std::vector<DocumentSummary> list_documents(const std::string &owner_id);

  std::vector<Chunk> list_degraded_chunks(const std::string &owner_id, int limit);
  int count_degraded_chunks(const std::string &owner_id);
  bool update_embedding(const std::string &owner_id,
                        const std::string &chunk_id,
                        const std::vector<float> &embedding,
                        bool degraded);

  bool has_owner_index();
  uint64_t full_scan_count() const {
    return full_scan_count_.load();
  }
  int dimension() const {
    return dimension_;
  }

  static int64_t now_millis();

 private:
  struct Candidate {
    int64_t row_id;
    Chunk chunk;
  };

  void validate_batch(const std::string &owner_id, std::vector<Chunk> &chunks) const;
  std::vector<Candidate> load_candidates(const std::string &owner_id,
                                         const ChunkFilter &filter,
                                         bool owner_indexed);
  void fill_text(std::vector<ChunkHit> &hits, const std::vector<int64_t> &row_ids);
  static std::vector<char> vector_to_blob(const std::vector<float> &vec);

  DatabaseManager &db_manager_;
  int dimension_;
  std::atomic<uint64_t> full_scan_count_{0};
};

}  // namespace recall_core
