#include "recall_core/db/chunk_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include "recall_core/db/pooled_connection.hpp"
#include "recall_core/db/sqlite_error_utils.hpp"
#include "recall_core/db/transaction.hpp"
#include "recall_core/services/compression_service.hpp"
#include "recall_core/utils/hashing.hpp"

namespace recall_core {

namespace {

// Extra neighbours fetched past top_k so equal scores at the cut can be re-ordered by recency;
// widened further while the last one still ties the cut-off.
constexpr int kTieSlack = 16;

constexpr const char *kMetadataColumns =
    "id, chunk_id, owner_id, document_id, source_type, source_link, source_title, page_number, "
    "section_title, embedding, embedding_degraded, chunk_index, chunk_size, created_at, "
    "updated_at";

std::vector<float> blob_to_floats(const std::vector<char> &blob) {
  std::vector<float> vec(blob.size() / sizeof(float));
  std::memcpy(vec.data(), blob.data(), vec.size() * sizeof(float));
  return vec;
}

Chunk make_chunk(std::string chunk_id,
                 std::string owner_id,
                 std::string document_id,
                 const std::string &source_type,
                 std::optional<std::string> source_link,
                 std::string source_title,
                 std::optional<int> page_number,
                 std::string section_title,
                 const std::vector<char> &embedding,
                 int degraded,
                 int chunk_index,
                 int chunk_size,
                 int64_t created_at,
                 int64_t updated_at) {
  Chunk chunk;
  chunk.chunk_id = std::move(chunk_id);
  chunk.owner_id = std::move(owner_id);
  chunk.document_id = std::move(document_id);
  chunk.source_type = source_type_from_string(source_type);
  chunk.source_link = std::move(source_link);
  chunk.source_title = std::move(source_title);
  chunk.page_number = page_number;
  chunk.section_title = std::move(section_title);
  chunk.embedding = blob_to_floats(embedding);
  chunk.embedding_degraded = degraded != 0;
  chunk.chunk_index = chunk_index;
  chunk.chunk_size = chunk_size;
  chunk.created_at = created_at;
  chunk.updated_at = updated_at;
  return chunk;
}

// Row reader for queries selecting kMetadataColumns followed by content.
auto full_row_reader(std::vector<Chunk> &out) {
  return [&out](int64_t /*id*/, std::string chunk_id, std::string owner_id,
                std::string document_id, std::string source_type,
                std::optional<std::string> source_link, std::string source_title,
                std::optional<int> page_number, std::string section_title,
                std::vector<char> embedding, int degraded, int chunk_index, int chunk_size,
                int64_t created_at, int64_t updated_at, std::vector<char> content) {
    Chunk chunk = make_chunk(std::move(chunk_id), std::move(owner_id), std::move(document_id),
                             source_type, std::move(source_link), std::move(source_title),
                             page_number, std::move(section_title), embedding, degraded,
                             chunk_index, chunk_size, created_at, updated_at);
    chunk.text = CompressionService::decompress(content);
    out.push_back(std::move(chunk));
  };
}

std::string join_ids(const std::vector<int64_t> &ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace

ChunkStore::ChunkStore(DatabaseManager &db_manager, int dimension)
    : db_manager_(db_manager), dimension_(dimension) {
  if (dimension <= 0) {
    throw std::invalid_argument("ChunkStore dimension must be greater than 0");
  }
}

int64_t ChunkStore::now_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::vector<char> ChunkStore::vector_to_blob(const std::vector<float> &vec) {
  std::vector<char> blob(vec.size() * sizeof(float));
  std::memcpy(blob.data(), vec.data(), blob.size());
  return blob;
}

void ChunkStore::validate_batch(const std::string &owner_id, std::vector<Chunk> &chunks) const {
  if (owner_id.empty()) {
    throw InvalidChunkError("owner_id must not be empty");
  }
  for (auto &chunk : chunks) {
    if (chunk.owner_id != owner_id) {
      throw OwnerIsolationViolation("Chunk for owner '" + chunk.owner_id +
                                    "' submitted in a batch for owner '" + owner_id + "'");
    }
    if (chunk.document_id.empty()) {
      throw InvalidChunkError("Chunk " + std::to_string(chunk.chunk_index) +
                              " has no document_id");
    }
    if (chunk.text.empty()) {
      throw InvalidChunkError("Chunk " + std::to_string(chunk.chunk_index) + " of document '" +
                              chunk.document_id + "' has empty text");
    }
    if (chunk.embedding.size() != static_cast<size_t>(dimension_)) {
      throw InvalidChunkError("Vector embedding size mismatch for chunk " +
                              std::to_string(chunk.chunk_index) + " of document '" +
                              chunk.document_id + "'. Expected " + std::to_string(dimension_) +
                              " dimensions, got " + std::to_string(chunk.embedding.size()) + ".");
    }
    if (chunk.chunk_id.empty()) {
      chunk.chunk_id = make_chunk_id(owner_id, chunk.document_id, chunk.chunk_index);
    }
    chunk.chunk_size = static_cast<int>(chunk.text.size());
  }
}

UpsertStats ChunkStore::upsert(const std::string &owner_id, std::vector<Chunk> chunks) {
  validate_batch(owner_id, chunks);
  UpsertStats stats;
  if (chunks.empty()) {
    return stats;
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);
    const int64_t now = now_millis();

    for (const auto &chunk : chunks) {
      std::optional<std::string> existing_owner;
      *conn << "SELECT owner_id FROM chunks WHERE chunk_id = ?" << chunk.chunk_id >>
          [&](std::string owner) { existing_owner = std::move(owner); };
      if (existing_owner && *existing_owner != owner_id) {
        throw OwnerIsolationViolation("chunk_id " + chunk.chunk_id +
                                      " already belongs to another owner");
      }

      std::vector<char> content = CompressionService::compress(chunk.text);
      std::vector<char> embedding = vector_to_blob(chunk.embedding);
      *conn << R"(
          INSERT INTO chunks (chunk_id, owner_id, document_id, content, source_type, source_link,
                              source_title, page_number, section_title, embedding,
                              embedding_degraded, chunk_index, chunk_size, created_at, updated_at)
          VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
          ON CONFLICT(chunk_id) DO UPDATE SET
              document_id = excluded.document_id,
              content = excluded.content,
              source_type = excluded.source_type,
              source_link = excluded.source_link,
              source_title = excluded.source_title,
              page_number = excluded.page_number,
              section_title = excluded.section_title,
              embedding = excluded.embedding,
              embedding_degraded = excluded.embedding_degraded,
              chunk_index = excluded.chunk_index,
              chunk_size = excluded.chunk_size,
              updated_at = MAX(excluded.updated_at, chunks.updated_at + 1)
          WHERE chunks.owner_id = excluded.owner_id
        )" << chunk.chunk_id
            << owner_id << chunk.document_id << content << to_string(chunk.source_type)
            << chunk.source_link << chunk.source_title << chunk.page_number << chunk.section_title
            << embedding << (chunk.embedding_degraded ? 1 : 0) << chunk.chunk_index
            << chunk.chunk_size << now << now;

      if (conn->rows_modified() == 0) {
        throw OwnerIsolationViolation("chunk_id " + chunk.chunk_id +
                                      " already belongs to another owner");
      }
      if (existing_owner) {
        ++stats.updated;
      } else {
        ++stats.inserted;
      }
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("upsert_chunks", e));
  }
  return stats;
}

bool ChunkStore::has_owner_index() {
  try {
    PooledConnection conn(db_manager_);
    int count = 0;
    *conn << "SELECT count(*) FROM sqlite_master WHERE type = 'index' AND tbl_name = 'chunks' "
             "AND name = 'idx_chunks_owner'" >>
        count;
    return count > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("has_owner_index", e));
  }
}

std::vector<ChunkStore::Candidate> ChunkStore::load_candidates(const std::string &owner_id,
                                                               const ChunkFilter &filter,
                                                               bool owner_indexed) {
  std::string sql = std::string("SELECT ") + kMetadataColumns + " FROM chunks";
  std::vector<std::string> clauses;
  if (owner_indexed)
    clauses.push_back("owner_id = ?");
  if (filter.document_id)
    clauses.push_back("document_id = ?");
  if (filter.source_type)
    clauses.push_back("source_type = ?");
  if (filter.page_number)
    clauses.push_back("page_number = ?");
  for (size_t i = 0; i < clauses.size(); ++i) {
    sql += (i == 0 ? " WHERE " : " AND ") + clauses[i];
  }
  // Newest first, so equal scores keep the most recent chunks.
  sql += " ORDER BY created_at DESC, id ASC";

  std::vector<Candidate> candidates;
  PooledConnection conn(db_manager_);
  auto query = *conn << sql;
  if (owner_indexed)
    query << owner_id;
  if (filter.document_id)
    query << *filter.document_id;
  if (filter.source_type)
    query << to_string(*filter.source_type);
  if (filter.page_number)
    query << *filter.page_number;

  query >> [&](int64_t id, std::string chunk_id, std::string row_owner, std::string document_id,
               std::string source_type, std::optional<std::string> source_link,
               std::string source_title, std::optional<int> page_number,
               std::string section_title, std::vector<char> embedding, int degraded,
               int chunk_index, int chunk_size, int64_t created_at, int64_t updated_at) {
    if (row_owner != owner_id) {
      return;
    }
    if (embedding.size() != static_cast<size_t>(dimension_) * sizeof(float)) {
      std::cerr << "Warning: Skipping chunk " << chunk_id
                << " during search due to mismatched vector dimension. Expected "
                << dimension_ * sizeof(float) << " bytes, got " << embedding.size() << " bytes."
                << std::endl;
      return;
    }
    candidates.push_back(
        {id, make_chunk(std::move(chunk_id), std::move(row_owner), std::move(document_id),
                        source_type, std::move(source_link), std::move(source_title),
                        page_number, std::move(section_title), embedding, degraded, chunk_index,
                        chunk_size, created_at, updated_at)});
  };
  return candidates;
}

std::vector<ChunkHit> ChunkStore::search(const std::string &owner_id,
                                         const std::vector<float> &query_vector,
                                         int top_k,
                                         const ChunkFilter &filter) {
  if (top_k <= 0) {
    return {};
  }
  if (query_vector.size() != static_cast<size_t>(dimension_)) {
    throw InvalidChunkError("Query vector dimension mismatch. Expected " +
                            std::to_string(dimension_) + ", got " +
                            std::to_string(query_vector.size()));
  }

  std::vector<Candidate> candidates;
  try {
    const bool indexed = has_owner_index();
    if (!indexed) {
      full_scan_count_.fetch_add(1);
      std::cerr << "Warning: StoreIndexMissing: idx_chunks_owner not found, "
                << "falling back to a full scan filtered by owner." << std::endl;
    }
    candidates = load_candidates(owner_id, filter, indexed);
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("search_chunks", e));
  }
  if (candidates.empty()) {
    return {};
  }

  const auto n = static_cast<faiss::idx_t>(candidates.size());
  std::vector<float> flat;
  flat.reserve(candidates.size() * dimension_);
  for (const auto &candidate : candidates) {
    flat.insert(flat.end(), candidate.chunk.embedding.begin(), candidate.chunk.embedding.end());
  }
  faiss::fvec_renorm_L2(dimension_, candidates.size(), flat.data());

  std::vector<float> query(query_vector);
  faiss::fvec_renorm_L2(dimension_, 1, query.data());

  faiss::IndexFlatIP index(dimension_);
  index.add(n, flat.data());

  faiss::idx_t k = std::min<faiss::idx_t>(n, static_cast<faiss::idx_t>(top_k) + kTieSlack);
  std::vector<float> scores;
  std::vector<faiss::idx_t> labels;
  while (true) {
    scores.assign(k, 0.0f);
    labels.assign(k, -1);
    index.search(1, query.data(), k, scores.data(), labels.data());
    const faiss::idx_t cut = std::min<faiss::idx_t>(k, top_k) - 1;
    // Widen until the last neighbour scores strictly below the cut-off.
    if (k == n || labels[k - 1] < 0 || scores[k - 1] < scores[cut]) {
      break;
    }
    k = std::min<faiss::idx_t>(n, k * 2);
  }

  std::vector<std::pair<size_t, float>> ranked;
  ranked.reserve(k);
  for (faiss::idx_t i = 0; i < k; ++i) {
    if (labels[i] >= 0) {
      ranked.emplace_back(static_cast<size_t>(labels[i]), scores[i]);
    }
  }
  std::stable_sort(ranked.begin(), ranked.end(), [&](const auto &a, const auto &b) {
    if (a.second != b.second) {
      return a.second > b.second;
    }
    const Chunk &ca = candidates[a.first].chunk;
    const Chunk &cb = candidates[b.first].chunk;
    if (ca.created_at != cb.created_at) {
      return ca.created_at > cb.created_at;
    }
    return candidates[a.first].row_id < candidates[b.first].row_id;
  });
  if (ranked.size() > static_cast<size_t>(top_k)) {
    ranked.resize(top_k);
  }

  std::vector<ChunkHit> hits;
  std::vector<int64_t> row_ids;
  hits.reserve(ranked.size());
  row_ids.reserve(ranked.size());
  for (const auto &[position, score] : ranked) {
    row_ids.push_back(candidates[position].row_id);
    hits.push_back({std::move(candidates[position].chunk), score});
  }
  fill_text(hits, row_ids);
  return hits;
}

void ChunkStore::fill_text(std::vector<ChunkHit> &hits, const std::vector<int64_t> &row_ids) {
  if (hits.empty()) {
    return;
  }
  std::unordered_map<int64_t, std::vector<char>> content_by_id;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, content FROM chunks WHERE id IN (" + join_ids(row_ids) + ")" >>
        [&](int64_t id, std::vector<char> content) { content_by_id[id] = std::move(content); };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("fill_chunk_text", e));
  }

  std::vector<ChunkHit> filled;
  filled.reserve(hits.size());
  for (size_t i = 0; i < hits.size(); ++i) {
    auto it = content_by_id.find(row_ids[i]);
    if (it == content_by_id.end()) {
      std::cerr << "Warning: chunk " << hits[i].chunk.chunk_id
                << " was removed while the search was running." << std::endl;
      continue;
    }
    hits[i].chunk.text = CompressionService::decompress(it->second);
    filled.push_back(std::move(hits[i]));
  }
  hits = std::move(filled);
}

int ChunkStore::delete_by_document(const std::string &owner_id, const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM chunks WHERE owner_id = ? AND document_id = ?" << owner_id
          << document_id;
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("delete_by_document", e));
  }
}

int ChunkStore::delete_stale_chunks(const std::string &owner_id,
                                    const std::string &document_id,
                                    int keep_below_index) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM chunks WHERE owner_id = ? AND document_id = ? AND chunk_index >= ?"
          << owner_id << document_id << keep_below_index;
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("delete_stale_chunks", e));
  }
}

int ChunkStore::delete_by_owner(const std::string &owner_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM chunks WHERE owner_id = ?" << owner_id;
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("delete_by_owner", e));
  }
}

std::optional<Chunk> ChunkStore::get_chunk(const std::string &owner_id,
                                           const std::string &chunk_id) {
  std::vector<Chunk> rows;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + kMetadataColumns +
                 ", content FROM chunks WHERE owner_id = ? AND chunk_id = ?"
          << owner_id << chunk_id >>
        full_row_reader(rows);
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("get_chunk", e));
  }
  if (rows.empty()) {
    return std::nullopt;
  }
  return std::move(rows.front());
}

int ChunkStore::count_chunks(const std::string &owner_id,
                             const std::optional<std::string> &document_id) {
  try {
    PooledConnection conn(db_manager_);
    int count = 0;
    if (document_id) {
      *conn << "SELECT count(*) FROM chunks WHERE owner_id = ? AND document_id = ?" << owner_id
            << *document_id >>
          count;
    } else {
      *conn << "SELECT count(*) FROM chunks WHERE owner_id = ?" << owner_id >> count;
    }
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("count_chunks", e));
  }
}

std::vector<DocumentSummary> ChunkStore::list_documents(const std::string &owner_id) {
  std::vector<DocumentSummary> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT document_id, MAX(source_title), MAX(source_type), COUNT(*), MAX(updated_at) "
             "FROM chunks WHERE owner_id = ? GROUP BY document_id ORDER BY document_id"
          << owner_id >>
        [&](std::string document_id, std::string source_title, std::string source_type,
            int chunk_count, int64_t updated_at) {
          DocumentSummary summary;
          summary.document_id = std::move(document_id);
          summary.source_title = std::move(source_title);
          summary.source_type = source_type_from_string(source_type);
          summary.chunk_count = chunk_count;
          summary.updated_at = updated_at;
          documents.push_back(std::move(summary));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("list_documents", e));
  }
  return documents;
}

std::vector<Chunk> ChunkStore::list_degraded_chunks(const std::string &owner_id, int limit) {
  std::vector<Chunk> rows;
  if (limit <= 0) {
    return rows;
  }
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + kMetadataColumns +
                 ", content FROM chunks WHERE owner_id = ? AND embedding_degraded = 1 "
                 "ORDER BY document_id, chunk_index LIMIT ?"
          << owner_id << limit >>
        full_row_reader(rows);
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("list_degraded_chunks", e));
  }
  return rows;
}

int ChunkStore::count_degraded_chunks(const std::string &owner_id) {
  try {
    PooledConnection conn(db_manager_);
    int count = 0;
    *conn << "SELECT count(*) FROM chunks WHERE owner_id = ? AND embedding_degraded = 1"
          << owner_id >>
        count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("count_degraded_chunks", e));
  }
}

bool ChunkStore::update_embedding(const std::string &owner_id,
                                  const std::string &chunk_id,
                                  const std::vector<float> &embedding,
                                  bool degraded) {
  if (embedding.size() != static_cast<size_t>(dimension_)) {
    throw InvalidChunkError("Vector embedding size mismatch for chunk " + chunk_id +
                            ". Expected " + std::to_string(dimension_) + " dimensions, got " +
                            std::to_string(embedding.size()) + ".");
  }
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE chunks SET embedding = ?, embedding_degraded = ?, "
             "updated_at = MAX(?, updated_at + 1) WHERE owner_id = ? AND chunk_id = ?"
          << vector_to_blob(embedding) << (degraded ? 1 : 0) << now_millis() << owner_id
          << chunk_id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("update_embedding", e));
  }
}

}  // namespace recall_core
