#include "recall_core/async/ingest_document_task.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "recall_core/async/service_provider.hpp"
#include "recall_core/db/chunk_store.hpp"
#include "recall_core/embedding/embedding_generator.hpp"
#include "recall_core/text/text_normalizer.hpp"
#include "recall_core/utils/hashing.hpp"

namespace recall_core {

nlohmann::json IngestionSummary::to_json() const {
  nlohmann::json json;
  json["total_pages"] = total_pages;
  json["processed_pages"] = processed_pages;
  json["total_chunks"] = total_chunks;
  json["stored_chunks"] = stored_chunks;
  json["degraded_chunks"] = degraded_chunks;
  json["warnings"] = warnings;
  json["page_errors"] = nlohmann::json::array();
  for (const auto& page_error : page_errors) {
    json["page_errors"].push_back({{"page", page_error.page}, {"error", page_error.error}});
  }
  return json;
}

IngestDocumentTask::IngestDocumentTask(long long id,
                                       JobStatus status,
                                       std::chrono::system_clock::time_point created_at,
                                       std::chrono::system_clock::time_point updated_at,
                                       IngestionRequest request)
    : ITask(id, status, created_at, updated_at), request_(std::move(request)) {}

int IngestDocumentTask::display_page(size_t page_index) const {
  const auto& page = request_.pages[page_index];
  return page.page_number.value_or(static_cast<int>(page_index) + 1);
}

IngestDocumentTask::PageOutcome IngestDocumentTask::process_page(
    size_t page_index,
    const TextNormalizer& normalizer,
    const BoundaryChunker& chunker,
    const IngestionSettings& settings) const {
  PageOutcome outcome;
  const auto& page = request_.pages[page_index];
  if (page.text.size() > settings.max_page_chars) {
    outcome.error = "DocumentTooLarge: page has " + std::to_string(page.text.size()) +
                    " characters, limit is " + std::to_string(settings.max_page_chars);
    return outcome;
  }

  try {
    NormalizationResult normalized = normalizer.normalize_with_status(page.text);
    if (normalized.degraded) {
      outcome.normalization_warning =
          "NormalizationDegraded: page " + std::to_string(display_page(page_index));
    }
    outcome.chunks =
        chunker.chunk(normalized.text, settings.max_chunk_size, settings.chunk_overlap);
    outcome.processed = true;
  } catch (const std::exception& e) {
    outcome.chunks.clear();
    outcome.error = e.what();
  }
  return outcome;
}

std::vector<IngestDocumentTask::PageOutcome> IngestDocumentTask::process_pages(
    ServiceProvider& services,
    const CancellationCheck& is_cancelled,
    bool& cancelled) const {
  const auto& settings = services.get_settings();
  const TextNormalizer& normalizer = services.get_text_normalizer();
  const BoundaryChunker& chunker = services.get_chunker();

  std::vector<PageOutcome> outcomes(request_.pages.size());
  std::atomic<size_t> next_page{0};
  std::atomic<bool> stop{false};
  std::mutex error_mutex;
  std::exception_ptr first_error;

  auto page_worker = [&]() {
    try {
      while (!stop.load()) {
        const size_t index = next_page.fetch_add(1);
        if (index >= outcomes.size()) {
          return;
        }
        if (is_cancelled && is_cancelled()) {
          stop.store(true);
          return;
        }
        outcomes[index] = process_page(index, normalizer, chunker, settings);
      }
    } catch (const std::exception&) {
      stop.store(true);
      std::lock_guard<std::mutex> lock(error_mutex);
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  };

  const size_t thread_count = std::min<size_t>(
      outcomes.size(), static_cast<size_t>(std::max(1, settings.page_parallelism)));
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    threads.emplace_back(page_worker);
  }
  for (auto& thread : threads) {
    thread.join();
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }

  cancelled = stop.load();
  return outcomes;
}

std::vector<Chunk> IngestDocumentTask::assemble_chunks(
    const std::vector<PageOutcome>& outcomes) const {
  const SourceType source_type = source_type_of(request_.source);
  const std::string source_title = source_title_of(request_.source);

  std::vector<Chunk> chunks;
  int next_index = 0;
  for (size_t page_index = 0; page_index < outcomes.size(); ++page_index) {
    const auto& page = request_.pages[page_index];
    for (const auto& piece : outcomes[page_index].chunks) {
      Chunk chunk;
      chunk.owner_id = request_.owner_id;
      chunk.document_id = request_.document_id;
      chunk.chunk_index = next_index++;
      chunk.chunk_id = make_chunk_id(chunk.owner_id, chunk.document_id, chunk.chunk_index);
      chunk.text = piece.text;
      chunk.chunk_size = static_cast<int>(piece.text.size());
      chunk.section_title = piece.section_title;
      chunk.source_type = source_type;
      chunk.source_title = source_title;
      chunk.page_number = page.page_number;
      chunk.source_link = source_link_for(request_.source, page.page_number);
      chunks.push_back(std::move(chunk));
    }
  }
  return chunks;
}

nlohmann::json IngestDocumentTask::execute(ServiceProvider& services,
                                           const ProgressUpdater& on_progress,
                                           const CancellationCheck& is_cancelled) {
  IngestionSummary summary;
  summary.total_pages = static_cast<int>(request_.pages.size());
  auto counters = [&summary]() {
    return JobCounters{summary.total_pages, summary.processed_pages, summary.total_chunks,
                       summary.stored_chunks};
  };
  auto report = [&](float percent, const std::string& message) {
    if (on_progress) {
      on_progress(percent, message, counters());
    }
  };

  report(0.0f, "Starting ingestion...");

  // 1. Normalize and chunk pages on the bounded page executor.
  bool cancelled = false;
  std::vector<PageOutcome> outcomes = process_pages(services, is_cancelled, cancelled);
  for (size_t i = 0; i < outcomes.size(); ++i) {
    const auto& outcome = outcomes[i];
    if (outcome.error) {
      summary.page_errors.push_back({display_page(i), *outcome.error});
      std::cerr << "Warning: job " << id_ << " page " << display_page(i)
                << " failed: " << *outcome.error << std::endl;
    } else if (outcome.processed) {
      ++summary.processed_pages;
    }
    if (outcome.normalization_warning) {
      summary.warnings.push_back(*outcome.normalization_warning);
    }
  }
  if (cancelled) {
    throw JobCancelled(summary.to_json());
  }
  if (summary.total_pages > 0 && summary.processed_pages == 0) {
    throw std::runtime_error("No page of document '" + request_.document_id +
                             "' could be processed: " + summary.page_errors.front().error);
  }

  std::vector<Chunk> chunks = assemble_chunks(outcomes);
  summary.total_chunks = static_cast<int>(chunks.size());
  report(0.3f, "Chunked " + std::to_string(summary.processed_pages) + " of " +
                   std::to_string(summary.total_pages) + " pages.");

  // 2. One batched embedding call for every chunk of the document.
  if (!chunks.empty()) {
    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto& chunk : chunks) {
      texts.push_back(chunk.text);
    }
    std::vector<EmbeddingResult> embeddings = services.get_embedding_generator().embed(texts);
    if (embeddings.size() != chunks.size()) {
      throw std::runtime_error("Embedding generator returned " +
                               std::to_string(embeddings.size()) + " vectors for " +
                               std::to_string(chunks.size()) + " chunks");
    }
    for (size_t i = 0; i < chunks.size(); ++i) {
      chunks[i].embedding = std::move(embeddings[i].vector);
      if (embeddings[i].degraded()) {
        chunks[i].embedding_degraded = true;
        summary.degraded_chunks.push_back(chunks[i].chunk_id);
        if (std::find(summary.warnings.begin(), summary.warnings.end(), embeddings[i].reason) ==
            summary.warnings.end()) {
          summary.warnings.push_back(embeddings[i].reason);
        }
      }
    }
  }
  report(0.6f, "Embedded " + std::to_string(chunks.size()) + " chunks.");

  // 3. Upsert in batches, checking for cancellation in between.
  ChunkStore& store = services.get_chunk_store();
  const size_t batch_size = std::max<size_t>(1, services.get_settings().embedding_batch_size);
  for (size_t start = 0; start < chunks.size(); start += batch_size) {
    if (is_cancelled && is_cancelled()) {
      throw JobCancelled(summary.to_json());
    }
    const size_t end = std::min(chunks.size(), start + batch_size);
    std::vector<Chunk> batch(chunks.begin() + start, chunks.begin() + end);
    store.upsert(request_.owner_id, std::move(batch));
    summary.stored_chunks += static_cast<int>(end - start);

    float progress = 0.6f + 0.35f * (static_cast<float>(end) / chunks.size());
    report(progress, "Stored " + std::to_string(end) + " of " + std::to_string(chunks.size()) +
                         " chunks.");
  }

  // 4. Drop the tail left behind by a longer earlier version of the document.
  // A failed page shifts later pages down, so the tail may still be live content.
  if (summary.page_errors.empty()) {
    int removed = store.delete_stale_chunks(request_.owner_id, request_.document_id,
                                            summary.total_chunks);
    if (removed > 0) {
      std::cout << "Job " << id_ << ": removed " << removed << " stale chunks of document '"
                << request_.document_id << "'." << std::endl;
    }
  } else {
    summary.warnings.push_back("Stale chunk cleanup skipped: " +
                               std::to_string(summary.page_errors.size()) +
                               " page(s) failed.");
  }

  report(1.0f, "Ingestion complete.");
  return summary.to_json();
}

}  // namespace recall_core
