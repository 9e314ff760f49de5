#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "recall_api/config.hpp"
#include "recall_api/routes.hpp"
#include "recall_api/server.hpp"
#include "recall_core/async/service_provider.hpp"
#include "recall_core/async/worker_pool.hpp"
#include "recall_core/chunking/boundary_chunker.hpp"
#include "recall_core/db/chunk_store.hpp"
#include "recall_core/db/database_manager.hpp"
#include "recall_core/db/job_repo.hpp"
#include "recall_core/embedding/embedding_generator.hpp"
#include "recall_core/embedding/ollama_embedding_backend.hpp"
#include "recall_core/retrieval/retriever.hpp"
#include "recall_core/services/document_service.hpp"
#include "recall_core/services/embedding_repair_service.hpp"
#include "recall_core/services/encryption_key_service.hpp"
#include "recall_core/services/ingestion_service.hpp"
#include "recall_core/services/search_service.hpp"
#include "recall_core/text/text_normalizer.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char** argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "recallrc.json";
    Config config = Config::from_file(config_path);

    std::string db_key = recall_core::EncryptionKeyService::get_database_key(config.db_key_path);
    std::cout << "Starting Recall API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Database Path: " << config.database_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (D="
              << config.embedding_dimension << ")" << std::endl;
    std::cout << "Workers: " << config.worker_pool_size
              << ", page parallelism: " << config.page_parallelism << std::endl;

    // --- 1. CORE COMPONENTS ---
    auto& db_manager = recall_core::DatabaseManager::get_instance();
    // Workers and page threads poll cancellation while API handlers run queries.
    const int pool_size = config.worker_pool_size * 2 + config.page_parallelism + 2;
    db_manager.initialize(config.database_path, db_key, pool_size);

    auto chunk_store =
        std::make_shared<recall_core::ChunkStore>(db_manager, config.embedding_dimension);
    auto job_repo = std::make_shared<recall_core::JobRepo>(db_manager);
    auto embeddings = std::make_shared<recall_core::EmbeddingGenerator>(
        recall_core::OllamaEmbeddingBackend::create_lazy(config.ollama_url,
                                                         config.embedding_model),
        config.embedding_dimension);
    auto normalizer = std::make_shared<recall_core::TextNormalizer>();
    auto chunker = std::make_shared<recall_core::BoundaryChunker>();

    auto retriever = std::make_shared<recall_core::Retriever>(embeddings, chunk_store);
    auto search_service =
        std::make_shared<recall_core::SearchService>(retriever, config.top_k_default);
    auto ingestion_service =
        std::make_shared<recall_core::IngestionService>(job_repo, config.ingestion_settings());
    auto document_service = std::make_shared<recall_core::DocumentService>(chunk_store);
    auto repair_service =
        std::make_shared<recall_core::EmbeddingRepairService>(chunk_store, embeddings);

    auto services = std::make_shared<recall_core::ServiceProvider>(
        chunk_store, job_repo, embeddings, normalizer, chunker, config.ingestion_settings());
    auto worker_pool = std::make_shared<recall_core::async::WorkerPool>(
        config.worker_pool_size, services,
        std::chrono::milliseconds(config.worker_poll_interval_ms));

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    recall_api::Server server(host, port);
    recall_api::Routes routes(ingestion_service, search_service, document_service,
                              repair_service, config.embedding_batch_size);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    worker_pool->start();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Stopping worker pool to finish processing..." << std::endl;
    worker_pool->stop();
    worker_pool.reset();  // Joins the worker threads

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
