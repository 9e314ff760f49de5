#pragma once

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "recall_core/types/ingestion_settings.hpp"

class Config {
 public:
  std::string api_base_url;
  std::string database_path;
  std::string db_key_path;
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;

  // Chunking and ingestion limits
  int max_chunk_size;
  int chunk_overlap;
  int top_k_default;
  int worker_pool_size;
  int page_parallelism;
  int max_document_chars;
  int max_page_chars;
  int max_pages;
  int embedding_batch_size;
  int worker_poll_interval_ms;

  // CPU cores, capped at 8.
  static int default_parallelism() {
    unsigned int cores = std::thread::hardware_concurrency();
    if (cores == 0) {
      cores = 1;
    }
    return static_cast<int>(std::min(cores, 8u));
  }

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.database_path = json_config.value("database_path", std::string("./data/recall.db"));
    config.db_key_path = json_config.value("db_key_path", std::string("./data/recall.key"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));

    config.embedding_dimension = int_value(json_config, "embedding_dimension", 1024);
    config.max_chunk_size = int_value(json_config, "max_chunk_size", 2000);
    config.chunk_overlap = int_value(json_config, "chunk_overlap", 200);
    config.top_k_default = int_value(json_config, "top_k_default", 5);
    config.worker_pool_size = int_value(json_config, "worker_pool_size", default_parallelism());
    config.page_parallelism = int_value(json_config, "page_parallelism", default_parallelism());
    config.max_document_chars = int_value(json_config, "max_document_chars", 5000000);
    config.max_page_chars = int_value(json_config, "max_page_chars", 200000);
    config.max_pages = int_value(json_config, "max_pages", 2000);
    config.embedding_batch_size = int_value(json_config, "embedding_batch_size", 64);
    config.worker_poll_interval_ms = int_value(json_config, "worker_poll_interval_ms", 1000);

    config.validate();
    return config;
  }

  recall_core::IngestionSettings ingestion_settings() const {
    recall_core::IngestionSettings settings;
    settings.max_chunk_size = static_cast<size_t>(max_chunk_size);
    settings.chunk_overlap = static_cast<size_t>(chunk_overlap);
    settings.page_parallelism = page_parallelism;
    settings.max_page_chars = static_cast<size_t>(max_page_chars);
    settings.max_document_chars = static_cast<size_t>(max_document_chars);
    settings.max_pages = static_cast<size_t>(max_pages);
    settings.embedding_batch_size = static_cast<size_t>(embedding_batch_size);
    return settings;
  }

 private:
  // Integer with default; a value of the wrong type is a configuration error.
  static int int_value(const nlohmann::json& json_config, const char* key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_number_integer()) {
      throw std::runtime_error(std::string(key) + " must be an integer");
    }
    return value.get<int>();
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (db_key_path.empty()) {
      throw std::runtime_error("db_key_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (max_chunk_size <= 0) {
      throw std::runtime_error("max_chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap * 2 >= max_chunk_size) {
      throw std::runtime_error("chunk_overlap must be non-negative and less than max_chunk_size / 2");
    }
    if (top_k_default <= 0) {
      throw std::runtime_error("top_k_default must be greater than 0");
    }
    if (worker_pool_size <= 0) {
      throw std::runtime_error("worker_pool_size must be greater than 0");
    }
    if (page_parallelism <= 0) {
      throw std::runtime_error("page_parallelism must be greater than 0");
    }
    if (max_document_chars <= 0 || max_page_chars <= 0 || max_pages <= 0) {
      throw std::runtime_error("document size limits must be greater than 0");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (worker_poll_interval_ms < 10) {
      throw std::runtime_error("worker_poll_interval_ms must be at least 10ms");
    }
  }
};
