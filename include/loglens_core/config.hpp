#pragma once

#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "loglens_core/model_id.hpp"
#include "loglens_core/types/errors.hpp"
#include "loglens_core/types/options.hpp"

namespace loglens_core {

class Config {
 public:
  std::string root_directory;
  int chunk_size;
  int overlap;
  int top_k;
  std::string embedding_model;
  int embedding_batch_size;
  int max_retries;
  int retry_base_delay_ms;
  int retry_max_delay_ms;
  int request_timeout_seconds;
  int max_concurrent_requests;
  std::string ollama_url;
  std::string llm_model;
  std::vector<std::string> log_extensions;
  int max_cache_entries;
  bool enable_embedding_cache;
  bool use_memory_map;
  int db_pool_size;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw ConfigurationError(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.root_directory = json_config.value("root_directory", std::string("./data"));
      config.chunk_size = json_config.value("chunk_size", 800);
      config.overlap = json_config.value("overlap", 100);
      config.top_k = json_config.value("top_k", 5);
      config.embedding_model =
          json_config.value("embedding_model", std::string("ollama:mxbai-embed-large:1024"));
      config.embedding_batch_size = json_config.value("embedding_batch_size", 32);
      config.max_retries = json_config.value("max_retries", 3);
      config.retry_base_delay_ms = json_config.value("retry_base_delay_ms", 500);
      config.retry_max_delay_ms = json_config.value("retry_max_delay_ms", 8000);
      config.request_timeout_seconds = json_config.value("request_timeout_seconds", 60);
      config.max_concurrent_requests = json_config.value("max_concurrent_requests", 2);
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.llm_model = json_config.value("llm_model", std::string("llama3.1"));
      config.log_extensions = json_config.value(
          "log_extensions", std::vector<std::string>{".log", ".txt", ".jsonl"});
      config.max_cache_entries = json_config.value("max_cache_entries", 100000);
      config.enable_embedding_cache = json_config.value("enable_embedding_cache", true);
      config.use_memory_map = json_config.value("use_memory_map", true);
      config.db_pool_size = json_config.value("db_pool_size", 4);
    } catch (const nlohmann::json::exception& e) {
      throw ConfigurationError(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

  ChunkingOptions chunking_options() const {
    return {chunk_size, overlap};
  }

  EmbeddingOptions embedding_options() const {
    EmbeddingOptions options;
    options.batch_size = static_cast<size_t>(embedding_batch_size);
    options.max_attempts = max_retries;
    options.retry_base_delay = std::chrono::milliseconds(retry_base_delay_ms);
    options.retry_max_delay = std::chrono::milliseconds(retry_max_delay_ms);
    return options;
  }

 private:
  void validate() const {
    if (root_directory.empty()) {
      throw ConfigurationError("root_directory cannot be empty");
    }
    chunking_options().validate();
    if (top_k <= 0) {
      throw ConfigurationError("top_k must be greater than 0");
    }
    ModelId::parse(embedding_model);
    if (embedding_batch_size <= 0) {
      throw ConfigurationError("embedding_batch_size must be greater than 0");
    }
    if (max_retries < 1) {
      throw ConfigurationError("max_retries must be at least 1");
    }
    if (retry_base_delay_ms < 0 || retry_max_delay_ms < retry_base_delay_ms) {
      throw ConfigurationError("retry delays must satisfy 0 <= base <= max");
    }
    if (request_timeout_seconds <= 0) {
      throw ConfigurationError("request_timeout_seconds must be greater than 0");
    }
    if (max_concurrent_requests <= 0) {
      throw ConfigurationError("max_concurrent_requests must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw ConfigurationError("ollama_url cannot be empty");
    }
    if (log_extensions.empty()) {
      throw ConfigurationError("log_extensions cannot be empty");
    }
    if (max_cache_entries < 0) {
      throw ConfigurationError("max_cache_entries must not be negative");
    }
    if (db_pool_size <= 0) {
      throw ConfigurationError("db_pool_size must be greater than 0");
    }
  }
};

}  // namespace loglens_core
