#include "loglens_core/service_provider.hpp"

#include <chrono>
#include <filesystem>

#include "loglens_core/llm/ollama_text_generator.hpp"

namespace loglens_core {

ServiceProvider::ServiceProvider(const Config& config, std::unique_ptr<TextGenerator> generator)
    : config_(config) {
  const std::filesystem::path root(config_.root_directory);
  std::filesystem::create_directories(root);

  if (config_.enable_embedding_cache) {
    db_manager_ = std::make_unique<DatabaseManager>(root / "embedding_cache.db", config_.db_pool_size);
    embedding_cache_ = std::make_unique<EmbeddingCache>(*db_manager_);
  }

  log_store_ = std::make_unique<FilesystemLogFileStore>(root, config_.log_extensions);
  repository_ = std::make_unique<KnowledgeBaseRepository>(root);

  registry_ = std::make_unique<ProviderRegistry>();
  register_default_providers(*registry_, config_);
  embedder_ = std::make_unique<BatchEmbedder>(*registry_, config_.max_concurrent_requests);

  ManagerSettings settings;
  settings.use_memory_map = config_.use_memory_map;
  settings.max_cache_entries = static_cast<size_t>(config_.max_cache_entries);
  knowledge_bases_ = std::make_unique<KnowledgeBaseManager>(*log_store_, *repository_,
                                                            embedding_cache_.get(), *embedder_,
                                                            settings);
  retriever_ = std::make_unique<Retriever>(*knowledge_bases_, *embedder_,
                                           config_.embedding_options());

  generator_ = std::move(generator);
  if (!generator_) {
    generator_ = std::make_unique<OllamaTextGenerator>(config_.ollama_url, config_.llm_model,
                                                       config_.request_timeout_seconds);
  }
  QueryOptions query_options;
  query_options.max_attempts = config_.max_retries;
  query_options.retry_base_delay = std::chrono::milliseconds(config_.retry_base_delay_ms);
  query_service_ = std::make_unique<QueryService>(*retriever_, *generator_, query_options);
}

// Members are destroyed in reverse order: services before the stores they reference.
ServiceProvider::~ServiceProvider() = default;

}  // namespace loglens_core
