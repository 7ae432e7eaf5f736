#pragma once

#include <memory>

#include "loglens_core/config.hpp"
#include "loglens_core/db/database_manager.hpp"
#include "loglens_core/db/embedding_cache.hpp"
#include "loglens_core/embedding/batch_embedder.hpp"
#include "loglens_core/embedding/provider_registry.hpp"
#include "loglens_core/llm/text_generator.hpp"
#include "loglens_core/services/knowledge_base_manager.hpp"
#include "loglens_core/services/query_service.hpp"
#include "loglens_core/services/retriever.hpp"
#include "loglens_core/storage/knowledge_base_repository.hpp"
#include "loglens_core/storage/log_file_store.hpp"

namespace loglens_core {

// Wires every service of one workspace from a Config. Nothing here is process-global;
// two providers over different roots are fully independent.
class ServiceProvider {
 public:
  // Without a generator, answers are produced by Ollama (config.llm_model).
  explicit ServiceProvider(const Config& config,
                           std::unique_ptr<TextGenerator> generator = nullptr);
  ~ServiceProvider();

  ServiceProvider(const ServiceProvider&) = delete;
  ServiceProvider& operator=(const ServiceProvider&) = delete;

  const Config& get_config() const {
    return config_;
  }
  FilesystemLogFileStore& get_log_store() {
    return *log_store_;
  }
  KnowledgeBaseRepository& get_repository() {
    return *repository_;
  }
  // Null when enable_embedding_cache is false.
  EmbeddingCache* get_embedding_cache() {
    return embedding_cache_.get();
  }
  ProviderRegistry& get_provider_registry() {
    return *registry_;
  }
  BatchEmbedder& get_embedder() {
    return *embedder_;
  }
  KnowledgeBaseManager& get_knowledge_base_manager() {
    return *knowledge_bases_;
  }
  Retriever& get_retriever() {
    return *retriever_;
  }
  QueryService& get_query_service() {
    return *query_service_;
  }

 private:
  Config config_;
  std::unique_ptr<DatabaseManager> db_manager_;
  std::unique_ptr<EmbeddingCache> embedding_cache_;
  std::unique_ptr<FilesystemLogFileStore> log_store_;
  std::unique_ptr<KnowledgeBaseRepository> repository_;
  std::unique_ptr<ProviderRegistry> registry_;
  std::unique_ptr<BatchEmbedder> embedder_;
  std::unique_ptr<KnowledgeBaseManager> knowledge_bases_;
  std::unique_ptr<Retriever> retriever_;
  std::unique_ptr<TextGenerator> generator_;
  std::unique_ptr<QueryService> query_service_;
};

}  // namespace loglens_core
