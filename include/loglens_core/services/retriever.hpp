#pragma once

#include <string>
#include <vector>

#include "loglens_core/embedding/batch_embedder.hpp"
#include "loglens_core/services/knowledge_base_manager.hpp"
#include "loglens_core/types/chunk.hpp"
#include "loglens_core/types/options.hpp"

namespace loglens_core {

// Read-only similarity search over an issue's committed knowledge base.
class Retriever {
 public:
  Retriever(KnowledgeBaseManager &knowledge_bases, BatchEmbedder &embedder,
            EmbeddingOptions embedding_options);

  // Embeds the query with the knowledge base's own model. top_k <= 0 throws
  // ConfigurationError; an issue without a knowledge base throws KnowledgeBaseNotFoundError.
  std::vector<RetrievedChunk> retrieve(const std::string &issue_id, const std::string &query_text,
                                       int top_k);

  // As above, and throws ModelMismatchError unless the index was built with expected_model_id.
  std::vector<RetrievedChunk> retrieve(const std::string &issue_id, const std::string &query_text,
                                       int top_k, const std::string &expected_model_id);

 private:
  std::vector<RetrievedChunk> search(const KnowledgeBase &kb, const std::string &query_text,
                                     int top_k);

  KnowledgeBaseManager &knowledge_bases_;
  BatchEmbedder &embedder_;
  EmbeddingOptions embedding_options_;
};

}  // namespace loglens_core
