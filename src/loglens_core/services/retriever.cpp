#include "loglens_core/services/retriever.hpp"

#include "loglens_core/types/errors.hpp"

namespace loglens_core {

Retriever::Retriever(KnowledgeBaseManager &knowledge_bases, BatchEmbedder &embedder,
                     EmbeddingOptions embedding_options)
    : knowledge_bases_(knowledge_bases),
      embedder_(embedder),
      embedding_options_(embedding_options) {}

std::vector<RetrievedChunk> Retriever::search(const KnowledgeBase &kb,
                                              const std::string &query_text, int top_k) {
  std::vector<float> query = embedder_.embed_query(query_text, kb.index.model(), embedding_options_);
  return kb.index.search(query, top_k);
}

std::vector<RetrievedChunk> Retriever::retrieve(const std::string &issue_id,
                                                const std::string &query_text, int top_k) {
  if (top_k <= 0) {
    throw ConfigurationError("top_k must be greater than 0, got " + std::to_string(top_k));
  }
  // The snapshot keeps this generation alive even if a build publishes a new one meanwhile.
  auto kb = knowledge_bases_.snapshot(issue_id);
  if (!kb) {
    throw KnowledgeBaseNotFoundError(issue_id);
  }
  return search(*kb, query_text, top_k);
}

std::vector<RetrievedChunk> Retriever::retrieve(const std::string &issue_id,
                                                const std::string &query_text, int top_k,
                                                const std::string &expected_model_id) {
  if (top_k <= 0) {
    throw ConfigurationError("top_k must be greater than 0, got " + std::to_string(top_k));
  }
  const ModelId expected = ModelId::parse(expected_model_id);
  auto kb = knowledge_bases_.snapshot(issue_id);
  if (!kb) {
    throw KnowledgeBaseNotFoundError(issue_id);
  }
  if (kb->index.model() != expected) {
    throw ModelMismatchError("Issue '" + issue_id + "' is indexed with " +
                             kb->index.model().str() + ", not " + expected.str());
  }
  return search(*kb, query_text, top_k);
}

}  // namespace loglens_core
