#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "loglens_core/embedding/cancellation_token.hpp"
#include "loglens_core/embedding/provider_registry.hpp"
#include "loglens_core/embedding/request_limiter.hpp"
#include "loglens_core/types/options.hpp"

namespace loglens_core {

struct BatchEmbeddingReport {
  // Input order. Entries for texts that were not embedded are empty.
  std::vector<std::vector<float>> vectors;
  std::vector<size_t> failed_indices;
  size_t batches_total = 0;
  size_t batches_succeeded = 0;
  size_t batches_failed = 0;
  size_t retries = 0;
  bool cancelled = false;
  std::string last_error;

  bool complete() const {
    return failed_indices.empty() && !cancelled;
  }
};

// Called after each successful batch with the input index of its first text.
using BatchCallback =
    std::function<void(size_t first_index, const std::vector<std::vector<float>> &vectors)>;

/**
 * @brief Sends texts to an embedding provider in fixed-size batches.
 *
 * A batch succeeds or fails as a unit. Transient ProviderErrors are retried with exponential
 * backoff (base * 2^attempt, capped at the max delay) up to options.max_attempts calls;
 * any other error fails the batch at once. After the first failed batch the remaining
 * batches are skipped and their indices are reported as failed too. Cancellation is checked
 * before every batch and interrupts backoff sleeps, but never a provider call in progress.
 */
class BatchEmbedder {
 public:
  BatchEmbedder(ProviderRegistry &registry, int max_concurrent_requests);

  BatchEmbedder(const BatchEmbedder &) = delete;
  BatchEmbedder &operator=(const BatchEmbedder &) = delete;

  BatchEmbeddingReport embed_batch(const std::vector<std::string> &texts, const ModelId &model,
                                   const EmbeddingOptions &options,
                                   const BatchCallback &on_batch = nullptr,
                                   const CancellationTokenPtr &cancel = nullptr);

  // Single text, same retry policy. Throws ProviderError when the attempts run out.
  std::vector<float> embed_query(const std::string &text, const ModelId &model,
                                 const EmbeddingOptions &options);

  ProviderRegistry &registry() {
    return registry_;
  }

 private:
  // Returns false if cancelled while waiting.
  static bool backoff(int attempt, const EmbeddingOptions &options,
                      const CancellationTokenPtr &cancel);

  std::vector<std::vector<float>> call_with_retry(EmbeddingProvider &provider,
                                                  const std::vector<std::string> &texts,
                                                  const EmbeddingOptions &options,
                                                  const CancellationTokenPtr &cancel,
                                                  size_t &retries);

  RequestLimiter &limiter_for(const ModelId &model);

  ProviderRegistry &registry_;
  const int max_concurrent_requests_;
  std::mutex limiters_mutex_;
  std::map<std::string, std::unique_ptr<RequestLimiter>> limiters_;
};

// Raised inside call_with_retry when a cancellation interrupts a backoff sleep.
class EmbeddingCancelled : public std::exception {
 public:
  const char *what() const noexcept override {
    return "Embedding cancelled";
  }
};

}  // namespace loglens_core
