#include "loglens_core/embedding/batch_embedder.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>

#include "loglens_core/types/errors.hpp"

namespace loglens_core {

BatchEmbedder::BatchEmbedder(ProviderRegistry &registry, int max_concurrent_requests)
    : registry_(registry), max_concurrent_requests_(max_concurrent_requests) {
  if (max_concurrent_requests <= 0) {
    throw ConfigurationError("max_concurrent_requests must be greater than 0");
  }
}

RequestLimiter &BatchEmbedder::limiter_for(const ModelId &model) {
  std::lock_guard<std::mutex> lock(limiters_mutex_);
  auto &limiter = limiters_[model.str()];
  if (!limiter) {
    limiter = std::make_unique<RequestLimiter>(max_concurrent_requests_);
  }
  return *limiter;
}

bool BatchEmbedder::backoff(int attempt, const EmbeddingOptions &options,
                            const CancellationTokenPtr &cancel) {
  // base * 2^attempt, capped. The shift is bounded so large attempt counts cannot overflow.
  std::chrono::milliseconds delay = options.retry_base_delay * (int64_t{1} << std::min(attempt, 20));
  delay = std::min(delay, options.retry_max_delay);
  if (cancel) {
    return !cancel->wait_for(delay);
  }
  std::this_thread::sleep_for(delay);
  return true;
}

std::vector<std::vector<float>> BatchEmbedder::call_with_retry(
    EmbeddingProvider &provider, const std::vector<std::string> &texts,
    const EmbeddingOptions &options, const CancellationTokenPtr &cancel, size_t &retries) {
  RequestLimiter &limiter = limiter_for(provider.model());
  for (int attempt = 0;; ++attempt) {
    try {
      std::vector<std::vector<float>> vectors;
      {
        RequestLimiter::Slot slot(limiter);
        vectors = provider.embed(texts);
      }
      if (vectors.size() != texts.size()) {
        throw ProviderError("Provider returned " + std::to_string(vectors.size()) +
                                " vectors for " + std::to_string(texts.size()) + " texts",
                            false);
      }
      for (const auto &vector : vectors) {
        if (vector.size() != provider.model().dimension) {
          throw ProviderError("Provider returned a vector of length " +
                                  std::to_string(vector.size()) + " for model " +
                                  provider.model().str(),
                              false);
        }
      }
      return vectors;
    } catch (const ProviderError &e) {
      if (!e.transient() || attempt + 1 >= options.max_attempts) {
        throw;
      }
      std::cerr << "[BatchEmbedder] " << e.what() << " (attempt " << attempt + 1 << "/"
                << options.max_attempts << "), retrying" << std::endl;
      ++retries;
      if (!backoff(attempt, options, cancel)) {
        throw EmbeddingCancelled();
      }
    }
  }
}

BatchEmbeddingReport BatchEmbedder::embed_batch(const std::vector<std::string> &texts,
                                                const ModelId &model,
                                                const EmbeddingOptions &options,
                                                const BatchCallback &on_batch,
                                                const CancellationTokenPtr &cancel) {
  options.validate();

  BatchEmbeddingReport report;
  report.vectors.resize(texts.size());
  if (texts.empty()) {
    return report;
  }

  EmbeddingProviderPtr provider = registry_.get(model);
  report.batches_total = (texts.size() + options.batch_size - 1) / options.batch_size;

  for (size_t first = 0; first < texts.size(); first += options.batch_size) {
    const size_t last = std::min(first + options.batch_size, texts.size());

    if (cancel && cancel->is_cancelled()) {
      report.cancelled = true;
      break;
    }

    if (report.batches_failed > 0) {
      // A batch already failed; the build is lost, so do not spend provider calls.
      for (size_t i = first; i < last; ++i) {
        report.failed_indices.push_back(i);
      }
      continue;
    }

    std::vector<std::string> batch(texts.begin() + first, texts.begin() + last);
    try {
      auto vectors = call_with_retry(*provider, batch, options, cancel, report.retries);
      if (on_batch) {
        on_batch(first, vectors);
      }
      for (size_t i = 0; i < vectors.size(); ++i) {
        report.vectors[first + i] = std::move(vectors[i]);
      }
      ++report.batches_succeeded;
    } catch (const EmbeddingCancelled &) {
      report.cancelled = true;
      break;
    } catch (const ProviderError &e) {
      std::cerr << "[BatchEmbedder] Batch " << first / options.batch_size + 1 << "/"
                << report.batches_total << " failed: " << e.what() << std::endl;
      report.last_error = e.what();
      ++report.batches_failed;
      for (size_t i = first; i < last; ++i) {
        report.failed_indices.push_back(i);
      }
    }
  }

  return report;
}

std::vector<float> BatchEmbedder::embed_query(const std::string &text, const ModelId &model,
                                              const EmbeddingOptions &options) {
  options.validate();
  EmbeddingProviderPtr provider = registry_.get(model);
  size_t retries = 0;
  auto vectors = call_with_retry(*provider, {text}, options, nullptr, retries);
  return std::move(vectors.front());
}

}  // namespace loglens_core
