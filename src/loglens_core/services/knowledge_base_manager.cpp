#include "loglens_core/services/knowledge_base_manager.hpp"

#include <iostream>
#include <set>
#include <unordered_set>

#include "loglens_core/config.hpp"
#include "loglens_core/content_hash.hpp"
#include "loglens_core/time_utils.hpp"
#include "loglens_core/types/errors.hpp"

namespace loglens_core {

std::string to_string(BuildStage stage) {
  switch (stage) {
    case BuildStage::Collect:
      return "collect";
    case BuildStage::Chunk:
      return "chunk";
    case BuildStage::Resolve:
      return "resolve";
    case BuildStage::Embed:
      return "embed";
    case BuildStage::Commit:
      return "commit";
    default:
      return "unknown";
  }
}

BuildOptions BuildOptions::from_config(const Config &config) {
  BuildOptions options;
  options.model_id = config.embedding_model;
  options.chunking = config.chunking_options();
  options.embedding = config.embedding_options();
  return options;
}

KnowledgeBaseManager::KnowledgeBaseManager(LogFileStore &log_store,
                                           KnowledgeBaseRepository &repository,
                                           EmbeddingCache *cache, BatchEmbedder &embedder,
                                           ManagerSettings settings)
    : log_store_(log_store),
      repository_(repository),
      cache_(cache),
      embedder_(embedder),
      settings_(settings) {}

std::mutex &KnowledgeBaseManager::issue_mutex(const std::string &issue_id) {
  std::lock_guard<std::mutex> lock(issue_locks_mutex_);
  auto &mutex = issue_locks_[issue_id];
  if (!mutex) {
    mutex = std::make_unique<std::mutex>();
  }
  return *mutex;
}

std::shared_ptr<const KnowledgeBase> KnowledgeBaseManager::snapshot(const std::string &issue_id) {
  {
    std::lock_guard<std::mutex> lock(snapshots_mutex_);
    auto it = snapshots_.find(issue_id);
    if (it != snapshots_.end()) {
      return it->second;
    }
  }

  // Loaded without the lock so a cold issue does not stall readers of other issues.
  auto kb = repository_.load(issue_id, settings_.use_memory_map);
  if (!kb) {
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(snapshots_mutex_);
  // A racing load or a publish may have got there first; the stored one wins.
  return snapshots_.emplace(issue_id, std::move(kb)).first->second;
}

void KnowledgeBaseManager::publish(const std::string &issue_id,
                                   std::shared_ptr<const KnowledgeBase> kb) {
  std::lock_guard<std::mutex> lock(snapshots_mutex_);
  snapshots_[issue_id] = std::move(kb);
}

std::shared_ptr<const KnowledgeBase> KnowledgeBaseManager::load_current(
    const std::string &issue_id, bool force_rebuild) {
  try {
    return snapshot(issue_id);
  } catch (const IndexFormatError &e) {
    if (!force_rebuild) {
      throw;
    }
    // A forced rebuild replaces the damaged generation anyway.
    std::cerr << "[KnowledgeBaseManager] Ignoring unreadable knowledge base of issue '"
              << issue_id << "': " << e.what() << std::endl;
    return nullptr;
  }
}

KnowledgeBaseStatus KnowledgeBaseManager::status(const std::string &issue_id) {
  KnowledgeBaseStatus result;
  result.committed = repository_.load_metadata(issue_id);
  result.last_build = repository_.read_build_status(issue_id);
  return result;
}

std::vector<KnowledgeBaseManager::ChunkedFile> KnowledgeBaseManager::chunk_files(
    const std::string &issue_id, const std::vector<LogFileInfo> &files, const Chunker &chunker,
    const BuildOptions &options) {
  std::vector<ChunkedFile> chunked;
  chunked.reserve(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    const std::string content = log_store_.read_file(issue_id, files[i].name);
    ChunkedFile file;
    file.chunks = chunker.chunk(content, files[i].name);
    file.record = {files[i].name, content.size(), compute_content_hash(content),
                   file.chunks.size()};
    chunked.push_back(std::move(file));
    if (options.progress) {
      options.progress(BuildStage::Chunk, i + 1, files.size());
    }
  }
  return chunked;
}

BuildReport KnowledgeBaseManager::finish(BuildReport report) {
  report.finished_at = utc_now_string();
  try {
    repository_.write_build_status(report.issue_id, report);
  } catch (const std::exception &e) {
    std::cerr << "[KnowledgeBaseManager] Could not record build status for issue '"
              << report.issue_id << "': " << e.what() << std::endl;
  }
  std::cout << "[KnowledgeBaseManager] Issue '" << report.issue_id << "': " << to_string(report.status)
            << " (" << report.chunks_processed << " chunks, " << report.cache_hits << " hits, "
            << report.cache_misses << " misses, " << report.embedding_failures << " failed)"
            << std::endl;
  return report;
}

BuildReport KnowledgeBaseManager::update(const std::string &issue_id, const BuildOptions &options) {
  // Configuration problems surface before any work starts.
  const ModelId model = ModelId::parse(options.model_id);
  const Chunker chunker(options.chunking);
  options.embedding.validate();
  validate_storage_name(issue_id, "issue id");
  if (!log_store_.issue_exists(issue_id)) {
    throw LogStoreError("Issue '" + issue_id + "' does not exist");
  }

  std::lock_guard<std::mutex> issue_lock(issue_mutex(issue_id));

  BuildReport report;
  report.issue_id = issue_id;
  report.model_id = model.str();
  report.started_at = utc_now_string();

  auto cancelled = [&options]() { return options.cancel && options.cancel->is_cancelled(); };

  try {
    // Collect
    std::shared_ptr<const KnowledgeBase> current = load_current(issue_id, options.force_rebuild);
    const bool same_model = current && current->index.model() == model;
    const bool incremental = same_model && !options.force_rebuild;
    const bool use_cache = cache_ && !options.force_rebuild && (!current || same_model);

    const std::vector<LogFileInfo> files = log_store_.list_files(issue_id);
    if (options.progress) {
      options.progress(BuildStage::Collect, files.size(), files.size());
    }

    std::vector<LogFileInfo> to_chunk;
    if (incremental) {
      std::set<std::string> known;
      for (const auto &record : current->metadata.source_files) {
        known.insert(record.name);
      }
      std::set<std::string> present;
      for (const auto &file : files) {
        present.insert(file.name);
        if (!known.count(file.name)) {
          to_chunk.push_back(file);
        }
      }
      for (const auto &name : known) {
        if (!present.count(name)) {
          std::cerr << "[KnowledgeBaseManager] '" << name << "' is indexed for issue '"
                    << issue_id << "' but no longer in the log store; keeping its chunks"
                    << std::endl;
        }
      }
      if (to_chunk.empty()) {
        report.status = BuildStatus::UpToDate;
        report.chunks_processed = current->index.size();
        report.generation = current->metadata.generation;
        return finish(std::move(report));
      }
    } else {
      to_chunk = files;
    }
    for (const auto &file : to_chunk) {
      report.new_files.push_back(file.name);
    }

    // Chunk
    const std::vector<ChunkedFile> chunked = chunk_files(issue_id, to_chunk, chunker, options);
    std::vector<const Chunk *> new_chunks;
    for (const auto &file : chunked) {
      for (const auto &chunk : file.chunks) {
        new_chunks.push_back(&chunk);
      }
    }
    const size_t existing = incremental ? current->index.size() : 0;
    report.chunks_processed = existing + new_chunks.size();
    // Committed chunks are carried over with their vectors.
    report.cache_hits = existing;

    // Resolve
    std::unordered_map<std::string, std::vector<float>> vectors_by_hash;
    if (use_cache && !new_chunks.empty()) {
      std::vector<std::string> hashes;
      hashes.reserve(new_chunks.size());
      for (const Chunk *chunk : new_chunks) {
        hashes.push_back(chunk->content_hash);
      }
      vectors_by_hash = cache_->get_many(hashes, model);
    }

    std::vector<std::string> miss_hashes;
    std::vector<std::string> miss_texts;
    std::unordered_set<std::string> queued;
    for (const Chunk *chunk : new_chunks) {
      if (vectors_by_hash.count(chunk->content_hash)) {
        ++report.cache_hits;
        continue;
      }
      ++report.cache_misses;
      // Identical text is embedded once per build.
      if (queued.insert(chunk->content_hash).second) {
        miss_hashes.push_back(chunk->content_hash);
        miss_texts.push_back(chunk->text);
      }
    }
    if (options.progress) {
      options.progress(BuildStage::Resolve, report.cache_hits, report.chunks_processed);
    }

    // Embed
    if (!miss_texts.empty()) {
      const size_t total_batches =
          (miss_texts.size() + options.embedding.batch_size - 1) / options.embedding.batch_size;
      size_t batches_done = 0;

      auto on_batch = [&](size_t first, const std::vector<std::vector<float>> &vectors) {
        std::vector<std::pair<std::string, std::vector<float>>> entries;
        entries.reserve(vectors.size());
        for (size_t i = 0; i < vectors.size(); ++i) {
          entries.emplace_back(miss_hashes[first + i], vectors[i]);
        }
        if (cache_) {
          const std::vector<CachePutResult> results = cache_->put_many(entries, model);
          for (size_t i = 0; i < results.size(); ++i) {
            if (results[i] != CachePutResult::Rejected) {
              continue;
            }
            ++report.cache_rejections;
            // The stored vector stays authoritative.
            if (auto stored = cache_->get(entries[i].first, model)) {
              entries[i].second = std::move(*stored);
            }
          }
        }
        for (auto &[hash, vector] : entries) {
          vectors_by_hash[hash] = std::move(vector);
        }
        if (options.progress) {
          options.progress(BuildStage::Embed, ++batches_done, total_batches);
        }
      };

      const BatchEmbeddingReport embedded =
          embedder_.embed_batch(miss_texts, model, options.embedding, on_batch, options.cancel);

      if (embedded.cancelled) {
        report.status = BuildStatus::Cancelled;
        report.error = "Build cancelled after " + std::to_string(embedded.batches_succeeded) +
                       " of " + std::to_string(embedded.batches_total) + " batches";
        return finish(std::move(report));
      }
      if (!embedded.complete()) {
        std::unordered_set<std::string> failed_hashes;
        for (size_t index : embedded.failed_indices) {
          failed_hashes.insert(miss_hashes[index]);
        }
        for (const Chunk *chunk : new_chunks) {
          if (failed_hashes.count(chunk->content_hash)) {
            ++report.embedding_failures;
          }
        }
        report.status = BuildStatus::Failed;
        report.error = embedded.last_error;
        return finish(std::move(report));
      }
    }

    if (cancelled()) {
      report.status = BuildStatus::Cancelled;
      report.error = "Build cancelled before commit";
      return finish(std::move(report));
    }

    // Commit
    std::vector<ChunkWithVector> entries;
    entries.reserve(new_chunks.size());
    for (const Chunk *chunk : new_chunks) {
      entries.push_back({*chunk, vectors_by_hash.at(chunk->content_hash)});
    }

    KnowledgeBaseMetadata metadata;
    VectorIndex index = incremental ? current->index.clone() : VectorIndex(model);
    index.append(entries);
    if (incremental) {
      metadata.source_files = current->metadata.source_files;
    }
    if (current) {
      metadata.models_history = current->metadata.models_history;
    }
    for (const auto &file : chunked) {
      metadata.source_files.push_back(file.record);
    }
    metadata.commit_mode = incremental ? CommitMode::Append : CommitMode::Rebuild;
    metadata.built_at = utc_now_string();

    report.generation = repository_.commit(issue_id, index, metadata);
    publish(issue_id, repository_.load(issue_id, settings_.use_memory_map));
    if (options.progress) {
      options.progress(BuildStage::Commit, 1, 1);
    }

    report.status = BuildStatus::Succeeded;
    report.commit_mode = metadata.commit_mode;

    if (cache_ && settings_.max_cache_entries > 0) {
      try {
        cache_->prune(settings_.max_cache_entries);
      } catch (const EmbeddingCacheError &e) {
        std::cerr << "[KnowledgeBaseManager] Cache pruning failed: " << e.what() << std::endl;
      }
    }
    return finish(std::move(report));
  } catch (const ConfigurationError &) {
    throw;
  } catch (const std::exception &e) {
    report.status = BuildStatus::Failed;
    report.error = e.what();
    throw BuildFailure(finish(std::move(report)));
  }
}

}  // namespace loglens_core
