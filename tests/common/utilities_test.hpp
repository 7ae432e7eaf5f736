#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/mocks_test.hpp"
#include "loglens_core/db/database_manager.hpp"
#include "loglens_core/db/embedding_cache.hpp"
#include "loglens_core/embedding/batch_embedder.hpp"
#include "loglens_core/embedding/provider_registry.hpp"
#include "loglens_core/services/knowledge_base_manager.hpp"
#include "loglens_core/storage/knowledge_base_repository.hpp"
#include "loglens_core/storage/log_file_store.hpp"

namespace loglens_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Unique, empty directory under the system temp directory
  static std::filesystem::path create_temp_directory(const std::string &prefix = "run");
  static void cleanup_temp_directory(const std::filesystem::path &directory);

  // "line NN <word>" lines, 1-based, joined with '\n' (no trailing newline)
  static std::string create_log_text(const std::vector<std::string> &lines);

  static std::vector<float> create_test_vector(const std::string &seed_text, size_t dimension);

  static std::string read_file_bytes(const std::filesystem::path &path);
};

/**
 * Fixture with a fresh temporary directory per test
 */
class TempDirectoryTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_directory();
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_directory(temp_dir_);
  }

  std::filesystem::path temp_dir_;
};

/**
 * Fixture providing an EmbeddingCache over a temporary database
 */
class EmbeddingCacheTestBase : public TempDirectoryTestBase {
 protected:
  void SetUp() override {
    TempDirectoryTestBase::SetUp();
    db_manager_ = std::make_unique<loglens_core::DatabaseManager>(temp_dir_ / "cache.db",
                                                                  /*pool_size*/ 2);
    cache_ = std::make_unique<loglens_core::EmbeddingCache>(*db_manager_);
  }

  void TearDown() override {
    cache_.reset();
    db_manager_.reset();
    TempDirectoryTestBase::TearDown();
  }

  std::unique_ptr<loglens_core::DatabaseManager> db_manager_;
  std::unique_ptr<loglens_core::EmbeddingCache> cache_;
};

/**
 * Fixture wiring a complete knowledge base stack in a temporary root. Model ids with the
 * "test" prefix are served by mock_provider_; a new model id gets a fresh mock.
 */
class KnowledgeBaseTestBase : public EmbeddingCacheTestBase {
 protected:
  static constexpr const char *kModel = "test:mock:32";
  static constexpr const char *kOtherModel = "test:other:16";

  void SetUp() override;
  void TearDown() override;

  // Mock serving `model_id`, created on first use.
  testing::NiceMock<MockEmbeddingProvider> &provider_for(const std::string &model_id);

  loglens_core::BuildOptions build_options(const std::string &model_id = kModel,
                                           bool force_rebuild = false) const;

  void upload(const std::string &issue_id, const std::string &name, const std::string &content);

  std::unique_ptr<loglens_core::FilesystemLogFileStore> log_store_;
  std::unique_ptr<loglens_core::KnowledgeBaseRepository> repository_;
  std::unique_ptr<loglens_core::ProviderRegistry> registry_;
  std::unique_ptr<loglens_core::BatchEmbedder> embedder_;
  std::unique_ptr<loglens_core::KnowledgeBaseManager> manager_;
  std::map<std::string, std::shared_ptr<testing::NiceMock<MockEmbeddingProvider>>> providers_;
};

}  // namespace loglens_tests
