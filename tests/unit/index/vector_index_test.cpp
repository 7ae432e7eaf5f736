#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <fstream>

#include "common/utilities_test.hpp"
#include "loglens_core/index/vector_index.hpp"
#include "loglens_core/index/vector_storage.hpp"
#include "loglens_core/types/errors.hpp"

namespace loglens_core {

using loglens_tests::MockUtilities::create_test_chunk;

class VectorIndexTest : public loglens_tests::TempDirectoryTestBase {
 protected:
  static ChunkWithVector entry(int n, std::vector<float> vector) {
    return {create_test_chunk("app.log", n, n, "line " + std::to_string(n)), std::move(vector)};
  }

  // [1,0], [0,1], [0.9,0.1]
  VectorIndex three_entry_index() const {
    return VectorIndex::build(model_, {entry(1, {1.0f, 0.0f}), entry(2, {0.0f, 1.0f}),
                                       entry(3, {0.9f, 0.1f})});
  }

  ModelId model_ = ModelId::parse("test:mock:2");
};

TEST_F(VectorIndexTest, SearchRanksByCosineSimilarity) {
  VectorIndex index = three_entry_index();

  auto results = index.search({1.0f, 0.0f}, 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].position, 0u);
  EXPECT_EQ(results[1].position, 2u);
  EXPECT_NEAR(results[0].score, 1.0f, 1e-5f);
  EXPECT_NEAR(results[1].score, 0.9f / std::sqrt(0.82f), 1e-5f);
  EXPECT_EQ(results[0].chunk.chunk_id, "app.log:1-1");
  EXPECT_EQ(results[1].citation(), "app.log: lines 3-3");
}

TEST_F(VectorIndexTest, QueryIsNormalisedBeforeScoring) {
  VectorIndex index = three_entry_index();

  auto results = index.search({5.0f, 0.0f}, 1);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_NEAR(results[0].score, 1.0f, 1e-5f);
}

TEST_F(VectorIndexTest, KLargerThanIndexReturnsEverything) {
  VectorIndex index = three_entry_index();

  auto results = index.search({0.0f, 1.0f}, 10);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].position, 1u);
  EXPECT_GE(results[1].score, results[2].score);
}

TEST_F(VectorIndexTest, EqualScoresKeepInsertionOrder) {
  VectorIndex index = VectorIndex::build(
      model_, {entry(1, {0.0f, 1.0f}), entry(2, {1.0f, 0.0f}), entry(3, {2.0f, 0.0f}),
               entry(4, {3.0f, 0.0f})});

  auto results = index.search({1.0f, 0.0f}, 3);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].position, 1u);
  EXPECT_EQ(results[1].position, 2u);
  EXPECT_EQ(results[2].position, 3u);
}

TEST_F(VectorIndexTest, EmptyIndexReturnsNothing) {
  VectorIndex index(model_);

  EXPECT_TRUE(index.empty());
  EXPECT_TRUE(index.search({1.0f, 0.0f}, 5).empty());
}

TEST_F(VectorIndexTest, InvalidSearchArguments) {
  VectorIndex index = three_entry_index();

  EXPECT_THROW(index.search({1.0f, 0.0f}, 0), ConfigurationError);
  EXPECT_THROW(index.search({1.0f, 0.0f}, -1), ConfigurationError);
  EXPECT_THROW(index.search({1.0f, 0.0f, 0.0f}, 1), ModelMismatchError);
}

TEST_F(VectorIndexTest, AppendRejectsWrongDimensionAtomically) {
  VectorIndex index = three_entry_index();

  EXPECT_THROW(index.append({entry(4, {1.0f, 1.0f}), entry(5, {1.0f, 1.0f, 1.0f})}),
               ModelMismatchError);

  EXPECT_EQ(index.size(), 3u);
}

TEST_F(VectorIndexTest, AppendRejectsDuplicateChunkIds) {
  VectorIndex index = three_entry_index();

  EXPECT_THROW(index.append({entry(2, {1.0f, 1.0f})}), ConsistencyViolation);
  EXPECT_THROW(index.append({entry(7, {1.0f, 1.0f}), entry(7, {1.0f, 1.0f})}),
               ConsistencyViolation);
  EXPECT_EQ(index.size(), 3u);
}

TEST_F(VectorIndexTest, AppendKeepsExistingPositions) {
  VectorIndex index = three_entry_index();

  index.append({entry(4, {-1.0f, 0.0f})});

  ASSERT_EQ(index.size(), 4u);
  EXPECT_EQ(index.chunks()[0].chunk_id, "app.log:1-1");
  EXPECT_EQ(index.chunks()[3].chunk_id, "app.log:4-4");
  EXPECT_EQ(index.vector(3), (std::vector<float>{-1.0f, 0.0f}));
}

TEST_F(VectorIndexTest, CloneIsIndependent) {
  VectorIndex index = three_entry_index();

  VectorIndex copy = index.clone();
  copy.append({entry(4, {1.0f, 1.0f})});

  EXPECT_EQ(index.size(), 3u);
  EXPECT_EQ(copy.size(), 4u);
  EXPECT_EQ(copy.model(), index.model());
}

TEST_F(VectorIndexTest, SaveAndLoadInMemory) {
  VectorIndex index = three_entry_index();
  index.save(temp_dir_ / "gen");

  VectorIndex loaded = VectorIndex::load(temp_dir_ / "gen", /*mapped*/ false);

  EXPECT_FALSE(loaded.is_mapped());
  EXPECT_EQ(loaded.model(), model_);
  EXPECT_EQ(loaded.chunks(), index.chunks());
  for (size_t i = 0; i < index.size(); ++i) {
    EXPECT_EQ(loaded.vector(i), index.vector(i));
  }
}

TEST_F(VectorIndexTest, MappedIndexSearchesLikeInMemory) {
  VectorIndex index = three_entry_index();
  index.save(temp_dir_ / "gen");

  VectorIndex mapped = VectorIndex::load(temp_dir_ / "gen", /*mapped*/ true);

  EXPECT_TRUE(mapped.is_mapped());
  auto expected = index.search({0.7f, 0.3f}, 3);
  auto actual = mapped.search({0.7f, 0.3f}, 3);
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < actual.size(); ++i) {
    EXPECT_EQ(actual[i].position, expected[i].position);
    EXPECT_FLOAT_EQ(actual[i].score, expected[i].score);
  }
}

TEST_F(VectorIndexTest, AppendingToMappedIndexLeavesFileUntouched) {
  VectorIndex index = three_entry_index();
  index.save(temp_dir_ / "gen");
  const std::string before =
      loglens_tests::TestUtilities::read_file_bytes(temp_dir_ / "gen" / VectorIndex::kVectorsFile);

  VectorIndex mapped = VectorIndex::load(temp_dir_ / "gen", true);
  mapped.append({entry(4, {-1.0f, 0.0f})});

  EXPECT_FALSE(mapped.is_mapped());
  EXPECT_EQ(mapped.size(), 4u);
  EXPECT_EQ(mapped.search({-1.0f, 0.0f}, 1)[0].position, 3u);
  EXPECT_EQ(loglens_tests::TestUtilities::read_file_bytes(temp_dir_ / "gen" /
                                                          VectorIndex::kVectorsFile),
            before);
}

TEST_F(VectorIndexTest, EmptyIndexRoundTrips) {
  VectorIndex(model_).save(temp_dir_ / "empty");

  VectorIndex loaded = VectorIndex::load(temp_dir_ / "empty", true);

  EXPECT_TRUE(loaded.empty());
  EXPECT_EQ(loaded.model(), model_);
}

TEST_F(VectorIndexTest, DamagedFilesAreFormatErrors) {
  three_entry_index().save(temp_dir_ / "gen");

  // Missing chunks file
  std::filesystem::remove(temp_dir_ / "gen" / VectorIndex::kChunksFile);
  EXPECT_THROW(VectorIndex::load(temp_dir_ / "gen", false), IndexFormatError);

  // Fewer chunk records than vectors
  {
    std::ofstream out(temp_dir_ / "gen" / VectorIndex::kChunksFile);
    out << nlohmann::json(create_test_chunk("app.log", 1, 1, "line 1")).dump() << "\n";
  }
  EXPECT_THROW(VectorIndex::load(temp_dir_ / "gen", true), IndexFormatError);

  // Foreign vector file
  {
    std::ofstream out(temp_dir_ / "gen" / VectorIndex::kVectorsFile, std::ios::trunc);
    out << "definitely not a vector file";
  }
  EXPECT_THROW(VectorIndex::load(temp_dir_ / "gen", true), IndexFormatError);
  EXPECT_THROW(VectorIndex::load(temp_dir_ / "gen", false), IndexFormatError);

  EXPECT_THROW(VectorIndex::load(temp_dir_ / "absent", true), IndexFormatError);

  // A count whose payload size wraps around to zero bytes
  three_entry_index().save(temp_dir_ / "huge");
  {
    std::fstream io(temp_dir_ / "huge" / VectorIndex::kVectorsFile,
                    std::ios::in | std::ios::out | std::ios::binary);
    const uint64_t count = uint64_t{1} << 61;  // 2^61 rows of 8 bytes
    io.seekp(16);
    io.write(reinterpret_cast<const char *>(&count), sizeof(count));
  }
  EXPECT_THROW(VectorIndex::load(temp_dir_ / "huge", true), IndexFormatError);
  EXPECT_THROW(VectorIndex::load(temp_dir_ / "huge", false), IndexFormatError);
}

TEST_F(VectorIndexTest, TruncatedPayloadIsFormatError) {
  three_entry_index().save(temp_dir_ / "gen");
  auto path = temp_dir_ / "gen" / VectorIndex::kVectorsFile;
  std::filesystem::resize_file(path, std::filesystem::file_size(path) - 4);

  EXPECT_THROW(VectorIndex::load(temp_dir_ / "gen", true), IndexFormatError);
  EXPECT_THROW(VectorIndex::load(temp_dir_ / "gen", false), IndexFormatError);
}

TEST(VectorFileHeaderTest, PayloadIsAligned) {
  VectorFileHeader header;
  header.model_id = "test:mock:2";

  EXPECT_EQ(header.payload_offset() % VectorFileHeader::kPayloadAlignment, 0u);
  EXPECT_GE(header.payload_offset(), 8u + 4u + 4u + 8u + 4u + header.model_id.size());
}

}  // namespace loglens_core
