#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <chrono>
#include <memory>
#include <vector>

#include "docsage_core/db/index_snapshot_store.hpp"
#include "docsage_core/index/faiss_vector_index.hpp"
#include "utilities_test.hpp"

namespace docsage_core {

using docsage_tests::TempFileTestBase;
using docsage_tests::TestUtilities;

class IndexSnapshotStoreTest : public TempFileTestBase {
 protected:
  void SetUp() override {
    db_path_ = temp_path(".db");
    entries_ = TestUtilities::create_test_entries(10);
    // Chunk text should survive compression byte for byte
    entries_[4].chunk.content = "Ünïcödé chunk with\nnewlines and\ttabs";
    entries_[4].chunk.source_page_index = 2;
    entries_[4].chunk.start_offset = 120;
    entries_[4].chunk.end_offset = 160;

    info_.embedding_model = "nomic-embed-text";
    info_.chunk_size = 500;
    info_.chunk_overlap = 50;
    info_.document_fingerprint = "abc123";
    info_.document_source = "manual.txt";
    info_.created_at = std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());
  }

  std::unique_ptr<FaissVectorIndex> make_index(DistanceMetric metric = DistanceMetric::Euclidean) {
    auto index = std::make_unique<FaissVectorIndex>(metric);
    index->add(entries_);
    return index;
  }

  std::filesystem::path db_path_;
  std::vector<IndexEntry> entries_;
  SnapshotInfo info_;
};

TEST_F(IndexSnapshotStoreTest, FreshStoreHasNoSnapshot) {
  IndexSnapshotStore store(db_path_);

  EXPECT_FALSE(store.read_info().has_value());
  EXPECT_THROW(store.load(), SnapshotStoreError);
}

TEST_F(IndexSnapshotStoreTest, RestoredIndexAnswersQueriesIdentically) {
  auto original = make_index();
  {
    IndexSnapshotStore store(db_path_);
    store.save(*original, info_);
  }

  IndexSnapshotStore reopened(db_path_);
  std::unique_ptr<VectorIndex> restored = reopened.load();

  ASSERT_EQ(restored->size(), original->size());
  EXPECT_EQ(restored->dimension(), original->dimension());
  EXPECT_EQ(restored->metric(), DistanceMetric::Euclidean);

  for (const char *query : {"first query", "second query", "chunk 4"}) {
    std::vector<float> vector = TestUtilities::create_test_vector(query);
    std::vector<ScoredChunk> expected = original->query(vector, 5);
    std::vector<ScoredChunk> actual = restored->query(vector, 5);
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
      EXPECT_EQ(actual[i].chunk, expected[i].chunk);
      EXPECT_FLOAT_EQ(actual[i].distance, expected[i].distance);
    }
  }
}

TEST_F(IndexSnapshotStoreTest, RestoresChunkMetadataAndVectors) {
  IndexSnapshotStore store(db_path_);
  store.save(*make_index(), info_);

  std::vector<IndexEntry> restored = store.load()->entries();

  ASSERT_EQ(restored.size(), entries_.size());
  for (size_t i = 0; i < entries_.size(); ++i) {
    EXPECT_EQ(restored[i].chunk, entries_[i].chunk);
    EXPECT_EQ(restored[i].vector, entries_[i].vector);
  }
}

TEST_F(IndexSnapshotStoreTest, ReadInfoTakesShapeFromIndex) {
  IndexSnapshotStore store(db_path_);
  info_.metric = DistanceMetric::Euclidean;
  info_.dimension = 999;
  info_.chunk_count = 1;
  store.save(*make_index(DistanceMetric::Cosine), info_);

  std::optional<SnapshotInfo> info = store.read_info();

  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->embedding_model, "nomic-embed-text");
  EXPECT_EQ(info->metric, DistanceMetric::Cosine);
  EXPECT_EQ(info->dimension, 8u);
  EXPECT_EQ(info->chunk_count, entries_.size());
  EXPECT_EQ(info->chunk_size, 500);
  EXPECT_EQ(info->chunk_overlap, 50);
  EXPECT_EQ(info->document_fingerprint, "abc123");
  EXPECT_EQ(info->document_source, "manual.txt");
  EXPECT_EQ(info->created_at, info_.created_at);
}

TEST_F(IndexSnapshotStoreTest, CosineMetricSurvivesRestore) {
  IndexSnapshotStore store(db_path_);
  auto original = make_index(DistanceMetric::Cosine);
  store.save(*original, info_);

  std::unique_ptr<VectorIndex> restored = store.load();
  EXPECT_EQ(restored->metric(), DistanceMetric::Cosine);

  std::vector<float> query = TestUtilities::create_test_vector("cosine query");
  std::vector<ScoredChunk> expected = original->query(query, 3);
  std::vector<ScoredChunk> actual = restored->query(query, 3);
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(actual[i].chunk.sequence_index, expected[i].chunk.sequence_index);
  }
}

TEST_F(IndexSnapshotStoreTest, SaveReplacesPreviousSnapshot) {
  IndexSnapshotStore store(db_path_);
  store.save(*make_index(), info_);

  auto smaller = std::make_unique<FaissVectorIndex>();
  smaller->add(TestUtilities::create_test_entries(3, 4));
  info_.document_fingerprint = "def456";
  store.save(*smaller, info_);

  std::unique_ptr<VectorIndex> restored = store.load();
  EXPECT_EQ(restored->size(), 3u);
  EXPECT_EQ(restored->dimension(), 4u);
  EXPECT_EQ(store.read_info()->document_fingerprint, "def456");
}

TEST_F(IndexSnapshotStoreTest, CorruptVectorBlobIsRejected) {
  {
    IndexSnapshotStore store(db_path_);
    store.save(*make_index(), info_);
  }
  {
    sqlite::database db(db_path_.string());
    db << "UPDATE snapshot_chunks SET vector_blob = x'00010203' WHERE sequence_index = 3;";
  }

  IndexSnapshotStore store(db_path_);
  EXPECT_THROW(store.load(), SnapshotStoreError);
}

TEST_F(IndexSnapshotStoreTest, CorruptChunkContentIsRejected) {
  {
    IndexSnapshotStore store(db_path_);
    store.save(*make_index(), info_);
  }
  {
    sqlite::database db(db_path_.string());
    db << "UPDATE snapshot_chunks SET content = x'DEADBEEFDEADBEEF' WHERE sequence_index = 1;";
  }

  IndexSnapshotStore store(db_path_);
  EXPECT_THROW(store.load(), SnapshotStoreError);
}

TEST_F(IndexSnapshotStoreTest, MissingChunkRowsAreDetected) {
  {
    IndexSnapshotStore store(db_path_);
    store.save(*make_index(), info_);
  }
  {
    sqlite::database db(db_path_.string());
    db << "DELETE FROM snapshot_chunks WHERE sequence_index = 7;";
  }

  IndexSnapshotStore store(db_path_);
  EXPECT_THROW(store.load(), SnapshotStoreError);
}

TEST_F(IndexSnapshotStoreTest, CreatesParentDirectories) {
  std::filesystem::path nested = temp_path("") / "nested" / "index.db";
  {
    IndexSnapshotStore store(nested);
    store.save(*make_index(), info_);
  }
  EXPECT_TRUE(std::filesystem::exists(nested));
  std::filesystem::remove_all(nested.parent_path().parent_path());
}

TEST_F(IndexSnapshotStoreTest, ExistingOnlyRejectsMissingFileWithoutCreatingIt) {
  std::filesystem::path missing = temp_path("") / "typo" / "index.db";

  EXPECT_THROW(
      { IndexSnapshotStore store(missing, IndexSnapshotStore::OpenMode::ExistingOnly); },
      SnapshotStoreError);
  EXPECT_FALSE(std::filesystem::exists(missing));
  EXPECT_FALSE(std::filesystem::exists(missing.parent_path()));
}

TEST_F(IndexSnapshotStoreTest, ExistingOnlyLoadsSavedSnapshot) {
  {
    IndexSnapshotStore store(db_path_);
    store.save(*make_index(), info_);
  }

  IndexSnapshotStore reader(db_path_, IndexSnapshotStore::OpenMode::ExistingOnly);
  ASSERT_TRUE(reader.read_info().has_value());
  EXPECT_EQ(reader.load()->size(), entries_.size());
  // Read-only handle
  EXPECT_THROW(reader.save(*make_index(), info_), SnapshotStoreError);
}

TEST(IndexSnapshotStoreTimeTest, TimeStringsAreUtcSeconds) {
  auto tp = std::chrono::system_clock::from_time_t(1700000000);
  std::string text = IndexSnapshotStore::time_point_to_string(tp);

  EXPECT_EQ(text, "2023-11-14 22:13:20");
  EXPECT_EQ(IndexSnapshotStore::string_to_time_point(text), tp);
  EXPECT_THROW(IndexSnapshotStore::string_to_time_point("yesterday"), SnapshotStoreError);
}

}  // namespace docsage_core
