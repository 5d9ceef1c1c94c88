#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "docsage_core/errors.hpp"
#include "docsage_core/index/vector_index.hpp"

namespace docsage_core {

class SnapshotStoreError : public DocsageError {
 public:
  explicit SnapshotStoreError(const std::string &message) : DocsageError(message) {}
};

// What a snapshot was built from. Enough to decide whether a rebuild is needed.
struct SnapshotInfo {
  std::string embedding_model;
  DistanceMetric metric = DistanceMetric::Euclidean;
  size_t dimension = 0;
  int chunk_size = 0;
  int chunk_overlap = 0;
  std::string document_fingerprint;
  std::string document_source;
  size_t chunk_count = 0;
  std::chrono::system_clock::time_point created_at;
};

/**
 * @class IndexSnapshotStore
 * @brief Persists one VectorIndex to a SQLite file and restores it without re-embedding.
 *
 * A file holds at most one snapshot. Chunk text is stored zstd-compressed,
 * vectors as raw native-endian float blobs.
 */
class IndexSnapshotStore {
 public:
  enum class OpenMode {
    // Creates the file, its parent directories and the schema if missing.
    CreateIfMissing,
    // Read-only; throws SnapshotStoreError if the file does not exist.
    ExistingOnly
  };

  explicit IndexSnapshotStore(const std::filesystem::path &db_path,
                              OpenMode mode = OpenMode::CreateIfMissing);

  IndexSnapshotStore(const IndexSnapshotStore &) = delete;
  IndexSnapshotStore &operator=(const IndexSnapshotStore &) = delete;

  // Replaces any previous snapshot in a single transaction. metric, dimension
  // and chunk_count are taken from the index, not from `info`.
  void save(const VectorIndex &index, const SnapshotInfo &info);

  // Throws SnapshotStoreError if no snapshot exists or any row is corrupt.
  std::unique_ptr<VectorIndex> load();

  std::optional<SnapshotInfo> read_info();

  const std::filesystem::path &path() const {
    return db_path_;
  }

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

 private:
  std::filesystem::path db_path_;
  sqlite::database db_;

  static sqlite::database open_database(const std::filesystem::path &db_path, OpenMode mode);
  void create_tables();
};

}  // namespace docsage_core
