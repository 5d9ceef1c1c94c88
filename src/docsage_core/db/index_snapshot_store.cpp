#include "docsage_core/db/index_snapshot_store.hpp"

#include <cstdint>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

#include "docsage_core/db/sqlite_error_utils.hpp"
#include "docsage_core/db/transaction.hpp"
#include "docsage_core/index/faiss_vector_index.hpp"
#include "docsage_core/services/compression_service.hpp"

namespace docsage_core {

std::string IndexSnapshotStore::time_point_to_string(
    const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point IndexSnapshotStore::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw SnapshotStoreError("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // Stored as UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

sqlite::database IndexSnapshotStore::open_database(const std::filesystem::path &db_path,
                                                   OpenMode mode) {
  try {
    if (mode == OpenMode::ExistingOnly) {
      std::error_code ec;
      if (!std::filesystem::is_regular_file(db_path, ec)) {
        throw SnapshotStoreError("No index found at " + db_path.string());
      }
      sqlite::sqlite_config config;
      config.flags = sqlite::OpenFlags::READONLY;
      return sqlite::database(db_path.string(), config);
    }

    if (db_path.has_parent_path()) {
      std::filesystem::create_directories(db_path.parent_path());
    }
    return sqlite::database(db_path.string());
  } catch (const std::filesystem::filesystem_error &e) {
    throw SnapshotStoreError("Cannot create directory for " + db_path.string() + ": " + e.what());
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("open " + db_path.string(), e));
  }
}

IndexSnapshotStore::IndexSnapshotStore(const std::filesystem::path &db_path, OpenMode mode)
    : db_path_(db_path), db_(open_database(db_path, mode)) {
  if (mode == OpenMode::CreateIfMissing) {
    create_tables();
  }
}

void IndexSnapshotStore::create_tables() {
  try {
    db_ << R"(
      CREATE TABLE IF NOT EXISTS snapshot_meta (
          id INTEGER PRIMARY KEY CHECK (id = 1),
          embedding_model TEXT NOT NULL,
          distance_metric TEXT NOT NULL,
          dimension INTEGER NOT NULL,
          chunk_size INTEGER NOT NULL,
          chunk_overlap INTEGER NOT NULL,
          document_fingerprint TEXT NOT NULL,
          document_source TEXT NOT NULL,
          chunk_count INTEGER NOT NULL,
          created_at TEXT NOT NULL
      )
    )";

    db_ << R"(
      CREATE TABLE IF NOT EXISTS snapshot_chunks (
          sequence_index INTEGER PRIMARY KEY,
          source_page_index INTEGER NOT NULL,
          start_offset INTEGER NOT NULL,
          end_offset INTEGER NOT NULL,
          content BLOB NOT NULL,
          vector_blob BLOB NOT NULL
      )
    )";
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("create_tables", e));
  }
}

void IndexSnapshotStore::save(const VectorIndex &index, const SnapshotInfo &info) {
  const std::vector<IndexEntry> entries = index.entries();

  try {
    Transaction tx(db_, true);
    db_ << "DELETE FROM snapshot_chunks;";
    db_ << "DELETE FROM snapshot_meta;";

    for (const auto &entry : entries) {
      std::vector<char> vector_blob(entry.vector.size() * sizeof(float));
      std::memcpy(vector_blob.data(), entry.vector.data(), vector_blob.size());
      std::vector<char> compressed_content = CompressionService::compress(entry.chunk.content);

      db_ << "INSERT INTO snapshot_chunks (sequence_index, source_page_index, start_offset, "
             "end_offset, content, vector_blob) VALUES (?, ?, ?, ?, ?, ?)"
          << entry.chunk.sequence_index << entry.chunk.source_page_index
          << static_cast<int64_t>(entry.chunk.start_offset)
          << static_cast<int64_t>(entry.chunk.end_offset) << compressed_content << vector_blob;
    }

    db_ << "INSERT INTO snapshot_meta (id, embedding_model, distance_metric, dimension, "
           "chunk_size, chunk_overlap, document_fingerprint, document_source, chunk_count, "
           "created_at) VALUES (1, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
        << info.embedding_model << to_string(index.metric())
        << static_cast<int64_t>(index.dimension()) << info.chunk_size << info.chunk_overlap
        << info.document_fingerprint << info.document_source
        << static_cast<int64_t>(entries.size()) << time_point_to_string(info.created_at);

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("save snapshot", e));
  } catch (const CompressionError &e) {
    throw SnapshotStoreError("save snapshot failed: " + std::string(e.what()));
  }

  std::cout << "[IndexSnapshotStore] Saved " << entries.size() << " chunks to "
            << db_path_.string() << std::endl;
}

std::optional<SnapshotInfo> IndexSnapshotStore::read_info() {
  std::optional<SnapshotInfo> result;
  try {
    db_ << "SELECT embedding_model, distance_metric, dimension, chunk_size, chunk_overlap, "
           "document_fingerprint, document_source, chunk_count, created_at "
           "FROM snapshot_meta WHERE id = 1" >>
        [&](std::string embedding_model, std::string distance_metric, int64_t dimension,
            int chunk_size, int chunk_overlap, std::string fingerprint, std::string source,
            int64_t chunk_count, std::string created_at) {
          if (dimension < 0 || chunk_count < 0) {
            throw SnapshotStoreError("Snapshot metadata holds negative counts");
          }
          SnapshotInfo info;
          info.embedding_model = std::move(embedding_model);
          info.metric = distance_metric_from_string(distance_metric);
          info.dimension = static_cast<size_t>(dimension);
          info.chunk_size = chunk_size;
          info.chunk_overlap = chunk_overlap;
          info.document_fingerprint = std::move(fingerprint);
          info.document_source = std::move(source);
          info.chunk_count = static_cast<size_t>(chunk_count);
          info.created_at = string_to_time_point(created_at);
          result = std::move(info);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("read snapshot info", e));
  } catch (const InvalidConfigurationError &e) {
    throw SnapshotStoreError("Snapshot metadata is corrupt: " + std::string(e.what()));
  }
  return result;
}

std::unique_ptr<VectorIndex> IndexSnapshotStore::load() {
  std::optional<SnapshotInfo> info = read_info();
  if (!info) {
    throw SnapshotStoreError("No snapshot stored in " + db_path_.string());
  }

  const size_t expected_blob_size = info->dimension * sizeof(float);
  std::vector<IndexEntry> entries;
  entries.reserve(info->chunk_count);

  try {
    db_ << "SELECT sequence_index, source_page_index, start_offset, end_offset, content, "
           "vector_blob FROM snapshot_chunks ORDER BY sequence_index" >>
        [&](int sequence_index, int source_page_index, int64_t start_offset, int64_t end_offset,
            std::vector<char> content, std::vector<char> vector_blob) {
          if (vector_blob.empty() || vector_blob.size() != expected_blob_size) {
            throw SnapshotStoreError("Corrupt vector for chunk " + std::to_string(sequence_index) +
                                     ": expected " + std::to_string(expected_blob_size) +
                                     " bytes, got " + std::to_string(vector_blob.size()));
          }
          if (start_offset < 0 || end_offset < start_offset) {
            throw SnapshotStoreError("Corrupt offsets for chunk " +
                                     std::to_string(sequence_index));
          }

          IndexEntry entry;
          entry.chunk.content = CompressionService::decompress(content);
          entry.chunk.source_page_index = source_page_index;
          entry.chunk.start_offset = static_cast<size_t>(start_offset);
          entry.chunk.end_offset = static_cast<size_t>(end_offset);
          entry.chunk.sequence_index = sequence_index;
          entry.vector.resize(info->dimension);
          std::memcpy(entry.vector.data(), vector_blob.data(), vector_blob.size());
          entries.push_back(std::move(entry));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("load snapshot", e));
  } catch (const CompressionError &e) {
    throw SnapshotStoreError("Corrupt chunk content: " + std::string(e.what()));
  }

  if (entries.size() != info->chunk_count) {
    throw SnapshotStoreError("Snapshot is incomplete: expected " +
                             std::to_string(info->chunk_count) + " chunks, found " +
                             std::to_string(entries.size()));
  }

  auto index = std::make_unique<FaissVectorIndex>(info->metric);
  index->add(entries);
  return index;
}

}  // namespace docsage_core
