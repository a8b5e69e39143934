#include "docqa_core/store/sqlite_vector_record_store.hpp"

#include <cstring>
#include <iostream>
#include <map>
#include <stdexcept>

#include "docqa_core/db/store_session.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/services/compression_service.hpp"

namespace docqa_core {

namespace {

struct ChunkRow {
  int chunk_index;
  int64_t char_start;
  int64_t char_end;
  std::string snippet;
  std::optional<std::vector<char>> content;
  std::optional<std::vector<char>> vector_blob;
};

}  // namespace

SqliteVectorRecordStore::SqliteVectorRecordStore(DatabaseManager &db_manager)
    : db_manager_(db_manager) {}

std::vector<char> SqliteVectorRecordStore::embedding_to_blob(const std::vector<float> &embedding) {
  std::vector<char> blob(embedding.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), embedding.data(), blob.size());
  }
  return blob;
}

std::vector<float> SqliteVectorRecordStore::blob_to_embedding(const std::vector<char> &blob,
                                                              const std::string &filename,
                                                              int chunk_index) {
  if (blob.size() % sizeof(float) != 0) {
    throw MalformedRecordError("chunk " + std::to_string(chunk_index) + " of '" + filename +
                               "' has a " + std::to_string(blob.size()) +
                               "-byte embedding blob, not a whole number of floats");
  }
  std::vector<float> embedding(blob.size() / sizeof(float));
  if (!embedding.empty()) {
    std::memcpy(embedding.data(), blob.data(), blob.size());
  }
  return embedding;
}

namespace {

// Without strict_content an undecompressable content blob falls back to the snippet.
EmbeddedChunk decode_chunk(const ChunkRow &row, const std::string &filename,
                           std::vector<float> embedding, bool strict_content) {
  if (row.chunk_index < 0 || row.char_start < 0 || row.char_end < row.char_start) {
    throw MalformedRecordError("chunk " + std::to_string(row.chunk_index) + " of '" + filename +
                               "' has invalid offsets");
  }
  EmbeddedChunk chunk;
  chunk.chunk.index = row.chunk_index;
  chunk.chunk.char_start = static_cast<size_t>(row.char_start);
  chunk.chunk.char_end = static_cast<size_t>(row.char_end);
  chunk.chunk.snippet = row.snippet;
  if (row.content) {
    try {
      chunk.chunk.content = CompressionService::decompress(*row.content);
    } catch (const std::runtime_error &e) {
      if (strict_content) {
        throw MalformedRecordError("chunk " + std::to_string(row.chunk_index) + " of '" +
                                   filename + "': " + e.what());
      }
      std::cerr << "Warning: Using the snippet of chunk " << row.chunk_index << " of '"
                << filename << "': " << e.what() << std::endl;
      chunk.chunk.content = row.snippet;
    }
  } else {
    chunk.chunk.content = row.snippet;
  }
  chunk.embedding = std::move(embedding);
  return chunk;
}

}  // namespace

std::optional<VectorRecord> SqliteVectorRecordStore::get(const std::string &filename) {
  try {
    StoreSession conn(db_manager_, StoreSession::Mode::SNAPSHOT);

    std::optional<VectorRecord> result;
    *conn << "SELECT filename, checksum, ingest_timestamp, embedder, embedding_dimension, "
             "chunk_size, chunk_overlap FROM documents WHERE filename = ?"
          << filename >>
        [&](std::string name, std::string checksum, int64_t ingest_timestamp,
            std::string embedder, int64_t embedding_dimension, int64_t chunk_size,
            int64_t chunk_overlap) {
          VectorRecord record;
          record.filename = std::move(name);
          record.checksum = std::move(checksum);
          record.ingest_timestamp = ingest_timestamp;
          record.embedder = std::move(embedder);
          record.embedding_dimension = static_cast<size_t>(embedding_dimension);
          record.chunk_size = static_cast<size_t>(chunk_size);
          record.chunk_overlap = static_cast<size_t>(chunk_overlap);
          result = std::move(record);
        };
    if (!result) {
      return std::nullopt;
    }

    std::vector<ChunkRow> rows;
    *conn << "SELECT chunk_index, char_start, char_end, snippet, content, vector_blob "
             "FROM chunks WHERE filename = ? ORDER BY chunk_index"
          << filename >>
        [&](int chunk_index, int64_t char_start, int64_t char_end, std::string snippet,
            std::optional<std::vector<char>> content,
            std::optional<std::vector<char>> vector_blob) {
          rows.push_back({chunk_index, char_start, char_end, std::move(snippet),
                          std::move(content), std::move(vector_blob)});
        };
    conn.commit();

    for (const auto &row : rows) {
      std::vector<float> embedding;
      if (row.vector_blob) {
        embedding = blob_to_embedding(*row.vector_blob, filename, row.chunk_index);
      }
      result->chunks.push_back(
          decode_chunk(row, filename, std::move(embedding), /*strict_content*/ true));
    }
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreSession::error("get", e);
  }
}

void SqliteVectorRecordStore::put(const std::string &filename, const VectorRecord &record) {
  // Compress before taking the write lock
  std::vector<std::vector<char>> compressed;
  compressed.reserve(record.chunks.size());
  try {
    for (const auto &chunk : record.chunks) {
      compressed.push_back(CompressionService::compress(chunk.chunk.content));
    }
  } catch (const std::runtime_error &e) {
    throw VectorStoreError("put failed for '" + filename + "': " + e.what());
  }

  try {
    StoreSession conn(db_manager_, StoreSession::Mode::WRITE);

    // Cascades to the old chunks
    *conn << "DELETE FROM documents WHERE filename = ?" << filename;

    *conn << "INSERT INTO documents (filename, checksum, ingest_timestamp, embedder, "
             "embedding_dimension, chunk_size, chunk_overlap) VALUES (?,?,?,?,?,?,?)"
          << filename << record.checksum << record.ingest_timestamp << record.embedder
          << static_cast<int64_t>(record.embedding_dimension)
          << static_cast<int64_t>(record.chunk_size) << static_cast<int64_t>(record.chunk_overlap);

    auto insert_chunk = *conn << "INSERT INTO chunks (filename, chunk_index, char_start, char_end, "
                                 "snippet, content, vector_blob) VALUES (?,?,?,?,?,?,?)";
    for (size_t i = 0; i < record.chunks.size(); ++i) {
      const auto &chunk = record.chunks[i];
      insert_chunk << filename << chunk.chunk.index << static_cast<int64_t>(chunk.chunk.char_start)
                   << static_cast<int64_t>(chunk.chunk.char_end) << chunk.chunk.snippet
                   << compressed[i] << embedding_to_blob(chunk.embedding);
      insert_chunk++;
    }
    insert_chunk.used(true);

    conn.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreSession::error("put", e);
  }
}

bool SqliteVectorRecordStore::remove(const std::string &filename) {
  try {
    StoreSession conn(db_manager_, StoreSession::Mode::WRITE);
    *conn << "DELETE FROM documents WHERE filename = ?" << filename;
    const bool removed = conn->rows_modified() > 0;
    conn.commit();
    return removed;
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreSession::error("remove", e);
  }
}

std::set<std::string> SqliteVectorRecordStore::list_filenames() {
  std::set<std::string> filenames;
  try {
    StoreSession conn(db_manager_);
    *conn << "SELECT filename FROM documents" >>
        [&](std::string filename) { filenames.insert(std::move(filename)); };
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreSession::error("list_filenames", e);
  }
  return filenames;
}

std::vector<VectorRecord> SqliteVectorRecordStore::all_records() {
  std::vector<VectorRecord> records;
  std::map<std::string, std::vector<ChunkRow>> rows_by_filename;

  try {
    // Documents and chunks come from the same snapshot
    StoreSession conn(db_manager_, StoreSession::Mode::SNAPSHOT);

    *conn << "SELECT filename, checksum, ingest_timestamp, embedder, embedding_dimension, "
             "chunk_size, chunk_overlap FROM documents ORDER BY filename" >>
        [&](std::string filename, std::string checksum, int64_t ingest_timestamp,
            std::string embedder, int64_t embedding_dimension, int64_t chunk_size,
            int64_t chunk_overlap) {
          VectorRecord record;
          record.filename = std::move(filename);
          record.checksum = std::move(checksum);
          record.ingest_timestamp = ingest_timestamp;
          record.embedder = std::move(embedder);
          record.embedding_dimension = static_cast<size_t>(embedding_dimension);
          record.chunk_size = static_cast<size_t>(chunk_size);
          record.chunk_overlap = static_cast<size_t>(chunk_overlap);
          records.push_back(std::move(record));
        };

    *conn << "SELECT filename, chunk_index, char_start, char_end, snippet, content, vector_blob "
             "FROM chunks ORDER BY filename, chunk_index" >>
        [&](std::string filename, int chunk_index, int64_t char_start, int64_t char_end,
            std::string snippet, std::optional<std::vector<char>> content,
            std::optional<std::vector<char>> vector_blob) {
          rows_by_filename[filename].push_back({chunk_index, char_start, char_end,
                                                std::move(snippet), std::move(content),
                                                std::move(vector_blob)});
        };
    conn.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreSession::error("all_records", e);
  }

  // A bad chunk costs only itself
  for (auto &record : records) {
    for (const auto &row : rows_by_filename[record.filename]) {
      try {
        std::vector<float> embedding;
        if (row.vector_blob) {
          embedding = blob_to_embedding(*row.vector_blob, record.filename, row.chunk_index);
        }
        record.chunks.push_back(
            decode_chunk(row, record.filename, std::move(embedding), /*strict_content*/ false));
      } catch (const MalformedRecordError &e) {
        std::cerr << "Warning: Skipping chunk: " << e.what() << std::endl;
        ++record.dropped_chunks;
      }
    }
  }
  return records;
}

}  // namespace docqa_core
