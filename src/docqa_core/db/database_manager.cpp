#include "docqa_core/db/database_manager.hpp"

#include "docqa_core/errors.hpp"

namespace docqa_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size) {
  std::lock_guard<std::mutex> lock(init_mtx_);
  if (pool_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      throw VectorStoreError("Could not create " + db_path.parent_path().string() + ": " +
                             ec.message());
    }
  }

  // Schema first, on its own connection, so the pool never races table creation
  {
    auto db = open_keyed_database(db_path.string(), db_key);
    try {
      create_schema(*db);
    } catch (const sqlite::sqlite_exception& e) {
      throw VectorStoreError("Could not create the record schema in " + db_path.string() + ": " +
                             e.what());
    }
  }

  pool_ = std::make_shared<ConnectionPool>(db_path.string(), db_key, pool_size);
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(init_mtx_);
  if (pool_) {
    pool_->close();
    pool_.reset();
  }
}

bool DatabaseManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(init_mtx_);
  return pool_ != nullptr;
}

std::unique_ptr<sqlite::database> DatabaseManager::acquire() {
  std::shared_ptr<ConnectionPool> pool;
  {
    std::lock_guard<std::mutex> lock(init_mtx_);
    pool = pool_;
  }
  if (!pool) {
    throw VectorStoreError("Record database has not been initialized");
  }
  // Wait outside init_mtx_ so shutdown() can still close the pool
  return pool->acquire();
}

void DatabaseManager::release(std::unique_ptr<sqlite::database> conn) {
  std::shared_ptr<ConnectionPool> pool;
  {
    std::lock_guard<std::mutex> lock(init_mtx_);
    pool = pool_;
  }
  // A connection borrowed before shutdown() is simply closed
  if (pool) {
    pool->release(std::move(conn));
  }
}

void DatabaseManager::create_schema(sqlite::database& db) {
  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          filename TEXT PRIMARY KEY NOT NULL,
          checksum TEXT NOT NULL,
          ingest_timestamp INTEGER NOT NULL,
          embedder TEXT NOT NULL,
          embedding_dimension INTEGER NOT NULL,
          chunk_size INTEGER NOT NULL,
          chunk_overlap INTEGER NOT NULL
      )
    )";

  // content holds the zstd-compressed full chunk text
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          filename TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          char_start INTEGER NOT NULL,
          char_end INTEGER NOT NULL,
          snippet TEXT NOT NULL,
          content BLOB,
          vector_blob BLOB,
          UNIQUE (filename, chunk_index),
          FOREIGN KEY (filename) REFERENCES documents(filename) ON DELETE CASCADE
      )
    )";
}

}  // namespace docqa_core
