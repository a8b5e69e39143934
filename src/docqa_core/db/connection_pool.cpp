#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>
#include "docqa_core/db/connection_pool.hpp"
#include <stdexcept>

#include "docqa_core/errors.hpp"

namespace docqa_core {

std::unique_ptr<sqlite::database> open_keyed_database(const std::string& db_path,
                                                      const std::string& db_key) {
  auto db = std::make_unique<sqlite::database>(db_path);
  sqlite3* handle = db->connection().get();
  if (!handle) {
    throw VectorStoreError("Could not open record database " + db_path);
  }
  if (!db_key.empty() &&
      sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
    throw VectorStoreError("Could not key record database " + db_path + ": " +
                           sqlite3_errmsg(handle));
  }

  try {
    // SQLCipher only checks the key on first read
    *db << "SELECT count(*) FROM sqlite_master;";
    *db << "PRAGMA foreign_keys = ON;";
    *db << "PRAGMA journal_mode = WAL;";
    *db << "PRAGMA busy_timeout = 5000;";
  } catch (const sqlite::sqlite_exception& e) {
    throw VectorStoreError("Could not read record database " + db_path + " (check db_key): " +
                           e.what());
  }
  return db;
}

ConnectionPool::ConnectionPool(const std::string& db_path, const std::string& db_key,
                               int pool_size) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be positive, got " +
                                std::to_string(pool_size));
  }
  idle_.reserve(static_cast<size_t>(pool_size));
  for (int i = 0; i < pool_size; ++i) {
    idle_.push_back(open_keyed_database(db_path, db_key));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mtx_);
  released_.wait(lock, [this] { return closed_ || !idle_.empty(); });
  if (closed_) {
    throw VectorStoreError("Record database is closed");
  }
  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::release(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!closed_ && conn) {
    idle_.push_back(std::move(conn));
  }
  released_.notify_one();
}

void ConnectionPool::close() {
  std::lock_guard<std::mutex> lock(mtx_);
  closed_ = true;
  idle_.clear();
  released_.notify_all();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace docqa_core
