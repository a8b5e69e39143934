#pragma once

#include "docqa_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace docqa_core {

// Process-wide owner of the record database: the schema and the connection pool.
class DatabaseManager {
 public:
  static DatabaseManager& get_instance();

  // Creates the schema and the connection pool. Must be called once at startup;
  // later calls are ignored until shutdown().
  void initialize(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);

  // Used by StoreSession. acquire() throws VectorStoreError when not initialized.
  std::unique_ptr<sqlite::database> acquire();
  void release(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  bool is_initialized() const;

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  DatabaseManager() = default;
  static void create_schema(sqlite::database& db);

  std::shared_ptr<ConnectionPool> pool_;
  mutable std::mutex init_mtx_;
};

}  // namespace docqa_core
