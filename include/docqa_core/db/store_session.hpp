#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>
#include <string>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/errors.hpp"

namespace docqa_core {

/**
 * @brief One unit of work against the record database.
 *
 * Borrows a pooled connection for its lifetime. SNAPSHOT and WRITE sessions also open a
 * transaction that is rolled back on scope exit unless commit() was called; WRITE takes the
 * write lock up front (BEGIN IMMEDIATE) so concurrent writers queue on busy_timeout instead of
 * failing at COMMIT.
 */
class StoreSession {
 public:
  enum class Mode { AUTOCOMMIT, SNAPSHOT, WRITE };

  explicit StoreSession(DatabaseManager &manager, Mode mode = Mode::AUTOCOMMIT);
  ~StoreSession();

  StoreSession(const StoreSession &) = delete;
  StoreSession &operator=(const StoreSession &) = delete;

  sqlite::database &operator*() const {
    return *conn_;
  }
  sqlite::database *operator->() const {
    return conn_.get();
  }

  void commit();

  // VectorStoreError naming the store operation, the SQLite codes and, for the common
  // failures, what to check.
  static VectorStoreError error(const std::string &operation, const sqlite::sqlite_exception &e);

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
  bool in_transaction_ = false;
};

}  // namespace docqa_core
