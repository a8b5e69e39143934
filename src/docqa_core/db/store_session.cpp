#include "docqa_core/db/store_session.hpp"

#include <iostream>

namespace docqa_core {

StoreSession::StoreSession(DatabaseManager &manager, Mode mode)
    : manager_(manager), conn_(manager.acquire()) {
  if (mode == Mode::AUTOCOMMIT) {
    return;
  }
  try {
    *conn_ << (mode == Mode::WRITE ? "BEGIN IMMEDIATE;" : "BEGIN;");
  } catch (const sqlite::sqlite_exception &e) {
    manager_.release(std::move(conn_));
    throw error(mode == Mode::WRITE ? "begin write" : "begin read", e);
  }
  in_transaction_ = true;
}

StoreSession::~StoreSession() {
  if (in_transaction_) {
    try {
      *conn_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "Warning: Rollback failed: " << e.what() << std::endl;
    }
  }
  manager_.release(std::move(conn_));
}

void StoreSession::commit() {
  if (in_transaction_) {
    *conn_ << "COMMIT;";
    in_transaction_ = false;
  }
}

VectorStoreError StoreSession::error(const std::string &operation,
                                     const sqlite::sqlite_exception &e) {
  std::string message = operation + " failed: " + e.errstr() + " [code=" +
                        std::to_string(e.get_code()) + ", xcode=" +
                        std::to_string(e.get_extended_code()) + "]";
  switch (e.get_code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      message += ": another writer held the database past busy_timeout";
      break;
    case SQLITE_NOTADB:
      message += ": wrong db_key, or not a docqa database";
      break;
    case SQLITE_FULL:
      message += ": disk is full";
      break;
    case SQLITE_READONLY:
      message += ": database file is read-only";
      break;
    default:
      break;
  }
  return VectorStoreError(message);
}

}  // namespace docqa_core
