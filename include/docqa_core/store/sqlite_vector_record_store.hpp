#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/store/vector_record_store.hpp"

namespace docqa_core {

/**
 * @brief VectorRecordStore backed by the SQLCipher database owned by DatabaseManager.
 *
 * A record is one row in `documents` plus one row per chunk in `chunks`. put() and remove() run
 * inside a BEGIN IMMEDIATE transaction, so concurrent writers to the same filename serialize and
 * a reader never sees a half-written record.
 */
class SqliteVectorRecordStore : public VectorRecordStore {
 public:
  explicit SqliteVectorRecordStore(DatabaseManager &db_manager);

  SqliteVectorRecordStore(const SqliteVectorRecordStore &) = delete;
  SqliteVectorRecordStore &operator=(const SqliteVectorRecordStore &) = delete;

  std::optional<VectorRecord> get(const std::string &filename) override;
  void put(const std::string &filename, const VectorRecord &record) override;
  bool remove(const std::string &filename) override;
  std::set<std::string> list_filenames() override;
  std::vector<VectorRecord> all_records() override;

 private:
  DatabaseManager &db_manager_;

  static std::vector<char> embedding_to_blob(const std::vector<float> &embedding);
  static std::vector<float> blob_to_embedding(const std::vector<char> &blob,
                                              const std::string &filename,
                                              int chunk_index);
};

}  // namespace docqa_core
