#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "docqa_core/types/vector_record.hpp"

namespace docqa_core {

/**
 * @brief Keyed persistence of one VectorRecord per filename.
 *
 * Writes are all-or-nothing per filename: a reader observes either the previous record or the
 * new one, never a mix of chunks from both. The store has no notion of checksums or update
 * policy; that belongs to the ingestion service.
 *
 * Storage failures raise VectorStoreError.
 */
class VectorRecordStore {
 public:
  virtual ~VectorRecordStore() = default;

  // Throws MalformedRecordError if the stored unit cannot be decoded.
  virtual std::optional<VectorRecord> get(const std::string &filename) = 0;

  // Atomically creates or fully replaces the record stored under filename.
  virtual void put(const std::string &filename, const VectorRecord &record) = 0;

  // Returns true if a record was removed.
  virtual bool remove(const std::string &filename) = 0;

  virtual std::set<std::string> list_filenames() = 0;

  // Bulk load ordered by filename. Units that cannot be decoded are skipped with a warning.
  virtual std::vector<VectorRecord> all_records() = 0;
};

}  // namespace docqa_core
