#pragma once

#include <atomic>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "docqa_core/store/vector_record_store.hpp"

namespace docqa_core {

/**
 * @brief Stores each record as a JSON document `<encoded filename>.json` in one directory.
 *
 * put() writes a sibling temporary file and renames it over the target, so a reader sees
 * either the complete old file or the complete new one.
 */
class JsonFileVectorRecordStore : public VectorRecordStore {
 public:
  explicit JsonFileVectorRecordStore(const std::filesystem::path &vectors_dir);

  std::optional<VectorRecord> get(const std::string &filename) override;
  void put(const std::string &filename, const VectorRecord &record) override;
  bool remove(const std::string &filename) override;
  std::set<std::string> list_filenames() override;
  std::vector<VectorRecord> all_records() override;

  std::filesystem::path path_for(const std::string &filename) const;

  // Percent-encodes every byte outside [A-Za-z0-9._-], plus a leading '.'.
  static std::string encode_filename(const std::string &filename);

 private:
  std::filesystem::path vectors_dir_;
  std::atomic<uint64_t> temp_counter_{0};

  std::vector<std::filesystem::path> list_record_files() const;
  // With skip_bad_chunks, undecodable chunks are dropped and counted instead of failing the file.
  static VectorRecord read_record(const std::filesystem::path &path, bool skip_bad_chunks = false);
};

}  // namespace docqa_core
