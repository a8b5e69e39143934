#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/chunking/text_chunker.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/store/vector_record_store.hpp"
#include "docqa_core/types/vector_record.hpp"

namespace docqa_core {

enum class UpdatePolicy { REPLACE_ON_CHANGE, SKIP_EXISTING };

inline std::string to_string(UpdatePolicy policy) {
  switch (policy) {
    case UpdatePolicy::REPLACE_ON_CHANGE:
      return "replace";
    case UpdatePolicy::SKIP_EXISTING:
      return "skip";
    default:
      return "unknown";
  }
}

inline UpdatePolicy update_policy_from_string(const std::string &str) {
  if (str == "replace")
    return UpdatePolicy::REPLACE_ON_CHANGE;
  if (str == "skip")
    return UpdatePolicy::SKIP_EXISTING;
  throw std::invalid_argument("Unknown UpdatePolicy: " + str);
}

struct IngestionConfig {
  ChunkingConfig chunking;
  UpdatePolicy update_policy = UpdatePolicy::REPLACE_ON_CHANGE;
  uintmax_t max_file_size_bytes = 10 * 1024 * 1024;
};

/**
 * @brief Turns documents into stored VectorRecords, one store write per document at most.
 *
 * The content checksum decides what happens to a filename that is already stored:
 *  - same checksum: skipped_duplicate, nothing is written
 *  - different checksum: re-chunked and re-embedded (updated), or skipped_existing under
 *    UpdatePolicy::SKIP_EXISTING
 *
 * Every per-document problem (empty text, invalid UTF-8, embedding failure, store failure) is
 * reported as a failed IngestResult and leaves the stored record untouched.
 */
class IngestionService {
 public:
  using RecordWrittenCallback = std::function<void()>;

  // Throws ConfigError if config.chunking is invalid.
  IngestionService(std::shared_ptr<VectorRecordStore> store,
                   std::shared_ptr<Embedder> embedder,
                   std::shared_ptr<ContentExtractorFactory> extractor_factory,
                   IngestionConfig config = {});

  // Invoked after every successful put, e.g. to drop the retrieval cache.
  void set_record_written_callback(RecordWrittenCallback callback);

  // Ingests already-normalized text under the given filename with the service's chunking config.
  IngestResult ingest(const std::string &filename, const std::string &text);

  // Same, with an explicit chunking config. Throws ConfigError before touching the store if the
  // config is invalid.
  IngestResult ingest(const std::string &filename, const std::string &text,
                      const ChunkingConfig &chunking);

  // Reads and normalizes the file, then ingests it keyed by its file name (not its path).
  IngestResult ingest_file(const std::filesystem::path &file_path);

  // One result per path, in order. A failing file does not affect the others.
  std::vector<IngestResult> ingest_files(const std::vector<std::filesystem::path> &file_paths);

  const IngestionConfig &config() const {
    return config_;
  }

 private:
  std::shared_ptr<VectorRecordStore> store_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  IngestionConfig config_;
  RecordWrittenCallback on_record_written_;

  std::vector<EmbeddedChunk> embed_chunks(const std::vector<Chunk> &chunks);
  static int64_t now_seconds();
};

}  // namespace docqa_core
