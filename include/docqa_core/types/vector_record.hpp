#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

// The persisted unit: one document's chunks, embeddings and metadata.
struct VectorRecord {
  std::string filename;
  std::string checksum;
  int64_t ingest_timestamp = 0;
  std::string embedder;
  size_t embedding_dimension = 0;
  size_t chunk_size = 0;
  size_t chunk_overlap = 0;
  std::vector<EmbeddedChunk> chunks;
  // Chunks left out by a bulk load because they could not be decoded. Never persisted.
  size_t dropped_chunks = 0;
};

struct DocumentSummary {
  std::string filename;
  std::string checksum;
  int64_t ingest_timestamp = 0;
  std::string embedder;
  size_t embedding_dimension = 0;
  size_t chunk_count = 0;
};

struct Match {
  std::string filename;
  std::string checksum;
  int index = 0;
  size_t char_start = 0;
  size_t char_end = 0;
  std::string snippet;
  float score = 0.0f;
  // file:// URL of the source when it is in the knowledge directory, else ./<filename>.
  // Both carry a #chars=<start>-<end> fragment.
  std::string link;
};

struct Answer {
  std::string question;
  std::string answer;
  std::vector<Match> matches;
  size_t skipped_chunks = 0;
  // Markdown table of the matches, one row each; empty when there are none
  std::string references_table;
};

enum class IngestStatus { CREATED, UPDATED, SKIPPED_DUPLICATE, SKIPPED_EXISTING, FAILED };

inline std::string to_string(IngestStatus status) {
  switch (status) {
    case IngestStatus::CREATED:
      return "created";
    case IngestStatus::UPDATED:
      return "updated";
    case IngestStatus::SKIPPED_DUPLICATE:
      return "skipped_duplicate";
    case IngestStatus::SKIPPED_EXISTING:
      return "skipped_existing";
    case IngestStatus::FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

inline IngestStatus ingest_status_from_string(const std::string &str) {
  if (str == "created")
    return IngestStatus::CREATED;
  if (str == "updated")
    return IngestStatus::UPDATED;
  if (str == "skipped_duplicate")
    return IngestStatus::SKIPPED_DUPLICATE;
  if (str == "skipped_existing")
    return IngestStatus::SKIPPED_EXISTING;
  if (str == "failed")
    return IngestStatus::FAILED;
  throw std::invalid_argument("Unknown IngestStatus: " + str);
}

struct IngestResult {
  std::string filename;
  IngestStatus status = IngestStatus::FAILED;
  size_t chunk_count = 0;
  std::string checksum;
  std::string message;

  bool ok() const {
    return status != IngestStatus::FAILED;
  }

  static IngestResult success_response(const std::string &filename,
                                       IngestStatus status,
                                       size_t chunk_count,
                                       const std::string &checksum,
                                       const std::string &message) {
    return {filename, status, chunk_count, checksum, message};
  }

  static IngestResult failure_response(const std::string &filename, const std::string &reason) {
    return {filename, IngestStatus::FAILED, 0, "", reason};
  }
};

}  // namespace docqa_core
