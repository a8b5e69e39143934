#include "docqa_core/services/ingestion_service.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "docqa_core/errors.hpp"
#include "docqa_core/utils/checksum.hpp"
#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

IngestionService::IngestionService(std::shared_ptr<VectorRecordStore> store,
                                   std::shared_ptr<Embedder> embedder,
                                   std::shared_ptr<ContentExtractorFactory> extractor_factory,
                                   IngestionConfig config)
    : store_(std::move(store)),
      embedder_(std::move(embedder)),
      extractor_factory_(std::move(extractor_factory)),
      config_(config) {
  if (!store_ || !embedder_) {
    throw std::invalid_argument("IngestionService requires a store and an embedder");
  }
  if (!extractor_factory_) {
    extractor_factory_ = std::make_shared<ContentExtractorFactory>();
  }
  TextChunker::validate(config_.chunking);
}

void IngestionService::set_record_written_callback(RecordWrittenCallback callback) {
  on_record_written_ = std::move(callback);
}

int64_t IngestionService::now_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

IngestResult IngestionService::ingest(const std::string &filename, const std::string &text) {
  return ingest(filename, text, config_.chunking);
}

std::vector<EmbeddedChunk> IngestionService::embed_chunks(const std::vector<Chunk> &chunks) {
  std::vector<EmbeddedChunk> embedded;
  embedded.reserve(chunks.size());
  const size_t dimension = embedder_->dimension();
  for (const auto &chunk : chunks) {
    std::vector<float> embedding = embedder_->embed(chunk.content);
    if (embedding.size() != dimension) {
      throw DimensionMismatchError(dimension, embedding.size());
    }
    embedded.push_back({chunk, std::move(embedding)});
  }
  return embedded;
}

IngestResult IngestionService::ingest(const std::string &filename, const std::string &text,
                                      const ChunkingConfig &chunking) {
  // Invalid config is fatal to the call, not a per-document failure
  TextChunker chunker(chunking);

  if (filename.empty()) {
    return IngestResult::failure_response(filename, "filename is empty");
  }
  if (is_blank(text)) {
    return IngestResult::failure_response(filename, "document is empty");
  }

  std::string checksum;
  std::vector<Chunk> chunks;
  try {
    chunks = chunker.chunk(text);
    checksum = compute_checksum(text);
  } catch (const ContentError &e) {
    return IngestResult::failure_response(filename, e.what());
  } catch (const std::runtime_error &e) {
    return IngestResult::failure_response(filename, std::string("checksum failed: ") + e.what());
  }

  const std::string identity = embedder_->identity();
  IngestStatus status = IngestStatus::CREATED;
  try {
    std::optional<VectorRecord> existing = store_->get(filename);
    if (existing) {
      if (existing->checksum == checksum && existing->embedder == identity) {
        return IngestResult::success_response(filename, IngestStatus::SKIPPED_DUPLICATE,
                                              existing->chunks.size(), checksum,
                                              "unchanged since last ingest");
      }
      if (existing->checksum != checksum &&
          config_.update_policy == UpdatePolicy::SKIP_EXISTING) {
        return IngestResult::success_response(filename, IngestStatus::SKIPPED_EXISTING,
                                              existing->chunks.size(), existing->checksum,
                                              "content changed; existing record kept");
      }
      status = IngestStatus::UPDATED;
    }
  } catch (const MalformedRecordError &e) {
    std::cerr << "Warning: Stored record for '" << filename
              << "' is unreadable and will be replaced: " << e.what() << std::endl;
    status = IngestStatus::UPDATED;
  } catch (const VectorStoreError &e) {
    return IngestResult::failure_response(filename, e.what());
  }

  VectorRecord record;
  record.filename = filename;
  record.checksum = checksum;
  record.ingest_timestamp = now_seconds();
  record.embedder = identity;
  record.embedding_dimension = embedder_->dimension();
  record.chunk_size = chunking.chunk_size;
  record.chunk_overlap = chunking.chunk_overlap;

  try {
    record.chunks = embed_chunks(chunks);
  } catch (const EmbeddingError &e) {
    return IngestResult::failure_response(filename, std::string("embedding failed: ") + e.what());
  } catch (const DimensionMismatchError &e) {
    return IngestResult::failure_response(filename, std::string("embedding failed: ") + e.what());
  }

  try {
    store_->put(filename, record);
  } catch (const VectorStoreError &e) {
    return IngestResult::failure_response(filename, e.what());
  }

  if (on_record_written_) {
    on_record_written_();
  }

  std::cout << "Ingested '" << filename << "': " << to_string(status) << " ("
            << record.chunks.size() << " chunks)" << std::endl;
  return IngestResult::success_response(filename, status, record.chunks.size(), checksum,
                                        status == IngestStatus::CREATED ? "ingested"
                                                                        : "re-ingested");
}

IngestResult IngestionService::ingest_file(const std::filesystem::path &file_path) {
  const std::string filename = file_path.filename().string();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    return IngestResult::failure_response(filename, "file not found: " + file_path.string());
  }
  if (!extractor_factory_->is_supported(file_path)) {
    return IngestResult::failure_response(filename, "unsupported file type");
  }
  const uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    return IngestResult::failure_response(filename, "could not stat file: " + ec.message());
  }
  if (size > config_.max_file_size_bytes) {
    return IngestResult::failure_response(
        filename, "file is " + std::to_string(size) + " bytes, limit is " +
                      std::to_string(config_.max_file_size_bytes));
  }

  std::string text;
  try {
    text = extractor_factory_->get_extractor_for(file_path).extract_text(file_path);
  } catch (const ContentExtractorError &e) {
    return IngestResult::failure_response(filename, e.what());
  } catch (const ContentError &e) {
    return IngestResult::failure_response(filename, e.what());
  }
  return ingest(filename, text);
}

std::vector<IngestResult> IngestionService::ingest_files(
    const std::vector<std::filesystem::path> &file_paths) {
  std::vector<IngestResult> results;
  results.reserve(file_paths.size());
  for (const auto &path : file_paths) {
    try {
      results.push_back(ingest_file(path));
    } catch (const std::exception &e) {
      std::cerr << "Error: Ingesting " << path << " failed: " << e.what() << std::endl;
      results.push_back(IngestResult::failure_response(path.filename().string(), e.what()));
    }
  }
  return results;
}

}  // namespace docqa_core
