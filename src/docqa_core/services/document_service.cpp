#include "docqa_core/services/document_service.hpp"

#include <iostream>
#include <stdexcept>

namespace docqa_core {

DocumentService::DocumentService(std::shared_ptr<VectorRecordStore> store)
    : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("DocumentService requires a store");
  }
}

void DocumentService::set_record_removed_callback(RecordRemovedCallback callback) {
  on_record_removed_ = std::move(callback);
}

DocumentSummary DocumentService::summarize(const VectorRecord &record) {
  return {record.filename,       record.checksum,           record.ingest_timestamp,
          record.embedder,       record.embedding_dimension, record.chunks.size()};
}

std::vector<DocumentSummary> DocumentService::list_documents() {
  std::vector<DocumentSummary> summaries;
  for (const auto &record : store_->all_records()) {
    summaries.push_back(summarize(record));
  }
  return summaries;
}

std::optional<DocumentSummary> DocumentService::get_document(const std::string &filename) {
  std::optional<VectorRecord> record = store_->get(filename);
  if (!record) {
    return std::nullopt;
  }
  return summarize(*record);
}

bool DocumentService::remove_document(const std::string &filename) {
  const bool removed = store_->remove(filename);
  if (removed) {
    std::cout << "Removed '" << filename << "'" << std::endl;
    if (on_record_removed_) {
      on_record_removed_();
    }
  }
  return removed;
}

}  // namespace docqa_core
