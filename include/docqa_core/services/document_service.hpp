#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/store/vector_record_store.hpp"
#include "docqa_core/types/vector_record.hpp"

namespace docqa_core {

class DocumentService {
 public:
  using RecordRemovedCallback = std::function<void()>;

  explicit DocumentService(std::shared_ptr<VectorRecordStore> store);

  void set_record_removed_callback(RecordRemovedCallback callback);

  // Summaries of every readable record, ordered by filename.
  std::vector<DocumentSummary> list_documents();
  std::optional<DocumentSummary> get_document(const std::string &filename);

  // Returns false if nothing was stored under filename.
  bool remove_document(const std::string &filename);


  static DocumentSummary summarize(const VectorRecord &record);

 private:
  std::shared_ptr<VectorRecordStore> store_;
  RecordRemovedCallback on_record_removed_;
};

}  // namespace docqa_core
