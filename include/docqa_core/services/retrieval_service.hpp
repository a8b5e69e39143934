#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/index/chunk_index.hpp"
#include "docqa_core/store/vector_record_store.hpp"
#include "docqa_core/types/vector_record.hpp"

namespace docqa_core {

struct RetrievalConfig {
  size_t max_answer_chars = 10000;
  // Where ingested files live; match links point here when the file exists
  std::string knowledge_dir;
};

/**
 * @brief Answers questions by ranking stored chunks against the embedded question.
 *
 * The first query after construction or invalidate() loads every record from the store into a
 * ChunkIndex; later queries reuse it. The ingestion service calls invalidate() after each
 * successful write. Records produced by a different embedder identity are left out of the index,
 * and chunks whose dimension differs from the query are not compared. Both are counted in
 * Answer::skipped_chunks and reported as warnings.
 */
class RetrievalService {
 public:
  RetrievalService(std::shared_ptr<VectorRecordStore> store,
                   std::shared_ptr<Embedder> embedder,
                   RetrievalConfig config = {});

  // Throws ConfigError for a blank question or k <= 0, EmbeddingError if the question
  // cannot be embedded.
  Answer answer(const std::string &question, int k);

  // Drops the cached index. Safe to call from any thread.
  void invalidate();

  bool is_cached() const;

  // Deduplicated snippets in rank order, separated by a blank line and cut to max_chars
  // code points (at a word boundary, with "..." appended, when cut).
  static std::string compose_answer(const std::vector<Match> &matches, size_t max_chars);

  static std::string make_link(const std::string &knowledge_dir, const Match &match);

  // | filename | checksum | index | char_start | char_end | score |, with the filename linked
  static std::string references_table(const std::vector<Match> &matches);

 private:
  struct CachedIndex {
    ChunkIndex index;
    // Chunks left out while building the index
    size_t skipped_chunks = 0;
  };

  std::shared_ptr<const CachedIndex> load_index();

  std::shared_ptr<VectorRecordStore> store_;
  std::shared_ptr<Embedder> embedder_;
  RetrievalConfig config_;

  mutable std::mutex cache_mtx_;
  std::shared_ptr<const CachedIndex> cache_;
};

}  // namespace docqa_core
