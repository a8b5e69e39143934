#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/types/vector_record.hpp"

namespace docqa_core {

/**
 * @brief In-memory similarity index over the chunks of many records.
 *
 * Chunks are grouped by embedding dimension. Each group is a faiss inner-product index over
 * L2-normalized vectors, so the inner product is the cosine similarity. Zero vectors stay zero
 * and score 0 against everything.
 *
 * Search is const and safe to run from several threads at once; building is not.
 */
class ChunkIndex {
 public:
  ChunkIndex() = default;

  ChunkIndex(const ChunkIndex &) = delete;
  ChunkIndex &operator=(const ChunkIndex &) = delete;
  ChunkIndex(ChunkIndex &&) = default;
  ChunkIndex &operator=(ChunkIndex &&) = default;

  // Adds every well-formed chunk of the record. Returns the number of chunks rejected
  // (empty or non-finite embeddings).
  size_t add_record(const VectorRecord &record);

  /**
   * @brief Ranks every chunk whose dimension equals the query's.
   *
   * Results are ordered by descending score, ties broken by ascending (filename, index), and cut
   * to k. Chunks indexed under another dimension are not compared; their count is written to
   * dimension_skipped when it is non-null.
   */
  std::vector<Match> search(const std::vector<float> &query, size_t k,
                            size_t *dimension_skipped = nullptr) const;

  size_t size() const {
    return total_;
  }
  bool empty() const {
    return total_ == 0;
  }

  // Scales v to unit length in place. Returns false (and leaves v zero) for a zero vector.
  static bool l2_normalize(std::vector<float> &v);

 private:
  struct Entry {
    std::string filename;
    std::string checksum;
    int index;
    size_t char_start;
    size_t char_end;
    std::string snippet;
  };

  struct Group {
    std::unique_ptr<faiss::IndexIDMap> index;
    std::vector<Entry> entries;
  };

  std::map<size_t, Group> groups_;
  size_t total_ = 0;

  static std::unique_ptr<faiss::IndexIDMap> create_base_index(size_t dimension);
};

}  // namespace docqa_core
