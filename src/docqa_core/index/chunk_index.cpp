#include "docqa_core/index/chunk_index.hpp"

#include <faiss/impl/FaissException.h>

#include <algorithm>
#include <cmath>
#include <iostream>

#include "docqa_core/errors.hpp"

namespace docqa_core {

std::unique_ptr<faiss::IndexIDMap> ChunkIndex::create_base_index(size_t dimension) {
  auto base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension));
  // Wrap with IDMap so labels are positions in Group::entries
  auto id_map = std::make_unique<faiss::IndexIDMap>(base_index);
  id_map->own_fields = true;
  return id_map;
}

bool ChunkIndex::l2_normalize(std::vector<float> &v) {
  double sum = 0.0;
  for (float x : v) {
    sum += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum <= 0.0) {
    std::fill(v.begin(), v.end(), 0.0f);
    return false;
  }
  const double norm = std::sqrt(sum);
  for (auto &x : v) {
    x = static_cast<float>(x / norm);
  }
  return true;
}

size_t ChunkIndex::add_record(const VectorRecord &record) {
  // Collect per dimension first so each group gets one add_with_ids call
  std::map<size_t, std::vector<float>> vectors_by_dim;
  std::map<size_t, std::vector<Entry>> entries_by_dim;
  size_t rejected = 0;

  for (const auto &embedded : record.chunks) {
    const auto &embedding = embedded.embedding;
    const bool finite = std::all_of(embedding.begin(), embedding.end(),
                                    [](float x) { return std::isfinite(x); });
    if (embedding.empty() || !finite) {
      std::cerr << "Warning: Skipping chunk " << embedded.chunk.index << " of '"
                << record.filename << "': embedding is empty or not finite" << std::endl;
      ++rejected;
      continue;
    }

    std::vector<float> normalized = embedding;
    l2_normalize(normalized);
    auto &flat = vectors_by_dim[normalized.size()];
    flat.insert(flat.end(), normalized.begin(), normalized.end());
    entries_by_dim[normalized.size()].push_back({record.filename, record.checksum,
                                                 embedded.chunk.index, embedded.chunk.char_start,
                                                 embedded.chunk.char_end, embedded.chunk.snippet});
  }

  for (auto &[dimension, entries] : entries_by_dim) {
    auto &group = groups_[dimension];
    if (!group.index) {
      group.index = create_base_index(dimension);
    }
    std::vector<faiss::idx_t> ids(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
      ids[i] = static_cast<faiss::idx_t>(group.entries.size() + i);
    }
    try {
      group.index->add_with_ids(static_cast<faiss::idx_t>(entries.size()),
                                vectors_by_dim[dimension].data(), ids.data());
    } catch (const faiss::FaissException &e) {
      throw VectorStoreError("Failed to add chunks of '" + record.filename +
                             "' to the index: " + e.what());
    }
    total_ += entries.size();
    for (auto &entry : entries) {
      group.entries.push_back(std::move(entry));
    }
  }
  return rejected;
}

std::vector<Match> ChunkIndex::search(const std::vector<float> &query, size_t k,
                                      size_t *dimension_skipped) const {
  size_t skipped = 0;
  for (const auto &[dimension, group] : groups_) {
    if (dimension != query.size()) {
      skipped += group.entries.size();
    }
  }
  if (dimension_skipped) {
    *dimension_skipped = skipped;
  }

  auto it = groups_.find(query.size());
  if (k == 0 || it == groups_.end() || it->second.entries.empty()) {
    return {};
  }
  const Group &group = it->second;

  std::vector<float> normalized = query;
  l2_normalize(normalized);

  // Score everything in the group; faiss ordering does not apply the tie-break
  const faiss::idx_t n = group.index->ntotal;
  std::vector<float> distances(static_cast<size_t>(n));
  std::vector<faiss::idx_t> labels(static_cast<size_t>(n));
  try {
    group.index->search(1, normalized.data(), n, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError(std::string("Index search failed: ") + e.what());
  }

  std::vector<Match> matches;
  matches.reserve(static_cast<size_t>(n));
  for (faiss::idx_t i = 0; i < n; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    const Entry &entry = group.entries[static_cast<size_t>(labels[i])];
    Match match;
    match.filename = entry.filename;
    match.checksum = entry.checksum;
    match.index = entry.index;
    match.char_start = entry.char_start;
    match.char_end = entry.char_end;
    match.snippet = entry.snippet;
    match.score = std::clamp(distances[i], -1.0f, 1.0f);
    matches.push_back(std::move(match));
  }

  std::sort(matches.begin(), matches.end(), [](const Match &a, const Match &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    if (a.filename != b.filename) {
      return a.filename < b.filename;
    }
    return a.index < b.index;
  });
  if (matches.size() > k) {
    matches.resize(k);
  }
  return matches;
}

}  // namespace docqa_core
