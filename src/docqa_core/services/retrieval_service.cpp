#include "docqa_core/services/retrieval_service.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "docqa_core/errors.hpp"
#include "docqa_core/utils/text_utils.hpp"

namespace fs = std::filesystem;

namespace docqa_core {

namespace {

const std::string ELLIPSIS = "...";

}  // namespace

RetrievalService::RetrievalService(std::shared_ptr<VectorRecordStore> store,
                                   std::shared_ptr<Embedder> embedder,
                                   RetrievalConfig config)
    : store_(std::move(store)), embedder_(std::move(embedder)), config_(config) {
  if (!store_ || !embedder_) {
    throw std::invalid_argument("RetrievalService requires a store and an embedder");
  }
  if (config_.max_answer_chars == 0) {
    throw ConfigError("max_answer_chars must be greater than 0");
  }
}

void RetrievalService::invalidate() {
  std::lock_guard<std::mutex> lock(cache_mtx_);
  cache_.reset();
}

bool RetrievalService::is_cached() const {
  std::lock_guard<std::mutex> lock(cache_mtx_);
  return cache_ != nullptr;
}

std::shared_ptr<const RetrievalService::CachedIndex> RetrievalService::load_index() {
  std::lock_guard<std::mutex> lock(cache_mtx_);
  if (cache_) {
    return cache_;
  }

  auto built = std::make_shared<CachedIndex>();
  const std::string identity = embedder_->identity();
  const std::vector<VectorRecord> records = store_->all_records();

  for (const auto &record : records) {
    // Chunks the store could not decode have already been reported
    built->skipped_chunks += record.dropped_chunks;
    // Records written before identities were stored carry none; the dimension check still applies
    if (!record.embedder.empty() && record.embedder != identity) {
      std::cerr << "[Retrieval] Warning: Skipping " << record.chunks.size() << " chunk(s) of '"
                << record.filename << "' embedded by '" << record.embedder
                << "', current embedder is '" << identity << "'" << std::endl;
      built->skipped_chunks += record.chunks.size();
      continue;
    }
    built->skipped_chunks += built->index.add_record(record);
  }

  std::cout << "[Retrieval] Indexed " << built->index.size() << " chunk(s) from " << records.size()
            << " record(s)" << std::endl;
  cache_ = built;
  return cache_;
}

Answer RetrievalService::answer(const std::string &question, int k) {
  if (is_blank(question)) {
    throw ConfigError("question must be a non-empty string");
  }
  if (k <= 0) {
    throw ConfigError("k must be > 0, got " + std::to_string(k));
  }

  auto cached = load_index();

  Answer result;
  result.question = question;
  result.skipped_chunks = cached->skipped_chunks;
  if (cached->index.empty()) {
    return result;
  }

  const std::vector<float> query = embedder_->embed(question);

  size_t dimension_skipped = 0;
  result.matches = cached->index.search(query, static_cast<size_t>(k), &dimension_skipped);
  if (dimension_skipped > 0) {
    std::cerr << "[Retrieval] Warning: Skipped " << dimension_skipped
              << " chunk(s) whose embedding dimension differs from the query dimension "
              << query.size() << std::endl;
  }
  result.skipped_chunks += dimension_skipped;
  for (auto &match : result.matches) {
    match.link = make_link(config_.knowledge_dir, match);
  }
  result.answer = compose_answer(result.matches, config_.max_answer_chars);
  result.references_table = references_table(result.matches);
  return result;
}

std::string RetrievalService::compose_answer(const std::vector<Match> &matches, size_t max_chars) {
  std::set<std::string> seen;
  std::string joined;
  size_t total = 0;
  for (const auto &match : matches) {
    if (match.snippet.empty() || !seen.insert(match.snippet).second) {
      continue;
    }
    if (!joined.empty()) {
      joined += "\n\n";
    }
    joined += match.snippet;
    total += code_point_length(match.snippet);
    if (total >= max_chars) {
      break;
    }
  }

  if (code_point_length(joined) <= max_chars) {
    return joined;
  }
  if (max_chars <= ELLIPSIS.size()) {
    return truncate_code_points(joined, max_chars);
  }

  // The ellipsis counts toward max_chars
  const std::vector<size_t> boundaries = code_point_boundaries(joined);
  const size_t cut_at = boundaries[max_chars - ELLIPSIS.size()];
  std::string cut = joined.substr(0, cut_at);
  if (joined[cut_at] != ' ') {
    const size_t last_space = cut.find_last_of(' ');
    if (last_space != std::string::npos && last_space > 0) {
      cut.erase(last_space);
    }
  }
  return cut + ELLIPSIS;
}

std::string RetrievalService::make_link(const std::string &knowledge_dir, const Match &match) {
  const std::string fragment =
      "#chars=" + std::to_string(match.char_start) + "-" + std::to_string(match.char_end);
  if (!knowledge_dir.empty()) {
    std::error_code ec;
    const fs::path candidate = fs::absolute(fs::path(knowledge_dir) / match.filename, ec);
    if (!ec && fs::is_regular_file(candidate, ec)) {
      return "file://" + candidate.lexically_normal().generic_string() + fragment;
    }
  }
  return "./" + match.filename + fragment;
}

std::string RetrievalService::references_table(const std::vector<Match> &matches) {
  if (matches.empty()) {
    return "";
  }
  std::ostringstream table;
  table << "| filename | checksum | index | char_start | char_end | score |\n"
        << "| --- | --- | --- | --- | --- | --- |";
  for (const auto &match : matches) {
    std::string name = match.filename;
    for (size_t pos = name.find('|'); pos != std::string::npos; pos = name.find('|', pos + 2)) {
      name.insert(pos, "\\");
    }
    table << "\n| [" << name << "](" << match.link << ") | " << match.checksum << " | "
          << match.index << " | " << match.char_start << " | " << match.char_end << " | "
          << std::fixed << std::setprecision(6) << match.score << " |";
  }
  return table.str();
}

}  // namespace docqa_core
