#include "docqa_core/store/record_codec.hpp"

#include <iostream>

#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {

const nlohmann::json &require(const nlohmann::json &j, const char *key) {
  if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
    throw MalformedRecordError(std::string("missing required field '") + key + "'");
  }
  return j.at(key);
}

size_t require_unsigned(const nlohmann::json &j, const char *key) {
  const auto &value = require(j, key);
  if (!value.is_number_integer() || value.get<int64_t>() < 0) {
    throw MalformedRecordError(std::string("field '") + key +
                               "' must be a non-negative integer");
  }
  return value.get<size_t>();
}

std::string require_string(const nlohmann::json &j, const char *key) {
  const auto &value = require(j, key);
  if (!value.is_string()) {
    throw MalformedRecordError(std::string("field '") + key + "' must be a string");
  }
  return value.get<std::string>();
}

}  // namespace

void to_json(nlohmann::json &j, const EmbeddedChunk &chunk) {
  j = nlohmann::json{{"index", chunk.chunk.index},
                     {"char_start", chunk.chunk.char_start},
                     {"char_end", chunk.chunk.char_end},
                     {"snippet", chunk.chunk.snippet},
                     {"content", chunk.chunk.content},
                     {"embedding", chunk.embedding}};
}

void from_json(const nlohmann::json &j, EmbeddedChunk &chunk) {
  chunk.chunk.index = static_cast<int>(require_unsigned(j, "index"));
  chunk.chunk.char_start = require_unsigned(j, "char_start");
  chunk.chunk.char_end = require_unsigned(j, "char_end");
  if (chunk.chunk.char_end < chunk.chunk.char_start) {
    throw MalformedRecordError("chunk " + std::to_string(chunk.chunk.index) +
                               " has char_end before char_start");
  }
  chunk.chunk.snippet = require_string(j, "snippet");
  // Files written before content was stored separately only carry the snippet
  if (j.contains("content") && j.at("content").is_string()) {
    chunk.chunk.content = j.at("content").get<std::string>();
  } else {
    chunk.chunk.content = chunk.chunk.snippet;
  }

  const auto &embedding = require(j, "embedding");
  if (!embedding.is_array()) {
    throw MalformedRecordError("field 'embedding' must be an array");
  }
  chunk.embedding.clear();
  chunk.embedding.reserve(embedding.size());
  for (const auto &value : embedding) {
    if (!value.is_number()) {
      throw MalformedRecordError("chunk " + std::to_string(chunk.chunk.index) +
                                 " has a non-numeric embedding value");
    }
    chunk.embedding.push_back(value.get<float>());
  }
}

void to_json(nlohmann::json &j, const VectorRecord &record) {
  j = nlohmann::json{{"filename", record.filename},
                     {"checksum", record.checksum},
                     {"ingest_timestamp", record.ingest_timestamp},
                     {"embedder", record.embedder},
                     {"embedding_dimension", record.embedding_dimension},
                     {"chunk_size", record.chunk_size},
                     {"chunk_overlap", record.chunk_overlap},
                     {"chunks", record.chunks}};
}

namespace {

// Everything but the chunks. Returns the chunks array.
const nlohmann::json &decode_record_fields(const nlohmann::json &j, VectorRecord &record) {
  record.filename = require_string(j, "filename");
  record.checksum = require_string(j, "checksum");
  const auto &timestamp = require(j, "ingest_timestamp");
  if (!timestamp.is_number()) {
    throw MalformedRecordError("field 'ingest_timestamp' must be a number");
  }
  record.ingest_timestamp = timestamp.get<int64_t>();

  // "embedding_model" is the key used by older vector files
  record.embedder = j.value("embedder", j.value("embedding_model", std::string()));
  record.embedding_dimension = j.value("embedding_dimension", size_t{0});
  record.chunk_size = j.value("chunk_size", size_t{0});
  record.chunk_overlap = j.value("chunk_overlap", j.value("overlap", size_t{0}));

  const auto &chunks = require(j, "chunks");
  if (!chunks.is_array()) {
    throw MalformedRecordError("field 'chunks' must be an array");
  }
  record.chunks.clear();
  record.chunks.reserve(chunks.size());
  record.dropped_chunks = 0;
  return chunks;
}

}  // namespace

void from_json(const nlohmann::json &j, VectorRecord &record) {
  for (const auto &chunk_json : decode_record_fields(j, record)) {
    record.chunks.push_back(chunk_json.get<EmbeddedChunk>());
  }
}

VectorRecord decode_record_skipping_bad_chunks(const nlohmann::json &j,
                                               const std::string &source) {
  VectorRecord record;
  const auto &chunks = decode_record_fields(j, record);
  for (size_t i = 0; i < chunks.size(); ++i) {
    try {
      record.chunks.push_back(chunks[i].get<EmbeddedChunk>());
    } catch (const MalformedRecordError &e) {
      std::cerr << "Warning: Skipping chunk " << i << " of " << source << ": " << e.what()
                << std::endl;
      ++record.dropped_chunks;
    } catch (const nlohmann::json::exception &e) {
      std::cerr << "Warning: Skipping chunk " << i << " of " << source << ": " << e.what()
                << std::endl;
      ++record.dropped_chunks;
    }
  }
  return record;
}

void to_json(nlohmann::json &j, const DocumentSummary &summary) {
  j = nlohmann::json{{"filename", summary.filename},
                     {"checksum", summary.checksum},
                     {"ingest_timestamp", summary.ingest_timestamp},
                     {"embedder", summary.embedder},
                     {"embedding_dimension", summary.embedding_dimension},
                     {"chunk_count", summary.chunk_count}};
}

void to_json(nlohmann::json &j, const Match &match) {
  j = nlohmann::json{{"filename", match.filename},
                     {"checksum", match.checksum},
                     {"index", match.index},
                     {"char_start", match.char_start},
                     {"char_end", match.char_end},
                     {"snippet", match.snippet},
                     {"score", match.score},
                     {"link", match.link}};
}

void to_json(nlohmann::json &j, const Answer &answer) {
  j = nlohmann::json{{"question", answer.question},
                     {"answer", answer.answer},
                     {"matches", answer.matches},
                     {"skipped_chunks", answer.skipped_chunks},
                     {"references_table", answer.references_table}};
}

void to_json(nlohmann::json &j, const IngestResult &result) {
  j = nlohmann::json{{"filename", result.filename},
                     {"status", to_string(result.status)},
                     {"chunk_count", result.chunk_count},
                     {"checksum", result.checksum},
                     {"message", result.message}};
}

}  // namespace docqa_core
