#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "docqa_core/types/vector_record.hpp"

namespace docqa_core {

// JSON encoding shared by the file store, the API and the CLI.
//
// The from_json overloads for persisted types validate structure and throw
// MalformedRecordError naming the missing or mistyped field.

void to_json(nlohmann::json &j, const EmbeddedChunk &chunk);
void from_json(const nlohmann::json &j, EmbeddedChunk &chunk);

void to_json(nlohmann::json &j, const VectorRecord &record);
void from_json(const nlohmann::json &j, VectorRecord &record);

// Bulk-load variant of from_json: a chunk that fails validation is logged with its position in
// source, left out, and counted in VectorRecord::dropped_chunks. Problems with the record's own
// fields still throw MalformedRecordError.
VectorRecord decode_record_skipping_bad_chunks(const nlohmann::json &j, const std::string &source);

void to_json(nlohmann::json &j, const DocumentSummary &summary);
void to_json(nlohmann::json &j, const Match &match);
void to_json(nlohmann::json &j, const Answer &answer);
void to_json(nlohmann::json &j, const IngestResult &result);

}  // namespace docqa_core
