#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "docqa_core/errors.hpp"
#include "docqa_core/store/record_codec.hpp"
#include "../../common/utilities_test.hpp"

namespace docqa_core {

namespace {

nlohmann::json minimal_record_json() {
  return nlohmann::json{
      {"filename", "notes.md"},
      {"checksum", "abc123"},
      {"ingest_timestamp", 1700000000},
      {"embedder", "hashing-v1:d=3"},
      {"embedding_dimension", 3},
      {"chunk_size", 40},
      {"chunk_overlap", 10},
      {"chunks", nlohmann::json::array({nlohmann::json{{"index", 0},
                                                       {"char_start", 0},
                                                       {"char_end", 40},
                                                       {"snippet", "first chunk"},
                                                       {"content", "first chunk full text"},
                                                       {"embedding", {0.1, 0.2, 0.3}}}})}};
}

}  // namespace

TEST(RecordCodecTest, WritesTheStoredFieldNames) {
  VectorRecord record =
      docqa_tests::TestUtilities::create_test_record("notes.md", {{1.0f, 0.0f, 0.0f}});
  nlohmann::json j = record;

  EXPECT_EQ(j["filename"], "notes.md");
  EXPECT_EQ(j["checksum"], "checksum");
  EXPECT_EQ(j["ingest_timestamp"], 1700000000);
  EXPECT_EQ(j["embedder"], "mock-embedder:d=3");
  EXPECT_EQ(j["embedding_dimension"], 3);
  ASSERT_EQ(j["chunks"].size(), 1u);
  EXPECT_EQ(j["chunks"][0]["index"], 0);
  EXPECT_EQ(j["chunks"][0]["char_end"], 10);
  EXPECT_EQ(j["chunks"][0]["embedding"].size(), 3u);
}

TEST(RecordCodecTest, ReadsAllFields) {
  VectorRecord record = minimal_record_json().get<VectorRecord>();

  EXPECT_EQ(record.filename, "notes.md");
  EXPECT_EQ(record.checksum, "abc123");
  EXPECT_EQ(record.ingest_timestamp, 1700000000);
  EXPECT_EQ(record.embedder, "hashing-v1:d=3");
  EXPECT_EQ(record.chunk_size, 40u);
  EXPECT_EQ(record.chunk_overlap, 10u);
  ASSERT_EQ(record.chunks.size(), 1u);
  EXPECT_EQ(record.chunks[0].chunk.snippet, "first chunk");
  EXPECT_EQ(record.chunks[0].chunk.content, "first chunk full text");
  EXPECT_FLOAT_EQ(record.chunks[0].embedding[2], 0.3f);
}

TEST(RecordCodecTest, AcceptsLegacyKeysAndMissingContent) {
  nlohmann::json j = minimal_record_json();
  j.erase("embedder");
  j.erase("chunk_overlap");
  j["embedding_model"] = "mxbai-embed-large";
  j["overlap"] = 5;
  j["chunks"][0].erase("content");

  VectorRecord record = j.get<VectorRecord>();

  EXPECT_EQ(record.embedder, "mxbai-embed-large");
  EXPECT_EQ(record.chunk_overlap, 5u);
  EXPECT_EQ(record.chunks[0].chunk.content, "first chunk");
}

TEST(RecordCodecTest, MissingRequiredFieldIsMalformed) {
  for (const char* field : {"filename", "checksum", "ingest_timestamp", "chunks"}) {
    nlohmann::json j = minimal_record_json();
    j.erase(field);
    EXPECT_THROW(j.get<VectorRecord>(), MalformedRecordError) << field;
  }
}

TEST(RecordCodecTest, BadChunkIsMalformed) {
  nlohmann::json reversed = minimal_record_json();
  reversed["chunks"][0]["char_start"] = 50;
  EXPECT_THROW(reversed.get<VectorRecord>(), MalformedRecordError);

  nlohmann::json text_embedding = minimal_record_json();
  text_embedding["chunks"][0]["embedding"] = nlohmann::json::array({0.1, "x", 0.3});
  EXPECT_THROW(text_embedding.get<VectorRecord>(), MalformedRecordError);

  nlohmann::json negative_index = minimal_record_json();
  negative_index["chunks"][0]["index"] = -1;
  EXPECT_THROW(negative_index.get<VectorRecord>(), MalformedRecordError);
}

TEST(RecordCodecTest, BulkDecodeDropsOnlyTheBadChunks) {
  nlohmann::json j = minimal_record_json();
  nlohmann::json second = j["chunks"][0];
  second["index"] = 1;
  second["embedding"] = nlohmann::json::array({1.0, "x", 0.0});
  nlohmann::json third = j["chunks"][0];
  third["index"] = 2;
  third.erase("snippet");
  j["chunks"].push_back(second);
  j["chunks"].push_back(third);
  j["chunks"].push_back("not a chunk");

  VectorRecord record = decode_record_skipping_bad_chunks(j, "notes.md.json");

  EXPECT_EQ(record.filename, "notes.md");
  ASSERT_EQ(record.chunks.size(), 1u);
  EXPECT_EQ(record.chunks[0].chunk.index, 0);
  EXPECT_EQ(record.dropped_chunks, 3u);
  EXPECT_THROW(j.get<VectorRecord>(), MalformedRecordError);
}

TEST(RecordCodecTest, BulkDecodeStillRejectsBadRecordFields) {
  nlohmann::json j = minimal_record_json();
  j.erase("checksum");
  EXPECT_THROW(decode_record_skipping_bad_chunks(j, "notes.md.json"), MalformedRecordError);

  j = minimal_record_json();
  j["chunks"] = "none";
  EXPECT_THROW(decode_record_skipping_bad_chunks(j, "notes.md.json"), MalformedRecordError);
}

TEST(RecordCodecTest, IngestResultUsesLowercaseStatus) {
  IngestResult result = IngestResult::success_response("a.md", IngestStatus::SKIPPED_DUPLICATE,
                                                       3, "abc", "unchanged");
  nlohmann::json j = result;

  EXPECT_EQ(j["status"], "skipped_duplicate");
  EXPECT_EQ(j["chunk_count"], 3);
  EXPECT_EQ(ingest_status_from_string("skipped_duplicate"), IngestStatus::SKIPPED_DUPLICATE);
  EXPECT_THROW(ingest_status_from_string("done"), std::invalid_argument);
}

TEST(RecordCodecTest, AnswerCarriesMatchesAndSkippedCount) {
  Answer answer;
  answer.question = "q";
  answer.answer = "a";
  answer.skipped_chunks = 2;
  Match match;
  match.filename = "notes.md";
  match.index = 1;
  match.score = 0.5f;
  match.link = "./notes.md#chars=0-10";
  answer.matches.push_back(match);
  answer.references_table = "| filename |";

  nlohmann::json j = answer;

  EXPECT_EQ(j["question"], "q");
  EXPECT_EQ(j["skipped_chunks"], 2);
  ASSERT_EQ(j["matches"].size(), 1u);
  EXPECT_EQ(j["matches"][0]["filename"], "notes.md");
  EXPECT_EQ(j["matches"][0]["index"], 1);
  EXPECT_EQ(j["matches"][0]["link"], "./notes.md#chars=0-10");
  EXPECT_EQ(j["references_table"], "| filename |");
}

}  // namespace docqa_core
