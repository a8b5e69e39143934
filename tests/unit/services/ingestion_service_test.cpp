#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "docqa_core/errors.hpp"
#include "docqa_core/services/ingestion_service.hpp"
#include "docqa_core/utils/checksum.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace docqa_core {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

class IngestionServiceTest : public docqa_tests::TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    store_ = std::make_shared<NiceMock<docqa_tests::MockVectorRecordStore>>();
    embedder_ = std::make_shared<NiceMock<docqa_tests::MockEmbedder>>(32);
    config_.chunking.chunk_size = 40;
    config_.chunking.chunk_overlap = 10;
    config_.chunking.snippet_max_chars = 500;
    service_ = make_service(config_);
  }

  std::unique_ptr<IngestionService> make_service(const IngestionConfig& config) {
    return std::make_unique<IngestionService>(store_, embedder_, nullptr, config);
  }

  std::shared_ptr<NiceMock<docqa_tests::MockVectorRecordStore>> store_;
  std::shared_ptr<NiceMock<docqa_tests::MockEmbedder>> embedder_;
  IngestionConfig config_;
  std::unique_ptr<IngestionService> service_;
};

TEST_F(IngestionServiceTest, FirstIngestCreatesRecord) {
  const std::string text = docqa_tests::TestUtilities::create_test_text(100);

  IngestResult result = service_->ingest("notes.md", text);

  EXPECT_EQ(result.status, IngestStatus::CREATED);
  EXPECT_EQ(result.chunk_count, 3u);
  EXPECT_EQ(result.checksum, compute_checksum(text));
  ASSERT_EQ(store_->records.count("notes.md"), 1u);

  const VectorRecord& stored = store_->records["notes.md"];
  EXPECT_EQ(stored.filename, "notes.md");
  EXPECT_EQ(stored.checksum, result.checksum);
  EXPECT_EQ(stored.embedder, "mock-embedder:d=32");
  EXPECT_EQ(stored.embedding_dimension, 32u);
  EXPECT_EQ(stored.chunk_size, 40u);
  EXPECT_EQ(stored.chunk_overlap, 10u);
  EXPECT_GT(stored.ingest_timestamp, 0);
  ASSERT_EQ(stored.chunks.size(), 3u);
  EXPECT_EQ(stored.chunks[1].chunk.char_start, 30u);
  EXPECT_EQ(stored.chunks[1].chunk.char_end, 70u);
  EXPECT_EQ(stored.chunks[1].embedding.size(), 32u);
}

TEST_F(IngestionServiceTest, ReingestingSameTextIsSkippedDuplicate) {
  const std::string text = docqa_tests::TestUtilities::create_test_text(100);
  EXPECT_CALL(*store_, put(_, _)).Times(1);

  IngestResult first = service_->ingest("notes.md", text);
  const VectorRecord before = store_->records["notes.md"];
  IngestResult second = service_->ingest("notes.md", text);

  EXPECT_EQ(first.status, IngestStatus::CREATED);
  EXPECT_EQ(second.status, IngestStatus::SKIPPED_DUPLICATE);
  EXPECT_EQ(second.chunk_count, first.chunk_count);
  EXPECT_EQ(second.chunk_count, 3u);
  EXPECT_EQ(second.checksum, first.checksum);
  EXPECT_EQ(store_->records["notes.md"].ingest_timestamp, before.ingest_timestamp);
}

TEST_F(IngestionServiceTest, ChangedTextReplacesTheRecord) {
  service_->ingest("notes.md", docqa_tests::TestUtilities::create_test_text(100));
  const std::string updated_text = "A short replacement.";

  IngestResult result = service_->ingest("notes.md", updated_text);

  EXPECT_EQ(result.status, IngestStatus::UPDATED);
  EXPECT_EQ(result.chunk_count, 1u);
  ASSERT_EQ(store_->records.size(), 1u);
  const VectorRecord& stored = store_->records["notes.md"];
  EXPECT_EQ(stored.checksum, compute_checksum(updated_text));
  ASSERT_EQ(stored.chunks.size(), 1u);
  EXPECT_EQ(stored.chunks[0].chunk.content, updated_text);
}

TEST_F(IngestionServiceTest, SkipPolicyKeepsExistingRecord) {
  config_.update_policy = UpdatePolicy::SKIP_EXISTING;
  service_ = make_service(config_);
  IngestResult first = service_->ingest("notes.md", "original text");

  IngestResult result = service_->ingest("notes.md", "changed text");

  EXPECT_EQ(result.status, IngestStatus::SKIPPED_EXISTING);
  EXPECT_EQ(result.checksum, first.checksum);
  EXPECT_EQ(store_->records["notes.md"].checksum, first.checksum);
}

TEST_F(IngestionServiceTest, NewEmbedderIdentityReingestsUnchangedText) {
  service_->ingest("notes.md", "some text");
  store_->records["notes.md"].embedder = "hashing-v1:d=384";

  IngestResult result = service_->ingest("notes.md", "some text");

  EXPECT_EQ(result.status, IngestStatus::UPDATED);
  EXPECT_EQ(store_->records["notes.md"].embedder, "mock-embedder:d=32");
}

TEST_F(IngestionServiceTest, UnreadableStoredRecordIsReplaced) {
  EXPECT_CALL(*store_, get("notes.md")).WillOnce(Throw(MalformedRecordError("bad json")));

  IngestResult result = service_->ingest("notes.md", "some text");

  EXPECT_EQ(result.status, IngestStatus::UPDATED);
  EXPECT_EQ(store_->records.count("notes.md"), 1u);
}

TEST_F(IngestionServiceTest, EmptyOrBlankTextFails) {
  EXPECT_CALL(*store_, put(_, _)).Times(0);

  EXPECT_EQ(service_->ingest("empty.md", "").status, IngestStatus::FAILED);
  IngestResult blank = service_->ingest("blank.md", " \n\t ");
  EXPECT_EQ(blank.status, IngestStatus::FAILED);
  EXPECT_FALSE(blank.message.empty());
  EXPECT_TRUE(blank.checksum.empty());
}

TEST_F(IngestionServiceTest, EmptyFilenameFails) {
  EXPECT_EQ(service_->ingest("", "text").status, IngestStatus::FAILED);
}

TEST_F(IngestionServiceTest, InvalidUtf8Fails) {
  IngestResult result = service_->ingest("bad.txt", std::string("abc\xFF", 4));
  EXPECT_EQ(result.status, IngestStatus::FAILED);
  EXPECT_TRUE(store_->records.empty());
}

TEST_F(IngestionServiceTest, EmbeddingFailureWritesNothing) {
  service_->ingest("notes.md", "original text");
  const std::string original_checksum = store_->records["notes.md"].checksum;
  EXPECT_CALL(*embedder_, embed(_)).WillRepeatedly(Throw(EmbeddingError("model offline")));
  EXPECT_CALL(*store_, put(_, _)).Times(0);

  IngestResult result = service_->ingest("notes.md", "changed text");

  EXPECT_EQ(result.status, IngestStatus::FAILED);
  EXPECT_THAT(result.message, ::testing::HasSubstr("model offline"));
  EXPECT_EQ(store_->records["notes.md"].checksum, original_checksum);
}

TEST_F(IngestionServiceTest, WrongEmbeddingDimensionFails) {
  EXPECT_CALL(*embedder_, embed(_)).WillRepeatedly(::testing::Return(std::vector<float>(8, 1.0f)));
  EXPECT_CALL(*store_, put(_, _)).Times(0);

  IngestResult result = service_->ingest("notes.md", "some text");

  EXPECT_EQ(result.status, IngestStatus::FAILED);
}

TEST_F(IngestionServiceTest, StoreFailureIsReportedAndSkipsCallback) {
  int written = 0;
  service_->set_record_written_callback([&written]() { ++written; });
  EXPECT_CALL(*store_, put(_, _)).WillOnce(Throw(VectorStoreError("disk full")));

  IngestResult result = service_->ingest("notes.md", "some text");

  EXPECT_EQ(result.status, IngestStatus::FAILED);
  EXPECT_THAT(result.message, ::testing::HasSubstr("disk full"));
  EXPECT_EQ(written, 0);
}

TEST_F(IngestionServiceTest, CallbackRunsAfterEverySuccessfulWrite) {
  int written = 0;
  service_->set_record_written_callback([&written]() { ++written; });

  service_->ingest("a.md", "first");
  service_->ingest("a.md", "first");
  service_->ingest("a.md", "second");

  EXPECT_EQ(written, 2);
}

TEST_F(IngestionServiceTest, InvalidChunkingConfigThrowsBeforeTouchingStore) {
  EXPECT_CALL(*store_, get(_)).Times(0);
  ChunkingConfig bad;
  bad.chunk_size = 10;
  bad.chunk_overlap = 10;

  EXPECT_THROW(service_->ingest("notes.md", "text", bad), ConfigError);

  config_.chunking.chunk_overlap = 50;
  EXPECT_THROW(make_service(config_), ConfigError);
}

TEST_F(IngestionServiceTest, ExplicitChunkingConfigIsRecorded) {
  ChunkingConfig chunking;
  chunking.chunk_size = 10;
  chunking.chunk_overlap = 2;

  IngestResult result = service_->ingest("notes.md", "0123456789abcdefghij", chunking);

  EXPECT_EQ(result.chunk_count, 3u);
  EXPECT_EQ(store_->records["notes.md"].chunk_size, 10u);
  EXPECT_EQ(store_->records["notes.md"].chunk_overlap, 2u);
}

TEST_F(IngestionServiceTest, IngestFileKeysRecordByFileName) {
  auto path = temp_dir_ / "guide.md";
  docqa_tests::TestUtilities::write_file(path, "# Guide\r\n\r\nStep one.\r\n");

  IngestResult result = service_->ingest_file(path);

  EXPECT_EQ(result.status, IngestStatus::CREATED);
  EXPECT_EQ(result.filename, "guide.md");
  ASSERT_EQ(store_->records.count("guide.md"), 1u);
  EXPECT_EQ(store_->records["guide.md"].checksum, compute_checksum("# Guide\n\nStep one."));
}

TEST_F(IngestionServiceTest, IngestFileRejectsMissingUnsupportedAndOversizedFiles) {
  EXPECT_EQ(service_->ingest_file(temp_dir_ / "missing.md").status, IngestStatus::FAILED);

  auto pdf = temp_dir_ / "slides.pdf";
  docqa_tests::TestUtilities::write_file(pdf, "%PDF-1.4");
  IngestResult unsupported = service_->ingest_file(pdf);
  EXPECT_EQ(unsupported.status, IngestStatus::FAILED);
  EXPECT_THAT(unsupported.message, ::testing::HasSubstr("unsupported"));

  config_.max_file_size_bytes = 16;
  service_ = make_service(config_);
  auto big = temp_dir_ / "big.txt";
  docqa_tests::TestUtilities::write_file(big, std::string(64, 'x'));
  EXPECT_EQ(service_->ingest_file(big).status, IngestStatus::FAILED);

  EXPECT_TRUE(store_->records.empty());
}

TEST_F(IngestionServiceTest, BatchReportsEachFileInOrder) {
  auto good = temp_dir_ / "good.txt";
  auto empty = temp_dir_ / "empty.txt";
  auto other = temp_dir_ / "other.md";
  docqa_tests::TestUtilities::write_file(good, "useful content");
  docqa_tests::TestUtilities::write_file(empty, "\n\n");
  docqa_tests::TestUtilities::write_file(other, "more content");

  auto results = service_->ingest_files({good, empty, temp_dir_ / "missing.txt", other});

  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0].status, IngestStatus::CREATED);
  EXPECT_EQ(results[1].status, IngestStatus::FAILED);
  EXPECT_EQ(results[2].status, IngestStatus::FAILED);
  EXPECT_EQ(results[3].status, IngestStatus::CREATED);
  EXPECT_EQ(store_->records.size(), 2u);
}

}  // namespace docqa_core
