#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "docqa_core/errors.hpp"
#include "docqa_core/store/json_file_vector_record_store.hpp"
#include "../../common/utilities_test.hpp"

namespace docqa_core {

class JsonFileVectorRecordStoreTest : public docqa_tests::TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    vectors_dir_ = temp_dir_ / "vectors";
    store_ = std::make_unique<JsonFileVectorRecordStore>(vectors_dir_);
  }

  size_t count_files() const {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(vectors_dir_)) {
      (void)entry;
      ++count;
    }
    return count;
  }

  std::filesystem::path vectors_dir_;
  std::unique_ptr<JsonFileVectorRecordStore> store_;
};

TEST_F(JsonFileVectorRecordStoreTest, CreatesVectorsDirectory) {
  EXPECT_TRUE(std::filesystem::is_directory(vectors_dir_));
}

TEST_F(JsonFileVectorRecordStoreTest, PutThenGetReturnsTheRecord) {
  auto record = docqa_tests::TestUtilities::create_test_record(
      "notes.md", {{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}}, "sum1");

  store_->put("notes.md", record);
  auto loaded = store_->get("notes.md");

  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->filename, "notes.md");
  EXPECT_EQ(loaded->checksum, "sum1");
  EXPECT_EQ(loaded->embedder, record.embedder);
  ASSERT_EQ(loaded->chunks.size(), 2u);
  EXPECT_EQ(loaded->chunks[1].chunk.char_start, 10u);
  EXPECT_EQ(loaded->chunks[1].chunk.content, record.chunks[1].chunk.content);
  EXPECT_EQ(loaded->chunks[1].embedding, record.chunks[1].embedding);
}

TEST_F(JsonFileVectorRecordStoreTest, GetOfUnknownFilenameIsEmpty) {
  EXPECT_FALSE(store_->get("missing.md").has_value());
}

TEST_F(JsonFileVectorRecordStoreTest, PutReplacesAndLeavesNoTemporaryFiles) {
  store_->put("notes.md", docqa_tests::TestUtilities::create_test_record(
                              "notes.md", {{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}}, "old"));
  store_->put("notes.md",
              docqa_tests::TestUtilities::create_test_record("notes.md", {{0.0f, 0.0f, 1.0f}},
                                                             "new"));

  auto loaded = store_->get("notes.md");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->checksum, "new");
  EXPECT_EQ(loaded->chunks.size(), 1u);
  EXPECT_EQ(count_files(), 1u);
}

TEST_F(JsonFileVectorRecordStoreTest, StoredFileUsesTheDocumentFormat) {
  store_->put("notes.md",
              docqa_tests::TestUtilities::create_test_record("notes.md", {{1.0f, 0.0f, 0.0f}}));

  std::ifstream in(store_->path_for("notes.md"));
  ASSERT_TRUE(in.is_open());
  nlohmann::json payload = nlohmann::json::parse(in);

  EXPECT_EQ(payload["filename"], "notes.md");
  EXPECT_TRUE(payload.contains("checksum"));
  EXPECT_TRUE(payload.contains("ingest_timestamp"));
  EXPECT_TRUE(payload["chunks"].is_array());
  EXPECT_TRUE(payload["chunks"][0].contains("embedding"));
}

TEST_F(JsonFileVectorRecordStoreTest, EncodesUnsafeFilenames) {
  EXPECT_EQ(JsonFileVectorRecordStore::encode_filename("notes.md"), "notes.md");
  EXPECT_EQ(JsonFileVectorRecordStore::encode_filename("a/b c.md"), "a%2Fb%20c.md");
  EXPECT_EQ(JsonFileVectorRecordStore::encode_filename(".hidden"), "%2Ehidden");
  EXPECT_EQ(JsonFileVectorRecordStore::encode_filename(".."), "%2E.");

  const std::string name = "../escape attempt.md";
  store_->put(name, docqa_tests::TestUtilities::create_test_record(name, {{1.0f, 0.0f, 0.0f}}));
  EXPECT_EQ(store_->path_for(name).parent_path(), vectors_dir_);
  auto loaded = store_->get(name);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->filename, name);
}

TEST_F(JsonFileVectorRecordStoreTest, RemoveDeletesTheRecord) {
  store_->put("notes.md",
              docqa_tests::TestUtilities::create_test_record("notes.md", {{1.0f, 0.0f, 0.0f}}));

  EXPECT_TRUE(store_->remove("notes.md"));
  EXPECT_FALSE(store_->get("notes.md").has_value());
  EXPECT_FALSE(store_->remove("notes.md"));
}

TEST_F(JsonFileVectorRecordStoreTest, ListsFilenamesAndAllRecordsSorted) {
  for (const std::string name : {"b.md", "a.txt", "c.md"}) {
    store_->put(name, docqa_tests::TestUtilities::create_test_record(name, {{1.0f, 0.0f, 0.0f}}));
  }

  auto filenames = store_->list_filenames();
  EXPECT_EQ(filenames, (std::set<std::string>{"a.txt", "b.md", "c.md"}));

  auto records = store_->all_records();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].filename, "a.txt");
  EXPECT_EQ(records[1].filename, "b.md");
  EXPECT_EQ(records[2].filename, "c.md");
}

TEST_F(JsonFileVectorRecordStoreTest, AllRecordsSkipsUnreadableFiles) {
  store_->put("good.md",
              docqa_tests::TestUtilities::create_test_record("good.md", {{1.0f, 0.0f, 0.0f}}));
  docqa_tests::TestUtilities::write_file(vectors_dir_ / "broken.json", "{ not json");
  docqa_tests::TestUtilities::write_file(vectors_dir_ / "partial.json",
                                         R"({"filename": "partial.md", "checksum": "x"})");

  auto records = store_->all_records();

  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].filename, "good.md");
  EXPECT_EQ(records[0].dropped_chunks, 0u);
  EXPECT_EQ(store_->list_filenames(), (std::set<std::string>{"good.md", "partial.md"}));
}

TEST_F(JsonFileVectorRecordStoreTest, AllRecordsKeepsGoodChunksOfDamagedFile) {
  docqa_tests::TestUtilities::write_file(vectors_dir_ / "doc.md.json", R"({
    "filename": "doc.md", "checksum": "c", "ingest_timestamp": 1700000000,
    "embedder": "mock-embedder:d=2", "embedding_dimension": 2,
    "chunks": [
      {"index": 0, "char_start": 0, "char_end": 10, "snippet": "kept", "embedding": [1.0, 0.0]},
      {"index": 1, "char_start": 10, "char_end": 20, "snippet": "lost", "embedding": [1.0, "x"]}
    ]})");

  auto records = store_->all_records();

  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].filename, "doc.md");
  ASSERT_EQ(records[0].chunks.size(), 1u);
  EXPECT_EQ(records[0].chunks[0].chunk.snippet, "kept");
  EXPECT_EQ(records[0].chunks[0].embedding, (std::vector<float>{1.0f, 0.0f}));
  EXPECT_EQ(records[0].dropped_chunks, 1u);

  EXPECT_THROW(store_->get("doc.md"), MalformedRecordError);
}

TEST_F(JsonFileVectorRecordStoreTest, GetOfMalformedFileThrows) {
  docqa_tests::TestUtilities::write_file(store_->path_for("notes.md"), "[1, 2, 3]");
  EXPECT_THROW(store_->get("notes.md"), MalformedRecordError);
}

TEST_F(JsonFileVectorRecordStoreTest, GetRejectsFileStoredUnderAnotherName) {
  store_->put("other.md",
              docqa_tests::TestUtilities::create_test_record("other.md", {{1.0f, 0.0f, 0.0f}}));
  std::filesystem::copy_file(store_->path_for("other.md"), store_->path_for("notes.md"));

  EXPECT_THROW(store_->get("notes.md"), MalformedRecordError);
}

}  // namespace docqa_core
