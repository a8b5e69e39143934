#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "docqa_core/services/document_service.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace docqa_core {

using ::testing::NiceMock;
using docqa_tests::TestUtilities;

class DocumentServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<NiceMock<docqa_tests::MockVectorRecordStore>>();
    service_ = std::make_unique<DocumentService>(store_);
  }

  std::shared_ptr<NiceMock<docqa_tests::MockVectorRecordStore>> store_;
  std::unique_ptr<DocumentService> service_;
};

TEST_F(DocumentServiceTest, ListsSummariesByFilename) {
  store_->records["b.md"] = TestUtilities::create_test_record("b.md", {{1.0f, 0.0f, 0.0f}});
  store_->records["a.md"] = TestUtilities::create_test_record(
      "a.md", {{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}}, "sum-a");

  auto documents = service_->list_documents();

  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[0].filename, "a.md");
  EXPECT_EQ(documents[0].checksum, "sum-a");
  EXPECT_EQ(documents[0].chunk_count, 2u);
  EXPECT_EQ(documents[0].embedder, "mock-embedder:d=3");
  EXPECT_EQ(documents[0].embedding_dimension, 3u);
  EXPECT_EQ(documents[0].ingest_timestamp, 1700000000);
  EXPECT_EQ(documents[1].filename, "b.md");
  EXPECT_EQ(documents[1].chunk_count, 1u);
}

TEST_F(DocumentServiceTest, GetDocumentReturnsSummaryOrNothing) {
  store_->records["a.md"] = TestUtilities::create_test_record("a.md", {{1.0f, 0.0f, 0.0f}});

  auto found = service_->get_document("a.md");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename, "a.md");
  EXPECT_EQ(found->chunk_count, 1u);

  EXPECT_FALSE(service_->get_document("missing.md").has_value());
}

TEST_F(DocumentServiceTest, RemoveNotifiesOnlyWhenSomethingWasRemoved) {
  store_->records["a.md"] = TestUtilities::create_test_record("a.md", {{1.0f, 0.0f, 0.0f}});
  int removed = 0;
  service_->set_record_removed_callback([&removed]() { ++removed; });

  EXPECT_TRUE(service_->remove_document("a.md"));
  EXPECT_FALSE(service_->remove_document("a.md"));
  EXPECT_FALSE(service_->remove_document("never-stored.md"));

  EXPECT_EQ(removed, 1);
  EXPECT_TRUE(store_->records.empty());
}

TEST_F(DocumentServiceTest, RequiresStore) {
  EXPECT_THROW(DocumentService service(nullptr), std::invalid_argument);
}

}  // namespace docqa_core
