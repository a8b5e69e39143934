#pragma once

#include <gmock/gmock.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "docqa_cli/command_backend.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/embedding/hashing_embedder.hpp"
#include "docqa_core/store/vector_record_store.hpp"

namespace docqa_tests {

/**
 * Mock Embedder. By default it embeds with a HashingEmbedder of dimension 64 and reports the
 * identity "mock-embedder:d=64".
 */
class MockEmbedder : public docqa_core::Embedder {
 public:
  explicit MockEmbedder(size_t dim = 64) : hashing_(dim) {
    ON_CALL(*this, embed(testing::_)).WillByDefault([this](const std::string& text) {
      return hashing_.embed(text);
    });
    ON_CALL(*this, dimension()).WillByDefault(testing::Return(dim));
    ON_CALL(*this, identity())
        .WillByDefault(testing::Return("mock-embedder:d=" + std::to_string(dim)));
  }

  MOCK_METHOD(std::vector<float>, embed, (const std::string& text), (override));
  MOCK_METHOD(size_t, dimension, (), (const, override));
  MOCK_METHOD(std::string, identity, (), (const, override));

 private:
  docqa_core::HashingEmbedder hashing_;
};

/**
 * Mock VectorRecordStore that keeps records in a map by default, so tests only override the
 * calls they want to fail.
 */
class MockVectorRecordStore : public docqa_core::VectorRecordStore {
 public:
  MockVectorRecordStore() {
    using docqa_core::VectorRecord;
    ON_CALL(*this, get(testing::_))
        .WillByDefault([this](const std::string& filename) -> std::optional<VectorRecord> {
          auto it = records.find(filename);
          if (it == records.end()) {
            return std::nullopt;
          }
          return it->second;
        });
    ON_CALL(*this, put(testing::_, testing::_))
        .WillByDefault([this](const std::string& filename, const VectorRecord& record) {
          records[filename] = record;
        });
    ON_CALL(*this, remove(testing::_)).WillByDefault([this](const std::string& filename) {
      return records.erase(filename) > 0;
    });
    ON_CALL(*this, list_filenames()).WillByDefault([this]() {
      std::set<std::string> filenames;
      for (const auto& [filename, record] : records) {
        filenames.insert(filename);
      }
      return filenames;
    });
    ON_CALL(*this, all_records()).WillByDefault([this]() {
      std::vector<VectorRecord> all;
      for (const auto& [filename, record] : records) {
        all.push_back(record);
      }
      return all;
    });
  }

  MOCK_METHOD(std::optional<docqa_core::VectorRecord>, get, (const std::string& filename),
              (override));
  MOCK_METHOD(void, put, (const std::string& filename, const docqa_core::VectorRecord& record),
              (override));
  MOCK_METHOD(bool, remove, (const std::string& filename), (override));
  MOCK_METHOD(std::set<std::string>, list_filenames, (), (override));
  MOCK_METHOD(std::vector<docqa_core::VectorRecord>, all_records, (), (override));

  std::map<std::string, docqa_core::VectorRecord> records;
};

/**
 * Mock CommandBackend for CLI tests
 */
class MockCommandBackend : public docqa_cli::CommandBackend {
 public:
  MOCK_METHOD(nlohmann::json, ingest, (const std::vector<std::string>& paths), (override));
  MOCK_METHOD(nlohmann::json, ask, (const std::string& question, int top_k), (override));
  MOCK_METHOD(nlohmann::json, documents, (), (override));
  MOCK_METHOD(bool, remove, (const std::string& filename), (override));
  MOCK_METHOD(std::vector<std::string>, scan, (const std::string& dir), (override));
};

}  // namespace docqa_tests
