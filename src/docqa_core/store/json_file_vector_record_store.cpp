#include "docqa_core/store/json_file_vector_record_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "docqa_core/errors.hpp"
#include "docqa_core/store/record_codec.hpp"

namespace fs = std::filesystem;

namespace docqa_core {

JsonFileVectorRecordStore::JsonFileVectorRecordStore(const fs::path &vectors_dir)
    : vectors_dir_(vectors_dir) {
  std::error_code ec;
  fs::create_directories(vectors_dir_, ec);
  if (ec) {
    throw VectorStoreError("Failed to create vectors directory " + vectors_dir_.string() + ": " +
                           ec.message());
  }
}

std::string JsonFileVectorRecordStore::encode_filename(const std::string &filename) {
  static const char *HEX = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(filename.size());
  for (size_t i = 0; i < filename.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(filename[i]);
    const bool safe = (c < 0x80 && std::isalnum(c)) || c == '_' || c == '-' || (c == '.' && i > 0);
    if (safe) {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded.push_back('%');
      encoded.push_back(HEX[c >> 4]);
      encoded.push_back(HEX[c & 0x0F]);
    }
  }
  return encoded;
}

fs::path JsonFileVectorRecordStore::path_for(const std::string &filename) const {
  return vectors_dir_ / (encode_filename(filename) + ".json");
}

VectorRecord JsonFileVectorRecordStore::read_record(const fs::path &path, bool skip_bad_chunks) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw VectorStoreError("Could not open record file: " + path.string());
  }
  try {
    nlohmann::json payload = nlohmann::json::parse(in);
    if (skip_bad_chunks) {
      return decode_record_skipping_bad_chunks(payload, path.filename().string());
    }
    return payload.get<VectorRecord>();
  } catch (const nlohmann::json::exception &e) {
    throw MalformedRecordError(path.filename().string() + ": " + e.what());
  } catch (const MalformedRecordError &e) {
    throw MalformedRecordError(path.filename().string() + ": " + e.what());
  }
}

std::vector<fs::path> JsonFileVectorRecordStore::list_record_files() const {
  std::vector<fs::path> files;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(vectors_dir_, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    throw VectorStoreError("Failed to list vectors directory " + vectors_dir_.string() + ": " +
                           ec.message());
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::optional<VectorRecord> JsonFileVectorRecordStore::get(const std::string &filename) {
  const fs::path path = path_for(filename);
  if (!fs::exists(path)) {
    return std::nullopt;
  }
  VectorRecord record = read_record(path);
  if (record.filename != filename) {
    throw MalformedRecordError(path.filename().string() + ": stored filename '" +
                               record.filename + "' does not match key '" + filename + "'");
  }
  return record;
}

void JsonFileVectorRecordStore::put(const std::string &filename, const VectorRecord &record) {
  const fs::path target = path_for(filename);
  const fs::path temp =
      vectors_dir_ / (encode_filename(filename) + ".tmp" + std::to_string(temp_counter_++));

  nlohmann::json payload = record;
  payload["filename"] = filename;

  {
    std::ofstream out(temp, std::ios::trunc);
    if (!out.is_open()) {
      throw VectorStoreError("put failed: could not open " + temp.string() + " for writing");
    }
    out << payload.dump(2);
    out.flush();
    if (!out.good()) {
      out.close();
      std::remove(temp.c_str());
      throw VectorStoreError("put failed: could not write " + temp.string());
    }
  }

  std::error_code ec;
  fs::rename(temp, target, ec);
  if (ec) {
    std::remove(temp.c_str());
    throw VectorStoreError("put failed: could not move record into place for '" + filename +
                           "': " + ec.message());
  }
}

bool JsonFileVectorRecordStore::remove(const std::string &filename) {
  std::error_code ec;
  const bool removed = fs::remove(path_for(filename), ec);
  if (ec) {
    throw VectorStoreError("remove failed for '" + filename + "': " + ec.message());
  }
  return removed;
}

std::set<std::string> JsonFileVectorRecordStore::list_filenames() {
  std::set<std::string> filenames;
  for (const auto &path : list_record_files()) {
    std::ifstream in(path);
    try {
      nlohmann::json payload = nlohmann::json::parse(in);
      if (payload.is_object() && payload.contains("filename") && payload["filename"].is_string()) {
        filenames.insert(payload["filename"].get<std::string>());
      } else {
        std::cerr << "Warning: Skipping " << path.filename() << ": no filename field" << std::endl;
      }
    } catch (const nlohmann::json::exception &e) {
      std::cerr << "Warning: Skipping " << path.filename() << ": " << e.what() << std::endl;
    }
  }
  return filenames;
}

std::vector<VectorRecord> JsonFileVectorRecordStore::all_records() {
  std::vector<VectorRecord> records;
  size_t skipped = 0;
  for (const auto &path : list_record_files()) {
    try {
      records.push_back(read_record(path, /*skip_bad_chunks*/ true));
    } catch (const MalformedRecordError &e) {
      ++skipped;
      std::cerr << "Warning: Skipping malformed record " << e.what() << std::endl;
    } catch (const VectorStoreError &e) {
      ++skipped;
      std::cerr << "Warning: Skipping unreadable record " << e.what() << std::endl;
    }
  }
  if (skipped > 0) {
    std::cerr << "Warning: " << skipped << " record file(s) in " << vectors_dir_
              << " could not be loaded" << std::endl;
  }
  std::sort(records.begin(), records.end(),
            [](const VectorRecord &a, const VectorRecord &b) { return a.filename < b.filename; });
  return records;
}

}  // namespace docqa_core
