#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docqa_core {

// Opens db_path, applies the SQLCipher key (none when db_key is empty) and the connection
// pragmas. Throws VectorStoreError when the key is wrong or the file is not a database.
std::unique_ptr<sqlite::database> open_keyed_database(const std::string& db_path,
                                                      const std::string& db_key);

// Fixed set of keyed connections to the record database, shared by request threads.
class ConnectionPool {
 public:
  ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

  // Blocks until a connection is free. Throws VectorStoreError once the pool is closed.
  std::unique_ptr<sqlite::database> acquire();

  void release(std::unique_ptr<sqlite::database> conn);

  // Drops idle connections and wakes every waiter; connections released later are closed.
  void close();

  size_t available() const;

 private:
  std::vector<std::unique_ptr<sqlite::database>> idle_;
  bool closed_ = false;
  mutable std::mutex mtx_;
  std::condition_variable released_;
};

}  // namespace docqa_core
