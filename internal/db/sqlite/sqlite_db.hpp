#pragma once

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/db/api/result.hpp"

namespace freightline::db::sqlite {

// sqlite3 primary result code -> portable code.
ErrorCode TranslateCode(int rc);

/*
  Thin RAII wrapper around sqlite3*.

  Every transaction shares this one connection, so at most one may be
  open at a time. Another thread waits up to kBusyTimeout for the
  current one to finish; the thread that already holds it gets Busy at
  once.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, transaction control).
  // Throws db::TransactionError carrying the translated code.
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

  // Throws db::TransactionError(Busy) when the connection stays taken.
  void AcquireTransactionSlot();
  void ReleaseTransactionSlot();

  static constexpr std::chrono::milliseconds kBusyTimeout{5000};

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;

  std::timed_mutex             tx_mutex_;
  std::atomic<std::thread::id> tx_owner_{};
};

} // namespace freightline::db::sqlite
