#include "sqlite_db.hpp"

namespace freightline::db::sqlite {

ErrorCode TranslateCode(int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw TransactionError(TranslateCode(rc), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw TransactionError(TranslateCode(rc), "sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw TransactionError(TranslateCode(rc), msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers run while the writer holds the lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(kBusyTimeout.count())), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

void SqliteDB::AcquireTransactionSlot() {
  if (tx_owner_.load() == std::this_thread::get_id()) {
    throw TransactionError(ErrorCode::Busy, "sqlite " + path_ + ": a transaction is already open on this thread");
  }
  if (!tx_mutex_.try_lock_for(kBusyTimeout)) {
    throw TransactionError(ErrorCode::Busy, "sqlite " + path_ + ": timed out waiting for the open transaction");
  }
  tx_owner_.store(std::this_thread::get_id());
}

void SqliteDB::ReleaseTransactionSlot() {
  tx_owner_.store(std::thread::id{});
  tx_mutex_.unlock();
}

} // namespace freightline::db::sqlite
