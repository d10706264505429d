#include "sqlite_tx.hpp"

namespace freightline::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->AcquireTransactionSlot();
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const TransactionError&) {
    db_->ReleaseTransactionSlot();
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    // destructor must not throw; sqlite3_exec reports failure via rc only
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    Finish();
  }
}

// A failed COMMIT leaves the transaction open for the destructor to roll back.
void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  Finish();
}

void SqliteTransaction::Finish() {
  finished_ = true;
  db_->ReleaseTransactionSlot();
}

} // namespace freightline::db::sqlite
