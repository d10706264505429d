#include "pg_tx.hpp"

#include "internal/db/api/result.hpp"

namespace freightline::db::postgres {

namespace {

ErrorCode TranslateCode(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return ErrorCode::SerializationFailure;
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return ErrorCode::IOError;
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) return ErrorCode::IOError;
  return ErrorCode::InternalError;
}

} // namespace

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::failure& e) {
    throw TransactionError(TranslateCode(e), e.what());
  }
}

PgTransaction::~PgTransaction() {
  // pqxx::work aborts in its own destructor when neither committed nor aborted
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::failure& e) {
    finished_ = true;
    throw TransactionError(TranslateCode(e), e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  tx_->abort();
  finished_ = true;
}

} // namespace freightline::db::postgres
