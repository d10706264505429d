#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace freightline::db::sqlite {

using freightline::db::ErrorCode;
using freightline::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// Column order matches every SELECT in sql_queries.hpp.
static model::TokenRecord ReadToken(sqlite3_stmt* st) {
  model::TokenRecord r;
  r.id               = ColText(st, 0);
  r.token_type       = ColText(st, 1);
  r.version          = static_cast<uint32_t>(sqlite3_column_int(st, 2));
  r.state            = ColText(st, 3);
  r.payload          = ColText(st, 4);
  r.root_shipment_id = ColText(st, 5);
  r.signature        = ColOptText(st, 6);
  r.created_at_ms    = ColI64(st, 7);
  r.updated_at_ms    = ColI64(st, 8);
  return r;
}

namespace {

/*
  Owns one prepared statement for the duration of a call.
  Prepare failures surface as TransactionError.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
    if (rc != SQLITE_OK) {
      throw TransactionError(TranslateCode(rc), std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  std::vector<model::TokenRecord> ReadAll() {
    std::vector<model::TokenRecord> out;
    int                             rc;
    while ((rc = sqlite3_step(st_)) == SQLITE_ROW) {
      out.push_back(ReadToken(st_));
    }
    if (rc != SQLITE_DONE) {
      throw TransactionError(TranslateCode(rc), std::string("sqlite step: ") + sqlite3_errmsg(db_));
    }
    return out;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  const auto code = TranslateCode(rc);
  if (code == ErrorCode::OK) return Result::Ok();
  return Result::Err(code, sqlite3_errmsg(db));
}

// ------------------------------------------------------------------
// Tokens
// ------------------------------------------------------------------

Result SqliteRepository::InsertToken(Transaction& t, const model::TokenRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::kInsertToken);

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.token_type);
  sqlite3_bind_int(st.get(), 3, static_cast<int>(r.version));
  BindText(st.get(), 4, r.state);
  BindText(st.get(), 5, r.payload);
  BindText(st.get(), 6, r.root_shipment_id);
  BindOptText(st.get(), 7, r.signature);
  BindI64(st.get(), 8, r.created_at_ms);
  BindI64(st.get(), 9, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "token " + r.id + " already exists");
  }
  return Translate(db, rc);
}

std::optional<model::TokenRecord> SqliteRepository::GetToken(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::kSelectToken);
  BindText(st.get(), 1, id);

  auto rows = st.ReadAll();
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

Result SqliteRepository::UpdateTokenState(Transaction& t, const std::string& id, const std::string& state,
                                          const std::optional<std::string>& signature, int64_t updated_at_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::kUpdateTokenState);

  BindText(st.get(), 1, state);
  BindOptText(st.get(), 2, signature);
  BindI64(st.get(), 3, updated_at_ms);
  BindText(st.get(), 4, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "token " + id + " not found");
  return Result::Ok();
}

std::vector<model::TokenRecord> SqliteRepository::ListTokensByShipment(Transaction& t, const std::string& root_shipment_id) {
  Statement st(TX(t).Handle(), sql::kSelectTokensByShipment);
  BindText(st.get(), 1, root_shipment_id);
  return st.ReadAll();
}

std::vector<model::TokenRecord> SqliteRepository::ListTokens(Transaction& t) {
  Statement st(TX(t).Handle(), sql::kSelectAllTokens);
  return st.ReadAll();
}

} // namespace freightline::db::sqlite
