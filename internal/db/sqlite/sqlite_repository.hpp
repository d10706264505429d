#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace freightline::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertToken(Transaction&, const model::TokenRecord&) override;
  std::optional<model::TokenRecord> GetToken(Transaction&, const std::string&) override;
  Result UpdateTokenState(Transaction&, const std::string& id, const std::string& state,
                          const std::optional<std::string>& signature, int64_t updated_at_ms) override;
  std::vector<model::TokenRecord> ListTokensByShipment(Transaction&, const std::string& root_shipment_id) override;
  std::vector<model::TokenRecord> ListTokens(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace freightline::db::sqlite
