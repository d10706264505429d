#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace freightline::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertToken(Transaction&, const model::TokenRecord&) override;
  std::optional<model::TokenRecord> GetToken(Transaction&, const std::string&) override;
  Result UpdateTokenState(Transaction&, const std::string& id, const std::string& state,
                          const std::optional<std::string>& signature, int64_t updated_at_ms) override;
  std::vector<model::TokenRecord> ListTokensByShipment(Transaction&, const std::string& root_shipment_id) override;
  std::vector<model::TokenRecord> ListTokens(Transaction&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

} // namespace freightline::db::postgres
