#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/token_record.hpp"

namespace freightline::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Token rows are never deleted
  - Listing order is creation order (created_at_ms, then insertion)

  The DB is the source of truth for:
    token state
    token payload (metadata + relations)
    signatures
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tokens
  // ---------------------------------------------------------------------

  // AlreadyExists when the id is taken.
  virtual Result InsertToken(Transaction&, const model::TokenRecord&) = 0;

  virtual std::optional<model::TokenRecord> GetToken(Transaction&, const std::string& id) = 0;

  // Rewrites state, signature and updated_at_ms only. NotFound when absent.
  virtual Result UpdateTokenState(Transaction&, const std::string& id, const std::string& state,
                                  const std::optional<std::string>& signature, int64_t updated_at_ms) = 0;

  virtual std::vector<model::TokenRecord> ListTokensByShipment(Transaction&, const std::string& root_shipment_id) = 0;

  virtual std::vector<model::TokenRecord> ListTokens(Transaction&) = 0;
};

} // namespace freightline::db
