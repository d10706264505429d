#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/token/token.hpp"
#include "internal/token/token_index.hpp"

namespace freightline::registry {

/*
  TokenRegistry

  Persistence adapter between Token and db::model::TokenRecord.

  - Persist() is an upsert by id. A new id inserts the full row; an
    existing id only gets state, signature and updated_at rewritten.
  - Stored state only moves forward along the token's lifecycle.
  - A stored signature is kept when Persist() is called without one.
  - Backend failures surface as util::PersistenceError; Retryable() is
    true for busy/locked, I/O and transaction conflicts.
*/
class TokenRegistry {
 public:
  explicit TokenRegistry(std::shared_ptr<db::Repository> repository);

  db::model::TokenRecord Persist(const token::Token& token, const std::optional<std::string>& signature = std::nullopt);

  // Throws util::NotFound for an unknown id.
  token::Token Load(const std::string& token_id);

  // Creation order.
  std::vector<token::Token> LoadShipment(const std::string& root_shipment_id);

  // Registers every stored token in the index. Returns how many were new.
  std::size_t HydrateIndex(token::TokenIndex& index);

  // Row <-> token conversion. Payload is {"metadata": {...}, "relations": {...}}.
  static db::model::TokenRecord ToRecord(const token::Token& token, const std::optional<std::string>& signature, int64_t now_ms);
  static token::Token           FromRecord(const db::model::TokenRecord& record);

 private:
  template <typename Fn>
  decltype(auto) InTransaction(const std::string& context, Fn&& fn);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace freightline::registry
