#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace freightline::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertToken(Transaction&, const model::TokenRecord&) override;
  std::optional<model::TokenRecord> GetToken(Transaction&, const std::string&) override;
  Result UpdateTokenState(Transaction&, const std::string& id, const std::string& state,
                          const std::optional<std::string>& signature, int64_t updated_at_ms) override;
  std::vector<model::TokenRecord> ListTokensByShipment(Transaction&, const std::string& root_shipment_id) override;
  std::vector<model::TokenRecord> ListTokens(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TokenRecord> tokens;
    std::vector<std::string>                            insertion_order;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace freightline::db::memory
