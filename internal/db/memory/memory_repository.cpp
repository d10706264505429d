#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace freightline::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertToken(Transaction& t, const model::TokenRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.tokens.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "token " + r.id + " already exists");
  s.tokens[r.id] = r;
  s.insertion_order.push_back(r.id);
  return Result::Ok();
}

std::optional<model::TokenRecord> MemoryRepository::GetToken(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tokens.find(id);
  if (it == s.tokens.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateTokenState(Transaction& t, const std::string& id, const std::string& state,
                                          const std::optional<std::string>& signature, int64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tokens.find(id);
  if (it == s.tokens.end()) return Result::Err(ErrorCode::NotFound, "token " + id + " not found");
  it->second.state         = state;
  it->second.signature     = signature;
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

std::vector<model::TokenRecord> MemoryRepository::ListTokensByShipment(Transaction& t, const std::string& root_shipment_id) {
  std::vector<model::TokenRecord> out;
  for (const auto& r : ListTokens(t)) {
    if (r.root_shipment_id == root_shipment_id) out.push_back(r);
  }
  return out;
}

std::vector<model::TokenRecord> MemoryRepository::ListTokens(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::TokenRecord> out;
  out.reserve(s.insertion_order.size());
  for (const auto& id : s.insertion_order) {
    out.push_back(s.tokens.at(id));
  }
  // created_at_ms ascending; stable keeps insertion order for ties
  std::stable_sort(out.begin(), out.end(),
                   [](const model::TokenRecord& a, const model::TokenRecord& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

} // namespace freightline::db::memory
