#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/token/token.hpp"
#include "internal/token/token_type.hpp"

namespace freightline::token {

/*
  TokenIndex

  In-process view of every token that exists, used by the factory to
  resolve relations without touching storage.

  - id -> (type, root shipment, registration sequence)
  - relation edges kept in both directions for lineage queries
  - many readers, one writer (shared_mutex)
*/
class TokenIndex {
 public:
  struct Entry {
    TokenType     type;
    std::string   root_shipment_id;
    std::uint64_t sequence = 0;
  };

  struct Edge {
    std::string role;
    std::string other; // token id on the far end
  };

  // False when the id is already registered; the index is left unchanged.
  bool Register(const Token& token);

  std::optional<Entry> Lookup(const std::string& token_id) const;
  bool                 Contains(const std::string& token_id) const;

  // Relations declared by `token_id`.
  std::vector<Edge> Parents(const std::string& token_id) const;

  // Tokens that name `token_id` in one of their relations.
  std::vector<Edge> Children(const std::string& token_id) const;

  // Transitive closure over Children(), breadth first. max_depth 0 = unbounded.
  std::vector<std::string> Descendants(const std::string& token_id, std::uint32_t max_depth = 0) const;

  // Ids anchored to a root shipment, in registration order.
  std::vector<std::string> TokensForShipment(const std::string& root_shipment_id) const;

  std::size_t Size() const;
  void        Clear();

 private:
  mutable std::shared_mutex                                mutex_;
  std::unordered_map<std::string, Entry>                   entries_;
  std::unordered_map<std::string, std::vector<Edge>>       parents_;
  std::unordered_map<std::string, std::vector<Edge>>       children_;
  std::unordered_map<std::string, std::vector<std::string>> by_shipment_;
  std::uint64_t                                            next_sequence_ = 1;
};

} // namespace freightline::token
