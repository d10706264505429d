#include "token_index.hpp"

#include <mutex>
#include <queue>
#include <unordered_set>

namespace freightline::token {

bool TokenIndex::Register(const Token& token) {
  std::unique_lock lock(mutex_);
  if (entries_.contains(token.id())) {
    return false;
  }

  entries_.emplace(token.id(), Entry{token.type(), token.parent_shipment_id(), next_sequence_++});
  by_shipment_[token.parent_shipment_id()].push_back(token.id());

  for (const auto& [role, target] : token.relations()) {
    parents_[token.id()].push_back(Edge{role, target});
    children_[target].push_back(Edge{role, token.id()});
  }
  return true;
}

std::optional<TokenIndex::Entry> TokenIndex::Lookup(const std::string& token_id) const {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(token_id);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

bool TokenIndex::Contains(const std::string& token_id) const {
  std::shared_lock lock(mutex_);
  return entries_.contains(token_id);
}

std::vector<TokenIndex::Edge> TokenIndex::Parents(const std::string& token_id) const {
  std::shared_lock lock(mutex_);
  auto             it = parents_.find(token_id);
  if (it == parents_.end()) return {};
  return it->second;
}

std::vector<TokenIndex::Edge> TokenIndex::Children(const std::string& token_id) const {
  std::shared_lock lock(mutex_);
  auto             it = children_.find(token_id);
  if (it == children_.end()) return {};
  return it->second;
}

// ------------------------------------------------------------
// Traversal
// ------------------------------------------------------------

std::vector<std::string> TokenIndex::Descendants(const std::string& token_id, std::uint32_t max_depth) const {
  std::shared_lock lock(mutex_);

  std::vector<std::string>                     result;
  std::queue<std::pair<std::string, uint32_t>> q;
  std::unordered_set<std::string>              visited;

  q.emplace(token_id, 0);
  visited.insert(token_id);

  while (!q.empty()) {
    auto [node, depth] = q.front();
    q.pop();

    if (max_depth && depth >= max_depth) continue;

    auto it = children_.find(node);
    if (it == children_.end()) continue;

    for (const auto& edge : it->second) {
      if (!visited.insert(edge.other).second) continue;
      result.push_back(edge.other);
      q.emplace(edge.other, depth + 1);
    }
  }
  return result;
}

std::vector<std::string> TokenIndex::TokensForShipment(const std::string& root_shipment_id) const {
  std::shared_lock lock(mutex_);
  auto             it = by_shipment_.find(root_shipment_id);
  if (it == by_shipment_.end()) return {};
  return it->second;
}

std::size_t TokenIndex::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void TokenIndex::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
  parents_.clear();
  children_.clear();
  by_shipment_.clear();
  next_sequence_ = 1;
}

} // namespace freightline::token
