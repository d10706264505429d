#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/token/metadata.hpp"
#include "internal/token/token_state.hpp"
#include "internal/token/token_type.hpp"
#include "internal/util/time.hpp"

namespace freightline::registry {
class TokenRegistry;
} // namespace freightline::registry

namespace freightline::token {

class TokenFactory;

/*
  Token

  A validated domain token. Only TokenFactory (new tokens) and
  TokenRegistry (rehydration) construct one, so every live Token has
  passed schema and relation checks. Identity, metadata and relations are
  fixed; only the lifecycle state moves, and only through TransitionTo.
*/
class Token {
 public:
  const std::string& id() const {
    return id_;
  }
  TokenType type() const {
    return type_;
  }
  std::uint32_t version() const {
    return version_;
  }
  TokenState state() const {
    return state_;
  }
  // Root ST-01 id. For an ST-01 this is its own id.
  const std::string& parent_shipment_id() const {
    return parent_shipment_id_;
  }
  const Metadata& metadata() const {
    return metadata_;
  }
  const Relations& relations() const {
    return relations_;
  }
  const std::optional<std::string>& signature() const {
    return signature_;
  }
  util::TimePoint created_at() const {
    return created_at_;
  }

  // Throws InvalidStateTransitionError when the edge is not in the lifecycle.
  void TransitionTo(TokenState next);

  bool CanTransitionTo(TokenState next) const;
  bool IsTerminal() const;

  // Value equality over every field.
  bool operator==(const Token& other) const;
  bool operator!=(const Token& other) const {
    return !(*this == other);
  }

 private:
  friend class TokenFactory;
  friend class registry::TokenRegistry;

  Token(std::string id, TokenType type, std::uint32_t version, TokenState state, std::string parent_shipment_id, Metadata metadata,
        Relations relations, std::optional<std::string> signature, util::TimePoint created_at);

  std::string                id_;
  TokenType                  type_;
  std::uint32_t              version_;
  TokenState                 state_;
  std::string                parent_shipment_id_;
  Metadata                   metadata_;
  Relations                  relations_;
  std::optional<std::string> signature_;
  util::TimePoint            created_at_;
};

} // namespace freightline::token
