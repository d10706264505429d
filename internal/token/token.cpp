#include "token.hpp"

#include <utility>

#include "internal/token/token_schema.hpp"
#include "internal/util/errors.hpp"

namespace freightline::token {

Token::Token(std::string id, TokenType type, std::uint32_t version, TokenState state, std::string parent_shipment_id, Metadata metadata,
             Relations relations, std::optional<std::string> signature, util::TimePoint created_at)
    : id_(std::move(id)),
      type_(type),
      version_(version),
      state_(state),
      parent_shipment_id_(std::move(parent_shipment_id)),
      metadata_(std::move(metadata)),
      relations_(std::move(relations)),
      signature_(std::move(signature)),
      created_at_(created_at) {
}

void Token::TransitionTo(TokenState next) {
  if (!CanTransitionTo(next)) {
    throw util::InvalidStateTransitionError(std::string(ToString(type_)) + " " + id_ + ": cannot transition from " +
                                            std::string(ToString(state_)) + " to " + std::string(ToString(next)));
  }
  state_ = next;
}

bool Token::CanTransitionTo(TokenState next) const {
  return SchemaFor(type_).CanTransition(state_, next);
}

bool Token::IsTerminal() const {
  return SchemaFor(type_).IsTerminal(state_);
}

bool Token::operator==(const Token& other) const {
  return id_ == other.id_ && type_ == other.type_ && version_ == other.version_ && state_ == other.state_ &&
         parent_shipment_id_ == other.parent_shipment_id_ && relations_ == other.relations_ && signature_ == other.signature_ &&
         created_at_ == other.created_at_ && Equal(metadata_, other.metadata_);
}

} // namespace freightline::token
