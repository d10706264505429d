#include "token_factory.hpp"

#include <sstream>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace freightline::token {

TokenFactory::TokenFactory(TokenIndex& index) : index_(index) {
}

Token TokenFactory::Create(const TokenRequest& request) {
  return CreateToken(request.token_type, request.parent_shipment_id, request.metadata, request.relations);
}

Token TokenFactory::CreateToken(const std::string& token_type, const std::string& parent_shipment_id, const Metadata& metadata,
                                const Relations& relations) {
  auto token = PrepareToken(token_type, parent_shipment_id, metadata, relations);
  Register(token);
  return token;
}

Token TokenFactory::Prepare(const TokenRequest& request) const {
  return PrepareToken(request.token_type, request.parent_shipment_id, request.metadata, request.relations);
}

void TokenFactory::Register(const Token& token) {
  if (!index_.Register(token)) {
    throw util::TokenValidationError(std::string(ToString(token.type())) + " token already exists: " + token.id());
  }
}

Token TokenFactory::PrepareToken(const std::string& token_type, const std::string& parent_shipment_id, const Metadata& metadata,
                                 const Relations& relations) const {
  const auto type = ParseTokenType(token_type);
  if (!type) {
    throw util::TokenValidationError("Unknown token_type: '" + token_type + "'");
  }

  const auto& schema = SchemaFor(*type);
  ValidateMetadata(schema, metadata);

  const std::string root_id = ResolveRoot(*type, parent_shipment_id);
  ValidateRelations(schema, root_id, relations);

  std::string id;
  switch (*type) {
    case TokenType::kShipment:
      id = root_id;
      break;
    case TokenType::kMilestone:
    case TokenType::kAccessorial:
    case TokenType::kQuote:
    case TokenType::kInvoice:
    case TokenType::kPayment:
      id = util::NewId();
      break;
  }

  // storage keeps millisecond precision
  const auto created_at = util::FromUnixMillis(util::ToUnixMillis(util::Now()));

  return Token(id, *type, schema.version, TokenState::kCreated, root_id, metadata, relations, std::nullopt, created_at);
}

void TokenFactory::ValidateMetadata(const TokenSchema& schema, const Metadata& metadata) const {
  const auto problems = token::ValidateMetadata(schema, metadata);
  if (problems.empty()) return;

  std::ostringstream msg;
  msg << ToString(schema.type) << " metadata invalid: ";
  for (std::size_t i = 0; i < problems.size(); ++i) {
    if (i) msg << "; ";
    msg << problems[i];
  }
  throw util::TokenValidationError(msg.str());
}

// ST-01 is its own root. Everything else hangs off an existing ST-01.
std::string TokenFactory::ResolveRoot(TokenType type, const std::string& parent_shipment_id) const {
  if (type == TokenType::kShipment) {
    if (parent_shipment_id.empty()) return util::NewId();
    if (index_.Contains(parent_shipment_id)) {
      throw util::TokenValidationError("ST-01 token already exists: " + parent_shipment_id);
    }
    return parent_shipment_id;
  }

  if (parent_shipment_id.empty()) {
    throw util::RelationValidationError(std::string(ToString(type)) + " requires parent_shipment_id");
  }
  const auto parent = index_.Lookup(parent_shipment_id);
  if (!parent) {
    throw util::RelationValidationError("parent_shipment_id references unknown token: " + parent_shipment_id);
  }
  if (parent->type != TokenType::kShipment) {
    throw util::RelationValidationError("parent_shipment_id must reference an ST-01, got " + std::string(ToString(parent->type)));
  }
  return parent_shipment_id;
}

void TokenFactory::ValidateRelations(const TokenSchema& schema, const std::string& root_id, const Relations& relations) const {
  for (const auto& required : schema.relations) {
    const std::string role(required.role);
    auto              it = relations.find(role);
    if (it == relations.end() || it->second.empty()) {
      throw util::RelationValidationError(std::string(ToString(schema.type)) + " missing required relation '" + role + "'");
    }
    const auto target = index_.Lookup(it->second);
    if (!target) {
      throw util::RelationValidationError("relation '" + role + "' references unknown token: " + it->second);
    }
    if (target->type != required.target) {
      throw util::RelationValidationError("relation '" + role + "' must reference " + std::string(ToString(required.target)) + ", got " +
                                          std::string(ToString(target->type)));
    }
  }

  // Every relation, required or not, points at an existing token under the same root.
  for (const auto& [role, target_id] : relations) {
    if (target_id.empty()) {
      throw util::RelationValidationError("relation '" + role + "' is empty");
    }
    const auto target = index_.Lookup(target_id);
    if (!target) {
      throw util::RelationValidationError("relation '" + role + "' references unknown token: " + target_id);
    }
    if (target->root_shipment_id != root_id) {
      throw util::RelationValidationError("relation '" + role + "' crosses shipments: " + target_id + " belongs to " +
                                          target->root_shipment_id + ", not " + root_id);
    }
  }
}

} // namespace freightline::token
