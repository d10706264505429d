#include "token_registry.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/token/token_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace freightline::registry {

using db::ErrorCode;
using token::Token;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      // lost an insert race; a retry takes the update path
      throw util::PersistenceError(message, true);
    default:
      throw util::PersistenceError(message + " (" + db::ToString(result.code) + ")", db::IsTransient(result.code));
  }
}

std::string EncodePayload(const token::Metadata& metadata, const token::Relations& relations) {
  google::protobuf::Struct payload;
  auto&                    fields = *payload.mutable_fields();

  *fields["metadata"].mutable_struct_value() = metadata;

  auto& rel = *fields["relations"].mutable_struct_value()->mutable_fields();
  for (const auto& [role, target] : relations) {
    rel[role].set_string_value(target);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) {
    throw util::PersistenceError("encode token payload: " + std::string(status.message()), false);
  }
  return json;
}

void DecodePayload(const std::string& json, token::Metadata* metadata, token::Relations* relations) {
  google::protobuf::Struct payload;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &payload);
  if (!status.ok()) {
    throw util::PersistenceError("decode token payload: " + std::string(status.message()), false);
  }

  const auto& fields = payload.fields();
  if (auto it = fields.find("metadata"); it != fields.end()) {
    *metadata = it->second.struct_value();
  }
  if (auto it = fields.find("relations"); it != fields.end()) {
    for (const auto& [role, value] : it->second.struct_value().fields()) {
      if (value.kind_case() != google::protobuf::Value::kStringValue) {
        throw util::PersistenceError("decode token payload: relation '" + role + "' is not a string", false);
      }
      (*relations)[role] = value.string_value();
    }
  }
}

} // namespace

TokenRegistry::TokenRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

// Runs fn(tx) and maps backend exceptions to PersistenceError. fn commits
// or rolls back itself.
template <typename Fn>
decltype(auto) TokenRegistry::InTransaction(const std::string& context, Fn&& fn) {
  try {
    auto tx = repository_->Begin();
    return std::forward<Fn>(fn)(*tx);
  } catch (const db::TransactionError& e) {
    throw util::PersistenceError(context + ": " + e.what(), db::IsTransient(e.Code()));
  }
}

db::model::TokenRecord TokenRegistry::ToRecord(const Token& token, const std::optional<std::string>& signature, int64_t now_ms) {
  db::model::TokenRecord r;
  r.id               = token.id();
  r.token_type       = std::string(token::ToString(token.type()));
  r.version          = token.version();
  r.state            = std::string(token::ToString(token.state()));
  r.payload          = EncodePayload(token.metadata(), token.relations());
  r.root_shipment_id = token.parent_shipment_id();
  r.signature        = signature ? signature : token.signature();
  r.created_at_ms    = util::ToUnixMillis(token.created_at());
  r.updated_at_ms    = now_ms;
  return r;
}

Token TokenRegistry::FromRecord(const db::model::TokenRecord& r) {
  const auto type = token::ParseTokenType(r.token_type);
  if (!type) {
    throw util::PersistenceError("token " + r.id + ": stored token_type '" + r.token_type + "' is unknown", false);
  }
  const auto state = token::ParseTokenState(r.state);
  if (!state || !token::SchemaFor(*type).HasState(*state)) {
    throw util::PersistenceError("token " + r.id + ": stored state '" + r.state + "' is not valid for " + r.token_type, false);
  }

  const auto created_at = util::TryFromUnixMillis(r.created_at_ms);
  if (!created_at) {
    throw util::PersistenceError("token " + r.id + ": stored created_at_ms " + std::to_string(r.created_at_ms) + " is out of range", false);
  }

  token::Metadata  metadata;
  token::Relations relations;
  DecodePayload(r.payload, &metadata, &relations);

  return Token(r.id, *type, r.version, *state, r.root_shipment_id, std::move(metadata), std::move(relations), r.signature,
               *created_at);
}

db::model::TokenRecord TokenRegistry::Persist(const Token& token, const std::optional<std::string>& signature) {
  const std::string context = "persist token " + token.id();

  return InTransaction(context, [&](db::Transaction& tx) {
    const auto now_ms   = util::ToUnixMillis(util::Now());
    auto       existing = repository_->GetToken(tx, token.id());

    if (!existing) {
      auto record = ToRecord(token, signature, now_ms);
      ThrowIfDbError(repository_->InsertToken(tx, record), context);
      tx.Commit();
      return record;
    }

    if (existing->token_type != token::ToString(token.type())) {
      throw util::PersistenceError(context + ": stored row has token_type " + existing->token_type, false);
    }

    const auto stored_state = token::ParseTokenState(existing->state);
    if (!stored_state) {
      throw util::PersistenceError(context + ": stored state '" + existing->state + "' is unknown", false);
    }
    if (*stored_state != token.state() && !token::SchemaFor(token.type()).IsReachable(*stored_state, token.state())) {
      throw util::InvalidStateTransitionError(context + ": stored state " + existing->state + " cannot move to " +
                                              std::string(token::ToString(token.state())));
    }

    auto updated          = *existing;
    updated.state         = std::string(token::ToString(token.state()));
    updated.updated_at_ms = now_ms;
    if (signature) {
      updated.signature = signature;
    } else if (!updated.signature) {
      updated.signature = token.signature();
    }

    ThrowIfDbError(repository_->UpdateTokenState(tx, updated.id, updated.state, updated.signature, updated.updated_at_ms), context);
    tx.Commit();
    return updated;
  });
}

Token TokenRegistry::Load(const std::string& token_id) {
  auto record = InTransaction("load token " + token_id, [&](db::Transaction& tx) {
    auto r = repository_->GetToken(tx, token_id);
    tx.Rollback();
    return r;
  });
  if (!record) {
    throw util::NotFound("token " + token_id + " not found");
  }
  return FromRecord(*record);
}

std::vector<Token> TokenRegistry::LoadShipment(const std::string& root_shipment_id) {
  auto records = InTransaction("load shipment " + root_shipment_id, [&](db::Transaction& tx) {
    auto rows = repository_->ListTokensByShipment(tx, root_shipment_id);
    tx.Rollback();
    return rows;
  });

  std::vector<Token> tokens;
  tokens.reserve(records.size());
  for (const auto& r : records) {
    tokens.push_back(FromRecord(r));
  }
  return tokens;
}

std::size_t TokenRegistry::HydrateIndex(token::TokenIndex& index) {
  auto records = InTransaction("hydrate token index", [&](db::Transaction& tx) {
    auto rows = repository_->ListTokens(tx);
    tx.Rollback();
    return rows;
  });

  std::size_t added = 0;
  for (const auto& r : records) {
    if (index.Register(FromRecord(r))) ++added;
  }
  return added;
}

} // namespace freightline::registry
