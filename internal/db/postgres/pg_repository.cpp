#include "pg_repository.hpp"

namespace freightline::db::postgres {

namespace {

model::TokenRecord ReadToken(const pqxx::row& row) {
  model::TokenRecord r;
  r.id               = row[0].c_str();
  r.token_type       = row[1].c_str();
  r.version          = row[2].as<uint32_t>();
  r.state            = row[3].c_str();
  r.payload          = row[4].c_str();
  r.root_shipment_id = row[5].c_str();
  if (!row[6].is_null()) r.signature = row[6].c_str();
  r.created_at_ms = row[7].as<int64_t>();
  r.updated_at_ms = row[8].as<int64_t>();
  return r;
}

std::vector<model::TokenRecord> ReadAll(const pqxx::result& res) {
  std::vector<model::TokenRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadToken(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertToken(Transaction& t, const model::TokenRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_token", r.id, r.token_type, static_cast<int>(r.version), r.state, r.payload, r.root_shipment_id,
                               r.signature, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::TokenRecord> PgRepository::GetToken(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_token", id);
    if (res.empty()) return std::nullopt;
    return ReadToken(res[0]);
  } catch (const pqxx::failure& e) {
    throw TransactionError(Translate(e).code, e.what());
  }
}

Result PgRepository::UpdateTokenState(Transaction& t, const std::string& id, const std::string& state,
                                      const std::optional<std::string>& signature, int64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("update_token_state", id, state, signature, updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "token " + id + " not found");
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::vector<model::TokenRecord> PgRepository::ListTokensByShipment(Transaction& t, const std::string& root_shipment_id) {
  try {
    return ReadAll(TX(t).Work().exec_prepared("list_tokens_by_shipment", root_shipment_id));
  } catch (const pqxx::failure& e) {
    throw TransactionError(Translate(e).code, e.what());
  }
}

std::vector<model::TokenRecord> PgRepository::ListTokens(Transaction& t) {
  try {
    return ReadAll(TX(t).Work().exec_prepared("list_tokens"));
  } catch (const pqxx::failure& e) {
    throw TransactionError(Translate(e).code, e.what());
  }
}

} // namespace freightline::db::postgres
