#include "token_schema.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <deque>
#include <set>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace freightline::token {

using S = TokenState;

namespace {

TokenSchema MakeShipmentSchema() {
  return TokenSchema{
      .type      = TokenType::kShipment,
      .version   = 1,
      .fields    = {{"origin", FieldKind::kString}, {"destination", FieldKind::kString}, {"carrier_id", FieldKind::kString}},
      .relations = {},
      .transitions =
          {
              {S::kCreated, S::kDispatched},
              {S::kDispatched, S::kInTransit},
              {S::kInTransit, S::kArrived},
              {S::kArrived, S::kDelivered},
              {S::kDelivered, S::kSettled},
              {S::kCreated, S::kCancelled},
              {S::kDispatched, S::kCancelled},
          },
  };
}

TokenSchema MakeMilestoneSchema() {
  return TokenSchema{
      .type        = TokenType::kMilestone,
      .version     = 1,
      .fields      = {{"milestone_type", FieldKind::kString}, {"timestamp", FieldKind::kTimestamp}, {"location", FieldKind::kObject}},
      .relations   = {{"st01_id", TokenType::kShipment}},
      .transitions = {{S::kCreated, S::kSigned}, {S::kSigned, S::kFinalized}},
  };
}

TokenSchema MakeAccessorialSchema() {
  return TokenSchema{
      .type    = TokenType::kAccessorial,
      .version = 1,
      .fields =
          {
              {"accessorial_type", FieldKind::kString},
              {"amount", FieldKind::kNonNegativeNumber},
              {"timestamp", FieldKind::kTimestamp},
              {"currency", FieldKind::kCurrency},
          },
      .relations = {{"mt01_id", TokenType::kMilestone}},
      .transitions =
          {
              {S::kCreated, S::kProofAttached},
              {S::kProofAttached, S::kVerified},
              {S::kVerified, S::kFinalized},
              {S::kCreated, S::kRejected},
              {S::kProofAttached, S::kRejected},
          },
  };
}

TokenSchema MakeQuoteSchema() {
  return TokenSchema{
      .type    = TokenType::kQuote,
      .version = 1,
      .fields =
          {
              {"rate_amount", FieldKind::kNonNegativeNumber},
              {"rate_currency", FieldKind::kCurrency},
              {"equipment_type", FieldKind::kString},
          },
      .relations = {{"st01_id", TokenType::kShipment}},
      .transitions =
          {
              {S::kCreated, S::kAccepted},
              {S::kAccepted, S::kFinalized},
              {S::kCreated, S::kRejected},
              {S::kCreated, S::kExpired},
          },
  };
}

TokenSchema MakeInvoiceSchema() {
  return TokenSchema{
      .type    = TokenType::kInvoice,
      .version = 1,
      .fields =
          {
              {"invoice_number", FieldKind::kString},
              {"currency", FieldKind::kCurrency},
              {"total", FieldKind::kNonNegativeNumber},
              {"line_items", FieldKind::kList},
              {"due_date", FieldKind::kTimestamp},
          },
      .relations   = {{"qt01_id", TokenType::kQuote}},
      .transitions = {{S::kCreated, S::kSigned}, {S::kSigned, S::kFinalized}, {S::kFinalized, S::kPaid}},
  };
}

TokenSchema MakePaymentSchema() {
  return TokenSchema{
      .type    = TokenType::kPayment,
      .version = 1,
      .fields =
          {
              {"payment_reference", FieldKind::kString},
              {"currency", FieldKind::kCurrency},
              {"amount", FieldKind::kNonNegativeNumber},
              {"escrow_account", FieldKind::kString},
          },
      .relations   = {{"it01_id", TokenType::kInvoice}},
      .transitions = {{S::kCreated, S::kPending}, {S::kPending, S::kComplete}, {S::kPending, S::kFailed}},
  };
}

bool IsCurrencyCode(const std::string& s) {
  return s.size() == 3 && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isupper(c) != 0; });
}

// Empty string when the value matches; otherwise what is wrong with it.
std::string CheckField(const google::protobuf::Value& value, FieldKind kind) {
  using V = google::protobuf::Value;
  switch (kind) {
    case FieldKind::kString:
      if (value.kind_case() != V::kStringValue) return "expected string";
      if (value.string_value().empty()) return "must not be empty";
      return {};
    case FieldKind::kNumber:
      if (value.kind_case() != V::kNumberValue) return "expected number";
      if (!std::isfinite(value.number_value())) return "must be finite";
      return {};
    case FieldKind::kNonNegativeNumber:
      if (value.kind_case() != V::kNumberValue) return "expected number";
      if (!std::isfinite(value.number_value()) || value.number_value() < 0.0) return "must be a non-negative number";
      return {};
    case FieldKind::kBool:
      if (value.kind_case() != V::kBoolValue) return "expected bool";
      return {};
    case FieldKind::kList:
      if (value.kind_case() != V::kListValue) return "expected list";
      return {};
    case FieldKind::kObject:
      if (value.kind_case() != V::kStructValue) return "expected object";
      return {};
    case FieldKind::kTimestamp:
      if (value.kind_case() != V::kStringValue) return "expected RFC 3339 string";
      if (!util::ParseRfc3339(value.string_value())) return "not an RFC 3339 timestamp";
      return {};
    case FieldKind::kCurrency:
      if (value.kind_case() != V::kStringValue) return "expected currency string";
      if (!IsCurrencyCode(value.string_value())) return "not an ISO 4217 currency code";
      return {};
  }
  return "unsupported field kind";
}

// Appends the path of every NaN/Inf number under value. JSON cannot carry them.
void CollectNonFinite(const google::protobuf::Value& value, const std::string& path, std::vector<std::string>* out) {
  using V = google::protobuf::Value;
  switch (value.kind_case()) {
    case V::kNumberValue:
      if (!std::isfinite(value.number_value())) out->push_back(path);
      return;
    case V::kStructValue: {
      std::vector<std::string> keys;
      for (const auto& [key, unused] : value.struct_value().fields()) keys.push_back(key);
      std::sort(keys.begin(), keys.end());
      for (const auto& key : keys) {
        CollectNonFinite(value.struct_value().fields().at(key), path + "." + key, out);
      }
      return;
    }
    case V::kListValue:
      for (int i = 0; i < value.list_value().values_size(); ++i) {
        CollectNonFinite(value.list_value().values(i), path + "[" + std::to_string(i) + "]", out);
      }
      return;
    default:
      return;
  }
}

} // namespace

std::string_view ToString(FieldKind kind) {
  switch (kind) {
    case FieldKind::kString:
      return "string";
    case FieldKind::kNumber:
      return "number";
    case FieldKind::kNonNegativeNumber:
      return "non-negative number";
    case FieldKind::kBool:
      return "bool";
    case FieldKind::kList:
      return "list";
    case FieldKind::kObject:
      return "object";
    case FieldKind::kTimestamp:
      return "timestamp";
    case FieldKind::kCurrency:
      return "currency";
  }
  return "unknown";
}

bool TokenSchema::CanTransition(TokenState from, TokenState to) const {
  return std::any_of(transitions.begin(), transitions.end(), [&](const Transition& t) { return t.from == from && t.to == to; });
}

bool TokenSchema::IsReachable(TokenState from, TokenState to) const {
  std::set<TokenState>   seen{from};
  std::deque<TokenState> frontier{from};
  while (!frontier.empty()) {
    const auto current = frontier.front();
    frontier.pop_front();
    for (const auto& t : transitions) {
      if (t.from != current) continue;
      if (t.to == to) return true;
      if (seen.insert(t.to).second) frontier.push_back(t.to);
    }
  }
  return false;
}

bool TokenSchema::IsTerminal(TokenState state) const {
  return std::none_of(transitions.begin(), transitions.end(), [&](const Transition& t) { return t.from == state; });
}

bool TokenSchema::HasState(TokenState state) const {
  if (state == TokenState::kCreated) return true;
  return std::any_of(transitions.begin(), transitions.end(), [&](const Transition& t) { return t.from == state || t.to == state; });
}

const TokenSchema& SchemaFor(TokenType type) {
  static const TokenSchema kShipment    = MakeShipmentSchema();
  static const TokenSchema kMilestone   = MakeMilestoneSchema();
  static const TokenSchema kAccessorial = MakeAccessorialSchema();
  static const TokenSchema kQuote       = MakeQuoteSchema();
  static const TokenSchema kInvoice     = MakeInvoiceSchema();
  static const TokenSchema kPayment     = MakePaymentSchema();

  switch (type) {
    case TokenType::kShipment:
      return kShipment;
    case TokenType::kMilestone:
      return kMilestone;
    case TokenType::kAccessorial:
      return kAccessorial;
    case TokenType::kQuote:
      return kQuote;
    case TokenType::kInvoice:
      return kInvoice;
    case TokenType::kPayment:
      return kPayment;
  }
  throw std::invalid_argument("SchemaFor: unhandled token type");
}

std::vector<std::string> ValidateMetadata(const TokenSchema& schema, const Metadata& metadata) {
  std::vector<std::string> problems;
  for (const auto& field : schema.fields) {
    const std::string key(field.name);
    auto              it = metadata.fields().find(key);
    if (it == metadata.fields().end() || it->second.kind_case() == google::protobuf::Value::kNullValue ||
        it->second.kind_case() == google::protobuf::Value::KIND_NOT_SET) {
      problems.push_back("missing required field '" + key + "'");
      continue;
    }
    if (auto why = CheckField(it->second, field.kind); !why.empty()) {
      problems.push_back("field '" + key + "' " + why);
    }
  }

  // optional and nested values too; required numbers were reported above
  std::vector<std::string> keys;
  for (const auto& [key, unused] : metadata.fields()) {
    const bool checked_number = std::any_of(schema.fields.begin(), schema.fields.end(), [&](const FieldSpec& f) {
      return f.name == key && (f.kind == FieldKind::kNumber || f.kind == FieldKind::kNonNegativeNumber);
    });
    if (!checked_number) keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());

  std::vector<std::string> non_finite;
  for (const auto& key : keys) {
    CollectNonFinite(metadata.fields().at(key), key, &non_finite);
  }
  for (const auto& path : non_finite) {
    problems.push_back("field '" + path + "' must be finite");
  }
  return problems;
}

} // namespace freightline::token
