#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/token/metadata.hpp"
#include "internal/token/token_state.hpp"
#include "internal/token/token_type.hpp"

namespace freightline::token {

enum class FieldKind : std::uint8_t {
  kString = 1, // non-empty
  kNumber,
  kNonNegativeNumber,
  kBool,
  kList,
  kObject,
  kTimestamp, // RFC 3339
  kCurrency,  // ISO 4217 alpha code
};

std::string_view ToString(FieldKind kind);

struct FieldSpec {
  std::string_view name;
  FieldKind        kind;
};

struct RelationSpec {
  std::string_view role;
  TokenType        target;
};

struct Transition {
  TokenState from;
  TokenState to;
};

/*
  TokenSchema

  Declarative description of one token variant: required metadata keys
  with their kinds, required relation roles with their target type, and
  the lifecycle as an explicit edge list starting at CREATED.
*/
struct TokenSchema {
  TokenType                 type;
  std::uint32_t             version = 1;
  std::vector<FieldSpec>    fields;
  std::vector<RelationSpec> relations;
  std::vector<Transition>   transitions;

  bool CanTransition(TokenState from, TokenState to) const;

  // True when `to` can be reached from `from` in one or more steps.
  bool IsReachable(TokenState from, TokenState to) const;

  // No outgoing edges.
  bool IsTerminal(TokenState state) const;

  // CREATED or any state named by an edge.
  bool HasState(TokenState state) const;
};

// Exhaustive over TokenType.
const TokenSchema& SchemaFor(TokenType type);

// Generic check of metadata against schema.fields. Returns one message per
// missing or ill-typed key, plus one per NaN/Inf number anywhere in the
// metadata (nested objects and lists included); empty when valid.
std::vector<std::string> ValidateMetadata(const TokenSchema& schema, const Metadata& metadata);

} // namespace freightline::token
