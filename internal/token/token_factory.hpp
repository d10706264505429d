#pragma once

#include <string>

#include "internal/token/token.hpp"
#include "internal/token/token_index.hpp"
#include "internal/token/token_request.hpp"
#include "internal/token/token_schema.hpp"

namespace freightline::token {

/*
  TokenFactory

  The only way to mint a new Token. Validation order:

    1. discriminant   -> TokenValidationError ("Unknown token_type")
    2. metadata       -> TokenValidationError
    3. parent/root    -> RelationValidationError
    4. relations      -> RelationValidationError

  A successful create registers the token in the index. A failed create
  leaves the index untouched.

  Prepare() runs the same validation but leaves registration to the
  caller, so a token that must be stored first only becomes a relation
  target once Register() is called.
*/
class TokenFactory {
 public:
  explicit TokenFactory(TokenIndex& index);

  Token CreateToken(const std::string& token_type, const std::string& parent_shipment_id, const Metadata& metadata,
                    const Relations& relations);

  Token Create(const TokenRequest& request);

  Token PrepareToken(const std::string& token_type, const std::string& parent_shipment_id, const Metadata& metadata,
                     const Relations& relations) const;

  Token Prepare(const TokenRequest& request) const;

  // Throws util::TokenValidationError when the id is already indexed.
  void Register(const Token& token);

 private:
  void ValidateMetadata(const TokenSchema& schema, const Metadata& metadata) const;
  void ValidateRelations(const TokenSchema& schema, const std::string& root_id, const Relations& relations) const;
  std::string ResolveRoot(TokenType type, const std::string& parent_shipment_id) const;

  TokenIndex& index_;
};

} // namespace freightline::token
