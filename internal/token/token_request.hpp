#pragma once

#include <string>

#include "internal/token/metadata.hpp"

namespace freightline::token {

// Unvalidated ask for a new token. token_type is the wire discriminant
// ("MT-01"), so unknown types surface as validation errors at the factory.
struct TokenRequest {
  std::string token_type;
  std::string parent_shipment_id;
  Metadata    metadata;
  Relations   relations;
};

} // namespace freightline::token
