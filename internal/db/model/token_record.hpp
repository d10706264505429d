#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace freightline::db::model {

/*
  Persistent token row.

  - token_type / state are stored as their wire strings ("MT-01", "SIGNED").
  - payload is JSON {"metadata": {...}, "relations": {...}}, written once.
  - root_shipment_id is indexed for per-shipment loads.
*/

struct TokenRecord {
  std::string id;
  std::string token_type;
  uint32_t    version = 1;
  std::string state;
  std::string payload;
  std::string root_shipment_id;

  std::optional<std::string> signature;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;

  bool operator==(const TokenRecord&) const = default;
};

} // namespace freightline::db::model
