#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace freightline::token {

// Closed set of token variants. Add a variant by adding a case here and in
// SchemaFor(); every switch over TokenType is exhaustive.
enum class TokenType : std::uint8_t {
  kShipment    = 1, // ST-01, lineage root
  kMilestone   = 2, // MT-01
  kAccessorial = 3, // AT-02
  kQuote       = 4, // QT-01
  kInvoice     = 5, // IT-01
  kPayment     = 6, // PT-01
};

constexpr std::string_view ToString(TokenType type) {
  switch (type) {
    case TokenType::kShipment:
      return "ST-01";
    case TokenType::kMilestone:
      return "MT-01";
    case TokenType::kAccessorial:
      return "AT-02";
    case TokenType::kQuote:
      return "QT-01";
    case TokenType::kInvoice:
      return "IT-01";
    case TokenType::kPayment:
      return "PT-01";
  }
  return "UNKNOWN";
}

constexpr std::optional<TokenType> ParseTokenType(std::string_view text) {
  if (text == "ST-01") return TokenType::kShipment;
  if (text == "MT-01") return TokenType::kMilestone;
  if (text == "AT-02") return TokenType::kAccessorial;
  if (text == "QT-01") return TokenType::kQuote;
  if (text == "IT-01") return TokenType::kInvoice;
  if (text == "PT-01") return TokenType::kPayment;
  return std::nullopt;
}

} // namespace freightline::token
