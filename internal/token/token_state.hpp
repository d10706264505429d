#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace freightline::token {

/*
  Lifecycle tags shared by all token types. Which transitions are legal
  is declared per type in TokenSchema.
*/
enum class TokenState : std::uint8_t {
  kCreated = 1,

  // ST-01
  kDispatched,
  kInTransit,
  kArrived,
  kDelivered,
  kSettled,
  kCancelled,

  // MT-01, IT-01
  kSigned,
  kFinalized,

  // AT-02
  kProofAttached,
  kVerified,

  // QT-01
  kAccepted,
  kExpired,

  kRejected,

  // IT-01, PT-01
  kPaid,
  kPending,
  kComplete,
  kFailed,
};

std::string_view          ToString(TokenState state);
std::optional<TokenState> ParseTokenState(std::string_view text);

} // namespace freightline::token
