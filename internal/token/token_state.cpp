#include "token_state.hpp"

#include <array>
#include <utility>

namespace freightline::token {

namespace {

constexpr std::array<std::pair<TokenState, std::string_view>, 18> kStateNames = {{
    {TokenState::kCreated, "CREATED"},
    {TokenState::kDispatched, "DISPATCHED"},
    {TokenState::kInTransit, "IN_TRANSIT"},
    {TokenState::kArrived, "ARRIVED"},
    {TokenState::kDelivered, "DELIVERED"},
    {TokenState::kSettled, "SETTLED"},
    {TokenState::kCancelled, "CANCELLED"},
    {TokenState::kSigned, "SIGNED"},
    {TokenState::kFinalized, "FINALIZED"},
    {TokenState::kProofAttached, "PROOF_ATTACHED"},
    {TokenState::kVerified, "VERIFIED"},
    {TokenState::kAccepted, "ACCEPTED"},
    {TokenState::kExpired, "EXPIRED"},
    {TokenState::kRejected, "REJECTED"},
    {TokenState::kPaid, "PAID"},
    {TokenState::kPending, "PENDING"},
    {TokenState::kComplete, "COMPLETE"},
    {TokenState::kFailed, "FAILED"},
}};

} // namespace

std::string_view ToString(TokenState state) {
  for (const auto& [value, name] : kStateNames) {
    if (value == state) return name;
  }
  return "UNKNOWN";
}

std::optional<TokenState> ParseTokenState(std::string_view text) {
  for (const auto& [value, name] : kStateNames) {
    if (name == text) return value;
  }
  return std::nullopt;
}

} // namespace freightline::token
