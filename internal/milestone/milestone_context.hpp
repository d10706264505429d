#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace freightline::milestone {

enum class MilestoneType : std::uint8_t {
  kPickupArrived = 1,
  kInTransit,
  kTerminalArrived,
  kTerminalDeparted,
  kDelivered,
};

std::string_view             ToString(MilestoneType type);
std::optional<MilestoneType> ParseMilestoneType(std::string_view text);

/*
  Per-shipment milestone state, owned by the caller and passed by
  reference into MilestoneBuilder::Build.

  Build() only touches the moving streak and the consignee arm. `fired`
  is recorded by whoever turns requests into tokens.
*/
struct MilestoneContext {
  std::string st01_id;

  std::set<MilestoneType> fired;

  std::uint32_t moving_streak     = 0;
  bool          streak_reaffirmed = false;

  // Inside a consignee fence, still moving; DELIVERED once stopped.
  bool        consignee_armed = false;
  std::string consignee_geofence_id;

  bool allow_reaffirmation = false;

  bool HasFired(MilestoneType type) const {
    return fired.contains(type);
  }

  void MarkFired(MilestoneType type) {
    fired.insert(type);
  }
};

} // namespace freightline::milestone
