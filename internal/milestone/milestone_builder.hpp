#pragma once

#include <cstdint>
#include <vector>

#include "internal/geofence/geofence.hpp"
#include "internal/milestone/milestone_context.hpp"
#include "internal/telemetry/normalized_record.hpp"
#include "internal/token/token_request.hpp"

namespace freightline::runtime::config {
class MilestoneConfig;
} // namespace freightline::runtime::config

namespace freightline::milestone {

struct MilestoneThresholds {
  double        moving_speed_mps  = 0.5; // strictly above = moving
  double        stopped_speed_mps = 0.5; // at or below = stopped
  std::uint32_t sustained_samples = 3;

  static MilestoneThresholds FromConfig(const freightline::runtime::config::MilestoneConfig& config);
};

/*
  MilestoneBuilder

  Derives MT-01 token requests from one normalized record plus the
  geofence events it produced. Deterministic, no I/O, no validation:
  requests are handed to TokenFactory by the caller.
*/
class MilestoneBuilder {
 public:
  explicit MilestoneBuilder(MilestoneThresholds thresholds = {});

  std::vector<token::TokenRequest> Build(MilestoneContext& context, const telemetry::NormalizedTelemetryRecord& record,
                                         const std::vector<geofence::GeofenceEvent>& events) const;

  const MilestoneThresholds& Thresholds() const {
    return thresholds_;
  }

 private:
  bool IsMoving(const telemetry::NormalizedTelemetryRecord& record) const;
  bool IsStopped(const telemetry::NormalizedTelemetryRecord& record) const;

  MilestoneThresholds thresholds_;
};

// Milestone type carried by an MT-01 request or token metadata.
std::optional<MilestoneType> MilestoneTypeOf(const token::Metadata& metadata);

} // namespace freightline::milestone
