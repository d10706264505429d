#include "milestone_builder.hpp"

#include "config/config.pb.h"
#include "internal/token/token_type.hpp"
#include "internal/util/time.hpp"

namespace freightline::milestone {

using geofence::GeofenceEvent;
using geofence::GeofenceEventType;
using geofence::GeofenceKind;
using telemetry::NormalizedTelemetryRecord;

std::string_view ToString(MilestoneType type) {
  switch (type) {
    case MilestoneType::kPickupArrived:
      return "PICKUP_ARRIVED";
    case MilestoneType::kInTransit:
      return "IN_TRANSIT";
    case MilestoneType::kTerminalArrived:
      return "TERMINAL_ARRIVED";
    case MilestoneType::kTerminalDeparted:
      return "TERMINAL_DEPARTED";
    case MilestoneType::kDelivered:
      return "DELIVERED";
  }
  return "UNKNOWN";
}

std::optional<MilestoneType> ParseMilestoneType(std::string_view text) {
  if (text == "PICKUP_ARRIVED") return MilestoneType::kPickupArrived;
  if (text == "IN_TRANSIT") return MilestoneType::kInTransit;
  if (text == "TERMINAL_ARRIVED") return MilestoneType::kTerminalArrived;
  if (text == "TERMINAL_DEPARTED") return MilestoneType::kTerminalDeparted;
  if (text == "DELIVERED") return MilestoneType::kDelivered;
  return std::nullopt;
}

std::optional<MilestoneType> MilestoneTypeOf(const token::Metadata& metadata) {
  auto value = token::GetString(metadata, "milestone_type");
  if (!value) return std::nullopt;
  return ParseMilestoneType(*value);
}

MilestoneThresholds MilestoneThresholds::FromConfig(const freightline::runtime::config::MilestoneConfig& config) {
  MilestoneThresholds t;
  if (config.moving_speed_mps() > 0.0) t.moving_speed_mps = config.moving_speed_mps();
  if (config.stopped_speed_mps() > 0.0) t.stopped_speed_mps = config.stopped_speed_mps();
  if (config.sustained_samples() > 0) t.sustained_samples = config.sustained_samples();
  return t;
}

namespace {

token::TokenRequest MakeRequest(const MilestoneContext& context, MilestoneType type, const NormalizedTelemetryRecord& record,
                                const std::string& geofence_id) {
  token::TokenRequest request;
  request.token_type         = std::string(token::ToString(token::TokenType::kMilestone));
  request.parent_shipment_id = context.st01_id;

  token::Metadata location;
  token::SetNumber(location, "lat", record.latitude);
  token::SetNumber(location, "lon", record.longitude);

  token::SetString(request.metadata, "milestone_type", std::string(ToString(type)));
  token::SetString(request.metadata, "timestamp", util::FormatRfc3339(record.event_time));
  token::SetObject(request.metadata, "location", location);
  token::SetString(request.metadata, "device_id", record.device_id);
  token::SetNumber(request.metadata, "speed_mps", record.speed_mps);
  if (!geofence_id.empty()) {
    token::SetString(request.metadata, "geofence_id", geofence_id);
  }

  request.relations["st01_id"] = context.st01_id;
  return request;
}

} // namespace

MilestoneBuilder::MilestoneBuilder(MilestoneThresholds thresholds) : thresholds_(thresholds) {
}

bool MilestoneBuilder::IsMoving(const NormalizedTelemetryRecord& record) const {
  return record.speed_mps > thresholds_.moving_speed_mps;
}

bool MilestoneBuilder::IsStopped(const NormalizedTelemetryRecord& record) const {
  return record.speed_mps <= thresholds_.stopped_speed_mps;
}

std::vector<token::TokenRequest> MilestoneBuilder::Build(MilestoneContext& context, const NormalizedTelemetryRecord& record,
                                                         const std::vector<GeofenceEvent>& events) const {
  std::vector<token::TokenRequest> requests;

  const bool moving        = IsMoving(record);
  const bool stopped_off   = IsStopped(record) && !record.ignition;
  bool       consignee_now = false; // consignee crossing seen on this sample

  if (moving) {
    ++context.moving_streak;
  } else {
    context.moving_streak     = 0;
    context.streak_reaffirmed = false;
  }

  for (const auto& event : events) {
    const bool enter = event.event_type == GeofenceEventType::kEnter;

    switch (event.kind) {
      case GeofenceKind::kShipperPickup:
        if (enter) {
          requests.push_back(MakeRequest(context, MilestoneType::kPickupArrived, record, event.geofence_id));
        } else if (moving && record.ignition) {
          requests.push_back(MakeRequest(context, MilestoneType::kInTransit, record, event.geofence_id));
        }
        break;

      case GeofenceKind::kTerminal:
      case GeofenceKind::kPort:
        requests.push_back(
            MakeRequest(context, enter ? MilestoneType::kTerminalArrived : MilestoneType::kTerminalDeparted, record, event.geofence_id));
        break;

      case GeofenceKind::kConsignee:
        consignee_now = true;
        if (!enter) {
          context.consignee_armed = false;
          context.consignee_geofence_id.clear();
        } else if (stopped_off) {
          context.consignee_armed = false;
          context.consignee_geofence_id.clear();
          requests.push_back(MakeRequest(context, MilestoneType::kDelivered, record, event.geofence_id));
        } else {
          context.consignee_armed       = true;
          context.consignee_geofence_id = event.geofence_id;
        }
        break;

      case GeofenceKind::kBorder:
      case GeofenceKind::kCustom:
        break;
    }
  }

  // Entered a consignee fence earlier while moving; now parked inside it.
  if (!consignee_now && context.consignee_armed && stopped_off) {
    requests.push_back(MakeRequest(context, MilestoneType::kDelivered, record, context.consignee_geofence_id));
    context.consignee_armed = false;
    context.consignee_geofence_id.clear();
  }

  if (events.empty() && requests.empty() && moving && !context.streak_reaffirmed &&
      context.moving_streak >= thresholds_.sustained_samples && !context.HasFired(MilestoneType::kDelivered)) {
    requests.push_back(MakeRequest(context, MilestoneType::kInTransit, record, {}));
    context.streak_reaffirmed = true;
  }

  return requests;
}

} // namespace freightline::milestone
