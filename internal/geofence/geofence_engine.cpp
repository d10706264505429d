#include "geofence_engine.hpp"

#include "internal/geofence/geometry.hpp"

namespace freightline::geofence {

std::string_view ToString(GeofenceKind kind) {
  switch (kind) {
    case GeofenceKind::kShipperPickup:
      return "SHIPPER_PICKUP";
    case GeofenceKind::kConsignee:
      return "CONSIGNEE";
    case GeofenceKind::kTerminal:
      return "TERMINAL";
    case GeofenceKind::kPort:
      return "PORT";
    case GeofenceKind::kBorder:
      return "BORDER";
    case GeofenceKind::kCustom:
      return "CUSTOM";
  }
  return "CUSTOM";
}

std::optional<GeofenceKind> ParseGeofenceKind(std::string_view text) {
  if (text == "SHIPPER_PICKUP") return GeofenceKind::kShipperPickup;
  if (text == "CONSIGNEE") return GeofenceKind::kConsignee;
  if (text == "TERMINAL") return GeofenceKind::kTerminal;
  if (text == "PORT") return GeofenceKind::kPort;
  if (text == "BORDER") return GeofenceKind::kBorder;
  if (text == "CUSTOM") return GeofenceKind::kCustom;
  return std::nullopt;
}

std::string_view ToString(GeofenceEventType type) {
  return type == GeofenceEventType::kEnter ? "ENTER" : "EXIT";
}

std::vector<GeofenceEvent> GeofenceEngine::Evaluate(const telemetry::NormalizedTelemetryRecord& record,
                                                    const std::vector<GeofenceDefinition>& definitions) {
  const auto position = record.Position();

  return membership_.WithState(record.device_id, [&](std::optional<Membership>& membership) {
    if (!membership) {
      membership.emplace();
      membership->last_event_time = record.event_time;
    } else if (record.event_time > membership->last_event_time) {
      membership->last_event_time = record.event_time;
    }

    std::vector<GeofenceEvent> events;
    for (const auto& definition : definitions) {
      const bool inside     = Contains(definition.boundary, position);
      auto&      was_inside = membership->inside[definition.id];
      if (inside == was_inside) {
        continue;
      }
      was_inside = inside;

      GeofenceEvent event;
      event.geofence_id = definition.id;
      event.kind        = definition.kind;
      event.event_type  = inside ? GeofenceEventType::kEnter : GeofenceEventType::kExit;
      event.timestamp   = record.event_time;
      event.device_id   = record.device_id;
      event.shipment_id = record.shipment_id;
      event.latitude    = record.latitude;
      event.longitude   = record.longitude;
      events.push_back(std::move(event));
    }
    return events;
  });
}

std::optional<bool> GeofenceEngine::IsInside(const std::string& device_id, const std::string& geofence_id) const {
  auto membership = membership_.Snapshot(device_id);
  if (!membership) {
    return std::nullopt;
  }
  auto it = membership->inside.find(geofence_id);
  if (it == membership->inside.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool GeofenceEngine::Forget(const std::string& device_id) {
  return membership_.Erase(device_id);
}

std::size_t GeofenceEngine::EvictOlderThan(util::TimePoint cutoff) {
  return membership_.EraseIf([cutoff](const std::string&, const Membership& m) { return m.last_event_time < cutoff; });
}

void GeofenceEngine::Clear() {
  membership_.Clear();
}

std::size_t GeofenceEngine::TrackedDevices() const {
  return membership_.Size();
}

} // namespace freightline::geofence
