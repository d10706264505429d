#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/util/geo.hpp"
#include "internal/util/time.hpp"

namespace freightline::geofence {

enum class GeofenceKind : std::uint8_t {
  kShipperPickup = 1,
  kConsignee,
  kTerminal,
  kPort,
  kBorder,
  kCustom,
};

enum class GeofenceEventType : std::uint8_t {
  kEnter = 1,
  kExit  = 2,
};

std::string_view              ToString(GeofenceKind kind);
std::optional<GeofenceKind>   ParseGeofenceKind(std::string_view text);
std::string_view              ToString(GeofenceEventType type);

struct CircleBoundary {
  util::GeoPoint center;
  double         radius_m = 0.0;
};

// Ordered ring; closing vertex is implicit.
struct PolygonBoundary {
  std::vector<util::GeoPoint> vertices;
};

using Boundary = std::variant<CircleBoundary, PolygonBoundary>;

/*
  Registered geographic boundary. Read-only for the pipeline's lifetime.
*/
struct GeofenceDefinition {
  std::string  id;
  std::string  name;
  GeofenceKind kind = GeofenceKind::kCustom;
  Boundary     boundary;
};

struct GeofenceEvent {
  std::string       geofence_id;
  GeofenceKind      kind = GeofenceKind::kCustom;
  GeofenceEventType event_type = GeofenceEventType::kEnter;
  util::TimePoint   timestamp;

  std::string device_id;
  std::string shipment_id;
  double      latitude  = 0.0;
  double      longitude = 0.0;
};

} // namespace freightline::geofence
