#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/geo.hpp"
#include "internal/util/time.hpp"

namespace freightline::telemetry {

enum class EngineState : std::uint8_t {
  kUnknown = 0,
  kOff     = 1,
  kIdle    = 2,
  kRunning = 3,
};

enum class TransportMode : std::uint8_t {
  kRoad  = 0,
  kRail  = 1,
  kOcean = 2,
  kAir   = 3,
};

std::string_view              ToString(EngineState state);
std::optional<EngineState>    ParseEngineState(std::string_view text);
std::string_view              ToString(TransportMode mode);
std::optional<TransportMode>  ParseTransportMode(std::string_view text);

/*
  Canonical telemetry record. Immutable once produced by Normalize().

  speed_mps is meters/second, heading is degrees in [0, 360).
*/
struct NormalizedTelemetryRecord {
  std::string device_id;
  std::string shipment_id;

  util::TimePoint                event_time;
  std::optional<util::TimePoint> received_at;

  double latitude  = 0.0;
  double longitude = 0.0;
  double speed_mps = 0.0;
  double heading   = 0.0;

  EngineState           engine_state      = EngineState::kUnknown;
  int64_t               idle_time_seconds = 0;
  bool                  ignition          = false;
  std::optional<double> battery_voltage;

  TransportMode transport_mode = TransportMode::kRoad;

  util::GeoPoint Position() const {
    return {latitude, longitude};
  }

  // (device_id, shipment_id) composite key.
  std::string Key() const {
    return device_id + "#" + shipment_id;
  }
};

} // namespace freightline::telemetry
