#pragma once

#include <cstdint>
#include <optional>

#include "internal/telemetry/normalized_record.hpp"
#include "internal/telemetry/raw_telemetry.hpp"

namespace freightline::telemetry {

/*
  Last-known values for a device. Fills fields a raw sample omits.
*/
struct DeviceState {
  std::optional<double>        battery_voltage;
  std::optional<EngineState>   engine_state;
  std::optional<bool>          ignition;
  std::optional<int64_t>       idle_time_seconds;
  std::optional<TransportMode> transport_mode;
};

/*
  Normalize

  Pure function: raw sample + device state -> canonical record.

  Throws util::MalformedTelemetryError when device_id, shipment_id, event
  time, latitude or longitude are missing or out of range, or when any
  present field cannot be interpreted.
*/
NormalizedTelemetryRecord Normalize(const RawTelemetry& raw, const DeviceState& device_state);

// Device state as seen after `record` was accepted.
DeviceState NextDeviceState(const NormalizedTelemetryRecord& record);

// Converts `value` in `unit` (MPH, KPH, MPS, KNOTS) to m/s.
std::optional<double> SpeedToMetersPerSecond(double value, const std::string& unit);

} // namespace freightline::telemetry
