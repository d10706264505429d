#include "normalizer.hpp"

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace freightline::telemetry {

namespace {

[[noreturn]] void Reject(const std::string& why) {
  throw util::MalformedTelemetryError(why);
}

const std::string& RequireText(const std::optional<std::string>& value, const char* field) {
  if (!value || value->empty()) {
    Reject(std::string("missing required field: ") + field);
  }
  return *value;
}

double RequireFinite(const std::optional<double>& value, const char* field) {
  if (!value) {
    Reject(std::string("missing required field: ") + field);
  }
  if (!std::isfinite(*value)) {
    Reject(std::string("non-finite value for field: ") + field);
  }
  return *value;
}

util::TimePoint ResolveEventTime(const RawTelemetry& raw) {
  if (raw.timestamp) {
    auto parsed = util::ParseRfc3339(*raw.timestamp);
    if (!parsed) {
      Reject("unparseable or out of range timestamp: " + *raw.timestamp);
    }
    return *parsed;
  }
  if (raw.event_time_ms) {
    auto tp = util::TryFromUnixMillis(*raw.event_time_ms);
    if (!tp) {
      Reject("event_time_ms out of range: " + std::to_string(*raw.event_time_ms));
    }
    return *tp;
  }
  Reject("missing required field: event_time");
}

double WrapHeading(double heading) {
  double wrapped = std::fmod(heading, 360.0);
  if (wrapped < 0.0) wrapped += 360.0;
  return wrapped;
}

} // namespace

std::optional<double> SpeedToMetersPerSecond(double value, const std::string& unit) {
  if (unit == "MPH" || unit == "mph") return value * util::kMetersPerSecondPerMph;
  if (unit == "KPH" || unit == "kph" || unit == "KMH" || unit == "kmh") return value * util::kMetersPerSecondPerKph;
  if (unit == "MPS" || unit == "mps") return value;
  if (unit == "KNOTS" || unit == "knots" || unit == "KN") return value * util::kMetersPerSecondPerKnot;
  return std::nullopt;
}

NormalizedTelemetryRecord Normalize(const RawTelemetry& raw, const DeviceState& device_state) {
  NormalizedTelemetryRecord record;

  // ------------------------------------------------------------
  // Required positional fields
  // ------------------------------------------------------------
  record.device_id   = RequireText(raw.device_id, "device_id");
  record.shipment_id = RequireText(raw.shipment_id, "shipment_id");
  record.event_time  = ResolveEventTime(raw);

  record.latitude  = RequireFinite(raw.latitude, "latitude");
  record.longitude = RequireFinite(raw.longitude, "longitude");
  if (!util::IsValidLatitude(record.latitude)) {
    Reject("latitude out of range: " + std::to_string(record.latitude));
  }
  if (!util::IsValidLongitude(record.longitude)) {
    Reject("longitude out of range: " + std::to_string(record.longitude));
  }

  if (raw.received_at_ms) {
    record.received_at = util::TryFromUnixMillis(*raw.received_at_ms);
    if (!record.received_at) {
      Reject("received_at_ms out of range: " + std::to_string(*raw.received_at_ms));
    }
  }

  // ------------------------------------------------------------
  // Device state merge
  // ------------------------------------------------------------
  if (raw.engine_state) {
    auto parsed = ParseEngineState(*raw.engine_state);
    if (!parsed) {
      Reject("unknown engine_state: " + *raw.engine_state);
    }
    record.engine_state = *parsed;
  } else if (device_state.engine_state) {
    record.engine_state = *device_state.engine_state;
  }

  // the sample's own engine state outranks remembered ignition
  if (raw.ignition) {
    record.ignition = *raw.ignition;
  } else if (raw.engine_state && record.engine_state != EngineState::kUnknown) {
    record.ignition = record.engine_state == EngineState::kRunning || record.engine_state == EngineState::kIdle;
  } else if (device_state.ignition) {
    record.ignition = *device_state.ignition;
  } else {
    record.ignition = record.engine_state == EngineState::kRunning || record.engine_state == EngineState::kIdle;
  }

  if (raw.idle_time_seconds) {
    if (*raw.idle_time_seconds < 0) {
      Reject("negative idle_time_seconds");
    }
    record.idle_time_seconds = *raw.idle_time_seconds;
  } else if (device_state.idle_time_seconds) {
    record.idle_time_seconds = *device_state.idle_time_seconds;
  }

  if (raw.battery_voltage) {
    if (!std::isfinite(*raw.battery_voltage) || *raw.battery_voltage < 0.0) {
      Reject("invalid battery_voltage");
    }
    record.battery_voltage = raw.battery_voltage;
  } else {
    record.battery_voltage = device_state.battery_voltage;
  }

  if (raw.transport_mode) {
    auto parsed = ParseTransportMode(*raw.transport_mode);
    if (!parsed) {
      Reject("unknown transport_mode: " + *raw.transport_mode);
    }
    record.transport_mode = *parsed;
  } else if (device_state.transport_mode) {
    record.transport_mode = *device_state.transport_mode;
  }

  // ------------------------------------------------------------
  // Motion
  // ------------------------------------------------------------
  if (raw.speed) {
    if (!std::isfinite(*raw.speed) || *raw.speed < 0.0) {
      Reject("invalid speed");
    }
    const std::string unit = raw.speed_unit.value_or("MPH");
    auto              mps  = SpeedToMetersPerSecond(*raw.speed, unit);
    if (!mps) {
      Reject("unknown speed_unit: " + unit);
    }
    record.speed_mps = *mps;
  } else if (!record.ignition) {
    record.speed_mps = 0.0;
  } else {
    Reject("missing speed while ignition is on");
  }

  if (raw.heading) {
    if (!std::isfinite(*raw.heading)) {
      Reject("non-finite heading");
    }
    record.heading = WrapHeading(*raw.heading);
  }

  return record;
}

DeviceState NextDeviceState(const NormalizedTelemetryRecord& record) {
  DeviceState state;
  state.battery_voltage   = record.battery_voltage;
  state.engine_state      = record.engine_state;
  state.ignition          = record.ignition;
  state.idle_time_seconds = record.idle_time_seconds;
  state.transport_mode    = record.transport_mode;
  return state;
}

} // namespace freightline::telemetry
