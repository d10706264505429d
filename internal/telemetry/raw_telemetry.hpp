#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "freightline/telemetry/v1/telemetry.pb.h"

namespace freightline::telemetry {

/*
  Raw sample as it arrives at the ingestion boundary.

  Nothing is guaranteed present or in range here; Normalize() decides.
*/
struct RawTelemetry {
  std::optional<std::string> device_id;
  std::optional<std::string> shipment_id;

  // RFC 3339 with offset. Takes precedence over event_time_ms.
  std::optional<std::string> timestamp;
  std::optional<int64_t>     event_time_ms;
  std::optional<int64_t>     received_at_ms;

  std::optional<double> latitude;
  std::optional<double> longitude;

  std::optional<double>      speed;
  std::optional<std::string> speed_unit; // MPH when absent
  std::optional<double>      heading;

  std::optional<std::string> engine_state;
  std::optional<bool>        ignition;
  std::optional<int64_t>     idle_time_seconds;
  std::optional<double>      battery_voltage;

  std::optional<std::string> transport_mode; // ROAD when absent
};

RawTelemetry FromProto(const freightline::telemetry::v1::RawTelemetrySample& sample);

// Parses one JSON object (e.g. a JSON-lines row) into a RawTelemetry.
// Throws MalformedTelemetryError when the text is not a valid sample object.
RawTelemetry ParseJson(const std::string& json);

} // namespace freightline::telemetry
