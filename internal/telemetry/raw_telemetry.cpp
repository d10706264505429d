#include "raw_telemetry.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace freightline::telemetry {

RawTelemetry FromProto(const freightline::telemetry::v1::RawTelemetrySample& sample) {
  RawTelemetry raw;
  if (sample.has_device_id()) raw.device_id = sample.device_id();
  if (sample.has_shipment_id()) raw.shipment_id = sample.shipment_id();
  if (sample.has_timestamp()) raw.timestamp = sample.timestamp();
  if (sample.has_event_time_ms()) raw.event_time_ms = sample.event_time_ms();
  if (sample.has_received_at_ms()) raw.received_at_ms = sample.received_at_ms();
  if (sample.has_latitude()) raw.latitude = sample.latitude();
  if (sample.has_longitude()) raw.longitude = sample.longitude();
  if (sample.has_speed()) raw.speed = sample.speed();
  if (sample.has_speed_unit()) raw.speed_unit = sample.speed_unit();
  if (sample.has_heading()) raw.heading = sample.heading();
  if (sample.has_engine_state()) raw.engine_state = sample.engine_state();
  if (sample.has_ignition()) raw.ignition = sample.ignition();
  if (sample.has_idle_time_seconds()) raw.idle_time_seconds = sample.idle_time_seconds();
  if (sample.has_battery_voltage()) raw.battery_voltage = sample.battery_voltage();
  if (sample.has_transport_mode()) raw.transport_mode = sample.transport_mode();
  return raw;
}

RawTelemetry ParseJson(const std::string& json) {
  freightline::telemetry::v1::RawTelemetrySample sample;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &sample, options);
  if (!status.ok()) {
    throw util::MalformedTelemetryError("unparseable telemetry sample: " + std::string(status.message()));
  }
  return FromProto(sample);
}

} // namespace freightline::telemetry
