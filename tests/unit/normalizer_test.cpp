#include "internal/telemetry/normalizer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include "internal/telemetry/raw_telemetry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using freightline::telemetry::DeviceState;
using freightline::telemetry::EngineState;
using freightline::telemetry::Normalize;
using freightline::telemetry::RawTelemetry;
using freightline::telemetry::TransportMode;

bool Near(double a, double b, double eps = 1e-6) {
  return std::abs(a - b) < eps;
}

RawTelemetry ValidSample() {
  RawTelemetry raw;
  raw.device_id   = "dev-1";
  raw.shipment_id = "shp-1";
  raw.timestamp   = "2024-05-01T12:00:00Z";
  raw.latitude    = 41.8781;
  raw.longitude   = -87.6298;
  raw.speed       = 10.0;
  raw.ignition    = true;
  return raw;
}

bool Rejects(const RawTelemetry& raw, const DeviceState& state = {}) {
  try {
    (void)Normalize(raw, state);
  } catch (const freightline::util::MalformedTelemetryError& e) {
    assert(e.Kind() == freightline::util::ErrorKind::kMalformedTelemetry);
    assert(!e.Retryable());
    return true;
  }
  return false;
}

void TestSpeedUnitsConvertToMetersPerSecond() {
  auto raw = ValidSample();
  auto rec = Normalize(raw, {});
  assert(Near(rec.speed_mps, 4.4704)); // MPH by default

  raw.speed_unit = "KPH";
  raw.speed      = 36.0;
  assert(Near(Normalize(raw, {}).speed_mps, 10.0));

  raw.speed_unit = "KNOTS";
  raw.speed      = 10.0;
  assert(Near(Normalize(raw, {}).speed_mps, 5.14444));

  raw.speed_unit = "MPS";
  raw.speed      = 3.5;
  assert(Near(Normalize(raw, {}).speed_mps, 3.5));

  raw.speed_unit = "FURLONGS";
  assert(Rejects(raw));
}

void TestTimestampOffsetsNormalizeToUtc() {
  auto raw      = ValidSample();
  raw.timestamp = "2024-05-01T07:00:00-05:00";
  auto rec      = Normalize(raw, {});
  assert(rec.event_time == *freightline::util::ParseRfc3339("2024-05-01T12:00:00Z"));

  raw.timestamp.reset();
  raw.event_time_ms = 1714564800000;
  assert(Normalize(raw, {}).event_time == freightline::util::FromUnixMillis(1714564800000));

  raw.event_time_ms.reset();
  assert(Rejects(raw));

  raw.timestamp = "yesterday-ish";
  assert(Rejects(raw));
}

void TestTimesOutsideClockRangeAreRejected() {
  auto raw      = ValidSample();
  raw.timestamp = "9999-12-31T23:59:59Z";
  assert(Rejects(raw));

  raw.timestamp = "1600-01-01T00:00:00Z";
  assert(Rejects(raw));

  // microseconds sent where milliseconds are expected
  raw.timestamp.reset();
  raw.event_time_ms = 1714564800000000;
  assert(Rejects(raw));

  raw.event_time_ms  = 1714564800000;
  raw.received_at_ms = 1714564800000000;
  assert(Rejects(raw));

  raw.received_at_ms = 1714564801000;
  auto rec           = Normalize(raw, {});
  assert(rec.received_at == freightline::util::FromUnixMillis(1714564801000));

  assert(!freightline::util::TryFromUnixMillis(1714564800000000));
  assert(freightline::util::FormatRfc3339(*freightline::util::ParseRfc3339("2200-01-01T00:00:00Z")) == "2200-01-01T00:00:00Z");
}

void TestRequiredFieldsAndRanges() {
  auto raw = ValidSample();
  raw.device_id.reset();
  assert(Rejects(raw));

  raw             = ValidSample();
  raw.shipment_id = "";
  assert(Rejects(raw));

  raw          = ValidSample();
  raw.latitude = 90.5;
  assert(Rejects(raw));

  raw           = ValidSample();
  raw.longitude = -180.01;
  assert(Rejects(raw));

  raw          = ValidSample();
  raw.latitude = std::numeric_limits<double>::quiet_NaN();
  assert(Rejects(raw));

  raw       = ValidSample();
  raw.speed = -1.0;
  assert(Rejects(raw));

  raw       = ValidSample();
  raw.speed = std::numeric_limits<double>::infinity();
  assert(Rejects(raw));

  raw              = ValidSample();
  raw.engine_state = "WARP";
  assert(Rejects(raw));

  raw                = ValidSample();
  raw.transport_mode = "TELEPORT";
  assert(Rejects(raw));

  // boundary values are valid
  raw           = ValidSample();
  raw.latitude  = -90.0;
  raw.longitude = 180.0;
  assert(!Rejects(raw));
}

void TestHeadingWrapsIntoRange() {
  auto raw    = ValidSample();
  raw.heading = 370.0;
  assert(Near(Normalize(raw, {}).heading, 10.0));

  raw.heading = -90.0;
  assert(Near(Normalize(raw, {}).heading, 270.0));

  raw.heading = 360.0;
  assert(Near(Normalize(raw, {}).heading, 0.0));
}

void TestMissingSpeedDependsOnIgnition() {
  auto raw = ValidSample();
  raw.speed.reset();
  raw.ignition = false;
  assert(Normalize(raw, {}).speed_mps == 0.0);

  raw.ignition = true;
  assert(Rejects(raw));
}

void TestDeviceStateFillsOmittedFields() {
  DeviceState state;
  state.battery_voltage   = 12.6;
  state.engine_state      = EngineState::kIdle;
  state.ignition          = false;
  state.idle_time_seconds = 120;
  state.transport_mode    = TransportMode::kRail;

  auto raw = ValidSample();
  raw.ignition.reset();
  raw.speed.reset();

  auto rec = Normalize(raw, state);
  assert(rec.battery_voltage && Near(*rec.battery_voltage, 12.6));
  assert(rec.engine_state == EngineState::kIdle);
  assert(!rec.ignition);
  assert(rec.idle_time_seconds == 120);
  assert(rec.transport_mode == TransportMode::kRail);
  assert(rec.speed_mps == 0.0);

  // explicit values beat device state
  raw.transport_mode = "OCEAN";
  raw.engine_state   = "RUNNING";
  raw.ignition       = true;
  raw.speed          = 5.0;
  rec                = Normalize(raw, state);
  assert(rec.transport_mode == TransportMode::kOcean);
  assert(rec.engine_state == EngineState::kRunning);
  assert(rec.ignition);

  auto next = freightline::telemetry::NextDeviceState(rec);
  assert(next.transport_mode == TransportMode::kOcean);
  assert(next.ignition && *next.ignition);
}

void TestIgnitionInferredFromEngineState() {
  auto raw = ValidSample();
  raw.ignition.reset();
  raw.engine_state = "RUNNING";
  assert(Normalize(raw, {}).ignition);

  raw.engine_state = "OFF";
  raw.speed.reset();
  auto rec = Normalize(raw, {});
  assert(!rec.ignition);
  assert(rec.speed_mps == 0.0);

  // reported engine state beats remembered ignition
  DeviceState state;
  state.ignition     = true;
  state.engine_state = EngineState::kRunning;
  raw.engine_state   = "OFF";
  rec                = Normalize(raw, state);
  assert(rec.engine_state == EngineState::kOff);
  assert(!rec.ignition);

  state.ignition   = false;
  raw.engine_state = "IDLE";
  raw.speed        = 0.0;
  assert(Normalize(raw, state).ignition);

  // UNKNOWN says nothing, so remembered ignition stays
  state.ignition   = true;
  raw.engine_state = "UNKNOWN";
  assert(Normalize(raw, state).ignition);
}

void TestJsonLinesParsing() {
  auto raw = freightline::telemetry::ParseJson(
      R"({"device_id":"d","shipment_id":"s","timestamp":"2024-05-01T12:00:00Z","latitude":1.5,"longitude":2.5,"speed":8,"ignition":true,"extra":"ignored"})");
  assert(raw.device_id == std::string("d"));
  assert(raw.speed && *raw.speed == 8.0);
  assert(!raw.heading);

  bool threw = false;
  try {
    (void)freightline::telemetry::ParseJson("{not json");
  } catch (const freightline::util::MalformedTelemetryError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSpeedUnitsConvertToMetersPerSecond();
  TestTimestampOffsetsNormalizeToUtc();
  TestTimesOutsideClockRangeAreRejected();
  TestRequiredFieldsAndRanges();
  TestHeadingWrapsIntoRange();
  TestMissingSpeedDependsOnIgnition();
  TestDeviceStateFillsOmittedFields();
  TestIgnitionInferredFromEngineState();
  TestJsonLinesParsing();

  std::cout << "freightline_unit_normalizer: pass\n";
  return 0;
}
