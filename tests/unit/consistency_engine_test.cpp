#include "internal/consistency/consistency_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace {

using freightline::consistency::ConsistencyEngine;
using freightline::consistency::ConsistencyFlag;
using freightline::consistency::ConsistencyThresholds;
using freightline::consistency::FlagCode;
using freightline::consistency::Severity;
using freightline::telemetry::NormalizedTelemetryRecord;
using freightline::telemetry::TransportMode;
using freightline::util::FromUnixMillis;

constexpr int64_t kT0 = 1714564800000; // 2024-05-01T12:00:00Z

NormalizedTelemetryRecord Record(int64_t t_ms, double lat, double lon, const std::string& device = "dev-1",
                                 const std::string& shipment = "shp-1") {
  NormalizedTelemetryRecord r;
  r.device_id   = device;
  r.shipment_id = shipment;
  r.event_time  = FromUnixMillis(t_ms);
  r.latitude    = lat;
  r.longitude   = lon;
  return r;
}

bool Has(const std::vector<ConsistencyFlag>& flags, FlagCode code) {
  return std::any_of(flags.begin(), flags.end(), [&](const ConsistencyFlag& f) { return f.code == code; });
}

void TestFirstRecordYieldsNoFlags() {
  ConsistencyEngine engine;
  assert(engine.Evaluate(Record(kT0, 41.0, -87.0)).empty());
  assert(engine.TrackedKeys() == 1);
  assert(engine.LastKnown("dev-1", "shp-1").has_value());
}

void TestImpossibleSpeedAt600Mph() {
  ConsistencyEngine engine;
  (void)engine.Evaluate(Record(kT0, 41.0, -87.0));

  // ~268 m/s (600 mph) northward for 60 s: ~16.1 km ~= 0.1447 degrees latitude
  auto flags = engine.Evaluate(Record(kT0 + 60'000, 41.0 + 0.1447, -87.0));
  assert(flags.size() == 1);
  assert(flags[0].code == FlagCode::kImpossibleSpeed);
  assert(flags[0].severity == Severity::kCritical);
  assert(flags[0].threshold == 60.0); // 40 m/s * 1.5
  assert(flags[0].observed > 260.0 && flags[0].observed < 275.0);
  assert(flags[0].previous.event_time == FromUnixMillis(kT0));
  assert(!flags[0].detail.empty());
}

void TestPlausibleMovementIsQuiet() {
  ConsistencyEngine engine;
  (void)engine.Evaluate(Record(kT0, 41.0, -87.0));
  // ~1.1 km in 60 s = ~18.5 m/s
  assert(engine.Evaluate(Record(kT0 + 60'000, 41.01, -87.0)).empty());
}

void TestAirModeRaisesCeiling() {
  ConsistencyEngine engine;
  auto              a = Record(kT0, 41.0, -87.0);
  auto              b = Record(kT0 + 60'000, 41.0 + 0.1447, -87.0);
  a.transport_mode = b.transport_mode = TransportMode::kAir;
  (void)engine.Evaluate(a);
  assert(engine.Evaluate(b).empty());
}

void TestTimestampDuplicate() {
  ConsistencyEngine engine;
  (void)engine.Evaluate(Record(kT0, 41.0, -87.0));

  // identical time, ~11 m apart: within GPS noise
  assert(engine.Evaluate(Record(kT0, 41.0001, -87.0)).empty());

  // identical time, ~1.1 km apart
  auto flags = engine.Evaluate(Record(kT0, 41.0101, -87.0));
  assert(flags.size() == 1);
  assert(flags[0].code == FlagCode::kTimestampDuplicate);
  assert(flags[0].severity == Severity::kWarning);
}

void TestReversedTimeOrder() {
  ConsistencyEngine engine;
  (void)engine.Evaluate(Record(kT0, 41.0, -87.0));
  auto flags = engine.Evaluate(Record(kT0 - 30'000, 41.0, -87.0));
  assert(Has(flags, FlagCode::kReversedTimeOrder));
  assert(!Has(flags, FlagCode::kImpossibleSpeed));

  // the reversed record still replaced "last known"
  assert(engine.LastKnown("dev-1", "shp-1")->event_time == FromUnixMillis(kT0 - 30'000));
}

void TestStaleDeviceClock() {
  ConsistencyEngine engine;
  (void)engine.Evaluate(Record(kT0, 41.0, -87.0));

  auto next        = Record(kT0 + 60'000, 41.0, -87.0);
  next.received_at = FromUnixMillis(kT0 + 60'000 + 900'000);
  auto flags       = engine.Evaluate(next);
  assert(flags.size() == 1);
  assert(flags[0].code == FlagCode::kStaleDeviceClock);
  assert(flags[0].severity == Severity::kInfo);

  auto close        = Record(kT0 + 120'000, 41.0, -87.0);
  close.received_at = FromUnixMillis(kT0 + 120'000 + 5'000);
  assert(engine.Evaluate(close).empty());
}

void TestBatteryDepletion() {
  ConsistencyEngine engine;
  auto              a = Record(kT0, 41.0, -87.0);
  a.battery_voltage = 12.6;
  (void)engine.Evaluate(a);

  // 0.5 V in 10 minutes = 3 V/h
  auto b            = Record(kT0 + 600'000, 41.0, -87.0);
  b.battery_voltage = 12.1;
  auto flags        = engine.Evaluate(b);
  assert(flags.size() == 1);
  assert(flags[0].code == FlagCode::kBatteryDepletion);

  // 0.1 V in an hour is fine
  auto c            = Record(kT0 + 600'000 + 3'600'000, 41.0, -87.0);
  c.battery_voltage = 12.0;
  assert(engine.Evaluate(c).empty());
}

void TestThresholdsFromConfig() {
  freightline::runtime::config::ConsistencyConfig config;
  config.set_road_max_speed_mps(10.0);
  config.set_safety_margin(1.0);

  auto t = ConsistencyThresholds::FromConfig(config);
  assert(t.SpeedCeiling(TransportMode::kRoad) == 10.0);
  assert(t.rail_max_speed_mps == 90.0);
  assert(t.gps_noise_epsilon_m == 25.0);

  ConsistencyEngine engine(t);
  (void)engine.Evaluate(Record(kT0, 41.0, -87.0));
  assert(Has(engine.Evaluate(Record(kT0 + 60'000, 41.01, -87.0)), FlagCode::kImpossibleSpeed));
}

void TestRetentionControls() {
  ConsistencyEngine engine;
  (void)engine.Evaluate(Record(kT0, 41.0, -87.0, "a"));
  (void)engine.Evaluate(Record(kT0 + 3'600'000, 41.0, -87.0, "b"));
  assert(engine.TrackedKeys() == 2);

  assert(engine.EvictOlderThan(FromUnixMillis(kT0 + 1)) == 1);
  assert(!engine.LastKnown("a", "shp-1").has_value());
  assert(engine.LastKnown("b", "shp-1").has_value());

  assert(engine.Forget("b", "shp-1"));
  assert(!engine.Forget("b", "shp-1"));

  (void)engine.Evaluate(Record(kT0, 41.0, -87.0, "c"));
  engine.Clear();
  assert(engine.TrackedKeys() == 0);

  // after Forget the next record is a first record again
  (void)engine.Evaluate(Record(kT0, 41.0, -87.0));
  engine.Forget("dev-1", "shp-1");
  assert(engine.Evaluate(Record(kT0 + 1'000, 45.0, -87.0)).empty());
}

void TestKeysAreIsolatedUnderConcurrency() {
  ConsistencyEngine engine;
  constexpr int     kDevices = 8;
  constexpr int     kSamples = 200;
  std::atomic<int>  flagged{0};

  std::vector<std::thread> workers;
  for (int d = 0; d < kDevices; ++d) {
    workers.emplace_back([&, d]() {
      const std::string device = "dev-" + std::to_string(d);
      // each device moves slowly in its own region; interleaving with other
      // devices must never be compared against this one
      for (int i = 0; i < kSamples; ++i) {
        auto flags = engine.Evaluate(Record(kT0 + i * 10'000, 10.0 * d, 0.0001 * i, device));
        flagged += static_cast<int>(flags.size());
      }
    });
  }
  for (auto& w : workers) w.join();

  assert(flagged.load() == 0);
  assert(engine.TrackedKeys() == kDevices);
  for (int d = 0; d < kDevices; ++d) {
    auto last = engine.LastKnown("dev-" + std::to_string(d), "shp-1");
    assert(last.has_value());
    assert(last->event_time == FromUnixMillis(kT0 + (kSamples - 1) * 10'000));
  }
}

} // namespace

int main() {
  TestFirstRecordYieldsNoFlags();
  TestImpossibleSpeedAt600Mph();
  TestPlausibleMovementIsQuiet();
  TestAirModeRaisesCeiling();
  TestTimestampDuplicate();
  TestReversedTimeOrder();
  TestStaleDeviceClock();
  TestBatteryDepletion();
  TestThresholdsFromConfig();
  TestRetentionControls();
  TestKeysAreIsolatedUnderConcurrency();

  std::cout << "freightline_unit_consistency_engine: pass\n";
  return 0;
}
