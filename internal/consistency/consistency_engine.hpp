#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/consistency/consistency_flag.hpp"
#include "internal/telemetry/normalized_record.hpp"
#include "internal/util/keyed_state.hpp"
#include "internal/util/time.hpp"

namespace freightline::runtime::config {
class ConsistencyConfig;
}

namespace freightline::consistency {

struct ConsistencyThresholds {
  double road_max_speed_mps  = 40.0;
  double rail_max_speed_mps  = 90.0;
  double ocean_max_speed_mps = 20.0;
  double air_max_speed_mps   = 280.0;

  // multiplier applied on top of the per-mode maximum
  double safety_margin = 1.5;

  double gps_noise_epsilon_m         = 25.0;
  double max_clock_skew_seconds      = 600.0;
  double max_battery_drop_v_per_hour = 1.0;

  double SpeedCeiling(telemetry::TransportMode mode) const;

  static ConsistencyThresholds FromConfig(const freightline::runtime::config::ConsistencyConfig& config);
};

/*
  ConsistencyEngine

  Compares each record with the last accepted record for the same
  (device_id, shipment_id) key and returns advisory flags.

  - First record for a key: stored, no flags.
  - The new record always replaces "last known"; nothing is dropped.
  - Evaluate() calls for one key are serialized; distinct keys run in
    parallel.
*/
class ConsistencyEngine {
 public:
  explicit ConsistencyEngine(ConsistencyThresholds thresholds = {});

  std::vector<ConsistencyFlag> Evaluate(const telemetry::NormalizedTelemetryRecord& record);

  std::optional<telemetry::NormalizedTelemetryRecord> LastKnown(const std::string& device_id, const std::string& shipment_id) const;

  // Retention controls.
  bool        Forget(const std::string& device_id, const std::string& shipment_id);
  std::size_t EvictOlderThan(util::TimePoint cutoff);
  void        Clear();
  std::size_t TrackedKeys() const;

  const ConsistencyThresholds& Thresholds() const {
    return thresholds_;
  }

 private:
  std::vector<ConsistencyFlag> Compare(const telemetry::NormalizedTelemetryRecord& previous,
                                       const telemetry::NormalizedTelemetryRecord& current) const;

  ConsistencyThresholds                                     thresholds_;
  mutable util::KeyedStateStore<telemetry::NormalizedTelemetryRecord> last_known_;
};

} // namespace freightline::consistency
