#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/geofence/geofence.hpp"
#include "internal/telemetry/normalized_record.hpp"
#include "internal/util/keyed_state.hpp"

namespace freightline::geofence {

/*
  GeofenceEngine

  Emits ENTER/EXIT when the "inside" membership of a (device, geofence)
  pair flips. Steady state emits nothing. A pair never seen before starts
  outside, so the first sample inside a geofence yields ENTER.

  Membership is held per device; evaluations for one device are
  serialized, different devices run in parallel.
*/
class GeofenceEngine {
 public:
  GeofenceEngine() = default;

  std::vector<GeofenceEvent> Evaluate(const telemetry::NormalizedTelemetryRecord& record, const std::vector<GeofenceDefinition>& definitions);

  std::optional<bool> IsInside(const std::string& device_id, const std::string& geofence_id) const;

  bool Forget(const std::string& device_id);

  // Drops devices whose latest record is older than cutoff. Returns the count.
  std::size_t EvictOlderThan(util::TimePoint cutoff);

  void        Clear();
  std::size_t TrackedDevices() const;

 private:
  struct Membership {
    std::unordered_map<std::string, bool> inside; // geofence id -> inside
    util::TimePoint                       last_event_time;
  };

  util::KeyedStateStore<Membership> membership_;
};

} // namespace freightline::geofence
