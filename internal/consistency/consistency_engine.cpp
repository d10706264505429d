#include "consistency_engine.hpp"

#include <cmath>
#include <sstream>

#include "config/config.pb.h"
#include "internal/util/geo.hpp"

namespace freightline::consistency {

using telemetry::NormalizedTelemetryRecord;
using telemetry::TransportMode;

std::string_view ToString(FlagCode code) {
  switch (code) {
    case FlagCode::kImpossibleSpeed:
      return "IMPOSSIBLE_SPEED";
    case FlagCode::kTimestampDuplicate:
      return "TIMESTAMP_DUPLICATE";
    case FlagCode::kStaleDeviceClock:
      return "STALE_DEVICE_CLOCK";
    case FlagCode::kReversedTimeOrder:
      return "REVERSED_TIME_ORDER";
    case FlagCode::kBatteryDepletion:
      return "BATTERY_DEPLETION";
  }
  return "UNKNOWN";
}

std::string_view ToString(Severity severity) {
  switch (severity) {
    case Severity::kInfo:
      return "INFO";
    case Severity::kWarning:
      return "WARNING";
    case Severity::kCritical:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

double ConsistencyThresholds::SpeedCeiling(TransportMode mode) const {
  double max_speed = road_max_speed_mps;
  switch (mode) {
    case TransportMode::kRoad:
      max_speed = road_max_speed_mps;
      break;
    case TransportMode::kRail:
      max_speed = rail_max_speed_mps;
      break;
    case TransportMode::kOcean:
      max_speed = ocean_max_speed_mps;
      break;
    case TransportMode::kAir:
      max_speed = air_max_speed_mps;
      break;
  }
  return max_speed * safety_margin;
}

ConsistencyThresholds ConsistencyThresholds::FromConfig(const freightline::runtime::config::ConsistencyConfig& config) {
  ConsistencyThresholds t;
  auto                  pick = [](double configured, double fallback) { return configured > 0.0 ? configured : fallback; };

  t.road_max_speed_mps          = pick(config.road_max_speed_mps(), t.road_max_speed_mps);
  t.rail_max_speed_mps          = pick(config.rail_max_speed_mps(), t.rail_max_speed_mps);
  t.ocean_max_speed_mps         = pick(config.ocean_max_speed_mps(), t.ocean_max_speed_mps);
  t.air_max_speed_mps           = pick(config.air_max_speed_mps(), t.air_max_speed_mps);
  t.safety_margin               = pick(config.safety_margin(), t.safety_margin);
  t.gps_noise_epsilon_m         = pick(config.gps_noise_epsilon_m(), t.gps_noise_epsilon_m);
  t.max_clock_skew_seconds      = pick(config.max_clock_skew_seconds(), t.max_clock_skew_seconds);
  t.max_battery_drop_v_per_hour = pick(config.max_battery_drop_v_per_hour(), t.max_battery_drop_v_per_hour);
  return t;
}

ConsistencyEngine::ConsistencyEngine(ConsistencyThresholds thresholds) : thresholds_(thresholds) {
}

std::vector<ConsistencyFlag> ConsistencyEngine::Evaluate(const NormalizedTelemetryRecord& record) {
  return last_known_.WithState(record.Key(), [&](std::optional<NormalizedTelemetryRecord>& last) {
    std::vector<ConsistencyFlag> flags;
    if (last) {
      flags = Compare(*last, record);
    }
    last = record;
    return flags;
  });
}

std::optional<NormalizedTelemetryRecord> ConsistencyEngine::LastKnown(const std::string& device_id, const std::string& shipment_id) const {
  return last_known_.Snapshot(device_id + "#" + shipment_id);
}

bool ConsistencyEngine::Forget(const std::string& device_id, const std::string& shipment_id) {
  return last_known_.Erase(device_id + "#" + shipment_id);
}

std::size_t ConsistencyEngine::EvictOlderThan(util::TimePoint cutoff) {
  return last_known_.EraseIf([cutoff](const std::string&, const NormalizedTelemetryRecord& last) { return last.event_time < cutoff; });
}

void ConsistencyEngine::Clear() {
  last_known_.Clear();
}

std::size_t ConsistencyEngine::TrackedKeys() const {
  return last_known_.Size();
}

// ------------------------------------------------------------
// Flag derivation: derive a delta, compare to a threshold.
// ------------------------------------------------------------

std::vector<ConsistencyFlag> ConsistencyEngine::Compare(const NormalizedTelemetryRecord& previous, const NormalizedTelemetryRecord& current) const {
  std::vector<ConsistencyFlag> flags;

  auto emit = [&](FlagCode code, Severity severity, double observed, double threshold, std::string detail) {
    ConsistencyFlag flag;
    flag.code      = code;
    flag.severity  = severity;
    flag.previous  = previous;
    flag.current   = current;
    flag.observed  = observed;
    flag.threshold = threshold;
    flag.detail    = std::move(detail);
    flags.push_back(std::move(flag));
  };

  const double dt = util::SecondsBetween(previous.event_time, current.event_time);
  const double dd = util::HaversineMeters(previous.Position(), current.Position());

  if (dt == 0.0) {
    if (dd > thresholds_.gps_noise_epsilon_m) {
      std::ostringstream detail;
      detail << "same event_time reported " << dd << "m apart";
      emit(FlagCode::kTimestampDuplicate, Severity::kWarning, dd, thresholds_.gps_noise_epsilon_m, detail.str());
    }
  } else {
    const double implied_speed = dd / std::abs(dt);
    const double ceiling       = thresholds_.SpeedCeiling(current.transport_mode);
    if (implied_speed > ceiling) {
      std::ostringstream detail;
      detail << "implied speed " << implied_speed << "m/s over " << dd << "m in " << std::abs(dt) << "s exceeds " << ceiling << "m/s";
      emit(FlagCode::kImpossibleSpeed, Severity::kCritical, implied_speed, ceiling, detail.str());
    }
  }

  if (dt < 0.0) {
    std::ostringstream detail;
    detail << "event_time moved backwards by " << -dt << "s";
    emit(FlagCode::kReversedTimeOrder, Severity::kWarning, dt, 0.0, detail.str());
  }

  if (current.received_at) {
    const double skew = std::abs(util::SecondsBetween(current.event_time, *current.received_at));
    if (skew > thresholds_.max_clock_skew_seconds) {
      std::ostringstream detail;
      detail << "device clock is " << skew << "s away from receipt time";
      emit(FlagCode::kStaleDeviceClock, Severity::kInfo, skew, thresholds_.max_clock_skew_seconds, detail.str());
    }
  }

  if (previous.battery_voltage && current.battery_voltage && dt > 0.0) {
    const double drop_per_hour = (*previous.battery_voltage - *current.battery_voltage) / (dt / 3600.0);
    if (drop_per_hour > thresholds_.max_battery_drop_v_per_hour) {
      std::ostringstream detail;
      detail << "battery fell " << (*previous.battery_voltage - *current.battery_voltage) << "V in " << dt << "s";
      emit(FlagCode::kBatteryDepletion, Severity::kWarning, drop_per_hour, thresholds_.max_battery_drop_v_per_hour, detail.str());
    }
  }

  return flags;
}

} // namespace freightline::consistency
