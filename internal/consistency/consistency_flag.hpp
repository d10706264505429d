#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/telemetry/normalized_record.hpp"

namespace freightline::consistency {

enum class FlagCode : std::uint8_t {
  kImpossibleSpeed = 1,
  kTimestampDuplicate,
  kStaleDeviceClock,
  kReversedTimeOrder,
  kBatteryDepletion,
};

enum class Severity : std::uint8_t {
  kInfo     = 1,
  kWarning  = 2,
  kCritical = 3,
};

std::string_view ToString(FlagCode code);
std::string_view ToString(Severity severity);

/*
  Advisory signal about a physically implausible transition.

  Never an accept/reject decision; downstream risk scoring consumes it.
  observed/threshold are in the unit named by the flag code
  (m/s, meters, seconds, volts/hour).
*/
struct ConsistencyFlag {
  FlagCode code     = FlagCode::kImpossibleSpeed;
  Severity severity = Severity::kInfo;

  telemetry::NormalizedTelemetryRecord previous;
  telemetry::NormalizedTelemetryRecord current;

  double      observed  = 0.0;
  double      threshold = 0.0;
  std::string detail;
};

} // namespace freightline::consistency
