#include "normalized_record.hpp"

namespace freightline::telemetry {

std::string_view ToString(EngineState state) {
  switch (state) {
    case EngineState::kOff:
      return "OFF";
    case EngineState::kIdle:
      return "IDLE";
    case EngineState::kRunning:
      return "RUNNING";
    case EngineState::kUnknown:
      break;
  }
  return "UNKNOWN";
}

std::optional<EngineState> ParseEngineState(std::string_view text) {
  if (text == "OFF" || text == "off") return EngineState::kOff;
  if (text == "IDLE" || text == "idle") return EngineState::kIdle;
  if (text == "RUNNING" || text == "running" || text == "ON" || text == "on") return EngineState::kRunning;
  if (text == "UNKNOWN" || text == "unknown") return EngineState::kUnknown;
  return std::nullopt;
}

std::string_view ToString(TransportMode mode) {
  switch (mode) {
    case TransportMode::kRoad:
      return "ROAD";
    case TransportMode::kRail:
      return "RAIL";
    case TransportMode::kOcean:
      return "OCEAN";
    case TransportMode::kAir:
      return "AIR";
  }
  return "ROAD";
}

std::optional<TransportMode> ParseTransportMode(std::string_view text) {
  if (text == "ROAD") return TransportMode::kRoad;
  if (text == "RAIL") return TransportMode::kRail;
  if (text == "OCEAN") return TransportMode::kOcean;
  if (text == "AIR") return TransportMode::kAir;
  return std::nullopt;
}

} // namespace freightline::telemetry
