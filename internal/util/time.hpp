#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace freightline::util {

/*
  Time utilities. Every clock read in the pipeline goes through Now().

  All instants are UTC system_clock time points.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// Throws std::out_of_range when ts does not fit Clock::duration.
TimePoint FromProto(const google::protobuf::Timestamp& ts);

int64_t ToUnixMillis(TimePoint tp);

// Throws std::out_of_range when ms does not fit Clock::duration.
TimePoint FromUnixMillis(int64_t ms);

// nullopt when ms does not fit Clock::duration.
std::optional<TimePoint> TryFromUnixMillis(int64_t ms);

// True when whole unix seconds fit Clock::duration.
bool IsRepresentable(int64_t unix_seconds);

// RFC 3339 with any UTC offset -> UTC instant. nullopt when unparseable or
// outside the range Clock::duration can hold.
std::optional<TimePoint> ParseRfc3339(const std::string& text);

// Always emitted in UTC ("Z" suffix).
std::string FormatRfc3339(TimePoint tp);

// Signed seconds from `from` to `to`.
double SecondsBetween(TimePoint from, TimePoint to);

} // namespace freightline::util
