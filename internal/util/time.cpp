#include "time.hpp"

#include <stdexcept>
#include <string>

#include <google/protobuf/util/time_util.h>

namespace freightline::util {

namespace {

// One second of slack on each side keeps the sub-second part in range too.
constexpr int64_t kMaxUnixSeconds = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count() - 1;
constexpr int64_t kMinUnixSeconds = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::min()).count() + 1;

} // namespace

bool IsRepresentable(int64_t unix_seconds) {
  return unix_seconds >= kMinUnixSeconds && unix_seconds <= kMaxUnixSeconds;
}

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  if (!IsRepresentable(ts.seconds())) {
    throw std::out_of_range("timestamp out of range: " + std::to_string(ts.seconds()) + "s");
  }
  return TimePoint{} +
         std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  auto tp = TryFromUnixMillis(ms);
  if (!tp) {
    throw std::out_of_range("unix millis out of range: " + std::to_string(ms));
  }
  return *tp;
}

std::optional<TimePoint> TryFromUnixMillis(int64_t ms) {
  if (!IsRepresentable(ms / 1000)) return std::nullopt;
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::optional<TimePoint> ParseRfc3339(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (text.empty() || !google::protobuf::util::TimeUtil::FromString(text, &ts)) {
    return std::nullopt;
  }
  if (!IsRepresentable(ts.seconds())) {
    return std::nullopt;
  }
  return FromProto(ts);
}

std::string FormatRfc3339(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(tp));
}

double SecondsBetween(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

} // namespace freightline::util
