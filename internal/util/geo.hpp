#pragma once

namespace freightline::util {

struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;
};

// Mean earth radius (IUGG).
inline constexpr double kEarthRadiusMeters = 6371008.8;

inline constexpr double kMetersPerSecondPerMph  = 0.44704;
inline constexpr double kMetersPerSecondPerKph  = 1.0 / 3.6;
inline constexpr double kMetersPerSecondPerKnot = 0.514444;

// Great-circle distance in meters.
double HaversineMeters(const GeoPoint& a, const GeoPoint& b);

constexpr bool IsValidLatitude(double lat) {
  return lat >= -90.0 && lat <= 90.0;
}

constexpr bool IsValidLongitude(double lon) {
  return lon >= -180.0 && lon <= 180.0;
}

} // namespace freightline::util
