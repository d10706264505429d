#include "geo.hpp"

#include <algorithm>
#include <cmath>

namespace freightline::util {

namespace {

constexpr double kPi = 3.14159265358979323846;

double ToRadians(double degrees) {
  return degrees * kPi / 180.0;
}

} // namespace

double HaversineMeters(const GeoPoint& a, const GeoPoint& b) {
  const double lat1 = ToRadians(a.lat);
  const double lat2 = ToRadians(b.lat);
  const double dlat = lat2 - lat1;
  const double dlon = ToRadians(b.lon - a.lon);

  const double s = std::sin(dlat / 2.0);
  const double t = std::sin(dlon / 2.0);
  double       h = s * s + std::cos(lat1) * std::cos(lat2) * t * t;
  h              = std::clamp(h, 0.0, 1.0);

  return 2.0 * kEarthRadiusMeters * std::asin(std::sqrt(h));
}

} // namespace freightline::util
