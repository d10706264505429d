#include "geometry.hpp"

#include <algorithm>
#include <cmath>

namespace freightline::geofence {

namespace {

// ~1cm at the equator; absorbs floating error on edge tests.
constexpr double kEdgeToleranceDegrees = 1e-7;

bool OnSegment(const util::GeoPoint& a, const util::GeoPoint& b, const util::GeoPoint& p) {
  const double cross = (b.lon - a.lon) * (p.lat - a.lat) - (b.lat - a.lat) * (p.lon - a.lon);
  const double len   = std::hypot(b.lon - a.lon, b.lat - a.lat);
  if (len == 0.0) {
    return std::hypot(p.lon - a.lon, p.lat - a.lat) <= kEdgeToleranceDegrees;
  }
  if (std::abs(cross) / len > kEdgeToleranceDegrees) {
    return false;
  }
  return p.lon >= std::min(a.lon, b.lon) - kEdgeToleranceDegrees && p.lon <= std::max(a.lon, b.lon) + kEdgeToleranceDegrees &&
         p.lat >= std::min(a.lat, b.lat) - kEdgeToleranceDegrees && p.lat <= std::max(a.lat, b.lat) + kEdgeToleranceDegrees;
}

} // namespace

bool Contains(const CircleBoundary& circle, const util::GeoPoint& point) {
  return util::HaversineMeters(circle.center, point) <= circle.radius_m;
}

bool Contains(const PolygonBoundary& polygon, const util::GeoPoint& point) {
  const auto& v = polygon.vertices;
  if (v.size() < 3) {
    return false;
  }

  bool inside = false;
  for (std::size_t i = 0, j = v.size() - 1; i < v.size(); j = i++) {
    if (OnSegment(v[j], v[i], point)) {
      return true;
    }

    // even-odd rule, lon as x and lat as y
    const bool crosses = (v[i].lat > point.lat) != (v[j].lat > point.lat);
    if (crosses) {
      const double x_at = v[j].lon + (point.lat - v[j].lat) * (v[i].lon - v[j].lon) / (v[i].lat - v[j].lat);
      if (point.lon < x_at) {
        inside = !inside;
      }
    }
  }
  return inside;
}

bool Contains(const Boundary& boundary, const util::GeoPoint& point) {
  return std::visit([&](const auto& shape) { return Contains(shape, point); }, boundary);
}

} // namespace freightline::geofence
