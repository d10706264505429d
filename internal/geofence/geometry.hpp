#pragma once

#include "internal/geofence/geofence.hpp"
#include "internal/util/geo.hpp"

namespace freightline::geofence {

// Points exactly on the boundary count as inside.
bool Contains(const Boundary& boundary, const util::GeoPoint& point);

bool Contains(const CircleBoundary& circle, const util::GeoPoint& point);
bool Contains(const PolygonBoundary& polygon, const util::GeoPoint& point);

} // namespace freightline::geofence
