#pragma once

#include <vector>

#include "config/config.pb.h"
#include "internal/geofence/geofence.hpp"

namespace freightline::geofence {

/*
  Builds the geofence catalogue from runtime config.

  Throws std::runtime_error on duplicate or empty ids, unknown kinds,
  non-positive radii, polygons with fewer than 3 vertices, or
  out-of-range coordinates.
*/
std::vector<GeofenceDefinition> LoadCatalog(const freightline::runtime::config::RuntimeConfig& config);

// Same checks for a caller-assembled catalogue.
void ValidateCatalog(const std::vector<GeofenceDefinition>& definitions);

} // namespace freightline::geofence
