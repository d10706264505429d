#include "catalog.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>

namespace freightline::geofence {

namespace {

using freightline::runtime::config::GeofenceConfig;
using freightline::runtime::config::GeoPointConfig;

util::GeoPoint ToPoint(const GeoPointConfig& point) {
  return {point.lat(), point.lon()};
}

void ValidatePoint(const std::string& id, const util::GeoPoint& point) {
  if (!util::IsValidLatitude(point.lat) || !util::IsValidLongitude(point.lon)) {
    throw std::runtime_error("geofence " + id + ": coordinate out of range");
  }
}

GeofenceDefinition ToDefinition(const GeofenceConfig& config) {
  GeofenceDefinition definition;
  definition.id   = config.id();
  definition.name = config.name().empty() ? config.id() : config.name();

  auto kind = ParseGeofenceKind(config.kind());
  if (!kind) {
    throw std::runtime_error("geofence " + config.id() + ": unknown kind '" + config.kind() + "'");
  }
  definition.kind = *kind;

  switch (config.boundary_case()) {
    case GeofenceConfig::kCircle: {
      CircleBoundary circle;
      circle.center   = ToPoint(config.circle().center());
      circle.radius_m = config.circle().radius_m();
      definition.boundary = circle;
      break;
    }
    case GeofenceConfig::kPolygon: {
      PolygonBoundary polygon;
      for (const auto& vertex : config.polygon().vertices()) {
        polygon.vertices.push_back(ToPoint(vertex));
      }
      definition.boundary = std::move(polygon);
      break;
    }
    case GeofenceConfig::BOUNDARY_NOT_SET:
      throw std::runtime_error("geofence " + config.id() + ": missing boundary");
  }
  return definition;
}

} // namespace

void ValidateCatalog(const std::vector<GeofenceDefinition>& definitions) {
  std::unordered_set<std::string> seen;
  for (const auto& definition : definitions) {
    if (definition.id.empty()) {
      throw std::runtime_error("geofence with empty id");
    }
    if (!seen.insert(definition.id).second) {
      throw std::runtime_error("duplicate geofence id: " + definition.id);
    }

    if (const auto* circle = std::get_if<CircleBoundary>(&definition.boundary)) {
      ValidatePoint(definition.id, circle->center);
      if (!(circle->radius_m > 0.0)) {
        throw std::runtime_error("geofence " + definition.id + ": radius must be positive");
      }
    } else if (const auto* polygon = std::get_if<PolygonBoundary>(&definition.boundary)) {
      if (polygon->vertices.size() < 3) {
        throw std::runtime_error("geofence " + definition.id + ": polygon needs at least 3 vertices");
      }
      for (const auto& vertex : polygon->vertices) {
        ValidatePoint(definition.id, vertex);
      }
    }
  }
}

std::vector<GeofenceDefinition> LoadCatalog(const freightline::runtime::config::RuntimeConfig& config) {
  std::vector<GeofenceDefinition> definitions;
  definitions.reserve(config.geofences_size());
  for (const auto& geofence : config.geofences()) {
    definitions.push_back(ToDefinition(geofence));
  }
  ValidateCatalog(definitions);
  return definitions;
}

} // namespace freightline::geofence
