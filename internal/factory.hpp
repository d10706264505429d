#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/consistency/consistency_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/geofence/geofence.hpp"
#include "internal/geofence/geofence_engine.hpp"
#include "internal/pipeline/telemetry_pipeline.hpp"
#include "internal/registry/token_registry.hpp"
#include "internal/token/token_factory.hpp"
#include "internal/token/token_index.hpp"

namespace freightline::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects of one pipeline instance.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  // declared before token_factory, which holds a reference to it
  std::shared_ptr<token::TokenIndex>       index;
  std::shared_ptr<token::TokenFactory>     token_factory;
  std::shared_ptr<registry::TokenRegistry> registry;

  std::shared_ptr<consistency::ConsistencyEngine> consistency;
  std::shared_ptr<geofence::GeofenceEngine>       geofences;
  std::vector<geofence::GeofenceDefinition>       catalog;

  std::shared_ptr<pipeline::TelemetryPipeline> pipeline;
};

/*
  BuildRuntime

  Constructs the whole pipeline from runtime config: repository (schema
  bootstrapped), token index hydrated from storage, engines, catalogue.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(const freightline::runtime::config::RuntimeConfig& config);

// Repository only, schema bootstrapped.
std::shared_ptr<db::Repository> BuildRepository(const freightline::runtime::config::RuntimeConfig& config);

} // namespace freightline::factory
