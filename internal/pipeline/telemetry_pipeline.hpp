#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/consistency/consistency_engine.hpp"
#include "internal/geofence/geofence.hpp"
#include "internal/geofence/geofence_engine.hpp"
#include "internal/milestone/milestone_builder.hpp"
#include "internal/milestone/milestone_context.hpp"
#include "internal/registry/token_registry.hpp"
#include "internal/telemetry/normalizer.hpp"
#include "internal/telemetry/raw_telemetry.hpp"
#include "internal/token/token.hpp"
#include "internal/token/token_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/keyed_state.hpp"

namespace freightline::pipeline {

enum class PersistStatus : std::uint8_t {
  kSkipped = 0, // persistence disabled or token not created
  kPersisted,
  kFailed,
};

// Error captured at a pipeline boundary instead of propagating.
struct Failure {
  util::ErrorKind kind;
  std::string     message;
  bool            retryable = false;
};

struct TokenOutcome {
  token::TokenRequest          request;
  std::optional<token::Token>  token;
  std::optional<Failure>       error; // creation failure
  PersistStatus                persist_status = PersistStatus::kSkipped;
  std::optional<Failure>       persist_error;
  bool                         retried = false; // stored on a later attempt

  bool ok() const {
    return token.has_value() && persist_status != PersistStatus::kFailed;
  }
};

struct SampleResult {
  std::optional<telemetry::NormalizedTelemetryRecord> record;
  std::vector<consistency::ConsistencyFlag>           flags;
  std::vector<geofence::GeofenceEvent>                events;
  std::vector<TokenOutcome>                           tokens;
  std::optional<Failure>                              error; // sample rejected

  bool ok() const {
    return !error.has_value();
  }
};

struct PipelineOptions {
  bool persist_tokens      = false;
  bool allow_reaffirmation = false;

  // 0 disables the automatic sweep; EvictIdle() still works.
  std::chrono::seconds idle_retention{0};
  std::uint32_t        sweep_every_samples = 1024;
};

// Keys dropped by one eviction pass, per store.
struct EvictionStats {
  std::size_t devices          = 0;
  std::size_t shipments        = 0;
  std::size_t consistency_keys = 0;
  std::size_t geofence_devices = 0;
};

/*
  TelemetryPipeline

  Runs one raw sample through normalize -> consistency -> geofence ->
  milestones -> token creation -> (optional) persistence.

  - Never throws for bad input: every failure becomes a Failure value in
    the SampleResult or TokenOutcome.
  - Per device: normalization and device state are serialized.
  - Per shipment: milestone derivation, token creation and persistence
    are serialized.
  - With persist_tokens, a token is registered in the index (and so can
    be referenced by later tokens) only after it is stored. A token whose
    store failed with a retryable error is kept per shipment and stored
    again, same id, before that shipment's next tokens.
  - A milestone type already fired (or awaiting storage) for a shipment
    is not minted again unless allow_reaffirmation is set.
  - With idle_retention set, every sweep_every_samples samples the state
    of devices and shipments not heard from within idle_retention of the
    newest event time is dropped. Shipments with unstored tokens stay.
*/
class TelemetryPipeline {
 public:
  TelemetryPipeline(std::shared_ptr<consistency::ConsistencyEngine> consistency, std::shared_ptr<geofence::GeofenceEngine> geofences,
                    std::vector<geofence::GeofenceDefinition> catalog, milestone::MilestoneBuilder builder,
                    std::shared_ptr<token::TokenFactory> factory, std::shared_ptr<registry::TokenRegistry> registry,
                    PipelineOptions options);

  SampleResult Process(const telemetry::RawTelemetry& raw);

  // One result per input, same order. Never fails as a whole.
  std::vector<SampleResult> ProcessBatch(const std::vector<telemetry::RawTelemetry>& batch);

  // Current milestone context for a shipment, if any sample was seen.
  std::optional<milestone::MilestoneContext> Context(const std::string& shipment_id) const;

  // Drops per-shipment milestone state.
  bool ForgetShipment(const std::string& shipment_id);

  // Drops device state, consistency history and geofence membership.
  void ForgetDevice(const std::string& device_id, const std::string& shipment_id);

  // Stores the shipment's unstored tokens now. Outcomes in creation order;
  // stops at the first retryable failure.
  std::vector<TokenOutcome> RetryUnpersisted(const std::string& shipment_id);

  std::size_t UnpersistedCount(const std::string& shipment_id) const;

  // Drops state whose latest event time is before cutoff.
  EvictionStats EvictIdle(util::TimePoint cutoff);

  // Newest event time accepted so far, if any.
  std::optional<util::TimePoint> NewestEventTime() const;

  const std::vector<geofence::GeofenceDefinition>& Catalog() const {
    return catalog_;
  }

 private:
  telemetry::NormalizedTelemetryRecord Normalize(const telemetry::RawTelemetry& raw);
  struct DeviceSlot {
    telemetry::DeviceState state;
    util::TimePoint        last_event_time;
  };

  struct ShipmentSlot {
    milestone::MilestoneContext context;
    std::vector<TokenOutcome>   unpersisted; // stored failed retryably; not indexed
    util::TimePoint             last_event_time;

    bool Pending(milestone::MilestoneType type) const;
  };

  std::vector<TokenOutcome> DeriveTokens(const telemetry::NormalizedTelemetryRecord& record,
                                         const std::vector<geofence::GeofenceEvent>& events);
  std::vector<TokenOutcome> FlushUnpersisted(ShipmentSlot& slot);

  // Stores (when enabled) then indexes the token. False when the store failed.
  bool Commit(ShipmentSlot& slot, TokenOutcome& outcome);
  void ObserveEventTime(util::TimePoint event_time);
  void MaybeSweep();

  std::shared_ptr<consistency::ConsistencyEngine> consistency_;
  std::shared_ptr<geofence::GeofenceEngine>       geofences_;
  std::vector<geofence::GeofenceDefinition>       catalog_;
  milestone::MilestoneBuilder                     builder_;
  std::shared_ptr<token::TokenFactory>            factory_;
  std::shared_ptr<registry::TokenRegistry>        registry_;
  PipelineOptions                                 options_;

  util::KeyedStateStore<DeviceSlot>   devices_;
  util::KeyedStateStore<ShipmentSlot> shipments_;

  std::atomic<std::int64_t>  newest_event_ms_{std::numeric_limits<std::int64_t>::min()};
  std::atomic<std::uint64_t> samples_since_sweep_{0};
};

} // namespace freightline::pipeline
