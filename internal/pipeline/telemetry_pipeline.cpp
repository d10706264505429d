#include "telemetry_pipeline.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/geofence/catalog.hpp"
#include "internal/observability/logging.hpp"

namespace freightline::pipeline {

using telemetry::NormalizedTelemetryRecord;
using telemetry::RawTelemetry;

namespace {

Failure ToFailure(const util::Error& e) {
  return Failure{e.Kind(), e.what(), e.Retryable()};
}

std::optional<milestone::MilestoneType> MilestoneOf(const TokenOutcome& outcome) {
  return milestone::MilestoneTypeOf(outcome.request.metadata);
}

} // namespace

bool TelemetryPipeline::ShipmentSlot::Pending(milestone::MilestoneType type) const {
  return std::any_of(unpersisted.begin(), unpersisted.end(), [type](const TokenOutcome& o) { return MilestoneOf(o) == type; });
}

TelemetryPipeline::TelemetryPipeline(std::shared_ptr<consistency::ConsistencyEngine> consistency,
                                     std::shared_ptr<geofence::GeofenceEngine> geofences, std::vector<geofence::GeofenceDefinition> catalog,
                                     milestone::MilestoneBuilder builder, std::shared_ptr<token::TokenFactory> factory,
                                     std::shared_ptr<registry::TokenRegistry> registry, PipelineOptions options)
    : consistency_(std::move(consistency)),
      geofences_(std::move(geofences)),
      catalog_(std::move(catalog)),
      builder_(builder),
      factory_(std::move(factory)),
      registry_(std::move(registry)),
      options_(options) {
  if (!consistency_ || !geofences_ || !factory_) {
    throw std::invalid_argument("TelemetryPipeline: consistency, geofence engine and token factory are required");
  }
  if (options_.persist_tokens && !registry_) {
    throw std::invalid_argument("TelemetryPipeline: persist_tokens requires a token registry");
  }
  if (options_.idle_retention.count() < 0) {
    throw std::invalid_argument("TelemetryPipeline: idle_retention must not be negative");
  }
  if (options_.sweep_every_samples == 0) {
    options_.sweep_every_samples = 1;
  }
  geofence::ValidateCatalog(catalog_);
}

NormalizedTelemetryRecord TelemetryPipeline::Normalize(const RawTelemetry& raw) {
  // device_id is validated by Normalize itself; an absent id shares the "" slot
  const std::string device_key = raw.device_id.value_or("");
  return devices_.WithState(device_key, [&](std::optional<DeviceSlot>& slot) {
    auto record = telemetry::Normalize(raw, slot ? slot->state : telemetry::DeviceState{});
    if (!slot) {
      slot.emplace();
      slot->last_event_time = record.event_time;
    }
    slot->state           = telemetry::NextDeviceState(record);
    slot->last_event_time = std::max(slot->last_event_time, record.event_time);
    return record;
  });
}

SampleResult TelemetryPipeline::Process(const RawTelemetry& raw) {
  SampleResult result;

  try {
    result.record = Normalize(raw);
  } catch (const util::MalformedTelemetryError& e) {
    result.error = ToFailure(e);
    FREIGHTLINE_LOG_WARN("telemetry rejected", {observability::StringField("device_id", raw.device_id.value_or("")),
                                                observability::StringField("reason", e.what())});
    return result;
  }

  const auto& record = *result.record;
  ObserveEventTime(record.event_time);

  result.flags = consistency_->Evaluate(record);
  for (const auto& flag : result.flags) {
    FREIGHTLINE_LOG_INFO("consistency flag", {observability::StringField("code", consistency::ToString(flag.code)),
                                              observability::StringField("severity", consistency::ToString(flag.severity)),
                                              observability::StringField("device_id", record.device_id),
                                              observability::StringField("shipment_id", record.shipment_id),
                                              observability::DoubleField("observed", flag.observed),
                                              observability::DoubleField("threshold", flag.threshold),
                                              observability::StringField("detail", flag.detail)});
  }

  result.events = geofences_->Evaluate(record, catalog_);
  for (const auto& event : result.events) {
    FREIGHTLINE_LOG_DEBUG("geofence event", {observability::StringField("geofence_id", event.geofence_id),
                                             observability::StringField("event", geofence::ToString(event.event_type)),
                                             observability::StringField("device_id", record.device_id)});
  }

  result.tokens = DeriveTokens(record, result.events);

  MaybeSweep();
  return result;
}

std::vector<SampleResult> TelemetryPipeline::ProcessBatch(const std::vector<RawTelemetry>& batch) {
  std::vector<SampleResult> results;
  results.reserve(batch.size());
  for (const auto& raw : batch) {
    results.push_back(Process(raw));
  }
  return results;
}

std::vector<TokenOutcome> TelemetryPipeline::DeriveTokens(const NormalizedTelemetryRecord& record,
                                                          const std::vector<geofence::GeofenceEvent>& events) {
  return shipments_.WithState(record.shipment_id, [&](std::optional<ShipmentSlot>& slot) {
    if (!slot) {
      slot.emplace();
      slot->context.st01_id             = record.shipment_id;
      slot->context.allow_reaffirmation = options_.allow_reaffirmation;
      slot->last_event_time             = record.event_time;
    }
    slot->last_event_time = std::max(slot->last_event_time, record.event_time);

    // earlier tokens are stored before anything newer for the shipment
    std::vector<TokenOutcome> outcomes = FlushUnpersisted(*slot);

    auto& context = slot->context;
    for (auto& request : builder_.Build(context, record, events)) {
      const auto type = milestone::MilestoneTypeOf(request.metadata);
      if (type && (context.HasFired(*type) || slot->Pending(*type)) && !context.allow_reaffirmation) {
        FREIGHTLINE_LOG_DEBUG("milestone already recorded", {observability::StringField("shipment_id", record.shipment_id),
                                                             observability::StringField("milestone_type", milestone::ToString(*type))});
        continue;
      }

      TokenOutcome outcome;
      outcome.request = std::move(request);
      try {
        outcome.token = factory_->Prepare(outcome.request);
      } catch (const util::Error& e) {
        outcome.error = ToFailure(e);
        FREIGHTLINE_LOG_WARN("milestone token rejected", {observability::StringField("shipment_id", record.shipment_id),
                                                          observability::StringField("kind", util::ToString(e.Kind())),
                                                          observability::StringField("reason", e.what())});
        outcomes.push_back(std::move(outcome));
        continue;
      }

      if (Commit(*slot, outcome)) {
        FREIGHTLINE_LOG_INFO("milestone token created",
                             {observability::StringField("token_id", outcome.token->id()),
                              observability::StringField("shipment_id", record.shipment_id),
                              observability::StringField("milestone_type", type ? milestone::ToString(*type) : "UNKNOWN")});
      }
      outcomes.push_back(std::move(outcome));
    }
    return outcomes;
  });
}

bool TelemetryPipeline::Commit(ShipmentSlot& slot, TokenOutcome& outcome) {
  if (options_.persist_tokens) {
    try {
      registry_->Persist(*outcome.token);
      outcome.persist_status = PersistStatus::kPersisted;
      outcome.persist_error.reset();
    } catch (const util::Error& e) {
      outcome.persist_status = PersistStatus::kFailed;
      outcome.persist_error  = ToFailure(e);
      FREIGHTLINE_LOG_ERROR("token persistence failed", {observability::StringField("token_id", outcome.token->id()),
                                                         observability::StringField("kind", util::ToString(e.Kind())),
                                                         observability::BoolField("retryable", e.Retryable()),
                                                         observability::StringField("reason", e.what())});
      if (e.Retryable() && !outcome.retried) {
        slot.unpersisted.push_back(outcome);
      }
      return false;
    }
  }

  try {
    factory_->Register(*outcome.token);
  } catch (const util::TokenValidationError& e) {
    outcome.error = ToFailure(e);
    FREIGHTLINE_LOG_ERROR("token index registration failed", {observability::StringField("token_id", outcome.token->id()),
                                                              observability::StringField("reason", e.what())});
    return false;
  }

  if (const auto type = MilestoneOf(outcome)) {
    slot.context.MarkFired(*type);
  }
  return true;
}

std::vector<TokenOutcome> TelemetryPipeline::FlushUnpersisted(ShipmentSlot& slot) {
  std::vector<TokenOutcome> outcomes;
  while (!slot.unpersisted.empty()) {
    TokenOutcome outcome = slot.unpersisted.front();
    outcome.retried      = true;

    const bool stored = Commit(slot, outcome);
    if (!stored && outcome.persist_error && outcome.persist_error->retryable) {
      outcomes.push_back(std::move(outcome));
      break;
    }
    // stored, or failed for good
    slot.unpersisted.erase(slot.unpersisted.begin());
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

std::vector<TokenOutcome> TelemetryPipeline::RetryUnpersisted(const std::string& shipment_id) {
  return shipments_.WithState(shipment_id, [&](std::optional<ShipmentSlot>& slot) {
    if (!slot) return std::vector<TokenOutcome>{};
    return FlushUnpersisted(*slot);
  });
}

std::size_t TelemetryPipeline::UnpersistedCount(const std::string& shipment_id) const {
  auto slot = shipments_.Snapshot(shipment_id);
  return slot ? slot->unpersisted.size() : 0;
}

std::optional<milestone::MilestoneContext> TelemetryPipeline::Context(const std::string& shipment_id) const {
  auto slot = shipments_.Snapshot(shipment_id);
  if (!slot) return std::nullopt;
  return slot->context;
}

bool TelemetryPipeline::ForgetShipment(const std::string& shipment_id) {
  return shipments_.Erase(shipment_id);
}

void TelemetryPipeline::ForgetDevice(const std::string& device_id, const std::string& shipment_id) {
  devices_.Erase(device_id);
  consistency_->Forget(device_id, shipment_id);
  geofences_->Forget(device_id);
}

// ------------------------------------------------------------
// Retention
// ------------------------------------------------------------

void TelemetryPipeline::ObserveEventTime(util::TimePoint event_time) {
  const auto ms     = util::ToUnixMillis(event_time);
  auto       newest = newest_event_ms_.load();
  while (ms > newest && !newest_event_ms_.compare_exchange_weak(newest, ms)) {
  }
}

std::optional<util::TimePoint> TelemetryPipeline::NewestEventTime() const {
  const auto ms = newest_event_ms_.load();
  if (ms == std::numeric_limits<std::int64_t>::min()) return std::nullopt;
  return util::FromUnixMillis(ms);
}

void TelemetryPipeline::MaybeSweep() {
  if (options_.idle_retention.count() == 0) return;
  if (++samples_since_sweep_ < options_.sweep_every_samples) return;
  samples_since_sweep_ = 0;

  const auto newest = NewestEventTime();
  if (!newest) return;

  const auto stats = EvictIdle(*newest - options_.idle_retention);
  if (stats.devices || stats.shipments || stats.consistency_keys || stats.geofence_devices) {
    FREIGHTLINE_LOG_INFO("idle state evicted", {observability::IntField("devices", static_cast<std::int64_t>(stats.devices)),
                                                observability::IntField("shipments", static_cast<std::int64_t>(stats.shipments)),
                                                observability::IntField("consistency_keys", static_cast<std::int64_t>(stats.consistency_keys)),
                                                observability::IntField("geofence_devices", static_cast<std::int64_t>(stats.geofence_devices))});
  }
}

EvictionStats TelemetryPipeline::EvictIdle(util::TimePoint cutoff) {
  EvictionStats stats;
  stats.devices   = devices_.EraseIf([cutoff](const std::string&, const DeviceSlot& d) { return d.last_event_time < cutoff; });
  stats.shipments = shipments_.EraseIf(
      [cutoff](const std::string&, const ShipmentSlot& s) { return s.last_event_time < cutoff && s.unpersisted.empty(); });
  stats.consistency_keys = consistency_->EvictOlderThan(cutoff);
  stats.geofence_devices = geofences_->EvictOlderThan(cutoff);
  return stats;
}

} // namespace freightline::pipeline
