#include "internal/gate/gate_resolver.hpp"

#include <stdexcept>

#include "internal/observability/observe.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace apparatus::gate {

namespace {

void RequireSession(const std::string& session_id, std::string_view operation) {
  if (session_id.empty()) {
    throw util::InputError(std::string(operation) + ": session id is required");
  }
}

std::string Describe(const model::UnitRef& unit) {
  if (unit.unit_id != 0) return "unit " + std::to_string(unit.unit_id);
  return unit.verse_id + "@" + std::to_string(unit.position);
}

} // namespace

GateResolver::GateResolver(std::shared_ptr<store::VariantStore> store, Options options) : store_(std::move(store)), options_(options) {
  if (!store_) {
    throw std::invalid_argument("gate resolver requires a variant store");
  }
}

std::optional<model::VariantUnit> GateResolver::Resolve(db::Transaction& tx, const model::UnitRef& unit) {
  if (unit.unit_id != 0) {
    auto found = store_->LoadUnitById(tx, unit.unit_id);
    if (found && !unit.verse_id.empty() && (found->verse_id != unit.verse_id || found->position != unit.position)) {
      throw util::InputError("unit reference mismatch: " + Describe(unit) + " is at " + found->verse_id + "@" +
                             std::to_string(found->position) + ", not " + unit.verse_id + "@" + std::to_string(unit.position));
    }
    return found;
  }
  if (unit.verse_id.empty()) {
    throw util::InputError("unit reference needs a unit id or a verse id");
  }
  return store_->LoadUnit(tx, unit.verse_id, unit.position);
}

std::vector<model::UnitRef> GateResolver::Pending(std::string_view scope_text, const std::string& session_id) {
  return observability::ObserveOperation("GateResolver.Pending", scope_text, [&] {
    RequireSession(session_id, "pending");
    const auto scope = model::Scope::Parse(scope_text);

    auto tx    = store_->BeginSession();
    auto units = store_->LoadUnitsForScope(*tx, scope, false);

    std::vector<model::UnitRef> pending;
    for (const auto& unit : units) {
      if (!model::IsAtLeast(unit.significance, options_.minimum_significance)) continue;
      if (store_->FindAcknowledgement(*tx, unit.id, session_id)) continue;
      pending.push_back(model::UnitRef{unit.id, unit.verse_id, unit.position});
    }
    return pending;
  });
}

model::Acknowledgement GateResolver::Acknowledge(const model::UnitRef& unit_ref, uint32_t reading_index, const std::string& session_id,
                                                 const std::string& reason) {
  return observability::ObserveOperation("GateResolver.Acknowledge", Describe(unit_ref), [&] {
    RequireSession(session_id, "acknowledge");

    auto tx   = store_->BeginSession();
    auto unit = Resolve(*tx, unit_ref);
    if (!unit) {
      throw util::InputError("acknowledge: no variant unit for " + Describe(unit_ref));
    }
    if (reading_index >= unit->readings.size()) {
      throw util::InputError("acknowledge: reading index " + std::to_string(reading_index) + " out of range for " + unit->verse_id + " (" +
                             std::to_string(unit->readings.size()) + " readings)");
    }

    model::Acknowledgement acknowledgement{unit->id, session_id, reading_index, reason, util::NowMs()};
    store_->RecordAcknowledgement(*tx, acknowledgement);
    tx->Commit();

    const auto waited_ms = acknowledgement.acknowledged_at_ms > unit->created_at_ms ? acknowledgement.acknowledged_at_ms - unit->created_at_ms : 0;
    observability::Metrics::Instance().RecordAcknowledgementLatencyMs(model::ToString(unit->significance), static_cast<double>(waited_ms));
    APPARATUS_LOG_INFO("unit acknowledged", {observability::StringField("verse_id", unit->verse_id),
                                             observability::IntField("position", unit->position),
                                             observability::StringField("session_id", session_id),
                                             observability::IntField("reading_index", reading_index)});
    return acknowledgement;
  });
}

std::optional<model::Acknowledgement> GateResolver::Status(const model::UnitRef& unit_ref, const std::string& session_id) {
  RequireSession(session_id, "status");

  auto tx   = store_->BeginSession();
  auto unit = Resolve(*tx, unit_ref);
  if (!unit) return std::nullopt;
  return store_->FindAcknowledgement(*tx, unit->id, session_id);
}

std::vector<model::Acknowledgement> GateResolver::SessionAcknowledgements(const std::string& session_id) {
  RequireSession(session_id, "session acknowledgements");

  auto tx = store_->BeginSession();
  return store_->ListAcknowledgements(*tx, session_id);
}

} // namespace apparatus::gate
