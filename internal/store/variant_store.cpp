#include "internal/store/variant_store.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include "internal/observability/observe.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace apparatus::store {

namespace {

model::WitnessSupport ToModel(const db::model::WitnessSupportRecord& record) {
  model::WitnessSupport support;
  support.id             = record.id;
  support.witness_siglum = record.witness_siglum;
  support.witness_type   = record.witness_type;
  support.raw_type_label = record.raw_type_label;
  support.source_pack_id = record.source_pack_id;
  if (record.century_earliest && record.century_latest) {
    support.century_range = model::CenturyRange{*record.century_earliest, *record.century_latest};
  }
  return support;
}

model::Reading ToModel(const db::model::ReadingRecord& record) {
  model::Reading reading;
  reading.id             = record.id;
  reading.index          = record.reading_index;
  reading.surface_text   = record.surface_text;
  reading.canonical_key  = record.canonical_key;
  reading.is_spine       = record.is_spine;
  reading.classification = record.classification;
  reading.significance   = record.significance;
  reading.reason_code    = record.reason_code;
  reading.reason_summary = record.reason_summary;
  return reading;
}

model::VariantUnit ToModel(const db::model::VariantUnitRecord& record) {
  model::VariantUnit unit;
  unit.id             = record.id;
  unit.verse_id       = record.verse_id;
  unit.position       = record.position;
  unit.classification = record.classification;
  unit.significance   = record.significance;
  unit.reason_code    = record.reason_code;
  unit.reason_summary = record.reason_summary;
  unit.version        = record.version;
  unit.created_at_ms  = record.created_at_ms;
  return unit;
}

model::Acknowledgement ToModel(const db::model::AcknowledgementRecord& record) {
  return model::Acknowledgement{record.unit_id, record.session_id, record.reading_index, record.reason, record.acknowledged_at_ms};
}

db::model::VariantUnitRecord ToRecord(const model::VariantUnit& unit) {
  db::model::VariantUnitRecord record;
  record.id             = unit.id;
  record.verse_id       = unit.verse_id;
  record.position       = unit.position;
  record.classification = unit.classification;
  record.significance   = unit.significance;
  record.reason_code    = unit.reason_code;
  record.reason_summary = unit.reason_summary;
  record.version        = unit.version;
  record.created_at_ms  = unit.created_at_ms;
  return record;
}

void RejectEvaluativeSummary(const std::string& summary, const std::string& context) {
  if (classify::SignificanceClassifier::ContainsEvaluativeLanguage(summary)) {
    throw util::IntegrityError(context + ": reason summary contains evaluative language: \"" + summary + "\"");
  }
}

void SortByLocation(std::vector<model::VariantUnit>& units) {
  std::sort(units.begin(), units.end(),
            [](const auto& a, const auto& b) { return model::LocationLess(a.verse_id, a.position, b.verse_id, b.position); });
}

} // namespace

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + std::string(db::ToString(result.code)) + ")";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw util::ConflictError(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::IntegrityError(message);
    default:
      throw std::runtime_error(message);
  }
}

VariantStore::VariantStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("variant store requires a repository");
  }
}

std::unique_ptr<db::Transaction> VariantStore::Begin() {
  return repository_->Begin();
}

std::unique_ptr<db::Transaction> VariantStore::BeginSession() {
  return repository_->BeginSession();
}

db::model::UnitFilter VariantStore::FilterFor(const model::Scope& scope) {
  db::model::UnitFilter filter;
  if (scope.verse) {
    filter.verse_prefix = scope.ToString();
    filter.exact        = true;
  } else {
    filter.verse_prefix = scope.ToString() + ".";
  }
  return filter;
}

model::VariantUnit VariantStore::Assemble(db::Transaction& tx, const db::model::VariantUnitRecord& record, bool with_readings) {
  auto unit = ToModel(record);
  if (!with_readings) {
    return unit;
  }

  for (const auto& reading_record : repository_->ListReadings(tx, record.id)) {
    auto reading = ToModel(reading_record);
    for (const auto& support_record : repository_->ListSupports(tx, reading_record.id)) {
      reading.supports.push_back(ToModel(support_record));
    }
    unit.readings.push_back(std::move(reading));
  }
  return unit;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<model::VariantUnit> VariantStore::LoadUnit(db::Transaction& tx, const std::string& verse_id, uint32_t position) {
  auto record = repository_->GetUnit(tx, verse_id, position);
  if (!record) return std::nullopt;
  return Assemble(tx, *record, true);
}

std::optional<model::VariantUnit> VariantStore::LoadUnitById(db::Transaction& tx, uint64_t unit_id) {
  auto record = repository_->GetUnitById(tx, unit_id);
  if (!record) return std::nullopt;
  return Assemble(tx, *record, true);
}

std::vector<model::VariantUnit> VariantStore::LoadUnitsForScope(db::Transaction& tx, const model::Scope& scope, bool with_readings) {
  std::vector<model::VariantUnit> units;
  for (const auto& record : repository_->ListUnits(tx, FilterFor(scope))) {
    units.push_back(Assemble(tx, record, with_readings));
  }
  SortByLocation(units);
  return units;
}

std::optional<model::VariantUnit> VariantStore::GetUnit(const std::string& verse_id, uint32_t position) {
  return observability::ObserveOperation("VariantStore.GetUnit", verse_id, [&] {
    auto tx = repository_->BeginSession();
    return LoadUnit(*tx, verse_id, position);
  });
}

std::optional<model::VariantUnit> VariantStore::GetUnitById(uint64_t unit_id) {
  auto tx = repository_->BeginSession();
  return LoadUnitById(*tx, unit_id);
}

std::vector<model::VariantUnit> VariantStore::GetUnitsForScope(const model::Scope& scope) {
  return observability::ObserveOperation("VariantStore.GetUnitsForScope", scope.ToString(), [&] {
    auto tx = repository_->BeginSession();
    return LoadUnitsForScope(*tx, scope);
  });
}

std::size_t VariantStore::CountUnits() {
  auto tx = repository_->BeginSession();
  return repository_->ListUnits(*tx, db::model::UnitFilter{}).size();
}

// ------------------------------------------------------------------
// Mutation primitives
// ------------------------------------------------------------------

model::VariantUnit VariantStore::CreateUnit(db::Transaction& tx, const std::string& verse_id, uint32_t position, const std::string& spine_text,
                                            const std::string& spine_key, const classify::Classification& initial) {
  RejectEvaluativeSummary(initial.reason_summary, "create unit " + verse_id);

  db::model::VariantUnitRecord unit_record;
  unit_record.verse_id       = verse_id;
  unit_record.position       = position;
  unit_record.classification = initial.classification;
  unit_record.significance   = initial.significance;
  unit_record.reason_code    = initial.reason_code;
  unit_record.reason_summary = initial.reason_summary;
  unit_record.version        = 1;
  unit_record.created_at_ms  = util::NowMs();
  ThrowIfDbError(repository_->InsertUnit(tx, unit_record), "create unit " + verse_id);

  db::model::ReadingRecord spine;
  spine.unit_id       = unit_record.id;
  spine.reading_index = 0;
  spine.surface_text  = spine_text;
  spine.canonical_key = spine_key;
  spine.is_spine      = true;
  ThrowIfDbError(repository_->InsertReading(tx, spine), "create spine reading " + verse_id);

  auto unit = ToModel(unit_record);
  unit.readings.push_back(ToModel(spine));
  return unit;
}

model::Reading VariantStore::AddReading(db::Transaction& tx, uint64_t unit_id, uint32_t index, const std::string& surface_text,
                                        const std::string& canonical_key, const classify::Classification& classification) {
  if (index == 0) {
    throw util::IntegrityError("add reading: index 0 is reserved for the spine");
  }
  RejectEvaluativeSummary(classification.reason_summary, "add reading");

  db::model::ReadingRecord record;
  record.unit_id        = unit_id;
  record.reading_index  = index;
  record.surface_text   = surface_text;
  record.canonical_key  = canonical_key;
  record.is_spine       = false;
  record.classification = classification.classification;
  record.significance   = classification.significance;
  record.reason_code    = classification.reason_code;
  record.reason_summary = classification.reason_summary;
  ThrowIfDbError(repository_->InsertReading(tx, record), "add reading");
  return ToModel(record);
}

bool VariantStore::HasSupport(db::Transaction& tx, uint64_t reading_id, const std::string& witness_siglum, const std::string& source_pack_id) {
  return repository_->HasSupport(tx, reading_id, witness_siglum, source_pack_id);
}

bool VariantStore::AddSupportIfAbsent(db::Transaction& tx, uint64_t reading_id, const model::WitnessSupport& support) {
  if (support.source_pack_id.empty()) {
    throw util::ProvenanceError("add support: witness support without source pack id");
  }
  if (support.witness_siglum.empty()) {
    throw util::InputError("add support: witness siglum is empty");
  }
  if (support.century_range && support.century_range->earliest > support.century_range->latest) {
    throw util::InputError("add support: century range earliest > latest for " + support.witness_siglum);
  }

  if (repository_->HasSupport(tx, reading_id, support.witness_siglum, support.source_pack_id)) {
    return false;
  }

  db::model::WitnessSupportRecord record;
  record.reading_id     = reading_id;
  record.witness_siglum = support.witness_siglum;
  record.witness_type   = support.witness_type;
  record.raw_type_label = support.raw_type_label;
  record.source_pack_id = support.source_pack_id;
  if (support.century_range) {
    record.century_earliest = support.century_range->earliest;
    record.century_latest   = support.century_range->latest;
  }
  ThrowIfDbError(repository_->InsertSupport(tx, record), "add support " + support.witness_siglum);
  return true;
}

void VariantStore::ClaimUnit(db::Transaction& tx, uint64_t unit_id, uint64_t expected_version) {
  ThrowIfDbError(repository_->ClaimUnit(tx, unit_id, expected_version), "claim unit " + std::to_string(unit_id));
}

bool VariantStore::RaiseUnitClassification(db::Transaction& tx, model::VariantUnit& unit, const classify::Classification& candidate) {
  if (!model::IsAtLeast(candidate.significance, unit.significance) || candidate.significance == unit.significance) {
    return false;
  }
  RejectEvaluativeSummary(candidate.reason_summary, "raise unit classification " + unit.verse_id);

  auto raised           = unit;
  raised.classification = candidate.classification;
  raised.significance   = candidate.significance;
  raised.reason_code    = candidate.reason_code;
  raised.reason_summary = candidate.reason_summary;
  ThrowIfDbError(repository_->UpdateUnitClassification(tx, ToRecord(raised)), "raise unit classification " + unit.verse_id);

  unit.classification = raised.classification;
  unit.significance   = raised.significance;
  unit.reason_code    = raised.reason_code;
  unit.reason_summary = raised.reason_summary;
  return true;
}

// ------------------------------------------------------------------
// Acknowledgements
// ------------------------------------------------------------------

void VariantStore::RecordAcknowledgement(db::Transaction& tx, const model::Acknowledgement& acknowledgement) {
  db::model::AcknowledgementRecord record;
  record.unit_id            = acknowledgement.unit_id;
  record.session_id         = acknowledgement.session_id;
  record.reading_index      = acknowledgement.reading_index;
  record.reason             = acknowledgement.reason;
  record.acknowledged_at_ms = acknowledgement.acknowledged_at_ms;
  ThrowIfDbError(repository_->UpsertAcknowledgement(tx, record), "acknowledge unit " + std::to_string(acknowledgement.unit_id));
}

std::optional<model::Acknowledgement> VariantStore::FindAcknowledgement(db::Transaction& tx, uint64_t unit_id, const std::string& session_id) {
  auto record = repository_->GetAcknowledgement(tx, unit_id, session_id);
  if (!record) return std::nullopt;
  return ToModel(*record);
}

std::vector<model::Acknowledgement> VariantStore::ListAcknowledgements(db::Transaction& tx, const std::string& session_id) {
  std::vector<model::Acknowledgement> out;
  for (const auto& record : repository_->ListAcknowledgements(tx, session_id)) {
    out.push_back(ToModel(record));
  }
  return out;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

std::vector<InvariantViolation> VariantStore::CheckInvariants(const model::Scope& scope) {
  auto tx    = repository_->BeginSession();
  auto units = LoadUnitsForScope(*tx, scope);

  std::vector<InvariantViolation> violations;
  auto report = [&](const model::VariantUnit& unit, std::string message) {
    violations.push_back(InvariantViolation{unit.id, unit.verse_id, unit.position, std::move(message)});
  };

  std::set<std::pair<std::string, uint32_t>> locations;
  for (const auto& unit : units) {
    if (!locations.insert({unit.verse_id, unit.position}).second) {
      report(unit, "duplicate unit for location");
    }
    if (unit.readings.empty() || !unit.readings.front().is_spine || unit.readings.front().index != 0) {
      report(unit, "reading 0 is not the spine");
    }

    std::set<std::string> keys;
    for (std::size_t i = 0; i < unit.readings.size(); ++i) {
      const auto& reading = unit.readings[i];
      if (reading.index != i) {
        report(unit, "reading indexes are not contiguous at " + std::to_string(i));
      }
      if (i > 0 && reading.is_spine) {
        report(unit, "more than one spine reading");
      }
      if (!keys.insert(reading.canonical_key).second) {
        report(unit, "duplicate canonical key \"" + reading.canonical_key + "\"");
      }
      if (classify::SignificanceClassifier::ContainsEvaluativeLanguage(reading.reason_summary)) {
        report(unit, "evaluative reason summary on reading " + std::to_string(reading.index));
      }

      std::set<std::pair<std::string, std::string>> supports;
      for (const auto& support : reading.supports) {
        if (support.source_pack_id.empty()) {
          report(unit, "support " + support.witness_siglum + " has no source pack");
        }
        if (!supports.insert({support.witness_siglum, support.source_pack_id}).second) {
          report(unit, "duplicate support " + support.witness_siglum + " from " + support.source_pack_id);
        }
      }
    }

    if (classify::SignificanceClassifier::ContainsEvaluativeLanguage(unit.reason_summary)) {
      report(unit, "evaluative unit reason summary");
    }
  }
  return violations;
}

std::size_t VariantStore::ResetScope(const model::Scope& scope) {
  return observability::ObserveOperation("VariantStore.ResetScope", scope.ToString(), [&] {
    auto tx      = repository_->Begin();
    auto records = repository_->ListUnits(*tx, FilterFor(scope));
    for (const auto& record : records) {
      ThrowIfDbError(repository_->DeleteUnit(*tx, record.id), "reset unit " + record.verse_id);
    }
    tx->Commit();

    APPARATUS_LOG_WARN("scope reset", {observability::StringField("scope", scope.ToString()),
                                       observability::IntField("units_deleted", static_cast<std::int64_t>(records.size()))});
    return records.size();
  });
}

} // namespace apparatus::store
