#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace apparatus::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

// Snapshots never wait on each other; the mutex is held only while copying.
std::unique_ptr<db::Transaction> MemoryRepository::BeginSession() {
  return Begin();
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Variant units
// ------------------------------------------------------------------

Result MemoryRepository::InsertUnit(Transaction& t, model::VariantUnitRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (s.unit_index.contains({r.verse_id, r.position})) {
    return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: variant_units.verse_id, variant_units.position");
  }

  r.id = next_unit_id_++;
  tx.CreatedUnit(r.id);
  s.units[r.id]                         = UnitState{.unit = r};
  s.unit_index[{r.verse_id, r.position}] = r.id;
  return Result::Ok();
}

std::optional<model::VariantUnitRecord> MemoryRepository::GetUnit(Transaction& t, const std::string& verse_id, uint32_t position) {
  const auto& s  = TX(t).View();
  auto        it = s.unit_index.find({verse_id, position});
  if (it == s.unit_index.end()) return std::nullopt;
  return s.units.at(it->second).unit;
}

std::optional<model::VariantUnitRecord> MemoryRepository::GetUnitById(Transaction& t, uint64_t unit_id) {
  const auto& s  = TX(t).View();
  auto        it = s.units.find(unit_id);
  if (it == s.units.end()) return std::nullopt;
  return it->second.unit;
}

std::vector<model::VariantUnitRecord> MemoryRepository::ListUnits(Transaction& t, const model::UnitFilter& filter) {
  std::vector<model::VariantUnitRecord> out;
  for (const auto& [_, state] : TX(t).View().units) {
    if (filter.Matches(state.unit.verse_id)) out.push_back(state.unit);
  }
  return out;
}

Result MemoryRepository::ClaimUnit(Transaction& t, uint64_t unit_id, uint64_t expected_version) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.units.find(unit_id);
  if (it == s.units.end()) return Result::Err(ErrorCode::NotFound, "variant unit not found");
  if (it->second.unit.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "variant unit version is " + std::to_string(it->second.unit.version) + ", expected " +
                                                 std::to_string(expected_version));
  }

  tx.TouchUnit(unit_id);
  it->second.unit.version++;
  tx.ClaimedUnit(unit_id);
  return Result::Ok();
}

Result MemoryRepository::UpdateUnitClassification(Transaction& t, const model::VariantUnitRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.units.find(r.id);
  if (it == s.units.end()) return Result::Err(ErrorCode::NotFound, "variant unit not found");

  tx.TouchUnit(r.id);
  auto& unit          = it->second.unit;
  unit.classification = r.classification;
  unit.significance   = r.significance;
  unit.reason_code    = r.reason_code;
  unit.reason_summary = r.reason_summary;
  return Result::Ok();
}

Result MemoryRepository::DeleteUnit(Transaction& t, uint64_t unit_id) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.units.find(unit_id);
  if (it == s.units.end()) return Result::Err(ErrorCode::NotFound, "variant unit not found");

  tx.DeletedUnit(unit_id);
  for (const auto& reading : it->second.readings) {
    s.reading_to_unit.erase(reading.id);
  }
  s.unit_index.erase({it->second.unit.verse_id, it->second.unit.position});
  std::erase_if(s.acknowledgements, [unit_id](const auto& entry) { return entry.first.first == unit_id; });
  s.units.erase(it);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Readings
// ------------------------------------------------------------------

Result MemoryRepository::InsertReading(Transaction& t, model::ReadingRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.units.find(r.unit_id);
  if (it == s.units.end()) return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: readings.unit_id");

  for (const auto& existing : it->second.readings) {
    if (existing.reading_index == r.reading_index) {
      return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: readings.unit_id, readings.reading_index");
    }
    if (existing.canonical_key == r.canonical_key) {
      return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: readings.unit_id, readings.canonical_key");
    }
  }

  r.id = next_reading_id_++;
  tx.TouchUnit(r.unit_id);
  it->second.readings.push_back(r);
  s.reading_to_unit[r.id] = r.unit_id;
  return Result::Ok();
}

std::vector<model::ReadingRecord> MemoryRepository::ListReadings(Transaction& t, uint64_t unit_id) {
  const auto& s  = TX(t).View();
  auto        it = s.units.find(unit_id);
  if (it == s.units.end()) return {};

  auto out = it->second.readings;
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.reading_index < b.reading_index; });
  return out;
}

// ------------------------------------------------------------------
// Witness supports
// ------------------------------------------------------------------

bool MemoryRepository::HasSupport(Transaction& t, uint64_t reading_id, const std::string& witness_siglum, const std::string& source_pack_id) {
  const auto& s     = TX(t).View();
  auto        owner = s.reading_to_unit.find(reading_id);
  if (owner == s.reading_to_unit.end()) return false;

  const auto& supports = s.units.at(owner->second).supports;
  return std::any_of(supports.begin(), supports.end(), [&](const auto& e) {
    return e.reading_id == reading_id && e.witness_siglum == witness_siglum && e.source_pack_id == source_pack_id;
  });
}

Result MemoryRepository::InsertSupport(Transaction& t, model::WitnessSupportRecord& r) {
  auto& tx    = TX(t);
  auto& s     = tx.Mutable();
  auto  owner = s.reading_to_unit.find(r.reading_id);
  if (owner == s.reading_to_unit.end()) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: witness_supports.reading_id");
  }
  if (r.source_pack_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "CHECK constraint failed: witness_supports.source_pack_id");
  }
  if (r.century_earliest && r.century_latest && *r.century_earliest > *r.century_latest) {
    return Result::Err(ErrorCode::ConstraintViolation, "CHECK constraint failed: witness_supports century range");
  }

  auto& supports = s.units.at(owner->second).supports;
  for (const auto& e : supports) {
    if (e.reading_id == r.reading_id && e.witness_siglum == r.witness_siglum && e.source_pack_id == r.source_pack_id) {
      return Result::Err(ErrorCode::ConstraintViolation,
                         "UNIQUE constraint failed: witness_supports.reading_id, witness_supports.witness_siglum, witness_supports.source_pack_id");
    }
  }

  r.id = next_support_id_++;
  tx.TouchUnit(owner->second);
  supports.push_back(r);
  return Result::Ok();
}

std::vector<model::WitnessSupportRecord> MemoryRepository::ListSupports(Transaction& t, uint64_t reading_id) {
  const auto& s     = TX(t).View();
  auto        owner = s.reading_to_unit.find(reading_id);
  if (owner == s.reading_to_unit.end()) return {};

  std::vector<model::WitnessSupportRecord> out;
  for (const auto& e : s.units.at(owner->second).supports) {
    if (e.reading_id == reading_id) out.push_back(e);
  }
  return out;
}

// ------------------------------------------------------------------
// Acknowledgements
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAcknowledgement(Transaction& t, const model::AcknowledgementRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (!s.units.contains(r.unit_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: acknowledgements.unit_id");
  }

  AckKey key{r.unit_id, r.session_id};
  s.acknowledgements[key] = r;
  tx.TouchAcknowledgement(key);
  return Result::Ok();
}

std::optional<model::AcknowledgementRecord> MemoryRepository::GetAcknowledgement(Transaction& t, uint64_t unit_id, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.acknowledgements.find({unit_id, session_id});
  if (it == s.acknowledgements.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AcknowledgementRecord> MemoryRepository::ListAcknowledgements(Transaction& t, const std::string& session_id) {
  std::vector<model::AcknowledgementRecord> out;
  for (const auto& [key, record] : TX(t).View().acknowledgements) {
    if (key.second == session_id) out.push_back(record);
  }
  return out;
}

} // namespace apparatus::db::memory
