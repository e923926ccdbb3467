#include "pg_repository.hpp"

namespace apparatus::db::postgres {

namespace am = apparatus::model;

static model::VariantUnitRecord ReadUnit(const pqxx::row& row) {
  model::VariantUnitRecord r;
  r.id             = row[0].as<uint64_t>();
  r.verse_id       = row[1].c_str();
  r.position       = row[2].as<uint32_t>();
  r.classification = am::ParseClassification(row[3].c_str()).value_or(am::Classification::kSubstitution);
  r.significance   = am::ParseSignificance(row[4].c_str()).value_or(am::Significance::kMinor);
  r.reason_code    = row[5].c_str();
  r.reason_summary = row[6].c_str();
  r.version        = row[7].as<uint64_t>();
  r.created_at_ms  = row[8].as<uint64_t>();
  return r;
}

static model::ReadingRecord ReadReading(const pqxx::row& row) {
  model::ReadingRecord r;
  r.id            = row[0].as<uint64_t>();
  r.unit_id       = row[1].as<uint64_t>();
  r.reading_index = row[2].as<uint32_t>();
  r.surface_text  = row[3].c_str();
  r.canonical_key = row[4].c_str();
  r.is_spine      = row[5].as<bool>();
  if (!row[6].is_null()) r.classification = am::ParseClassification(row[6].c_str());
  if (!row[7].is_null()) r.significance = am::ParseSignificance(row[7].c_str());
  r.reason_code    = row[8].c_str();
  r.reason_summary = row[9].c_str();
  return r;
}

static model::WitnessSupportRecord ReadSupport(const pqxx::row& row) {
  model::WitnessSupportRecord r;
  r.id             = row[0].as<uint64_t>();
  r.reading_id     = row[1].as<uint64_t>();
  r.witness_siglum = row[2].c_str();
  r.witness_type   = am::ParseWitnessType(row[3].c_str()).value_or(am::WitnessType::kOther);
  r.raw_type_label = row[4].c_str();
  r.source_pack_id = row[5].c_str();
  if (!row[6].is_null()) r.century_earliest = row[6].as<int>();
  if (!row[7].is_null()) r.century_latest = row[7].as<int>();
  return r;
}

static model::AcknowledgementRecord ReadAcknowledgement(const pqxx::row& row) {
  model::AcknowledgementRecord r;
  r.unit_id            = row[0].as<uint64_t>();
  r.session_id         = row[1].c_str();
  r.reading_index      = row[2].as<uint32_t>();
  r.reason             = row[3].c_str();
  r.acknowledged_at_ms = row[4].as<uint64_t>();
  return r;
}

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

// MVCC: the acknowledgement foreign key takes KEY SHARE on the unit row,
// which does not conflict with the claim's NO KEY UPDATE.
std::unique_ptr<db::Transaction> PgRepository::BeginSession() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  // callers check before inserting, so a duplicate key means a concurrent writer
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Variant units
// ------------------------------------------------------------------

Result PgRepository::InsertUnit(Transaction& t, model::VariantUnitRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_unit", r.verse_id, r.position, std::string(am::ToString(r.classification)),
                                          std::string(am::ToString(r.significance)), r.reason_code, r.reason_summary, r.version,
                                          r.created_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::VariantUnitRecord> PgRepository::GetUnit(Transaction& t, const std::string& verse_id, uint32_t position) {
  auto res = TX(t).Work().exec_prepared("get_unit", verse_id, position);
  if (res.empty()) return std::nullopt;
  return ReadUnit(res[0]);
}

std::optional<model::VariantUnitRecord> PgRepository::GetUnitById(Transaction& t, uint64_t unit_id) {
  auto res = TX(t).Work().exec_prepared("get_unit_by_id", unit_id);
  if (res.empty()) return std::nullopt;
  return ReadUnit(res[0]);
}

std::vector<model::VariantUnitRecord> PgRepository::ListUnits(Transaction& t, const model::UnitFilter& filter) {
  const char* sql = filter.exact
                        ? "SELECT id,verse_id,position,classification,significance,reason_code,reason_summary,version,created_at_ms "
                          "FROM variant_units WHERE verse_id=$1;"
                        : "SELECT id,verse_id,position,classification,significance,reason_code,reason_summary,version,created_at_ms "
                          "FROM variant_units WHERE left(verse_id, length($1)) = $1;";
  auto res = TX(t).Work().exec_params(sql, filter.verse_prefix);

  std::vector<model::VariantUnitRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadUnit(row));
  }
  return out;
}

Result PgRepository::ClaimUnit(Transaction& t, uint64_t unit_id, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("claim_unit", unit_id, expected_version);
    if (res.affected_rows() == 0) {
      auto current = GetUnitById(t, unit_id);
      if (!current) return Result::Err(ErrorCode::NotFound, "variant unit not found");
      return Result::Err(ErrorCode::Conflict, "variant unit version is " + std::to_string(current->version) + ", expected " +
                                                  std::to_string(expected_version));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateUnitClassification(Transaction& t, const model::VariantUnitRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_unit_classification", r.id, std::string(am::ToString(r.classification)),
                                          std::string(am::ToString(r.significance)), r.reason_code, r.reason_summary);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "variant unit not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteUnit(Transaction& t, uint64_t unit_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_unit", unit_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "variant unit not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Readings
// ------------------------------------------------------------------

Result PgRepository::InsertReading(Transaction& t, model::ReadingRecord& r) {
  std::optional<std::string> classification;
  std::optional<std::string> significance;
  if (r.classification) classification = std::string(am::ToString(*r.classification));
  if (r.significance) significance = std::string(am::ToString(*r.significance));

  try {
    auto res = TX(t).Work().exec_prepared("insert_reading", r.unit_id, r.reading_index, r.surface_text, r.canonical_key, r.is_spine,
                                          classification, significance, r.reason_code, r.reason_summary);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ReadingRecord> PgRepository::ListReadings(Transaction& t, uint64_t unit_id) {
  auto res = TX(t).Work().exec_prepared("list_readings", unit_id);

  std::vector<model::ReadingRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadReading(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Witness supports
// ------------------------------------------------------------------

bool PgRepository::HasSupport(Transaction& t, uint64_t reading_id, const std::string& witness_siglum, const std::string& source_pack_id) {
  auto res = TX(t).Work().exec_prepared("has_support", reading_id, witness_siglum, source_pack_id);
  return !res.empty();
}

Result PgRepository::InsertSupport(Transaction& t, model::WitnessSupportRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_support", r.reading_id, r.witness_siglum, std::string(am::ToString(r.witness_type)),
                                          r.raw_type_label, r.source_pack_id, r.century_earliest, r.century_latest);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::WitnessSupportRecord> PgRepository::ListSupports(Transaction& t, uint64_t reading_id) {
  auto res = TX(t).Work().exec_prepared("list_supports", reading_id);

  std::vector<model::WitnessSupportRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSupport(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Acknowledgements
// ------------------------------------------------------------------

Result PgRepository::UpsertAcknowledgement(Transaction& t, const model::AcknowledgementRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO acknowledgements(unit_id,session_id,reading_index,reason,acknowledged_at_ms) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(unit_id, session_id) DO UPDATE SET reading_index=EXCLUDED.reading_index,reason=EXCLUDED.reason,"
        "acknowledged_at_ms=EXCLUDED.acknowledged_at_ms;",
        r.unit_id, r.session_id, r.reading_index, r.reason, r.acknowledged_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AcknowledgementRecord> PgRepository::GetAcknowledgement(Transaction& t, uint64_t unit_id, const std::string& session_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT unit_id,session_id,reading_index,reason,acknowledged_at_ms FROM acknowledgements WHERE unit_id=$1 AND session_id=$2;", unit_id,
      session_id);
  if (res.empty()) return std::nullopt;
  return ReadAcknowledgement(res[0]);
}

std::vector<model::AcknowledgementRecord> PgRepository::ListAcknowledgements(Transaction& t, const std::string& session_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT unit_id,session_id,reading_index,reason,acknowledged_at_ms FROM acknowledgements WHERE session_id=$1 ORDER BY unit_id;",
      session_id);

  std::vector<model::AcknowledgementRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadAcknowledgement(row));
  }
  return out;
}

} // namespace apparatus::db::postgres
