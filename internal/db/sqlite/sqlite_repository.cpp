#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"

namespace apparatus::db::sqlite {

using apparatus::db::ErrorCode;
using apparatus::db::Result;

namespace am = apparatus::model;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

// positions and reading indexes are unsigned 32-bit; int would wrap
static void BindU32(sqlite3_stmt* st, int idx, uint32_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindOptI32(sqlite3_stmt* st, int idx, const std::optional<int>& v) {
  if (v) {
    sqlite3_bind_int(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string_view>& v) {
  if (v) {
    sqlite3_bind_text(st, idx, v->data(), static_cast<int>(v->size()), SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

static uint32_t ColU32(sqlite3_stmt* st, int col) {
  return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

static std::optional<int> ColOptI32(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int(st, col);
}

// Reads cannot report through Result; a statement that fails to prepare is a bug.
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
  }
  return st;
}

static void FinishOrThrow(sqlite3* db, sqlite3_stmt* st, int rc) {
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
  }
}

static constexpr const char* kUnitColumns =
    "SELECT id,verse_id,position,classification,significance,reason_code,reason_summary,version,created_at_ms FROM variant_units ";

static model::VariantUnitRecord ReadUnit(sqlite3_stmt* st) {
  model::VariantUnitRecord r;
  r.id             = ColU64(st, 0);
  r.verse_id       = ColText(st, 1);
  r.position       = ColU32(st, 2);
  r.classification = am::ParseClassification(ColText(st, 3)).value_or(am::Classification::kSubstitution);
  r.significance   = am::ParseSignificance(ColText(st, 4)).value_or(am::Significance::kMinor);
  r.reason_code    = ColText(st, 5);
  r.reason_summary = ColText(st, 6);
  r.version        = ColU64(st, 7);
  r.created_at_ms  = ColU64(st, 8);
  return r;
}

static model::ReadingRecord ReadReading(sqlite3_stmt* st) {
  model::ReadingRecord r;
  r.id            = ColU64(st, 0);
  r.unit_id       = ColU64(st, 1);
  r.reading_index = ColU32(st, 2);
  r.surface_text  = ColText(st, 3);
  r.canonical_key = ColText(st, 4);
  r.is_spine      = ColI32(st, 5) != 0;
  if (sqlite3_column_type(st, 6) != SQLITE_NULL) r.classification = am::ParseClassification(ColText(st, 6));
  if (sqlite3_column_type(st, 7) != SQLITE_NULL) r.significance = am::ParseSignificance(ColText(st, 7));
  r.reason_code    = ColText(st, 8);
  r.reason_summary = ColText(st, 9);
  return r;
}

static model::WitnessSupportRecord ReadSupport(sqlite3_stmt* st) {
  model::WitnessSupportRecord r;
  r.id               = ColU64(st, 0);
  r.reading_id       = ColU64(st, 1);
  r.witness_siglum   = ColText(st, 2);
  r.witness_type     = am::ParseWitnessType(ColText(st, 3)).value_or(am::WitnessType::kOther);
  r.raw_type_label   = ColText(st, 4);
  r.source_pack_id   = ColText(st, 5);
  r.century_earliest = ColOptI32(st, 6);
  r.century_latest   = ColOptI32(st, 7);
  return r;
}

static model::AcknowledgementRecord ReadAcknowledgement(sqlite3_stmt* st) {
  model::AcknowledgementRecord r;
  r.unit_id            = ColU64(st, 0);
  r.session_id         = ColText(st, 1);
  r.reading_index      = ColU32(st, 2);
  r.reason             = ColText(st, 3);
  r.acknowledged_at_ms = ColU64(st, 4);
  return r;
}

namespace {

constexpr char kGateSchema[] = "gate";

// Runs after the deleting build committed. A failure only leaves rows that
// no read returns: every acknowledgement query joins variant_units, whose
// ids are never reused (AUTOINCREMENT).
void PurgeAcknowledgements(const std::shared_ptr<SqliteDB>& session, const std::vector<uint64_t>& unit_ids) {
  try {
    SqliteTransaction tx(session, SqliteTxMode::kSession);
    for (const auto unit_id : unit_ids) {
      sqlite3_stmt* st = PrepareOrThrow(tx.Handle(), "DELETE FROM gate.acknowledgements WHERE unit_id=?;");
      BindU64(st, 1, unit_id);
      FinishOrThrow(tx.Handle(), st, sqlite3_step(st));
    }
    tx.Commit();
  } catch (const std::exception& ex) {
    APPARATUS_LOG_WARN("sqlite acknowledgement purge failed", {observability::IntField("units", static_cast<std::int64_t>(unit_ids.size())),
                                                               observability::StringField("error", ex.what())});
  }
}

Result RequireBuild(SqliteTransaction& tx) {
  if (tx.IsSession()) {
    return Result::Err(ErrorCode::InternalError, "unit writes need a build transaction (Begin)");
  }
  return Result::Ok();
}

void RequireSessionOrThrow(SqliteTransaction& tx) {
  if (!tx.IsSession()) {
    throw std::logic_error("acknowledgements are read in a session transaction (BeginSession)");
  }
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> units, std::shared_ptr<SqliteDB> session)
    : units_(std::move(units)), session_(std::move(session)) {}

std::shared_ptr<SqliteRepository> SqliteRepository::Open(const std::string& path, uint32_t busy_timeout_ms) {
  auto units = std::make_shared<SqliteDB>(path, busy_timeout_ms);
  sql::RunMigrations(*units, sql::SqliteSchema());

  auto session = std::make_shared<SqliteDB>(path, busy_timeout_ms);
  session->Attach(GatePath(path), kGateSchema);
  sql::RunMigrations(*session, sql::SqliteGateSchema());

  return std::make_shared<SqliteRepository>(std::move(units), std::move(session));
}

std::string SqliteRepository::GatePath(const std::string& path) {
  return path + ".gate";
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(
      units_, SqliteTxMode::kBuild, [session = session_](const std::vector<uint64_t>& deleted) { PurgeAcknowledgements(session, deleted); });
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginSession() {
  return std::make_unique<SqliteTransaction>(session_, SqliteTxMode::kSession);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Variant units
// ------------------------------------------------------------------

Result SqliteRepository::InsertUnit(Transaction& t, model::VariantUnitRecord& r) {
  if (auto guard = RequireBuild(TX(t)); !guard) return guard;
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO variant_units(verse_id,position,classification,significance,reason_code,reason_summary,version,created_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.verse_id);
  BindU32(st, 2, r.position);
  BindText(st, 3, std::string(am::ToString(r.classification)));
  BindText(st, 4, std::string(am::ToString(r.significance)));
  BindText(st, 5, r.reason_code);
  BindText(st, 6, r.reason_summary);
  BindU64(st, 7, r.version);
  BindU64(st, 8, r.created_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::VariantUnitRecord> SqliteRepository::GetUnit(Transaction& t, const std::string& verse_id, uint32_t position) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(kUnitColumns) + "WHERE verse_id=? AND position=?;";
  sqlite3_stmt*     st  = PrepareOrThrow(db, sql.c_str());
  BindText(st, 1, verse_id);
  BindU32(st, 2, position);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    FinishOrThrow(db, st, rc);
    return std::nullopt;
  }

  auto r = ReadUnit(st);
  sqlite3_finalize(st);
  return r;
}

std::optional<model::VariantUnitRecord> SqliteRepository::GetUnitById(Transaction& t, uint64_t unit_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(kUnitColumns) + "WHERE id=?;";
  sqlite3_stmt*     st  = PrepareOrThrow(db, sql.c_str());
  BindU64(st, 1, unit_id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    FinishOrThrow(db, st, rc);
    return std::nullopt;
  }

  auto r = ReadUnit(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::VariantUnitRecord> SqliteRepository::ListUnits(Transaction& t, const model::UnitFilter& filter) {
  auto* db = TX(t).Handle();

  // verse ids are ASCII, so substr() character counts equal byte counts
  const std::string sql =
      std::string(kUnitColumns) + (filter.exact ? "WHERE verse_id=?1;" : "WHERE substr(verse_id,1,length(?1))=?1;");
  sqlite3_stmt* st = PrepareOrThrow(db, sql.c_str());
  BindText(st, 1, filter.verse_prefix);

  std::vector<model::VariantUnitRecord> out;
  int                                   rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadUnit(st));
  }
  FinishOrThrow(db, st, rc);
  return out;
}

Result SqliteRepository::ClaimUnit(Transaction& t, uint64_t unit_id, uint64_t expected_version) {
  if (auto guard = RequireBuild(TX(t)); !guard) return guard;
  auto* db = TX(t).Handle();

  const char*   sql = "UPDATE variant_units SET version=version+1 WHERE id=? AND version=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, unit_id);
  BindU64(st, 2, expected_version);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) == 0) {
    auto current = GetUnitById(t, unit_id);
    if (!current) return Result::Err(ErrorCode::NotFound, "variant unit not found");
    return Result::Err(ErrorCode::Conflict,
                       "variant unit version is " + std::to_string(current->version) + ", expected " + std::to_string(expected_version));
  }
  return Result::Ok();
}

Result SqliteRepository::UpdateUnitClassification(Transaction& t, const model::VariantUnitRecord& r) {
  if (auto guard = RequireBuild(TX(t)); !guard) return guard;
  auto* db = TX(t).Handle();

  const char*   sql = "UPDATE variant_units SET classification=?,significance=?,reason_code=?,reason_summary=? WHERE id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, std::string(am::ToString(r.classification)));
  BindText(st, 2, std::string(am::ToString(r.significance)));
  BindText(st, 3, r.reason_code);
  BindText(st, 4, r.reason_summary);
  BindU64(st, 5, r.id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "variant unit not found");
  return Result::Ok();
}

Result SqliteRepository::DeleteUnit(Transaction& t, uint64_t unit_id) {
  if (auto guard = RequireBuild(TX(t)); !guard) return guard;
  auto* db = TX(t).Handle();

  // readings and supports go with it (ON DELETE CASCADE); acknowledgements
  // live in the gate file and are purged once this transaction commits
  const char*   sql = "DELETE FROM variant_units WHERE id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, unit_id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "variant unit not found");
  TX(t).NoteDeletedUnit(unit_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Readings
// ------------------------------------------------------------------

Result SqliteRepository::InsertReading(Transaction& t, model::ReadingRecord& r) {
  if (auto guard = RequireBuild(TX(t)); !guard) return guard;
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO readings(unit_id,reading_index,surface_text,canonical_key,is_spine,classification,significance,reason_code,"
      "reason_summary) VALUES(?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.unit_id);
  BindU32(st, 2, r.reading_index);
  BindText(st, 3, r.surface_text);
  BindText(st, 4, r.canonical_key);
  BindI32(st, 5, r.is_spine ? 1 : 0);
  BindOptText(st, 6, r.classification ? std::optional<std::string_view>(am::ToString(*r.classification)) : std::nullopt);
  BindOptText(st, 7, r.significance ? std::optional<std::string_view>(am::ToString(*r.significance)) : std::nullopt);
  BindText(st, 8, r.reason_code);
  BindText(st, 9, r.reason_summary);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::vector<model::ReadingRecord> SqliteRepository::ListReadings(Transaction& t, uint64_t unit_id) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT id,unit_id,reading_index,surface_text,canonical_key,is_spine,classification,significance,reason_code,reason_summary "
      "FROM readings WHERE unit_id=? ORDER BY reading_index;";
  sqlite3_stmt* st = PrepareOrThrow(db, sql);
  BindU64(st, 1, unit_id);

  std::vector<model::ReadingRecord> out;
  int                               rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadReading(st));
  }
  FinishOrThrow(db, st, rc);
  return out;
}

// ------------------------------------------------------------------
// Witness supports
// ------------------------------------------------------------------

bool SqliteRepository::HasSupport(Transaction& t, uint64_t reading_id, const std::string& witness_siglum, const std::string& source_pack_id) {
  auto* db = TX(t).Handle();

  const char*   sql = "SELECT 1 FROM witness_supports WHERE reading_id=? AND witness_siglum=? AND source_pack_id=? LIMIT 1;";
  sqlite3_stmt* st  = PrepareOrThrow(db, sql);
  BindU64(st, 1, reading_id);
  BindText(st, 2, witness_siglum);
  BindText(st, 3, source_pack_id);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    sqlite3_finalize(st);
    return true;
  }
  FinishOrThrow(db, st, rc);
  return false;
}

Result SqliteRepository::InsertSupport(Transaction& t, model::WitnessSupportRecord& r) {
  if (auto guard = RequireBuild(TX(t)); !guard) return guard;
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO witness_supports(reading_id,witness_siglum,witness_type,raw_type_label,source_pack_id,century_earliest,century_latest) "
      "VALUES(?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.reading_id);
  BindText(st, 2, r.witness_siglum);
  BindText(st, 3, std::string(am::ToString(r.witness_type)));
  BindText(st, 4, r.raw_type_label);
  BindText(st, 5, r.source_pack_id);
  BindOptI32(st, 6, r.century_earliest);
  BindOptI32(st, 7, r.century_latest);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::vector<model::WitnessSupportRecord> SqliteRepository::ListSupports(Transaction& t, uint64_t reading_id) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT id,reading_id,witness_siglum,witness_type,raw_type_label,source_pack_id,century_earliest,century_latest "
      "FROM witness_supports WHERE reading_id=? ORDER BY id;";
  sqlite3_stmt* st = PrepareOrThrow(db, sql);
  BindU64(st, 1, reading_id);

  std::vector<model::WitnessSupportRecord> out;
  int                                      rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadSupport(st));
  }
  FinishOrThrow(db, st, rc);
  return out;
}

// ------------------------------------------------------------------
// Acknowledgements
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAcknowledgement(Transaction& t, const model::AcknowledgementRecord& r) {
  auto& tx = TX(t);
  if (!tx.IsSession()) {
    return Result::Err(ErrorCode::InternalError, "acknowledgements are written in a session transaction (BeginSession)");
  }
  auto* db = tx.Handle();

  // the EXISTS stands in for the foreign key sqlite cannot hold across files
  const char* sql =
      "INSERT INTO gate.acknowledgements(unit_id,session_id,reading_index,reason,acknowledged_at_ms) "
      "SELECT ?1,?2,?3,?4,?5 WHERE EXISTS (SELECT 1 FROM variant_units WHERE id=?1) "
      "ON CONFLICT(unit_id, session_id) DO UPDATE SET reading_index=excluded.reading_index, reason=excluded.reason, "
      "acknowledged_at_ms=excluded.acknowledged_at_ms;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.unit_id);
  BindText(st, 2, r.session_id);
  BindU32(st, 3, r.reading_index);
  BindText(st, 4, r.reason);
  BindU64(st, 5, r.acknowledged_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: acknowledged unit does not exist");
  }
  return Result::Ok();
}

std::optional<model::AcknowledgementRecord> SqliteRepository::GetAcknowledgement(Transaction& t, uint64_t unit_id, const std::string& session_id) {
  RequireSessionOrThrow(TX(t));
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT a.unit_id,a.session_id,a.reading_index,a.reason,a.acknowledged_at_ms FROM gate.acknowledgements a "
      "JOIN variant_units u ON u.id=a.unit_id WHERE a.unit_id=? AND a.session_id=?;";
  sqlite3_stmt* st = PrepareOrThrow(db, sql);
  BindU64(st, 1, unit_id);
  BindText(st, 2, session_id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    FinishOrThrow(db, st, rc);
    return std::nullopt;
  }

  auto r = ReadAcknowledgement(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::AcknowledgementRecord> SqliteRepository::ListAcknowledgements(Transaction& t, const std::string& session_id) {
  RequireSessionOrThrow(TX(t));
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT a.unit_id,a.session_id,a.reading_index,a.reason,a.acknowledged_at_ms FROM gate.acknowledgements a "
      "JOIN variant_units u ON u.id=a.unit_id WHERE a.session_id=? ORDER BY a.unit_id;";
  sqlite3_stmt* st = PrepareOrThrow(db, sql);
  BindText(st, 1, session_id);

  std::vector<model::AcknowledgementRecord> out;
  int                                       rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadAcknowledgement(st));
  }
  FinishOrThrow(db, st, rc);
  return out;
}

} // namespace apparatus::db::sqlite
