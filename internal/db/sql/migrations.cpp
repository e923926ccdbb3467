#include "migrations.hpp"

namespace apparatus::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS variant_units (id INTEGER PRIMARY KEY AUTOINCREMENT, verse_id TEXT NOT NULL, position INTEGER NOT NULL, "
      "classification TEXT NOT NULL, significance TEXT NOT NULL, reason_code TEXT NOT NULL, reason_summary TEXT NOT NULL, "
      "version INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE(verse_id, position));",
      "CREATE TABLE IF NOT EXISTS readings (id INTEGER PRIMARY KEY AUTOINCREMENT, unit_id INTEGER NOT NULL REFERENCES variant_units(id) ON "
      "DELETE CASCADE, reading_index INTEGER NOT NULL, surface_text TEXT NOT NULL, canonical_key TEXT NOT NULL, is_spine INTEGER NOT NULL, "
      "classification TEXT, significance TEXT, reason_code TEXT NOT NULL DEFAULT '', reason_summary TEXT NOT NULL DEFAULT '', "
      "UNIQUE(unit_id, reading_index), UNIQUE(unit_id, canonical_key));",
      "CREATE TABLE IF NOT EXISTS witness_supports (id INTEGER PRIMARY KEY AUTOINCREMENT, reading_id INTEGER NOT NULL REFERENCES readings(id) "
      "ON DELETE CASCADE, witness_siglum TEXT NOT NULL, witness_type TEXT NOT NULL, raw_type_label TEXT NOT NULL, source_pack_id TEXT NOT NULL "
      "CHECK(length(source_pack_id) > 0), century_earliest INTEGER, century_latest INTEGER, UNIQUE(reading_id, witness_siglum, source_pack_id), "
      "CHECK(century_earliest IS NULL OR century_latest IS NULL OR century_earliest <= century_latest));",
      "CREATE INDEX IF NOT EXISTS idx_readings_unit ON readings(unit_id);",
      "CREATE INDEX IF NOT EXISTS idx_supports_reading ON witness_supports(reading_id);",
  };
  return kSchema;
}

const std::vector<std::string>& SqliteGateSchema() {
  // no foreign key: sqlite cannot reference a table in another file
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS gate.acknowledgements (unit_id INTEGER NOT NULL, session_id TEXT NOT NULL, reading_index INTEGER NOT NULL, "
      "reason TEXT NOT NULL, acknowledged_at_ms INTEGER NOT NULL, PRIMARY KEY (unit_id, session_id));",
      "CREATE INDEX IF NOT EXISTS gate.idx_acknowledgements_session ON acknowledgements(session_id);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS variant_units (id BIGSERIAL PRIMARY KEY, verse_id TEXT NOT NULL, position BIGINT NOT NULL, classification "
      "TEXT NOT NULL, significance TEXT NOT NULL, reason_code TEXT NOT NULL, reason_summary TEXT NOT NULL, version BIGINT NOT NULL, "
      "created_at_ms BIGINT NOT NULL, UNIQUE(verse_id, position));",
      "CREATE TABLE IF NOT EXISTS readings (id BIGSERIAL PRIMARY KEY, unit_id BIGINT NOT NULL REFERENCES variant_units(id) ON DELETE CASCADE, "
      "reading_index BIGINT NOT NULL, surface_text TEXT NOT NULL, canonical_key TEXT NOT NULL, is_spine BOOLEAN NOT NULL, classification TEXT, "
      "significance TEXT, reason_code TEXT NOT NULL DEFAULT '', reason_summary TEXT NOT NULL DEFAULT '', UNIQUE(unit_id, reading_index), "
      "UNIQUE(unit_id, canonical_key));",
      "CREATE TABLE IF NOT EXISTS witness_supports (id BIGSERIAL PRIMARY KEY, reading_id BIGINT NOT NULL REFERENCES readings(id) ON DELETE "
      "CASCADE, witness_siglum TEXT NOT NULL, witness_type TEXT NOT NULL, raw_type_label TEXT NOT NULL, source_pack_id TEXT NOT NULL "
      "CHECK(length(source_pack_id) > 0), century_earliest INTEGER, century_latest INTEGER, UNIQUE(reading_id, witness_siglum, source_pack_id), "
      "CHECK(century_earliest IS NULL OR century_latest IS NULL OR century_earliest <= century_latest));",
      "CREATE TABLE IF NOT EXISTS acknowledgements (unit_id BIGINT NOT NULL REFERENCES variant_units(id) ON DELETE CASCADE, session_id TEXT NOT "
      "NULL, reading_index BIGINT NOT NULL, reason TEXT NOT NULL, acknowledged_at_ms BIGINT NOT NULL, PRIMARY KEY (unit_id, session_id));",
      "CREATE INDEX IF NOT EXISTS idx_readings_unit ON readings(unit_id);",
      "CREATE INDEX IF NOT EXISTS idx_supports_reading ON witness_supports(reading_id);",
      "CREATE INDEX IF NOT EXISTS idx_acknowledgements_session ON acknowledgements(session_id);",
  };
  return kSchema;
}

} // namespace apparatus::db::sql
