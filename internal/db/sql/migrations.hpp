#pragma once

#include <string>
#include <vector>

namespace apparatus::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order. Every statement is idempotent
  (CREATE ... IF NOT EXISTS) so bootstrapping an existing
  database is a no-op.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

/*
  Schema per backend. The uniqueness constraints are the binding contract:
    variant_units     (verse_id, position)
    readings          (unit_id, canonical_key), (unit_id, reading_index)
    witness_supports  (reading_id, witness_siglum, source_pack_id)
    acknowledgements  (unit_id, session_id)
  Deleting a unit cascades to everything below it.

  SQLite keeps acknowledgements in their own file, attached as "gate", so
  acknowledgement writes never take the lock a build holds on the units
  file. SqliteGateSchema() is run on a connection with that file attached.
*/
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& SqliteGateSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace apparatus::db::sql
