#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace apparatus::db::sqlite {

// Two connections to the same units file. Build transactions (Begin) take the
// write lock on it with BEGIN IMMEDIATE. Session transactions (BeginSession)
// read it through WAL snapshots and write acknowledgements to a second file
// attached as "gate", so a running build never blocks an acknowledgement.
class SqliteRepository final : public db::Repository {
public:
  SqliteRepository(std::shared_ptr<SqliteDB> units, std::shared_ptr<SqliteDB> session);

  // Opens both connections and migrates the units and gate files.
  static std::shared_ptr<SqliteRepository> Open(const std::string& path, uint32_t busy_timeout_ms);
  static std::string GatePath(const std::string& path);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginSession() override;

  Result InsertUnit(Transaction&, model::VariantUnitRecord&) override;
  std::optional<model::VariantUnitRecord> GetUnit(Transaction&, const std::string& verse_id, uint32_t position) override;
  std::optional<model::VariantUnitRecord> GetUnitById(Transaction&, uint64_t unit_id) override;
  std::vector<model::VariantUnitRecord> ListUnits(Transaction&, const model::UnitFilter&) override;
  Result ClaimUnit(Transaction&, uint64_t unit_id, uint64_t expected_version) override;
  Result UpdateUnitClassification(Transaction&, const model::VariantUnitRecord&) override;
  Result DeleteUnit(Transaction&, uint64_t unit_id) override;

  Result InsertReading(Transaction&, model::ReadingRecord&) override;
  std::vector<model::ReadingRecord> ListReadings(Transaction&, uint64_t unit_id) override;

  bool HasSupport(Transaction&, uint64_t reading_id, const std::string& witness_siglum,
                  const std::string& source_pack_id) override;
  Result InsertSupport(Transaction&, model::WitnessSupportRecord&) override;
  std::vector<model::WitnessSupportRecord> ListSupports(Transaction&, uint64_t reading_id) override;

  Result UpsertAcknowledgement(Transaction&, const model::AcknowledgementRecord&) override;
  std::optional<model::AcknowledgementRecord> GetAcknowledgement(Transaction&, uint64_t unit_id,
                                                                 const std::string& session_id) override;
  std::vector<model::AcknowledgementRecord> ListAcknowledgements(Transaction&, const std::string& session_id) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> units_;
  std::shared_ptr<SqliteDB> session_;
};

} // namespace apparatus::db::sqlite
