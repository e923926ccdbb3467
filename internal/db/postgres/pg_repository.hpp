#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace apparatus::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
