#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace apparatus::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // Everything owned by one unit travels together on commit.
  struct UnitState {
    model::VariantUnitRecord                 unit;
    std::vector<model::ReadingRecord>        readings;
    std::vector<model::WitnessSupportRecord> supports;
  };

  using LocationKey = std::pair<std::string, uint32_t>;
  using AckKey      = std::pair<uint64_t, std::string>;

  struct State {
    std::map<uint64_t, UnitState>                  units;
    std::map<LocationKey, uint64_t>                unit_index;
    std::unordered_map<uint64_t, uint64_t>         reading_to_unit;
    std::map<AckKey, model::AcknowledgementRecord> acknowledgements;
  };

  std::mutex mutex_;
  State      committed_;

  // Ids are handed out outside transactions so concurrent writers never collide.
  std::atomic<uint64_t> next_unit_id_{1};
  std::atomic<uint64_t> next_reading_id_{1};
  std::atomic<uint64_t> next_support_id_{1};
};

}
