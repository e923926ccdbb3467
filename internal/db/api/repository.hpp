#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/acknowledgement_record.hpp"
#include "internal/db/model/reading_record.hpp"
#include "internal/db/model/variant_unit_record.hpp"
#include "internal/db/model/witness_support_record.hpp"

namespace apparatus::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Uniqueness constraints are enforced by every backend and surface
    as ErrorCode::ConstraintViolation (never silently ignored)
  - ClaimUnit is an atomic compare-and-increment on the unit version
  - Acknowledgements are read and written in session transactions;
    backends may reject them inside a build transaction

  Callers are expected to check before they insert (GetUnit, HasSupport,
  ListReadings). A ConstraintViolation therefore means either a concurrent
  writer or a bug, and is never part of normal control flow.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Build transaction: unit, reading and support writes.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Session transaction: reads plus acknowledgement writes. Never waits
  // for an open build transaction to finish.
  virtual std::unique_ptr<Transaction> BeginSession() = 0;

  // ---------------------------------------------------------------------
  // Variant units
  // ---------------------------------------------------------------------

  // Assigns id; version is stored as given.
  virtual Result InsertUnit(Transaction&, model::VariantUnitRecord&) = 0;

  virtual std::optional<model::VariantUnitRecord> GetUnit(Transaction&, const std::string& verse_id, uint32_t position) = 0;

  virtual std::optional<model::VariantUnitRecord> GetUnitById(Transaction&, uint64_t unit_id) = 0;

  // Unordered; callers sort by location.
  virtual std::vector<model::VariantUnitRecord> ListUnits(Transaction&, const model::UnitFilter&) = 0;

  // version := version + 1 iff version == expected_version, else Conflict.
  virtual Result ClaimUnit(Transaction&, uint64_t unit_id, uint64_t expected_version) = 0;

  virtual Result UpdateUnitClassification(Transaction&, const model::VariantUnitRecord&) = 0;

  // Cascades to readings, supports and acknowledgements.
  virtual Result DeleteUnit(Transaction&, uint64_t unit_id) = 0;

  // ---------------------------------------------------------------------
  // Readings
  // ---------------------------------------------------------------------

  virtual Result InsertReading(Transaction&, model::ReadingRecord&) = 0;

  // Ordered by reading_index.
  virtual std::vector<model::ReadingRecord> ListReadings(Transaction&, uint64_t unit_id) = 0;

  // ---------------------------------------------------------------------
  // Witness supports
  // ---------------------------------------------------------------------

  virtual bool HasSupport(Transaction&, uint64_t reading_id, const std::string& witness_siglum, const std::string& source_pack_id) = 0;

  virtual Result InsertSupport(Transaction&, model::WitnessSupportRecord&) = 0;

  // Ordered by insertion.
  virtual std::vector<model::WitnessSupportRecord> ListSupports(Transaction&, uint64_t reading_id) = 0;

  // ---------------------------------------------------------------------
  // Acknowledgements
  // ---------------------------------------------------------------------

  virtual Result UpsertAcknowledgement(Transaction&, const model::AcknowledgementRecord&) = 0;

  virtual std::optional<model::AcknowledgementRecord> GetAcknowledgement(Transaction&, uint64_t unit_id, const std::string& session_id) = 0;

  virtual std::vector<model::AcknowledgementRecord> ListAcknowledgements(Transaction&, const std::string& session_id) = 0;
};

} // namespace apparatus::db
