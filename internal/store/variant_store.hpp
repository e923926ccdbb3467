#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/classify/significance_classifier.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/scope.hpp"
#include "internal/model/variant.hpp"

namespace apparatus::store {

struct InvariantViolation {
  uint64_t    unit_id = 0;
  std::string verse_id;
  uint32_t    position = 0;
  std::string message;
};

/*
  VariantStore

  Domain view over a db::Repository. Converts records to model values,
  turns db::Result failures into the util error taxonomy and refuses
  writes that would break a persisted invariant.

  Read helpers open their own session transaction. Mutation primitives take
  the caller's transaction so a whole Location commits or rolls back
  together; unit writes need Begin(), acknowledgements need BeginSession().
*/
class VariantStore {
 public:
  explicit VariantStore(std::shared_ptr<db::Repository> repository);

  std::unique_ptr<db::Transaction> Begin();
  std::unique_ptr<db::Transaction> BeginSession();

  // ------------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------------

  std::optional<model::VariantUnit> GetUnit(const std::string& verse_id, uint32_t position);
  std::optional<model::VariantUnit> GetUnitById(uint64_t unit_id);

  // Ordered by book order, chapter, verse, position.
  std::vector<model::VariantUnit> GetUnitsForScope(const model::Scope& scope);

  std::size_t CountUnits();

  // Same as above, inside the caller's transaction.
  std::optional<model::VariantUnit> LoadUnit(db::Transaction& tx, const std::string& verse_id, uint32_t position);
  std::optional<model::VariantUnit> LoadUnitById(db::Transaction& tx, uint64_t unit_id);
  std::vector<model::VariantUnit>   LoadUnitsForScope(db::Transaction& tx, const model::Scope& scope, bool with_readings = true);

  // ------------------------------------------------------------------
  // Mutation primitives
  // ------------------------------------------------------------------

  // Inserts the unit and its spine reading (index 0). The unit-level
  // classification starts as the given triple.
  model::VariantUnit CreateUnit(db::Transaction& tx, const std::string& verse_id, uint32_t position, const std::string& spine_text,
                                const std::string& spine_key, const classify::Classification& initial);

  // Non-spine reading with its classifier output, written once.
  model::Reading AddReading(db::Transaction& tx, uint64_t unit_id, uint32_t index, const std::string& surface_text,
                            const std::string& canonical_key, const classify::Classification& classification);

  bool HasSupport(db::Transaction& tx, uint64_t reading_id, const std::string& witness_siglum, const std::string& source_pack_id);

  // false when (reading, siglum, pack) already exists; never duplicates.
  bool AddSupportIfAbsent(db::Transaction& tx, uint64_t reading_id, const model::WitnessSupport& support);

  // Throws util::ConflictError when another writer moved the version.
  void ClaimUnit(db::Transaction& tx, uint64_t unit_id, uint64_t expected_version);

  // Replaces the unit triple only when the candidate is strictly more severe.
  bool RaiseUnitClassification(db::Transaction& tx, model::VariantUnit& unit, const classify::Classification& candidate);

  // ------------------------------------------------------------------
  // Acknowledgements
  // ------------------------------------------------------------------

  // Upsert on (unit, session). Never touches the unit itself.
  void RecordAcknowledgement(db::Transaction& tx, const model::Acknowledgement& acknowledgement);

  std::optional<model::Acknowledgement> FindAcknowledgement(db::Transaction& tx, uint64_t unit_id, const std::string& session_id);

  std::vector<model::Acknowledgement> ListAcknowledgements(db::Transaction& tx, const std::string& session_id);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------

  std::vector<InvariantViolation> CheckInvariants(const model::Scope& scope);

  // Deletes every unit in scope with its readings, supports and acknowledgements.
  std::size_t ResetScope(const model::Scope& scope);

  static db::model::UnitFilter FilterFor(const model::Scope& scope);

 private:
  model::VariantUnit Assemble(db::Transaction& tx, const db::model::VariantUnitRecord& record, bool with_readings);

  std::shared_ptr<db::Repository> repository_;
};

// Maps a non-OK db::Result to the util error taxonomy.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace apparatus::store
