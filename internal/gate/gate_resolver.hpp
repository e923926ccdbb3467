#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/variant.hpp"
#include "internal/store/variant_store.hpp"

namespace apparatus::gate {

/*
  Acknowledgement gate.

  Per (unit, session):  UNACKNOWLEDGED --Acknowledge--> ACKNOWLEDGED

  A unit is pending for a session while its significance is at or above
  the threshold and the session has not acknowledged it. Re-acknowledging
  overwrites the earlier choice. Acknowledgements are keyed by unit id,
  so rebuilds that add readings or supports leave them in place.
*/
class GateResolver {
 public:
  struct Options {
    model::Significance minimum_significance = model::Significance::kSignificant;
  };

  GateResolver(std::shared_ptr<store::VariantStore> store, Options options);

  // Units in scope still needing review by this session, in Location order.
  std::vector<model::UnitRef> Pending(std::string_view scope, const std::string& session_id);

  // unit is resolved by unit_id when set, otherwise by (verse_id, position).
  model::Acknowledgement Acknowledge(const model::UnitRef& unit, uint32_t reading_index, const std::string& session_id,
                                     const std::string& reason);

  std::optional<model::Acknowledgement> Status(const model::UnitRef& unit, const std::string& session_id);

  std::vector<model::Acknowledgement> SessionAcknowledgements(const std::string& session_id);

  model::Significance threshold() const {
    return options_.minimum_significance;
  }

 private:
  std::optional<model::VariantUnit> Resolve(db::Transaction& tx, const model::UnitRef& unit);

  std::shared_ptr<store::VariantStore> store_;
  Options                              options_;
};

} // namespace apparatus::gate
