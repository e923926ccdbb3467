#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/variant.hpp"

namespace apparatus::db::model {

// Unique on (reading_id, witness_siglum, source_pack_id).
struct WitnessSupportRecord {
  uint64_t                         id         = 0;
  uint64_t                         reading_id = 0;
  std::string                      witness_siglum;
  apparatus::model::WitnessType    witness_type = apparatus::model::WitnessType::kOther;
  std::string                      raw_type_label;
  std::string                      source_pack_id;
  std::optional<int>               century_earliest;
  std::optional<int>               century_latest;
};

} // namespace apparatus::db::model
