#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/variant.hpp"

namespace apparatus::db::model {

/*
  One distinct reading within a unit.

  Unique per unit on canonical_key and on reading_index. Index 0 is the
  spine and carries no classification.
*/
struct ReadingRecord {
  uint64_t    id      = 0;
  uint64_t    unit_id = 0;
  uint32_t    reading_index = 0;
  std::string surface_text;
  std::string canonical_key;
  bool        is_spine = false;

  std::optional<apparatus::model::Classification> classification;
  std::optional<apparatus::model::Significance>   significance;
  std::string                                     reason_code;
  std::string                                     reason_summary;
};

} // namespace apparatus::db::model
