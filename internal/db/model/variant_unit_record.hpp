#pragma once

#include <cstdint>
#include <string>

#include "internal/model/variant.hpp"

namespace apparatus::db::model {

/*
  Persistent variant unit row.

  IMPORTANT:
  - (verse_id, position) is unique.
  - version is bumped by every transaction that writes to the unit and is
    the fence used to detect concurrent builds on the same Location.
  - The classification triple mirrors the most severe non-spine reading.
*/
struct VariantUnitRecord {
  uint64_t    id = 0;
  std::string verse_id;
  uint32_t    position = 0;

  apparatus::model::Classification classification = apparatus::model::Classification::kSubstitution;
  apparatus::model::Significance   significance   = apparatus::model::Significance::kMinor;
  std::string                      reason_code;
  std::string                      reason_summary;

  uint64_t version       = 0;
  uint64_t created_at_ms = 0;
};

/*
  Location filter for ListUnits.

  exact == false: verse_id starts with verse_prefix ("John." or "John.1.")
  exact == true:  verse_id equals verse_prefix
*/
struct UnitFilter {
  std::string verse_prefix;
  bool        exact = false;

  bool Matches(const std::string& verse_id) const {
    if (exact) return verse_id == verse_prefix;
    return verse_id.compare(0, verse_prefix.size(), verse_prefix) == 0;
  }
};

} // namespace apparatus::db::model
