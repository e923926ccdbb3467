#pragma once

#include <cstdint>
#include <string>

namespace apparatus::db::model {

// Unique on (unit_id, session_id). Absence of a row means unacknowledged.
struct AcknowledgementRecord {
  uint64_t    unit_id = 0;
  std::string session_id;
  uint32_t    reading_index = 0;
  std::string reason;
  uint64_t    acknowledged_at_ms = 0;
};

} // namespace apparatus::db::model
