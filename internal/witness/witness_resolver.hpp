#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/variant.hpp"

namespace apparatus::witness {

// Witness metadata as a pack supplies it, before resolution.
struct WitnessMetadata {
  std::string                        siglum;
  std::string                        type_label;
  std::optional<model::CenturyRange> century_range;
};

/*
  Maps free-form witness type labels to the closed WitnessType taxonomy.

  Stateless. Unknown labels resolve to kOther and never fail, so an
  unfamiliar label never blocks ingestion of otherwise valid data.
*/
class WitnessResolver {
 public:
  static model::WitnessType ResolveType(std::string_view label);

  static model::WitnessSupport Resolve(const WitnessMetadata& metadata, const std::string& source_pack_id);
};

} // namespace apparatus::witness
