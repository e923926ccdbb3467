#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/classify/significance_classifier.hpp"
#include "internal/pack/pack_source.hpp"
#include "internal/store/variant_store.hpp"

namespace apparatus::core {

struct LocationFailure {
  std::string verse_id;
  uint32_t    position = 0;
  std::string pack_id; // empty when the whole Location failed
  std::string kind;    // input | provenance | conflict | integrity | internal
  std::string message;
};

struct BuildResult {
  uint64_t units_created         = 0;
  uint64_t units_updated         = 0;
  uint64_t readings_added        = 0;
  uint64_t supports_added        = 0;
  // (reading, siglum, pack) supports seen again and not written
  uint64_t supports_deduplicated = 0;
  uint64_t agreements            = 0;
  uint64_t locations_processed   = 0;

  // Ordered by Location.
  std::vector<LocationFailure> failures;
};

/*
  AggregationEngine

  Merges pack records into one VariantUnit per Location:

    scope -> spine chapters -> pack records (caller's pack order)
          -> group by Location -> one transaction per Location

  Guarantees:
    - rebuilding with the same packs writes nothing
    - a failing Location rolls back alone; the rest of the build continues
    - a reading's classification is computed once, when it is created
    - the unit-level classification only ever moves up in severity

  With worker_threads > 1 Locations run in parallel; the result is the
  same as a sequential build.
*/
class AggregationEngine {
 public:
  struct Options {
    uint32_t worker_threads = 1;
    // ConflictError retries per Location before it is reported.
    uint32_t conflict_retries = 3;
  };

  AggregationEngine(std::shared_ptr<store::VariantStore> store, std::shared_ptr<pack::PackLoader> packs,
                    std::shared_ptr<pack::SpineSource> spine, Options options);

  // Throws util::InputError for an unparseable scope or empty pack list,
  // before anything is written.
  BuildResult Build(std::string_view scope, const std::vector<std::string>& pack_ids);

 private:
  struct SourcedRecord {
    std::string      requested_pack;
    pack::PackRecord record;
  };

  struct LocationInput {
    std::string                verse_id;
    uint32_t                   position = 0;
    bool                       has_spine = false;
    std::string                spine_text;
    std::vector<SourcedRecord> records;
  };

  std::vector<LocationInput> Collect(const model::Scope& scope, const std::vector<std::string>& pack_ids);

  BuildResult BuildLocation(const LocationInput& input) const;
  BuildResult ApplyLocation(const LocationInput& input, const std::vector<const SourcedRecord*>& accepted) const;

  std::shared_ptr<store::VariantStore> store_;
  std::shared_ptr<pack::PackLoader>    packs_;
  std::shared_ptr<pack::SpineSource>   spine_;
  Options                              options_;
  classify::SignificanceClassifier     classifier_;
};

} // namespace apparatus::core
