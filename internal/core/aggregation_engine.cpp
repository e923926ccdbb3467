#include "internal/core/aggregation_engine.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <set>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <utility>

#include "internal/observability/observe.hpp"
#include "internal/text/normalizer.hpp"
#include "internal/util/errors.hpp"
#include "internal/witness/witness_resolver.hpp"

namespace apparatus::core {

namespace {

constexpr std::size_t kNoPlannedReading = static_cast<std::size_t>(-1);

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; });
}

void Merge(BuildResult& into, BuildResult&& from) {
  into.units_created += from.units_created;
  into.units_updated += from.units_updated;
  into.readings_added += from.readings_added;
  into.supports_added += from.supports_added;
  into.supports_deduplicated += from.supports_deduplicated;
  into.agreements += from.agreements;
  into.locations_processed += from.locations_processed;
  for (auto& failure : from.failures) {
    into.failures.push_back(std::move(failure));
  }
}

void AddFailure(BuildResult& result, const std::string& verse_id, uint32_t position, const std::string& pack_id, std::string kind,
                std::string message) {
  APPARATUS_LOG_WARN("location failure", {observability::StringField("verse_id", verse_id), observability::IntField("position", position),
                                          observability::StringField("pack_id", pack_id), observability::StringField("kind", kind),
                                          observability::StringField("error", message)});
  observability::Metrics::Instance().RecordLocationFailure(kind);
  result.failures.push_back(LocationFailure{verse_id, position, pack_id, std::move(kind), std::move(message)});
}

} // namespace

AggregationEngine::AggregationEngine(std::shared_ptr<store::VariantStore> store, std::shared_ptr<pack::PackLoader> packs,
                                     std::shared_ptr<pack::SpineSource> spine, Options options)
    : store_(std::move(store)), packs_(std::move(packs)), spine_(std::move(spine)), options_(options) {
  if (!store_ || !packs_ || !spine_) {
    throw std::invalid_argument("aggregation engine requires a store, a pack loader and a spine source");
  }
  if (options_.worker_threads == 0) {
    options_.worker_threads = 1;
  }
}

BuildResult AggregationEngine::Build(std::string_view scope_text, const std::vector<std::string>& pack_ids) {
  return observability::ObserveOperation("AggregationEngine.Build", scope_text, [&] {
    const auto scope = model::Scope::Parse(scope_text);
    if (pack_ids.empty()) {
      throw util::InputError("build " + scope.ToString() + ": no packs selected");
    }
    for (const auto& pack_id : pack_ids) {
      if (pack_id.empty()) {
        throw util::InputError("build " + scope.ToString() + ": empty pack id in pack list");
      }
    }

    APPARATUS_LOG_INFO("build started", {observability::StringField("scope", scope.ToString()),
                                         observability::IntField("packs", static_cast<std::int64_t>(pack_ids.size())),
                                         observability::IntField("worker_threads", options_.worker_threads)});

    BuildResult result;
    auto        locations = Collect(scope, pack_ids);

    std::vector<BuildResult> per_location(locations.size());
    const auto               workers = std::min<std::size_t>(options_.worker_threads, locations.size());
    if (workers <= 1) {
      for (std::size_t i = 0; i < locations.size(); ++i) {
        per_location[i] = BuildLocation(locations[i]);
      }
    } else {
      std::atomic<std::size_t> next{0};
      // jthread joins on destruction, also when a later thread fails to start
      std::vector<std::jthread> pool;
      pool.reserve(workers);
      for (std::size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&] {
          for (std::size_t i = next.fetch_add(1); i < locations.size(); i = next.fetch_add(1)) {
            per_location[i] = BuildLocation(locations[i]);
          }
        });
      }
      pool.clear();
    }

    for (auto& location : per_location) {
      Merge(result, std::move(location));
    }
    std::stable_sort(result.failures.begin(), result.failures.end(), [](const auto& a, const auto& b) {
      return model::LocationLess(a.verse_id, a.position, b.verse_id, b.position);
    });

    observability::Metrics::Instance().RecordUnitsCreated(result.units_created);
    observability::Metrics::Instance().RecordSupportsDeduplicated(result.supports_deduplicated);
    APPARATUS_LOG_INFO("build finished", {observability::StringField("scope", scope.ToString()),
                                          observability::IntField("locations", static_cast<std::int64_t>(result.locations_processed)),
                                          observability::IntField("units_created", static_cast<std::int64_t>(result.units_created)),
                                          observability::IntField("units_updated", static_cast<std::int64_t>(result.units_updated)),
                                          observability::IntField("readings_added", static_cast<std::int64_t>(result.readings_added)),
                                          observability::IntField("supports_added", static_cast<std::int64_t>(result.supports_added)),
                                          observability::IntField("supports_deduplicated", static_cast<std::int64_t>(result.supports_deduplicated)),
                                          observability::IntField("agreements", static_cast<std::int64_t>(result.agreements)),
                                          observability::IntField("failures", static_cast<std::int64_t>(result.failures.size()))});
    return result;
  });
}

std::vector<AggregationEngine::LocationInput> AggregationEngine::Collect(const model::Scope& scope, const std::vector<std::string>& pack_ids) {
  std::vector<uint32_t> chapters;
  if (scope.chapter) {
    chapters.push_back(*scope.chapter);
  } else {
    chapters = spine_->Chapters(scope.book);
  }

  using LocationKey = std::pair<std::string, uint32_t>;
  std::map<LocationKey, LocationInput> by_location;

  for (const auto chapter : chapters) {
    for (const auto& verse : spine_->Verses(scope.book, chapter)) {
      auto ref = model::VerseRef::Parse(verse.verse_id);
      if (!ref) continue;
      const auto verse_id = ref->ToString();
      if (!scope.Contains(verse_id)) continue;

      auto& input      = by_location[{verse_id, verse.position}];
      input.verse_id   = verse_id;
      input.position   = verse.position;
      input.has_spine  = true;
      input.spine_text = verse.text;
    }

    // Caller's pack order, then each pack's document order.
    for (const auto& pack_id : pack_ids) {
      for (auto& record : packs_->Load(pack_id, scope.book, chapter)) {
        auto ref = model::VerseRef::Parse(record.verse_id);
        if (!ref) {
          // No Location to attach to; reported against the raw id.
          auto& input    = by_location[{record.verse_id, record.position}];
          input.verse_id = record.verse_id;
          input.position = record.position;
          input.records.push_back(SourcedRecord{pack_id, std::move(record)});
          continue;
        }

        const auto verse_id = ref->ToString();
        if (!scope.Contains(verse_id)) continue;

        record.verse_id = verse_id;
        auto& input     = by_location[{verse_id, record.position}];
        input.verse_id  = verse_id;
        input.position  = record.position;
        input.records.push_back(SourcedRecord{pack_id, std::move(record)});
      }
    }
  }

  std::vector<LocationInput> out;
  for (auto& [_, input] : by_location) {
    // A spine verse no pack speaks to has nothing to merge.
    if (input.records.empty()) continue;
    out.push_back(std::move(input));
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return model::LocationLess(a.verse_id, a.position, b.verse_id, b.position); });
  return out;
}

BuildResult AggregationEngine::BuildLocation(const LocationInput& input) const {
  BuildResult result;
  result.locations_processed = 1;

  if (!model::VerseRef::Parse(input.verse_id)) {
    AddFailure(result, input.verse_id, input.position, input.records.front().requested_pack, "input",
               "malformed verse id \"" + input.verse_id + "\"");
    return result;
  }
  if (!input.has_spine) {
    AddFailure(result, input.verse_id, input.position, "", "input", "no spine text for " + input.verse_id);
    return result;
  }

  std::vector<const SourcedRecord*> accepted;
  for (const auto& sourced : input.records) {
    const auto& record = sourced.record;
    if (record.pack_id.empty()) {
      AddFailure(result, input.verse_id, input.position, sourced.requested_pack, "provenance", "record without source pack id");
      continue;
    }
    if (record.pack_id != sourced.requested_pack) {
      AddFailure(result, input.verse_id, input.position, sourced.requested_pack, "provenance",
                 "record attributed to pack \"" + record.pack_id + "\" was delivered by pack \"" + sourced.requested_pack + "\"");
      continue;
    }
    if (IsBlank(record.witness.siglum)) {
      AddFailure(result, input.verse_id, input.position, record.pack_id, "input", "record without witness siglum");
      return result;
    }
    if (record.witness.century_range && record.witness.century_range->earliest > record.witness.century_range->latest) {
      AddFailure(result, input.verse_id, input.position, record.pack_id, "input",
                 "witness " + record.witness.siglum + " has century range earliest > latest");
      return result;
    }
    accepted.push_back(&sourced);
  }

  const uint32_t attempts = options_.conflict_retries + 1;
  for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    try {
      auto applied = ApplyLocation(input, accepted);
      applied.locations_processed = 0;
      Merge(result, std::move(applied));
      return result;
    } catch (const util::ConflictError& ex) {
      if (attempt == attempts) {
        AddFailure(result, input.verse_id, input.position, "", "conflict", ex.what());
        return result;
      }
      observability::Metrics::Instance().RecordRetry("conflict");
      APPARATUS_LOG_INFO("location conflict, retrying", {observability::StringField("verse_id", input.verse_id),
                                                         observability::IntField("attempt", attempt),
                                                         observability::StringField("error", ex.what())});
    } catch (const util::NotFound& ex) {
      // unit removed underneath us by a concurrent reset
      if (attempt == attempts) {
        AddFailure(result, input.verse_id, input.position, "", "conflict", ex.what());
        return result;
      }
      observability::Metrics::Instance().RecordRetry("not_found");
    } catch (const util::InputError& ex) {
      AddFailure(result, input.verse_id, input.position, "", "input", ex.what());
      return result;
    } catch (const util::ProvenanceError& ex) {
      AddFailure(result, input.verse_id, input.position, "", "provenance", ex.what());
      return result;
    } catch (const util::IntegrityError& ex) {
      AddFailure(result, input.verse_id, input.position, "", "integrity", ex.what());
      return result;
    } catch (const std::exception& ex) {
      AddFailure(result, input.verse_id, input.position, "", "internal", ex.what());
      return result;
    }
  }
  return result;
}

BuildResult AggregationEngine::ApplyLocation(const LocationInput& input, const std::vector<const SourcedRecord*>& accepted) const {
  struct PlannedReading {
    uint32_t                 index = 0;
    std::string              surface_text;
    std::string              canonical_key;
    classify::Classification classification;
  };
  struct PlannedSupport {
    uint64_t              reading_id = 0;
    std::size_t           planned    = kNoPlannedReading;
    model::WitnessSupport support;
  };

  BuildResult result;

  auto tx   = store_->Begin();
  auto unit = store_->LoadUnit(*tx, input.verse_id, input.position);

  // An existing unit keeps the spine it was created with, even when the
  // spine source has since changed.
  std::string spine_text = input.spine_text;
  std::string spine_key  = text::Normalize(input.spine_text);

  std::map<std::string, uint64_t> existing_by_key;
  uint32_t                        next_index = 1;
  if (unit) {
    for (const auto& reading : unit->readings) {
      if (reading.is_spine) {
        spine_text = reading.surface_text;
        spine_key  = reading.canonical_key;
      } else {
        existing_by_key.emplace(reading.canonical_key, reading.id);
      }
      next_index = std::max(next_index, reading.index + 1);
    }
    if (spine_text != input.spine_text) {
      APPARATUS_LOG_WARN("spine text differs from stored spine reading",
                         {observability::StringField("verse_id", input.verse_id), observability::IntField("position", input.position)});
    }
  }

  std::vector<PlannedReading>                                    planned_readings;
  std::map<std::string, std::size_t>                             planned_by_key;
  std::vector<PlannedSupport>                                    planned_supports;
  std::set<std::tuple<std::string, std::string, std::string>>    seen;

  for (const auto* sourced : accepted) {
    const auto& record = sourced->record;
    const auto  key    = text::Normalize(record.text);
    if (key == spine_key) {
      ++result.agreements;
      continue;
    }

    auto support = witness::WitnessResolver::Resolve(record.witness, record.pack_id);
    if (!seen.emplace(key, support.witness_siglum, support.source_pack_id).second) {
      ++result.supports_deduplicated;
      continue;
    }

    if (auto existing = existing_by_key.find(key); existing != existing_by_key.end()) {
      if (store_->HasSupport(*tx, existing->second, support.witness_siglum, support.source_pack_id)) {
        ++result.supports_deduplicated;
        continue;
      }
      planned_supports.push_back(PlannedSupport{existing->second, kNoPlannedReading, std::move(support)});
      continue;
    }

    auto planned = planned_by_key.find(key);
    if (planned == planned_by_key.end()) {
      planned_readings.push_back(PlannedReading{next_index++, record.text, key, classifier_.Classify(spine_text, record.text)});
      planned = planned_by_key.emplace(key, planned_readings.size() - 1).first;
    }
    planned_supports.push_back(PlannedSupport{0, planned->second, std::move(support)});
  }

  if (planned_readings.empty() && planned_supports.empty()) {
    tx->Rollback();
    return result;
  }

  if (!unit) {
    unit = store_->CreateUnit(*tx, input.verse_id, input.position, spine_text, spine_key, planned_readings.front().classification);
    result.units_created = 1;
  } else {
    store_->ClaimUnit(*tx, unit->id, unit->version);
    result.units_updated = 1;
  }

  std::vector<uint64_t> new_reading_ids;
  for (const auto& planned : planned_readings) {
    auto reading = store_->AddReading(*tx, unit->id, planned.index, planned.surface_text, planned.canonical_key, planned.classification);
    new_reading_ids.push_back(reading.id);
    ++result.readings_added;
    store_->RaiseUnitClassification(*tx, *unit, planned.classification);
  }

  for (const auto& planned : planned_supports) {
    const auto reading_id = planned.planned == kNoPlannedReading ? planned.reading_id : new_reading_ids[planned.planned];
    if (store_->AddSupportIfAbsent(*tx, reading_id, planned.support)) {
      ++result.supports_added;
    } else {
      ++result.supports_deduplicated;
    }
  }

  tx->Commit();
  return result;
}

} // namespace apparatus::core
