#include "internal/core/aggregation_engine.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using apparatus::core::AggregationEngine;
using apparatus::core::BuildResult;
using apparatus::db::ErrorCode;
using apparatus::db::Repository;
using apparatus::db::Result;
using apparatus::db::Transaction;
using apparatus::db::memory::MemoryRepository;
using apparatus::model::CenturyRange;
using apparatus::model::Scope;
using apparatus::model::Significance;
using apparatus::model::WitnessType;
using apparatus::pack::MemoryPackLoader;
using apparatus::pack::MemorySpineSource;
using apparatus::pack::PackLoader;
using apparatus::pack::PackRecord;
using apparatus::store::VariantStore;

namespace model   = apparatus::model;
namespace util    = apparatus::util;
namespace records = apparatus::db::model;

PackRecord Record(const std::string& pack_id, const std::string& verse_id, const std::string& text, const std::string& siglum,
                  const std::string& type_label = "edition", std::optional<CenturyRange> century = std::nullopt) {
  PackRecord record;
  record.pack_id                = pack_id;
  record.verse_id               = verse_id;
  record.text                   = text;
  record.witness.siglum         = siglum;
  record.witness.type_label     = type_label;
  record.witness.century_range  = century;
  return record;
}

struct Fixture {
  std::shared_ptr<MemoryRepository>  repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<VariantStore>      store      = std::make_shared<VariantStore>(repository);
  std::shared_ptr<MemoryPackLoader>  packs      = std::make_shared<MemoryPackLoader>();
  std::shared_ptr<MemorySpineSource> spine      = std::make_shared<MemorySpineSource>();
  AggregationEngine                  engine;

  explicit Fixture(uint32_t workers = 1) : engine(store, packs, spine, AggregationEngine::Options{workers, 3}) {
  }

  void AddRecord(const PackRecord& record) {
    packs->Add(record.pack_id, record);
  }
};

// John 1:18 with the two readings most editions print.
void SeedJohn118(Fixture& f) {
  f.spine->Add("John.1.18", "θεὸν οὐδεὶς ἑώρακεν πώποτε· μονογενὴς θεός");
  f.AddRecord(Record("wh", "John.1.18", "θεὸν οὐδεὶς ἑώρακεν πώποτε· μονογενὴς υἱός", "WH"));
  f.AddRecord(Record("byz", "John.1.18", "θεὸν οὐδεὶς ἑώρακεν πώποτε ὁ μονογενὴς υἱός", "Byz", "byzantine"));
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestMergesIdenticalReadingsAcrossPacks() {
  Fixture f;
  f.spine->Add("John.1.18", "μονογενὴς θεός");
  f.AddRecord(Record("wh", "John.1.18", "μονογενὴς υἱός", "WH"));
  f.AddRecord(Record("byz", "John.1.18", "μονογενης υιος", "Byz", "byzantine"));

  auto result = f.engine.Build("John.1", {"wh", "byz"});
  assert(result.failures.empty());
  assert(result.units_created == 1);
  assert(result.units_updated == 0);
  assert(result.readings_added == 1);
  assert(result.supports_added == 2);
  assert(result.locations_processed == 1);

  auto unit = f.store->GetUnit("John.1.18", 0);
  assert(unit.has_value());
  assert(unit->readings.size() == 2);
  assert(unit->readings[0].is_spine);
  assert(unit->readings[0].surface_text == "μονογενὴς θεός");
  assert(unit->significance == Significance::kMajor);
  assert(unit->reason_code == "theological_term");

  const auto& alt = unit->readings[1];
  assert(alt.index == 1);
  assert(alt.surface_text == "μονογενὴς υἱός");
  assert(alt.significance == Significance::kMajor);
  assert(alt.supports.size() == 2);
  assert(alt.supports[0].witness_siglum == "WH" && alt.supports[0].source_pack_id == "wh");
  assert(alt.supports[0].witness_type == WitnessType::kEdition);
  assert(alt.supports[1].witness_siglum == "Byz" && alt.supports[1].source_pack_id == "byz");
  assert(alt.supports[1].witness_type == WitnessType::kTradition);
}

void TestRebuildIsIdempotent() {
  Fixture f;
  SeedJohn118(f);

  auto first = f.engine.Build("John", {"wh", "byz"});
  assert(first.units_created == 1);
  assert(first.readings_added == 2);
  assert(first.supports_added == 2);

  const auto before = f.store->GetUnit("John.1.18", 0);

  auto second = f.engine.Build("John", {"wh", "byz"});
  assert(second.units_created == 0);
  assert(second.units_updated == 0);
  assert(second.readings_added == 0);
  assert(second.supports_added == 0);
  assert(second.supports_deduplicated == 2);
  assert(second.failures.empty());
  assert(second.locations_processed == 1);

  const auto after = f.store->GetUnit("John.1.18", 0);
  assert(after->version == before->version);
  assert(after->readings.size() == before->readings.size());
  assert(f.store->CheckInvariants(Scope::Parse("John")).empty());
}

void TestRebuildAfterSpineChangeKeepsStoredSpine() {
  Fixture f;
  f.spine->Add("John.1.18", "μονογενὴς θεός");
  f.AddRecord(Record("wh", "John.1.18", "μονογενὴς υἱός", "WH"));
  assert(f.engine.Build("John.1.18", {"wh"}).units_created == 1);

  // The spine source now prints what used to be the variant, and a new
  // pack carries the old spine text.
  auto revised = std::make_shared<MemorySpineSource>();
  revised->Add("John.1.18", "μονογενὴς υἱός");
  f.AddRecord(Record("na", "John.1.18", "μονογενὴς θεός", "NA"));
  AggregationEngine rebuilt(f.store, f.packs, revised, AggregationEngine::Options{});

  auto result = rebuilt.Build("John.1.18", {"wh", "na"});
  assert(result.failures.empty());
  assert(result.agreements == 1);
  assert(result.supports_deduplicated == 1);
  assert(result.readings_added == 0 && result.units_updated == 0);

  auto unit = f.store->GetUnit("John.1.18", 0);
  assert(unit->readings.size() == 2);
  assert(unit->readings[0].surface_text == "μονογενὴς θεός");
  assert(unit->readings[1].surface_text == "μονογενὴς υἱός");
  assert(f.store->CheckInvariants(Scope::Parse("John")).empty());
}

void TestAccentOnlyDifferenceIsAgreement() {
  Fixture f;
  f.spine->Add("John.1.1", "Ἐν ἀρχῇ ἦν ὁ λόγος");
  f.AddRecord(Record("plain", "John.1.1", "εν αρχη ην ο λογος.", "P66", "papyrus"));

  auto result = f.engine.Build("John.1.1", {"plain"});
  assert(result.agreements == 1);
  assert(result.units_created == 0);
  assert(result.failures.empty());
  assert(f.store->CountUnits() == 0);
}

void TestSamePackSameWitnessCountsOnce() {
  Fixture f;
  f.spine->Add("John.1.18", "μονογενὴς θεός");
  f.AddRecord(Record("wh", "John.1.18", "μονογενὴς υἱός", "WH"));
  f.AddRecord(Record("wh", "John.1.18", "μονογενὴς υἱὸς", "WH"));

  auto result = f.engine.Build("John.1.18", {"wh"});
  assert(result.supports_added == 1);

  // Same pack processed twice in one build.
  auto again = f.engine.Build("John.1.18", {"wh", "wh"});
  assert(again.supports_added == 0);

  auto unit = f.store->GetUnit("John.1.18", 0);
  assert(unit->readings.size() == 2);
  assert(unit->readings[1].supports.size() == 1);
}

void TestConflictingSiglumAcrossPacksKeepsBoth() {
  Fixture f;
  f.spine->Add("John.1.18", "μονογενὴς θεός");
  f.AddRecord(Record("pack-a", "John.1.18", "μονογενὴς υἱός", "X", "uncial"));
  f.AddRecord(Record("pack-b", "John.1.18", "ὁ μονογενὴς θεός", "X", "uncial"));

  auto result = f.engine.Build("John.1", {"pack-a", "pack-b"});
  assert(result.failures.empty());
  assert(result.readings_added == 2);
  assert(result.supports_added == 2);

  auto unit = f.store->GetUnit("John.1.18", 0);
  assert(unit->readings.size() == 3);
  assert(unit->readings[1].supports.size() == 1);
  assert(unit->readings[1].supports[0].source_pack_id == "pack-a");
  assert(unit->readings[2].supports.size() == 1);
  assert(unit->readings[2].supports[0].source_pack_id == "pack-b");
  // the later, minor reading does not lower the unit
  assert(unit->readings[2].significance == Significance::kMinor);
  assert(unit->significance == Significance::kMajor);
}

void TestProvenanceFailuresSkipOnlyTheRecord() {
  Fixture f;
  f.spine->Add("John.1.18", "μονογενὴς θεός");
  f.AddRecord(Record("wh", "John.1.18", "μονογενὴς υἱός", "WH"));
  f.packs->Add("wh", Record("", "John.1.18", "ὁ μονογενὴς", "Anon"));
  f.packs->Add("wh", Record("byz", "John.1.18", "ὁ μονογενὴς υἱός", "Byz"));

  auto result = f.engine.Build("John.1", {"wh"});
  assert(result.supports_added == 1);
  assert(result.readings_added == 1);
  assert(result.failures.size() == 2);
  for (const auto& failure : result.failures) {
    assert(failure.kind == "provenance");
    assert(failure.pack_id == "wh");
    assert(failure.verse_id == "John.1.18");
  }

  auto unit = f.store->GetUnit("John.1.18", 0);
  assert(unit->readings.size() == 2);
}

class RawPackLoader final : public PackLoader {
 public:
  std::vector<PackRecord> Load(const std::string& pack_id, const std::string&, uint32_t chapter) override {
    if (pack_id != "raw" || chapter != 1) return {};
    return {Record("raw", "John.one.1", "λόγος", "L"), Record("raw", "John.1.2", "οὗτος ἦν ἐν ἀρχῇ πρὸς τὸν θεόν", "L")};
  }
};

void TestMalformedVerseIdIsIsolated() {
  auto repository = std::make_shared<MemoryRepository>();
  auto store      = std::make_shared<VariantStore>(repository);
  auto spine      = std::make_shared<MemorySpineSource>();
  spine->Add("John.1.2", "οὗτος ἦν ἐν ἀρχῇ πρὸς τὸν θεόν");
  AggregationEngine engine(store, std::make_shared<RawPackLoader>(), spine, AggregationEngine::Options{});

  auto result = engine.Build("John.1", {"raw"});
  assert(result.agreements == 1);
  assert(result.failures.size() == 1);
  assert(result.failures[0].verse_id == "John.one.1");
  assert(result.failures[0].kind == "input");
  assert(result.failures[0].pack_id == "raw");
  assert(result.locations_processed == 2);
}

void TestLocationFailuresDoNotAbortScope() {
  Fixture f;
  f.spine->Add("John.1.1", "Ἐν ἀρχῇ ἦν ὁ λόγος");
  f.spine->Add("John.1.3", "πάντα δι᾽ αὐτοῦ ἐγένετο");
  f.spine->Add("John.1.4", "ἐν αὐτῷ ζωὴ ἦν");

  // 1:1 has a witness without a siglum: the whole Location is refused.
  f.AddRecord(Record("p", "John.1.1", "Ἐν ἀρχῇ ἦν λόγος", "P75"));
  f.AddRecord(Record("p", "John.1.1", "Ἐν ἀρχῇ ἦν ὁ θεός", "  "));
  // 1:2 has no spine text.
  f.AddRecord(Record("p", "John.1.2", "οὗτος ἦν", "P75"));
  // 1:3 is clean.
  f.AddRecord(Record("p", "John.1.3", "πάντα δι᾽ αὐτοῦ ἐγένετο καὶ", "P75", "papyrus", CenturyRange{2, 3}));
  // 1:4 has an inverted century range.
  f.AddRecord(Record("p", "John.1.4", "ἐν αὐτῷ ζωὴ ἐστιν", "D", "uncial", CenturyRange{6, 5}));

  auto result = f.engine.Build("John.1", {"p"});
  assert(result.units_created == 1);
  assert(result.locations_processed == 4);
  assert(result.failures.size() == 3);
  assert(result.failures[0].verse_id == "John.1.1");
  assert(result.failures[1].verse_id == "John.1.2");
  assert(result.failures[1].pack_id.empty());
  assert(result.failures[2].verse_id == "John.1.4");
  for (const auto& failure : result.failures) {
    assert(failure.kind == "input");
  }

  assert(!f.store->GetUnit("John.1.1", 0).has_value());
  assert(!f.store->GetUnit("John.1.4", 0).has_value());
  auto clean = f.store->GetUnit("John.1.3", 0);
  assert(clean.has_value());
  assert(clean->readings[1].supports[0].century_range->earliest == 2);
}

// Every claim loses to a writer that never finishes.
class AlwaysConflictingRepository final : public Repository {
 public:
  std::unique_ptr<Transaction> Begin() override { return inner_.Begin(); }
  std::unique_ptr<Transaction> BeginSession() override { return inner_.BeginSession(); }

  Result InsertUnit(Transaction& tx, records::VariantUnitRecord& r) override { return inner_.InsertUnit(tx, r); }
  std::optional<records::VariantUnitRecord> GetUnit(Transaction& tx, const std::string& verse_id, uint32_t position) override {
    return inner_.GetUnit(tx, verse_id, position);
  }
  std::optional<records::VariantUnitRecord> GetUnitById(Transaction& tx, uint64_t unit_id) override { return inner_.GetUnitById(tx, unit_id); }
  std::vector<records::VariantUnitRecord> ListUnits(Transaction& tx, const records::UnitFilter& filter) override {
    return inner_.ListUnits(tx, filter);
  }
  Result ClaimUnit(Transaction&, uint64_t, uint64_t) override {
    ++claims;
    return Result::Err(ErrorCode::Conflict, "variant unit version moved");
  }
  Result UpdateUnitClassification(Transaction& tx, const records::VariantUnitRecord& r) override {
    return inner_.UpdateUnitClassification(tx, r);
  }
  Result DeleteUnit(Transaction& tx, uint64_t unit_id) override { return inner_.DeleteUnit(tx, unit_id); }

  Result InsertReading(Transaction& tx, records::ReadingRecord& r) override { return inner_.InsertReading(tx, r); }
  std::vector<records::ReadingRecord> ListReadings(Transaction& tx, uint64_t unit_id) override { return inner_.ListReadings(tx, unit_id); }

  bool HasSupport(Transaction& tx, uint64_t reading_id, const std::string& siglum, const std::string& pack_id) override {
    return inner_.HasSupport(tx, reading_id, siglum, pack_id);
  }
  Result InsertSupport(Transaction& tx, records::WitnessSupportRecord& r) override { return inner_.InsertSupport(tx, r); }
  std::vector<records::WitnessSupportRecord> ListSupports(Transaction& tx, uint64_t reading_id) override {
    return inner_.ListSupports(tx, reading_id);
  }

  Result UpsertAcknowledgement(Transaction& tx, const records::AcknowledgementRecord& r) override { return inner_.UpsertAcknowledgement(tx, r); }
  std::optional<records::AcknowledgementRecord> GetAcknowledgement(Transaction& tx, uint64_t unit_id, const std::string& session_id) override {
    return inner_.GetAcknowledgement(tx, unit_id, session_id);
  }
  std::vector<records::AcknowledgementRecord> ListAcknowledgements(Transaction& tx, const std::string& session_id) override {
    return inner_.ListAcknowledgements(tx, session_id);
  }

  std::atomic<int> claims{0};

 private:
  MemoryRepository inner_;
};

void TestPersistentConflictIsReportedAsFailure() {
  auto repository = std::make_shared<AlwaysConflictingRepository>();
  auto store      = std::make_shared<VariantStore>(repository);
  auto packs      = std::make_shared<MemoryPackLoader>();
  auto spine      = std::make_shared<MemorySpineSource>();
  spine->Add("John.1.18", "μονογενὴς θεός");
  spine->Add("John.1.19", "καὶ αὕτη ἐστὶν ἡ μαρτυρία");
  packs->Add("wh", Record("wh", "John.1.18", "μονογενὴς υἱός", "WH"));

  AggregationEngine engine(store, packs, spine, AggregationEngine::Options{1, 2});
  assert(engine.Build("John.1", {"wh"}).units_created == 1);
  assert(repository->claims == 0);

  // John.1.18 now needs a claim on its existing unit; John.1.19 is new.
  packs->Add("byz", Record("byz", "John.1.18", "ὁ μονογενὴς υἱός", "Byz", "byzantine"));
  packs->Add("byz", Record("byz", "John.1.19", "καὶ αὕτη ἐστὶν ἡ μαρτυρία τοῦ Ἰωάννου", "Byz", "byzantine"));

  auto result = engine.Build("John.1", {"byz"});
  assert(repository->claims == 3);
  assert(result.failures.size() == 1);
  assert(result.failures[0].verse_id == "John.1.18");
  assert(result.failures[0].position == 0);
  assert(result.failures[0].kind == "conflict");
  assert(result.failures[0].pack_id.empty());
  assert(result.units_created == 1);
  assert(result.units_updated == 0);
  assert(result.locations_processed == 2);

  auto unit = store->GetUnit("John.1.18", 0);
  assert(unit->readings.size() == 2);
  assert(store->GetUnit("John.1.19", 0).has_value());
}

void TestInvalidArgumentsAbortBeforeWriting() {
  Fixture f;
  SeedJohn118(f);

  assert(Throws<util::InputError>([&] { f.engine.Build("Genesis 1", {"wh"}); }));
  assert(Throws<util::InputError>([&] { f.engine.Build("", {"wh"}); }));
  assert(Throws<util::InputError>([&] { f.engine.Build("John.1", {}); }));
  assert(Throws<util::InputError>([&] { f.engine.Build("John.1", {"wh", ""}); }));
  assert(f.store->CountUnits() == 0);
}

void TestUnitClassificationOnlyRises() {
  Fixture f;
  f.spine->Add("John.1.1", "καὶ ὁ λόγος ἦν πρὸς τὸν θεόν");
  f.AddRecord(Record("pack-a", "John.1.1", "καὶ λόγος ἦν πρὸς τὸν θεόν", "A", "uncial"));
  f.AddRecord(Record("pack-b", "John.1.1", "καὶ ὁ λόγος ἦν πρὸς τὸν κύριον", "B", "uncial"));

  auto first = f.engine.Build("John.1.1", {"pack-a"});
  assert(first.units_created == 1);
  auto unit = f.store->GetUnit("John.1.1", 0);
  assert(unit->significance == Significance::kMinor);
  assert(unit->version == 1);

  auto second = f.engine.Build("John.1.1", {"pack-a", "pack-b"});
  assert(second.units_created == 0);
  assert(second.units_updated == 1);
  assert(second.readings_added == 1);
  assert(second.supports_added == 1);

  unit = f.store->GetUnit("John.1.1", 0);
  assert(unit->version == 2);
  assert(unit->significance == Significance::kMajor);
  assert(unit->readings.size() == 3);
  // existing readings keep the classification they were created with
  assert(unit->readings[1].significance == Significance::kMinor);
  assert(unit->readings[1].reason_code == "function_word");
  assert(unit->readings[2].significance == Significance::kMajor);
}

void TestBookScopeWalksEveryChapter() {
  Fixture f;
  f.spine->Add("John.1.18", "μονογενὴς θεός");
  f.spine->Add("John.3.16", "τὸν υἱὸν τὸν μονογενῆ ἔδωκεν");
  f.spine->Add("Mark.1.1", "Ἀρχὴ τοῦ εὐαγγελίου Ἰησοῦ Χριστοῦ υἱοῦ θεοῦ");
  f.AddRecord(Record("wh", "John.1.18", "μονογενὴς υἱός", "WH"));
  f.AddRecord(Record("wh", "John.3.16", "τὸν υἱὸν τὸν μονογενῆ ἔδωκεν αὐτοῦ", "WH"));
  f.AddRecord(Record("wh", "Mark.1.1", "Ἀρχὴ τοῦ εὐαγγελίου Ἰησοῦ Χριστοῦ", "WH"));

  auto result = f.engine.Build("Jn", {"wh"});
  assert(result.units_created == 2);
  assert(f.store->GetUnitsForScope(Scope::Parse("John")).size() == 2);
  assert(!f.store->GetUnit("Mark.1.1", 0).has_value());
}

void TestMultiplePositionsPerVerse() {
  Fixture f;
  f.spine->Add("John.1.18", "θεὸν οὐδεὶς ἑώρακεν πώποτε", 0);
  f.spine->Add("John.1.18", "μονογενὴς θεός", 1);

  auto first = Record("wh", "John.1.18", "θεὸν οὐδεὶς ἑώρακε πώποτε", "WH");
  auto second = Record("wh", "John.1.18", "μονογενὴς υἱός", "WH");
  second.position = 1;
  f.AddRecord(first);
  f.AddRecord(second);

  auto result = f.engine.Build("John.1.18", {"wh"});
  assert(result.units_created == 2);

  auto units = f.store->GetUnitsForScope(Scope::Parse("John.1.18"));
  assert(units.size() == 2);
  assert(units[0].position == 0);
  assert(units[0].significance == Significance::kMinor);
  assert(units[1].position == 1);
  assert(units[1].significance == Significance::kMajor);
}

using Snapshot = std::set<std::tuple<std::string, uint32_t, std::string, std::string, std::string>>;

Snapshot Flatten(VariantStore& store) {
  Snapshot out;
  for (const auto& unit : store.GetUnitsForScope(Scope::Parse("John"))) {
    for (const auto& reading : unit.readings) {
      if (reading.supports.empty()) {
        out.emplace(unit.verse_id, reading.index, reading.canonical_key, "", "");
      }
      for (const auto& support : reading.supports) {
        out.emplace(unit.verse_id, reading.index, reading.canonical_key, support.witness_siglum, support.source_pack_id);
      }
    }
  }
  return out;
}

void SeedChapter(Fixture& f) {
  for (int verse = 1; verse <= 24; ++verse) {
    const auto id = "John.1." + std::to_string(verse);
    f.spine->Add(id, "λόγος " + std::to_string(verse));
    f.AddRecord(Record("a", id, "ῥῆμα " + std::to_string(verse), "A"));
    f.AddRecord(Record("b", id, "ῥῆμα " + std::to_string(verse), "B"));
    f.AddRecord(Record("b", id, "λόγος " + std::to_string(verse) + " καὶ", "B2"));
  }
}

void TestWorkerPoolMatchesSequentialBuild() {
  Fixture sequential(1);
  Fixture parallel(4);
  SeedChapter(sequential);
  SeedChapter(parallel);

  auto a = sequential.engine.Build("John.1", {"a", "b"});
  auto b = parallel.engine.Build("John.1", {"a", "b"});
  assert(a.units_created == 24 && b.units_created == 24);
  assert(a.readings_added == b.readings_added);
  assert(a.supports_added == b.supports_added);
  assert(b.failures.empty());
  assert(Flatten(*sequential.store) == Flatten(*parallel.store));
  assert(parallel.store->CheckInvariants(Scope::Parse("John")).empty());
}

void TestConcurrentBuildsConverge() {
  Fixture f;
  SeedChapter(f);
  AggregationEngine other(f.store, f.packs, f.spine, AggregationEngine::Options{2, 3});

  BuildResult r1;
  BuildResult r2;
  std::thread t1([&] { r1 = f.engine.Build("John.1", {"a", "b"}); });
  std::thread t2([&] { r2 = other.Build("John.1", {"b", "a"}); });
  t1.join();
  t2.join();

  assert(r1.failures.empty());
  assert(r2.failures.empty());
  assert(r1.units_created + r2.units_created == 24);
  assert(r1.supports_added + r2.supports_added == 24 * 3);
  assert(f.store->CountUnits() == 24);
  assert(f.store->CheckInvariants(Scope::Parse("John.1")).empty());

  auto rebuilt = f.engine.Build("John.1", {"a", "b"});
  assert(rebuilt.supports_added == 0 && rebuilt.units_created == 0);
}

} // namespace

int main() {
  TestMergesIdenticalReadingsAcrossPacks();
  TestRebuildIsIdempotent();
  TestRebuildAfterSpineChangeKeepsStoredSpine();
  TestAccentOnlyDifferenceIsAgreement();
  TestSamePackSameWitnessCountsOnce();
  TestConflictingSiglumAcrossPacksKeepsBoth();
  TestProvenanceFailuresSkipOnlyTheRecord();
  TestMalformedVerseIdIsIsolated();
  TestLocationFailuresDoNotAbortScope();
  TestPersistentConflictIsReportedAsFailure();
  TestInvalidArgumentsAbortBeforeWriting();
  TestUnitClassificationOnlyRises();
  TestBookScopeWalksEveryChapter();
  TestMultiplePositionsPerVerse();
  TestWorkerPoolMatchesSequentialBuild();
  TestConcurrentBuildsConverge();

  std::cout << "apparatus_unit_aggregation_engine: pass\n";
  return 0;
}
