#include "internal/gate/gate_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/aggregation_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using apparatus::core::AggregationEngine;
using apparatus::db::memory::MemoryRepository;
using apparatus::gate::GateResolver;
using apparatus::model::Significance;
using apparatus::model::UnitRef;
using apparatus::pack::MemoryPackLoader;
using apparatus::pack::MemorySpineSource;
using apparatus::pack::PackRecord;
using apparatus::store::VariantStore;

namespace util = apparatus::util;

PackRecord Record(const std::string& pack_id, const std::string& verse_id, const std::string& text, const std::string& siglum) {
  PackRecord record;
  record.pack_id            = pack_id;
  record.verse_id           = verse_id;
  record.text               = text;
  record.witness.siglum     = siglum;
  record.witness.type_label = "edition";
  return record;
}

struct Fixture {
  std::shared_ptr<MemoryRepository>  repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<VariantStore>      store      = std::make_shared<VariantStore>(repository);
  std::shared_ptr<MemoryPackLoader>  packs      = std::make_shared<MemoryPackLoader>();
  std::shared_ptr<MemorySpineSource> spine      = std::make_shared<MemorySpineSource>();
  AggregationEngine                  engine{store, packs, spine, AggregationEngine::Options{}};
  GateResolver                       gate{store, GateResolver::Options{}};

  Fixture() {
    // 1:1 differs only by an article (minor); 1:18 differs in a listed term (major).
    spine->Add("John.1.1", "Ἐν ἀρχῇ ἦν ὁ λόγος");
    spine->Add("John.1.18", "μονογενὴς θεός");
    packs->Add("wh", Record("wh", "John.1.1", "Ἐν ἀρχῇ ἦν λόγος", "WH"));
    packs->Add("wh", Record("wh", "John.1.18", "μονογενὴς υἱός", "WH"));
    packs->Add("byz", Record("byz", "John.1.18", "μονογενὴς υἱός", "Byz"));
    packs->Add("tisch", Record("tisch", "John.1.18", "μονογενὴς υἱός", "Tisch"));
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestPendingListsEachUnitOnce() {
  Fixture f;
  auto    result = f.engine.Build("John.1", {"wh", "byz"});
  assert(result.units_created == 2);

  assert(f.gate.threshold() == Significance::kSignificant);
  auto pending = f.gate.Pending("John.1", "s1");
  assert(pending.size() == 1);
  assert(pending[0].verse_id == "John.1.18");
  assert(pending[0].position == 0);
  assert(pending[0].unit_id != 0);

  assert(f.gate.Pending("John 1:18", "s1").size() == 1);
  assert(f.gate.Pending("John.2", "s1").empty());
}

void TestAcknowledgementSurvivesRebuild() {
  Fixture f;
  f.engine.Build("John.1", {"wh", "byz"});
  auto pending = f.gate.Pending("John.1", "s1");
  assert(pending.size() == 1);

  auto ack = f.gate.Acknowledge(UnitRef{pending[0].unit_id, "", 0}, 1, "s1", "compared against the papyri");
  assert(ack.unit_id == pending[0].unit_id);
  assert(ack.reading_index == 1);
  assert(ack.acknowledged_at_ms > 0);

  assert(f.gate.Pending("John.1", "s1").empty());
  assert(f.gate.Pending("John.1", "s2").size() == 1);

  // A third pack corroborates the same reading.
  auto rebuild = f.engine.Build("John.1", {"wh", "byz", "tisch"});
  assert(rebuild.supports_added == 1);
  assert(rebuild.units_updated == 1);
  assert(rebuild.units_created == 0);

  assert(f.gate.Pending("John.1", "s1").empty());
  auto status = f.gate.Status(UnitRef{0, "John.1.18", 0}, "s1");
  assert(status.has_value());
  assert(status->reading_index == 1);
  assert(status->reason == "compared against the papyri");

  auto unit = f.store->GetUnit("John.1.18", 0);
  assert(unit->readings[1].supports.size() == 3);
}

void TestReacknowledgeOverwrites() {
  Fixture f;
  f.engine.Build("John.1", {"wh"});

  f.gate.Acknowledge(UnitRef{0, "John.1.18", 0}, 1, "s1", "first");
  f.gate.Acknowledge(UnitRef{0, "John.1.18", 0}, 0, "s1", "second");

  auto status = f.gate.Status(UnitRef{0, "John.1.18", 0}, "s1");
  assert(status->reading_index == 0);
  assert(status->reason == "second");
  assert(f.gate.SessionAcknowledgements("s1").size() == 1);
  assert(f.gate.SessionAcknowledgements("s2").empty());
  assert(!f.gate.Status(UnitRef{0, "John.1.18", 0}, "s2").has_value());
  assert(!f.gate.Status(UnitRef{0, "John.1.99", 0}, "s1").has_value());
}

void TestThresholdIsConfigurable() {
  Fixture      f;
  GateResolver strict(f.store, GateResolver::Options{Significance::kMinor});
  GateResolver lenient(f.store, GateResolver::Options{Significance::kMajor});
  f.engine.Build("John.1", {"wh"});

  auto all = strict.Pending("John.1", "s1");
  assert(all.size() == 2);
  assert(all[0].verse_id == "John.1.1");
  assert(all[1].verse_id == "John.1.18");

  assert(lenient.Pending("John.1", "s1").size() == 1);

  strict.Acknowledge(all[0], 0, "s1", "");
  assert(strict.Pending("John.1", "s1").size() == 1);
}

void TestInvalidRequestsWriteNothing() {
  Fixture f;
  f.engine.Build("John.1", {"wh"});
  auto unit = f.store->GetUnit("John.1.18", 0);

  assert(Throws<util::InputError>([&] { f.gate.Pending("John.1", ""); }));
  assert(Throws<util::InputError>([&] { f.gate.Pending("Nowhere 1", "s1"); }));
  assert(Throws<util::InputError>([&] { f.gate.Acknowledge(UnitRef{0, "John.1.18", 0}, 1, "", "x"); }));
  assert(Throws<util::InputError>([&] { f.gate.Acknowledge(UnitRef{0, "John.1.99", 0}, 0, "s1", "x"); }));
  assert(Throws<util::InputError>([&] { f.gate.Acknowledge(UnitRef{unit->id + 999, "", 0}, 0, "s1", "x"); }));
  assert(Throws<util::InputError>([&] { f.gate.Acknowledge(UnitRef{0, "John.1.18", 0}, 2, "s1", "x"); }));
  assert(Throws<util::InputError>([&] { f.gate.Acknowledge(UnitRef{unit->id, "John.1.1", 0}, 0, "s1", "x"); }));
  assert(Throws<util::InputError>([&] { f.gate.Acknowledge(UnitRef{}, 0, "s1", "x"); }));
  assert(Throws<util::InputError>([&] { f.gate.Status(UnitRef{unit->id, "", 0}, ""); }));
  assert(Throws<util::InputError>([&] { f.gate.SessionAcknowledgements(""); }));

  assert(f.gate.SessionAcknowledgements("s1").empty());
  assert(f.gate.Pending("John.1", "s1").size() == 1);
}

} // namespace

int main() {
  TestPendingListsEachUnitOnce();
  TestAcknowledgementSurvivesRebuild();
  TestReacknowledgeOverwrites();
  TestThresholdIsConfigurable();
  TestInvalidRequestsWriteNothing();

  std::cout << "apparatus_unit_gate_resolver: pass\n";
  return 0;
}
