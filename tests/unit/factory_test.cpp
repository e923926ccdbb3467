#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using apparatus::model::Significance;
using apparatus::pack::MemoryPackLoader;
using apparatus::pack::MemorySpineSource;
using apparatus::pack::PackRecord;
using apparatus::runtime::config::RuntimeConfig;

PackRecord Record(const std::string& pack_id, const std::string& verse_id, const std::string& text, const std::string& siglum) {
  PackRecord record;
  record.pack_id            = pack_id;
  record.verse_id           = verse_id;
  record.text               = text;
  record.witness.siglum     = siglum;
  record.witness.type_label = "edition";
  return record;
}

std::shared_ptr<MemoryPackLoader> MakePacks() {
  auto packs = std::make_shared<MemoryPackLoader>();
  packs->Add("wh", Record("wh", "John.1.18", "μονογενὴς υἱός", "WH"));
  return packs;
}

std::shared_ptr<MemorySpineSource> MakeSpine() {
  auto spine = std::make_shared<MemorySpineSource>();
  spine->Add("John.1.18", "μονογενὴς θεός");
  return spine;
}

void TestDefaultsToMemoryBackend() {
  RuntimeConfig config;
  auto          app = apparatus::factory::Build(config, MakePacks(), MakeSpine());

  assert(app.repository && app.store && app.engine && app.gate);
  assert(std::dynamic_pointer_cast<apparatus::db::memory::MemoryRepository>(app.repository));
  assert(app.gate->threshold() == Significance::kSignificant);

  auto result = app.engine->Build("John.1", {"wh"});
  assert(result.units_created == 1);
  assert(app.gate->Pending("John.1", "s1").size() == 1);
}

void TestGateThresholdFromConfig() {
  RuntimeConfig config;
  config.mutable_gate()->set_minimum_significance("major");
  config.mutable_aggregation()->set_worker_threads(3);
  auto app = apparatus::factory::Build(config, MakePacks(), MakeSpine());
  assert(app.gate->threshold() == Significance::kMajor);

  config.mutable_gate()->set_minimum_significance("urgent");
  bool threw = false;
  try {
    (void)apparatus::factory::Build(config, MakePacks(), MakeSpine());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingCollaboratorsAreRejected() {
  RuntimeConfig config;
  bool          threw = false;
  try {
    (void)apparatus::factory::Build(config, nullptr, MakeSpine());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestObservabilityFromConfig() {
  RuntimeConfig config;
  config.mutable_logging()->set_level("error");
  apparatus::factory::InitializeObservability(config);
  assert(spdlog::get("apparatus"));
  if (std::getenv("APPARATUS_LOG_LEVEL") == nullptr) {
    assert(spdlog::get("apparatus")->level() == spdlog::level::err);

    config.mutable_logging()->set_level("chatty");
    bool rejected = false;
    try {
      apparatus::factory::InitializeObservability(config);
    } catch (const std::invalid_argument&) {
      rejected = true;
    }
    assert(rejected);
  }
}

#if APPARATUS_DB_SQLITE
void RemoveSqliteFiles(const std::string& path) {
  for (const auto& file : {path, path + ".gate"}) {
    std::filesystem::remove(file);
    std::filesystem::remove(file + "-wal");
    std::filesystem::remove(file + "-shm");
  }
}

void TestSqliteBackendPersistsAcrossBuilds() {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto path  = (std::filesystem::temp_directory_path() / ("apparatus_factory_" + std::to_string(stamp) + ".db")).string();

  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(path);
  config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(2000);

  uint64_t unit_id = 0;
  {
    auto app    = apparatus::factory::Build(config, MakePacks(), MakeSpine());
    auto result = app.engine->Build("John.1", {"wh"});
    assert(result.units_created == 1);
    auto pending = app.gate->Pending("John.1", "s1");
    assert(pending.size() == 1);
    unit_id = pending[0].unit_id;
    app.gate->Acknowledge(pending[0], 1, "s1", "read");
  }
  {
    auto app    = apparatus::factory::Build(config, MakePacks(), MakeSpine());
    auto result = app.engine->Build("John.1", {"wh"});
    assert(result.units_created == 0 && result.supports_added == 0);
    assert(app.gate->Pending("John.1", "s1").empty());

    auto unit = app.store->GetUnitById(unit_id);
    assert(unit.has_value());
    assert(unit->readings.size() == 2);
    assert(app.store->CheckInvariants(apparatus::model::Scope::Parse("John")).empty());
  }

  RemoveSqliteFiles(path);

  RuntimeConfig missing_path;
  missing_path.mutable_database()->mutable_sqlite();
  bool threw = false;
  try {
    (void)apparatus::factory::BuildRepository(missing_path);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  RuntimeConfig in_memory;
  in_memory.mutable_database()->mutable_sqlite()->set_path(":memory:");
  threw = false;
  try {
    (void)apparatus::factory::BuildRepository(in_memory);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestSqliteAcknowledgeWhileBuildHeld() {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto path  = (std::filesystem::temp_directory_path() / ("apparatus_gate_" + std::to_string(stamp) + ".db")).string();

  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(path);
  config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(3000);
  {
    auto app = apparatus::factory::Build(config, MakePacks(), MakeSpine());
    assert(app.engine->Build("John.1", {"wh"}).units_created == 1);
    auto pending = app.gate->Pending("John.1", "s1");
    assert(pending.size() == 1);
    auto unit = app.store->GetUnitById(pending[0].unit_id);
    assert(unit.has_value());

    // the units file stays write-locked until this transaction ends
    auto build = app.store->Begin();
    app.store->ClaimUnit(*build, unit->id, unit->version);

    auto started      = std::chrono::steady_clock::now();
    auto acknowledged = std::async(std::launch::async, [&] { return app.gate->Acknowledge(pending[0], 1, "s1", "during build"); });
    assert(acknowledged.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    assert(acknowledged.get().reading_index == 1);
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    assert(app.gate->Pending("John.1", "s1").empty());

    build->Commit();
    assert(app.gate->Status(pending[0], "s1").has_value());
    assert(app.store->GetUnitById(unit->id)->version == unit->version + 1);
  }
  RemoveSqliteFiles(path);
}
#endif

} // namespace

int main() {
  TestDefaultsToMemoryBackend();
  TestGateThresholdFromConfig();
  TestMissingCollaboratorsAreRejected();
  TestObservabilityFromConfig();
#if APPARATUS_DB_SQLITE
  TestSqliteBackendPersistsAcrossBuilds();
  TestSqliteAcknowledgeWhileBuildHeld();
#endif

  std::cout << "apparatus_unit_factory: pass\n";
  return 0;
}
