#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/aggregation_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/gate/gate_resolver.hpp"
#include "internal/pack/pack_source.hpp"
#include "internal/store/variant_store.hpp"

namespace apparatus::factory {

/*
  Application

  Owns every long-lived component. Everything here lives for the
  lifetime of the embedding process.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<store::VariantStore>     store;
  std::shared_ptr<core::AggregationEngine> engine;
  std::shared_ptr<gate::GateResolver>      gate;
};

/*
  Build

  Composition root: selects the persistence backend, bootstraps its
  schema and wires the store, engine and gate. It is the ONLY place
  allowed to know concrete DB types. Pack data and the spine come from
  the embedder.
*/
Application Build(const apparatus::runtime::config::RuntimeConfig& config, std::shared_ptr<pack::PackLoader> packs,
                  std::shared_ptr<pack::SpineSource> spine);

// Logging first, then tracing and metrics when the build has
// ENABLE_OTEL and the config turns them on. Throws on an unknown log level.
void InitializeObservability(const apparatus::runtime::config::RuntimeConfig& config);
void ShutdownObservability();

// Exposed for backend tests.
std::shared_ptr<db::Repository> BuildRepository(const apparatus::runtime::config::RuntimeConfig& config);

} // namespace apparatus::factory
