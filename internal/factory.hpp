#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/ephemeral/ephemeral_store.hpp"
#include "internal/migration/migrator.hpp"
#include "internal/orchestrator/hybrid_orchestrator.hpp"
#include "internal/persistent/persistent_store.hpp"
#include "internal/policy/distribution_policy.hpp"

namespace hivestate::factory {

/*
  Runtime

  Owns the long-lived pieces of the state layer. Everything here lives
  for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<persistent::PersistentStore>      persistent;
  std::shared_ptr<ephemeral::EphemeralStore>        ephemeral; // nullptr when not configured
  std::shared_ptr<const policy::DistributionPolicy> policy;
  std::shared_ptr<orchestrator::HybridOrchestrator> orchestrator;
};

/*
  Build

  Composition root: the ONLY place that knows concrete backend types.
  Schema bootstrap runs here, so a reachable but empty database is ready
  once Build returns.

  Throws std::runtime_error when the config selects a backend that was
  not compiled in, util::StoreError when a backend cannot be reached.
*/
Runtime Build(const hivestate::runtime::config::RuntimeConfig& config);

std::unique_ptr<migration::Migrator> BuildMigrator(const hivestate::runtime::config::RuntimeConfig& config, const Runtime& runtime);

} // namespace hivestate::factory
