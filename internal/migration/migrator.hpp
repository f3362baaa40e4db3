#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/migration/legacy_database.hpp"
#include "internal/orchestrator/hybrid_orchestrator.hpp"

namespace hivestate::migration {

struct PhaseResult {
  std::string                   phase;
  bool                          success          = false;
  uint64_t                      records_migrated = 0;
  std::vector<std::string>      errors;
  std::chrono::duration<double> duration{0};
  bool                          validation_passed  = false;
  bool                          rollback_available = false;
};

struct MigrationReport {
  bool                          success = false;
  std::string                   phase; // "complete" or the phase that halted
  uint64_t                      total_records = 0;
  std::chrono::duration<double> duration{0};
  std::vector<std::string>      errors;
  bool                          validation_passed  = false;
  bool                          rollback_available = false;
  std::vector<PhaseResult>      phases;
};

/*
  Migrator

  Moves a legacy SQLite state file into the hybrid stores, in six strictly
  sequential phases:

    source_validation -> infrastructure_setup -> agent_migration ->
    task_migration -> system_data_migration -> validation

  The first two phases halt the run on failure. Row-level failures in the
  copy phases are collected and the copy continues, unless fail_fast is set.
  dry_run reads and converts everything and writes nothing.

  rollback_available is reported only; nothing is undone.
*/
class Migrator {
 public:
  // Agents with this id prefix are validation probes, not migrated data.
  static constexpr const char* kProbePrefix = "test_migration_";

  Migrator(config::MigrationSettings settings, std::shared_ptr<orchestrator::HybridOrchestrator> target);

  MigrationReport Run();

 private:
  PhaseResult ValidateSource();
  PhaseResult SetupInfrastructure();
  PhaseResult MigrateAgents();
  PhaseResult MigrateTasks();
  PhaseResult MigrateSystemData();
  PhaseResult Validate(uint64_t agents_migrated);

  config::MigrationSettings                         settings_;
  std::shared_ptr<orchestrator::HybridOrchestrator> target_;
  std::unique_ptr<LegacyDatabase>                   legacy_;
};

} // namespace hivestate::migration
