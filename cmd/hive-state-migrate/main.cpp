#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using hivestate::runtime::config::RuntimeConfig;

static void Usage() {
  std::cout << "Usage: hive-state-migrate [options]\n"
            << "  --config <file.yaml>      runtime config (defaults: local Postgres + Redis)\n"
            << "  --legacy-db <path>        SQLite file to migrate (default hive_state.db)\n"
            << "  --pg-host <host>          --pg-port <port>   --pg-db <name>\n"
            << "  --pg-user <user>          --pg-password <password>\n"
            << "  --redis-host <host>       --redis-port <port> --redis-db <n>\n"
            << "  --batch-size <n>          rows per read (default 1000)\n"
            << "  --dry-run                 read and convert only, write nothing\n"
            << "  --fail-fast               stop at the first row error\n"
            << "\nExit status: 0 success, 1 migration failed, 2 fatal error\n";
}

static std::optional<uint32_t> ParseCount(const std::string& flag, const std::string& value) {
  char*         end    = nullptr;
  unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0' || parsed > UINT32_MAX) {
    std::cerr << "invalid value for " << flag << ": '" << value << "'\n";
    return std::nullopt;
  }
  return static_cast<uint32_t>(parsed);
}

// Flags override whatever the config file said.
static bool ApplyFlags(int argc, char** argv, std::string* config_path, RuntimeConfig* overrides) {
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];

    if (flag == "--dry-run") {
      overrides->mutable_migration()->set_dry_run(true);
      continue;
    }
    if (flag == "--fail-fast") {
      overrides->mutable_migration()->set_fail_fast(true);
      continue;
    }
    if (flag == "-h" || flag == "--help") {
      return false;
    }
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n";
      return false;
    }
    const std::string value = argv[++i];

    auto pg    = [&] { return overrides->mutable_persistent()->mutable_postgres(); };
    auto redis = [&] { return overrides->mutable_ephemeral()->mutable_redis(); };

    if (flag == "--config") {
      *config_path = value;
    } else if (flag == "--legacy-db") {
      overrides->mutable_migration()->set_legacy_db_path(value);
    } else if (flag == "--pg-host") {
      pg()->set_host(value);
    } else if (flag == "--pg-db") {
      pg()->set_database(value);
    } else if (flag == "--pg-user") {
      pg()->set_user(value);
    } else if (flag == "--pg-password") {
      pg()->set_password(value);
    } else if (flag == "--redis-host") {
      redis()->set_host(value);
    } else {
      auto n = ParseCount(flag, value);
      if (!n) {
        return false;
      }
      if (flag == "--pg-port") {
        pg()->set_port(*n);
      } else if (flag == "--redis-port") {
        redis()->set_port(*n);
      } else if (flag == "--redis-db") {
        redis()->set_db(*n);
      } else if (flag == "--batch-size") {
        overrides->mutable_migration()->set_batch_size(*n);
      } else {
        std::cerr << "unknown option " << flag << "\n";
        return false;
      }
    }
  }
  return true;
}

static RuntimeConfig ResolveConfig(const std::string& config_path, const RuntimeConfig& overrides) {
  RuntimeConfig config;
  if (!config_path.empty()) {
    config = hivestate::config::ConfigLoader::LoadFromYaml(config_path);
  }

  // Without a file the target is a local Postgres + Redis pair.
  if (config.persistent().backend_case() == hivestate::runtime::config::PersistentConfig::BACKEND_NOT_SET) {
    config.mutable_persistent()->mutable_postgres()->set_database("hive_state");
  }
  if (config.ephemeral().backend_case() == hivestate::runtime::config::EphemeralConfig::BACKEND_NOT_SET) {
    config.mutable_ephemeral()->mutable_redis();
  }

  hivestate::config::ApplyOverrides(&config, overrides);
  return config;
}

static void PrintReport(const hivestate::migration::MigrationReport& report, bool dry_run) {
  std::cout << "\nMigration " << (dry_run ? "dry run " : "") << (report.success ? "succeeded" : "FAILED") << "\n"
            << "  phase:              " << report.phase << "\n"
            << "  records:            " << report.total_records << "\n"
            << "  duration:           " << std::fixed << std::setprecision(2) << report.duration.count() << "s\n"
            << "  validation passed:  " << (report.validation_passed ? "yes" : "no") << "\n"
            << "  rollback available: " << (report.rollback_available ? "yes" : "no") << "\n";

  for (const auto& phase : report.phases) {
    std::cout << "  - " << std::left << std::setw(24) << phase.phase << (phase.success ? "ok  " : "FAIL") << "  records=" << phase.records_migrated
              << "  errors=" << phase.errors.size() << "  " << phase.duration.count() << "s\n";
  }

  constexpr std::size_t kShownErrors = 10;
  for (std::size_t i = 0; i < report.errors.size() && i < kShownErrors; ++i) {
    std::cout << "  error: " << report.errors[i] << "\n";
  }
  if (report.errors.size() > kShownErrors) {
    std::cout << "  ... " << (report.errors.size() - kShownErrors) << " more errors\n";
  }
}

int main(int argc, char** argv) {
  std::string   config_path;
  RuntimeConfig overrides;
  if (!ApplyFlags(argc, argv, &config_path, &overrides)) {
    Usage();
    return 2;
  }

  try {
    auto config = ResolveConfig(config_path, overrides);
    hivestate::observability::InitializeLogging(config);

    auto runtime  = hivestate::factory::Build(config);
    auto migrator = hivestate::factory::BuildMigrator(config, runtime);

    const auto report = migrator->Run();
    PrintReport(report, config.migration().dry_run());

    hivestate::observability::ShutdownLogging();
    return report.success ? 0 : 1;
  } catch (const std::exception& e) {
    HIVESTATE_LOG_ERROR("Fatal error", {hivestate::observability::StringField("error", e.what())});
    hivestate::observability::ShutdownLogging();
    return 2;
  }
}
