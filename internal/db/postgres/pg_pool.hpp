#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace hivestate::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository.

  Design notes:
  -------------
  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe, do not share.
  - Prepared statements and statement_timeout are installed per connection.
  - Acquire() waits at most acquire_timeout, then throws StoreError(Timeout).
  - Broken connections are dropped on release; idle connections above
    min_connections are closed once older than max_idle.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(config::PostgresSettings settings);

  // Opens min_connections up front so a bad conninfo fails at startup.
  void Warm();

  // Acquire a ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

  PoolStats Stats() const;

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct IdleConnection {
    std::unique_ptr<pqxx::connection> conn;
    SteadyClock::time_point           since;
  };

  std::unique_ptr<pqxx::connection> Open();
  void                              PrepareStatements(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);
  void                              RecycleIdleLocked(SteadyClock::time_point now);

  config::PostgresSettings settings_;

  mutable std::mutex          mutex_;
  std::condition_variable     cv_;
  std::vector<IdleConnection> idle_;
  std::size_t                 live_connections_ = 0;
  uint64_t                    acquire_waits_    = 0;
  uint64_t                    acquire_timeouts_ = 0;
  double                      last_acquire_ms_  = 0.0;
};

// pqxx / libpq failure -> StoreError with a portable code (by SQLSTATE).
util::StoreError TranslateError(const std::exception& e);

} // namespace hivestate::db::postgres
