#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"

namespace hivestate::db::postgres {

using util::ErrorCode;
using util::StoreError;

StoreError TranslateError(const std::exception& e) {
  if (const auto* store = dynamic_cast<const StoreError*>(&e)) {
    return *store;
  }

  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const std::string state = sql->sqlstate();
    if (state == "40001" || state == "40P01") return {ErrorCode::SerializationFailure, e.what()};
    if (state == "23505") return {ErrorCode::AlreadyExists, e.what()};
    if (state.rfind("23", 0) == 0) return {ErrorCode::ConstraintViolation, e.what()};
    if (state == "57014") return {ErrorCode::Timeout, e.what()};
    if (state.rfind("08", 0) == 0 || state.rfind("57P", 0) == 0) return {ErrorCode::Unavailable, e.what()};
    if (state == "22P02" || state.rfind("22", 0) == 0) return {ErrorCode::InvalidArgument, e.what()};
    return {ErrorCode::InternalError, e.what()};
  }

  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return {ErrorCode::Unavailable, e.what()};
  }

  return {ErrorCode::InternalError, e.what()};
}

PgPool::PgPool(config::PostgresSettings settings) : settings_(std::move(settings)) {
  if (settings_.max_connections == 0) settings_.max_connections = 1;
}

void PgPool::Warm() {
  std::vector<std::shared_ptr<pqxx::connection>> warm;
  for (std::size_t i = 0; i < settings_.min_connections; ++i) {
    warm.push_back(Acquire());
  }
  HIVESTATE_LOG_INFO("postgres pool ready", {observability::IntField("connections", static_cast<int64_t>(warm.size())),
                                             observability::IntField("max_connections", static_cast<int64_t>(settings_.max_connections))});
}

std::unique_ptr<pqxx::connection> PgPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(settings_.conninfo);

  pqxx::nontransaction setup(*conn);
  setup.exec("SET statement_timeout = " + std::to_string(settings_.command_timeout.count()));
  setup.commit();

  PrepareStatements(*conn);
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const auto start    = SteadyClock::now();
  const auto deadline = start + settings_.acquire_timeout;

  std::unique_lock lock(mutex_);
  for (;;) {
    RecycleIdleLocked(SteadyClock::now());

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back().conn);
      idle_.pop_back();
      if (!conn->is_open()) {
        --live_connections_;
        continue;
      }
      last_acquire_ms_ = std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
      return Wrap(conn.release());
    }

    if (live_connections_ < settings_.max_connections) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = Open();
        lock.lock();
        last_acquire_ms_ = std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
        lock.unlock();
        return Wrap(conn.release());
      } catch (const std::exception& e) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw TranslateError(e);
      }
    }

    ++acquire_waits_;
    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < settings_.max_connections;
    });
    if (!ready) {
      ++acquire_timeouts_;
      throw StoreError(ErrorCode::Timeout, "postgres pool acquire timed out");
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) const {
  conn.prepare("get_agent",
               "SELECT agent_id,status,COALESCE(current_task_id,''),context_usage,"
               "(EXTRACT(EPOCH FROM last_activity)*1000)::bigint,capabilities::text,performance_metrics::text,"
               "(EXTRACT(EPOCH FROM created_at)*1000)::bigint,(EXTRACT(EPOCH FROM updated_at)*1000)::bigint "
               "FROM agents WHERE agent_id=$1");

  conn.prepare("assign_task",
               "UPDATE tasks SET agent_id=$2, status='assigned', started_at=to_timestamp($3::bigint/1000.0) "
               "WHERE task_id=$1 AND status='pending'");

  conn.prepare("pending_tasks",
               "SELECT task_id,status,COALESCE(agent_id,''),priority,"
               "(EXTRACT(EPOCH FROM created_at)*1000)::bigint,"
               "COALESCE((EXTRACT(EPOCH FROM started_at)*1000)::bigint,0),"
               "COALESCE((EXTRACT(EPOCH FROM completed_at)*1000)::bigint,0),"
               "metadata::text,COALESCE(result::text,''),created_seq "
               "FROM tasks WHERE status='pending' "
               "ORDER BY priority DESC, created_at ASC, created_seq ASC LIMIT $1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.push_back({std::unique_ptr<pqxx::connection>(conn), SteadyClock::now()});
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

void PgPool::RecycleIdleLocked(SteadyClock::time_point now) {
  // oldest idle entries sit at the front
  while (!idle_.empty() && live_connections_ > settings_.min_connections && now - idle_.front().since > settings_.max_idle) {
    idle_.erase(idle_.begin());
    --live_connections_;
  }
}

PoolStats PgPool::Stats() const {
  std::lock_guard lock(mutex_);
  PoolStats       stats;
  stats.size             = live_connections_;
  stats.idle             = idle_.size();
  stats.min_size         = settings_.min_connections;
  stats.max_size         = settings_.max_connections;
  stats.acquire_waits    = acquire_waits_;
  stats.acquire_timeouts = acquire_timeouts_;
  stats.last_acquire_ms  = last_acquire_ms_;
  return stats;
}

} // namespace hivestate::db::postgres
