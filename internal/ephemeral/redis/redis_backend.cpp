#include "redis_backend.hpp"

#include <sw/redis++/redis++.h>

#include <iterator>
#include <sstream>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hivestate::ephemeral::redis {

using util::ErrorCode;
using util::StoreError;

namespace {

using Attrs      = std::vector<std::pair<std::string, std::string>>;
using Item       = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;

[[noreturn]] void Rethrow(const char* op) {
  try {
    throw;
  } catch (const sw::redis::TimeoutError& e) {
    throw StoreError(ErrorCode::Timeout, std::string(op) + ": " + e.what());
  } catch (const sw::redis::ClosedError& e) {
    throw StoreError(ErrorCode::Unavailable, std::string(op) + ": " + e.what());
  } catch (const sw::redis::IoError& e) {
    throw StoreError(ErrorCode::Unavailable, std::string(op) + ": " + e.what());
  } catch (const sw::redis::OomError& e) {
    throw StoreError(ErrorCode::Busy, std::string(op) + ": " + e.what());
  } catch (const sw::redis::ReplyError& e) {
    throw StoreError(ErrorCode::InvalidArgument, std::string(op) + ": " + e.what());
  } catch (const sw::redis::Error& e) {
    throw StoreError(ErrorCode::InternalError, std::string(op) + ": " + e.what());
  }
}

} // namespace

RedisBackend::RedisBackend(const config::RedisSettings& settings) {
  sw::redis::ConnectionOptions opts;
  opts.host            = settings.host;
  opts.port            = settings.port;
  opts.db              = settings.db;
  opts.password        = settings.password;
  opts.connect_timeout = settings.connect_timeout;
  opts.socket_timeout  = settings.socket_timeout;

  sw::redis::ConnectionPoolOptions pool_opts;
  pool_opts.size                = settings.pool_size;
  pool_opts.wait_timeout        = settings.pool_wait_timeout;
  pool_opts.connection_lifetime = settings.connection_lifetime;

  redis_ = std::make_unique<sw::redis::Redis>(opts, pool_opts);

  HIVESTATE_LOG_INFO("Redis backend configured", {observability::StringField("host", settings.host), observability::IntField("port", settings.port),
                                                  observability::IntField("db", settings.db),
                                                  observability::IntField("pool_size", static_cast<int64_t>(settings.pool_size))});
}

RedisBackend::~RedisBackend() = default;

// ------------------------------------------------------------------
// Keys
// ------------------------------------------------------------------

void RedisBackend::SetEx(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
  try {
    redis_->set(key, value, ttl);
  } catch (const sw::redis::Error&) {
    Rethrow("SET");
  }
}

std::optional<std::string> RedisBackend::Get(const std::string& key) {
  try {
    auto value = redis_->get(key);
    if (!value) {
      return std::nullopt;
    }
    return *value;
  } catch (const sw::redis::Error&) {
    Rethrow("GET");
  }
}

bool RedisBackend::Del(const std::string& key) {
  try {
    return redis_->del(key) > 0;
  } catch (const sw::redis::Error&) {
    Rethrow("DEL");
  }
}

bool RedisBackend::Expire(const std::string& key, std::chrono::seconds ttl) {
  try {
    return redis_->expire(key, ttl);
  } catch (const sw::redis::Error&) {
    Rethrow("EXPIRE");
  }
}

int64_t RedisBackend::IncrBy(const std::string& key, int64_t delta, std::chrono::seconds ttl) {
  try {
    auto pipe    = redis_->pipeline(false);
    auto replies = pipe.incrby(key, delta).expire(key, ttl).exec();
    return replies.get<long long>(0);
  } catch (const sw::redis::Error&) {
    Rethrow("INCRBY");
  }
}

void RedisBackend::SetExBatch(const std::vector<std::pair<std::string, std::string>>& entries, std::chrono::seconds ttl) {
  if (entries.empty()) {
    return;
  }
  try {
    auto pipe = redis_->pipeline(false);
    for (const auto& [key, value] : entries) {
      pipe.set(key, value, ttl);
    }
    pipe.exec();
  } catch (const sw::redis::Error&) {
    Rethrow("SET pipeline");
  }
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

std::string RedisBackend::XAdd(const std::string& stream, const Fields& fields, std::size_t maxlen) {
  try {
    if (maxlen == 0) {
      return redis_->xadd(stream, "*", fields.begin(), fields.end());
    }
    return redis_->xadd(stream, "*", fields.begin(), fields.end(), static_cast<long long>(maxlen), true);
  } catch (const sw::redis::Error&) {
    Rethrow("XADD");
  }
}

bool RedisBackend::XGroupCreate(const std::string& stream, const std::string& group) {
  try {
    redis_->xgroup_create(stream, group, "0", true);
    return true;
  } catch (const sw::redis::ReplyError& e) {
    if (std::string(e.what()).rfind("BUSYGROUP", 0) == 0) {
      return false;
    }
    Rethrow("XGROUP CREATE");
  } catch (const sw::redis::Error&) {
    Rethrow("XGROUP CREATE");
  }
}

std::vector<StreamEntry> RedisBackend::XReadGroup(const std::string& stream, const std::string& group, const std::string& consumer,
                                                  std::size_t count, std::chrono::milliseconds block) {
  std::unordered_map<std::string, ItemStream> result;
  try {
    if (block.count() > 0) {
      redis_->xreadgroup(group, consumer, stream, ">", block, static_cast<long long>(count), std::inserter(result, result.end()));
    } else {
      redis_->xreadgroup(group, consumer, stream, ">", static_cast<long long>(count), std::inserter(result, result.end()));
    }
  } catch (const sw::redis::ReplyError& e) {
    if (std::string(e.what()).rfind("NOGROUP", 0) == 0) {
      throw StoreError(ErrorCode::NotFound, std::string("XREADGROUP: ") + e.what());
    }
    Rethrow("XREADGROUP");
  } catch (const sw::redis::Error&) {
    Rethrow("XREADGROUP");
  }

  std::vector<StreamEntry> out;
  auto                     it = result.find(stream);
  if (it == result.end()) {
    return out;
  }
  for (auto& [id, attrs] : it->second) {
    // Entries trimmed after delivery come back without a body.
    if (!attrs) {
      continue;
    }
    out.push_back(StreamEntry{id, std::move(*attrs)});
  }
  return out;
}

bool RedisBackend::XAck(const std::string& stream, const std::string& group, const std::string& id) {
  try {
    return redis_->xack(stream, group, id) > 0;
  } catch (const sw::redis::Error&) {
    Rethrow("XACK");
  }
}

uint64_t RedisBackend::XLen(const std::string& stream) {
  try {
    return static_cast<uint64_t>(redis_->xlen(stream));
  } catch (const sw::redis::Error&) {
    Rethrow("XLEN");
  }
}

// ------------------------------------------------------------------
// Health
// ------------------------------------------------------------------

void RedisBackend::Ping() {
  try {
    redis_->ping();
  } catch (const sw::redis::Error&) {
    Rethrow("PING");
  }
}

uint64_t RedisBackend::UsedMemory() {
  std::string info;
  try {
    info = redis_->info("memory");
  } catch (const sw::redis::Error&) {
    Rethrow("INFO");
  }

  std::istringstream in(info);
  std::string        line;
  while (std::getline(in, line)) {
    if (line.rfind("used_memory:", 0) == 0) {
      return std::stoull(line.substr(12));
    }
  }
  return 0;
}

} // namespace hivestate::ephemeral::redis
