#pragma once

#include <memory>

#include "internal/config/settings.hpp"
#include "internal/ephemeral/api/backend.hpp"

namespace sw::redis {
class Redis;
}

namespace hivestate::ephemeral::redis {

/*
  redis-plus-plus backend.

  One sw::redis::Redis instance owns a bounded connection pool; every call
  borrows a connection for its duration. redis++ errors are translated into
  util::StoreError (timeouts and closed connections as connectivity codes).
*/
class RedisBackend final : public Backend {
 public:
  explicit RedisBackend(const config::RedisSettings& settings);
  ~RedisBackend() override;

  void                       SetEx(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
  std::optional<std::string> Get(const std::string& key) override;
  bool                       Del(const std::string& key) override;
  bool                       Expire(const std::string& key, std::chrono::seconds ttl) override;
  int64_t                    IncrBy(const std::string& key, int64_t delta, std::chrono::seconds ttl) override;
  void SetExBatch(const std::vector<std::pair<std::string, std::string>>& entries, std::chrono::seconds ttl) override;

  std::string XAdd(const std::string& stream, const Fields& fields, std::size_t maxlen) override;
  bool        XGroupCreate(const std::string& stream, const std::string& group) override;
  std::vector<StreamEntry> XReadGroup(const std::string& stream, const std::string& group, const std::string& consumer,
                                      std::size_t count, std::chrono::milliseconds block) override;
  bool     XAck(const std::string& stream, const std::string& group, const std::string& id) override;
  uint64_t XLen(const std::string& stream) override;

  void     Ping() override;
  uint64_t UsedMemory() override;

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
};

} // namespace hivestate::ephemeral::redis
