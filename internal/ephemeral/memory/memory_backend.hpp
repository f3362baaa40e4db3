#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/ephemeral/api/backend.hpp"

namespace hivestate::ephemeral::memory {

/*
  In-process backend with Redis-like semantics.

  Keys expire lazily against the injected clock. Stream ids are
  "<unix ms>-<seq>" and strictly increasing. Trimming is exact.
*/
class MemoryBackend final : public Backend {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  MemoryBackend();
  explicit MemoryBackend(Clock clock);

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

  // Unacknowledged deliveries for a group.
  std::size_t PendingCount(const std::string& stream, const std::string& group);

  // Makes every call throw Unavailable until cleared.
  void SetAvailable(bool available);

 private:
  using StreamId = std::pair<uint64_t, uint64_t>;

  struct Value {
    std::string                           data;
    std::chrono::steady_clock::time_point expires_at;
  };

  struct Group {
    StreamId                                     last_delivered{0, 0};
    std::map<StreamId, std::string>              pending; // id -> consumer
  };

  struct Stream {
    std::deque<std::pair<StreamId, Fields>> entries;
    std::map<std::string, Group>            groups;
    StreamId                                last_id{0, 0};
  };

  void   CheckAvailable() const;
  Value* Live(const std::string& key);

  static std::string FormatId(const StreamId& id);
  static bool        ParseId(const std::string& text, StreamId* id);

  Clock clock_;

  std::mutex                             mutex_;
  std::condition_variable                appended_;
  std::unordered_map<std::string, Value> values_;
  std::unordered_map<std::string, Stream> streams_;
  bool                                   available_ = true;
};

} // namespace hivestate::ephemeral::memory
