#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hivestate::ephemeral {

// Flat stream body, field order preserved.
using Fields = std::vector<std::pair<std::string, std::string>>;

struct StreamEntry {
  std::string id;
  Fields      fields;
};

/*
  Key/value + stream backend abstraction.

  Mirrors the small Redis command subset the ephemeral store needs.
  Every method throws util::StoreError on failure; a missing key is never a
  failure.

  Redis:  redis-plus-plus over a bounded connection pool
  Memory: in-process maps, for tests and single-node setups
*/
class Backend {
 public:
  virtual ~Backend() = default;

  virtual void                       SetEx(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
  virtual std::optional<std::string> Get(const std::string& key)                                                     = 0;
  virtual bool                       Del(const std::string& key)                                                     = 0;
  // false if the key does not exist.
  virtual bool                       Expire(const std::string& key, std::chrono::seconds ttl)                        = 0;
  // INCRBY, then (re)arm the TTL.
  virtual int64_t                    IncrBy(const std::string& key, int64_t delta, std::chrono::seconds ttl)         = 0;
  // All entries in one round trip.
  virtual void SetExBatch(const std::vector<std::pair<std::string, std::string>>& entries, std::chrono::seconds ttl) = 0;

  // Appends and trims the stream to about maxlen entries. Returns the id.
  virtual std::string XAdd(const std::string& stream, const Fields& fields, std::size_t maxlen) = 0;
  // Group starts at id 0; creates the stream when missing.
  // false if the group already existed.
  virtual bool XGroupCreate(const std::string& stream, const std::string& group) = 0;
  // Entries never delivered to the group (">"), waiting up to block.
  virtual std::vector<StreamEntry> XReadGroup(const std::string& stream, const std::string& group, const std::string& consumer,
                                              std::size_t count, std::chrono::milliseconds block) = 0;
  virtual bool     XAck(const std::string& stream, const std::string& group, const std::string& id) = 0;
  virtual uint64_t XLen(const std::string& stream)                                                   = 0;

  virtual void     Ping()       = 0;
  virtual uint64_t UsedMemory() = 0;
};

} // namespace hivestate::ephemeral
