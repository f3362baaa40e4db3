#include "memory_backend.hpp"

#include <charconv>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace hivestate::ephemeral::memory {

using util::ErrorCode;
using util::StoreError;

MemoryBackend::MemoryBackend() : MemoryBackend([] { return std::chrono::steady_clock::now(); }) {
}

MemoryBackend::MemoryBackend(Clock clock) : clock_(std::move(clock)) {
}

void MemoryBackend::CheckAvailable() const {
  if (!available_) {
    throw StoreError(ErrorCode::Unavailable, "memory backend marked unavailable");
  }
}

void MemoryBackend::SetAvailable(bool available) {
  std::lock_guard lock(mutex_);
  available_ = available;
}

MemoryBackend::Value* MemoryBackend::Live(const std::string& key) {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return nullptr;
  }
  if (clock_() >= it->second.expires_at) {
    values_.erase(it);
    return nullptr;
  }
  return &it->second;
}

// ------------------------------------------------------------------
// Keys
// ------------------------------------------------------------------

void MemoryBackend::SetEx(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
  std::lock_guard lock(mutex_);
  CheckAvailable();
  values_[key] = Value{value, clock_() + ttl};
}

std::optional<std::string> MemoryBackend::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  CheckAvailable();
  auto* value = Live(key);
  if (!value) {
    return std::nullopt;
  }
  return value->data;
}

bool MemoryBackend::Del(const std::string& key) {
  std::lock_guard lock(mutex_);
  CheckAvailable();
  if (!Live(key)) {
    return false;
  }
  values_.erase(key);
  return true;
}

bool MemoryBackend::Expire(const std::string& key, std::chrono::seconds ttl) {
  std::lock_guard lock(mutex_);
  CheckAvailable();
  auto* value = Live(key);
  if (!value) {
    return false;
  }
  value->expires_at = clock_() + ttl;
  return true;
}

int64_t MemoryBackend::IncrBy(const std::string& key, int64_t delta, std::chrono::seconds ttl) {
  std::lock_guard lock(mutex_);
  CheckAvailable();

  int64_t current = 0;
  if (auto* value = Live(key)) {
    const auto& text   = value->data;
    auto [ptr, ec]     = std::from_chars(text.data(), text.data() + text.size(), current);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
      throw StoreError(ErrorCode::InvalidArgument, "value is not an integer: " + key);
    }
  }
  current += delta;
  values_[key] = Value{std::to_string(current), clock_() + ttl};
  return current;
}

void MemoryBackend::SetExBatch(const std::vector<std::pair<std::string, std::string>>& entries, std::chrono::seconds ttl) {
  std::lock_guard lock(mutex_);
  CheckAvailable();
  const auto expires_at = clock_() + ttl;
  for (const auto& [key, value] : entries) {
    values_[key] = Value{value, expires_at};
  }
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

std::string MemoryBackend::FormatId(const StreamId& id) {
  return std::to_string(id.first) + "-" + std::to_string(id.second);
}

bool MemoryBackend::ParseId(const std::string& text, StreamId* id) {
  const auto dash = text.find('-');
  if (dash == std::string::npos) {
    return false;
  }
  const char* begin = text.data();
  const char* end   = text.data() + text.size();
  auto        first = std::from_chars(begin, begin + dash, id->first);
  auto        last  = std::from_chars(begin + dash + 1, end, id->second);
  return first.ec == std::errc() && last.ec == std::errc() && last.ptr == end;
}

std::string MemoryBackend::XAdd(const std::string& stream, const Fields& fields, std::size_t maxlen) {
  std::string id;
  {
    std::lock_guard lock(mutex_);
    CheckAvailable();

    auto&          s   = streams_[stream];
    const uint64_t now = util::NowMillis();
    StreamId       next{now, 0};
    if (next <= s.last_id) {
      next = {s.last_id.first, s.last_id.second + 1};
    }
    s.last_id = next;
    s.entries.emplace_back(next, fields);
    while (maxlen > 0 && s.entries.size() > maxlen) {
      s.entries.pop_front();
    }
    id = FormatId(next);
  }
  appended_.notify_all();
  return id;
}

bool MemoryBackend::XGroupCreate(const std::string& stream, const std::string& group) {
  std::lock_guard lock(mutex_);
  CheckAvailable();
  auto& s = streams_[stream];
  if (s.groups.count(group) > 0) {
    return false;
  }
  // Starts at "0": entries already in the stream are delivered too.
  s.groups[group];
  return true;
}

std::vector<StreamEntry> MemoryBackend::XReadGroup(const std::string& stream, const std::string& group, const std::string& consumer,
                                                   std::size_t count, std::chrono::milliseconds block) {
  std::unique_lock lock(mutex_);
  CheckAvailable();

  auto stream_it = streams_.find(stream);
  if (stream_it == streams_.end() || stream_it->second.groups.count(group) == 0) {
    throw StoreError(ErrorCode::NotFound, "NOGROUP no such stream or consumer group: " + stream + "/" + group);
  }

  auto has_new = [&] {
    auto& s = streams_[stream];
    return !s.entries.empty() && s.entries.back().first > s.groups[group].last_delivered;
  };
  if (!has_new() && block.count() > 0) {
    appended_.wait_for(lock, block, has_new);
  }
  CheckAvailable();

  auto&                    s = streams_[stream];
  auto&                    g = s.groups[group];
  std::vector<StreamEntry> out;
  for (const auto& [id, fields] : s.entries) {
    if (count > 0 && out.size() >= count) {
      break;
    }
    if (id <= g.last_delivered) {
      continue;
    }
    g.last_delivered = id;
    g.pending[id]    = consumer;
    out.push_back(StreamEntry{FormatId(id), fields});
  }
  return out;
}

bool MemoryBackend::XAck(const std::string& stream, const std::string& group, const std::string& id) {
  std::lock_guard lock(mutex_);
  CheckAvailable();

  StreamId parsed;
  if (!ParseId(id, &parsed)) {
    throw StoreError(ErrorCode::InvalidArgument, "invalid stream id: " + id);
  }
  auto stream_it = streams_.find(stream);
  if (stream_it == streams_.end()) {
    return false;
  }
  auto group_it = stream_it->second.groups.find(group);
  if (group_it == stream_it->second.groups.end()) {
    return false;
  }
  return group_it->second.pending.erase(parsed) > 0;
}

uint64_t MemoryBackend::XLen(const std::string& stream) {
  std::lock_guard lock(mutex_);
  CheckAvailable();
  auto it = streams_.find(stream);
  return it == streams_.end() ? 0 : it->second.entries.size();
}

std::size_t MemoryBackend::PendingCount(const std::string& stream, const std::string& group) {
  std::lock_guard lock(mutex_);
  auto            stream_it = streams_.find(stream);
  if (stream_it == streams_.end()) {
    return 0;
  }
  auto group_it = stream_it->second.groups.find(group);
  return group_it == stream_it->second.groups.end() ? 0 : group_it->second.pending.size();
}

// ------------------------------------------------------------------
// Health
// ------------------------------------------------------------------

void MemoryBackend::Ping() {
  std::lock_guard lock(mutex_);
  CheckAvailable();
}

uint64_t MemoryBackend::UsedMemory() {
  std::lock_guard lock(mutex_);
  CheckAvailable();

  uint64_t bytes = 0;
  for (const auto& [key, value] : values_) {
    bytes += key.size() + value.data.size();
  }
  for (const auto& [name, stream] : streams_) {
    bytes += name.size();
    for (const auto& [id, fields] : stream.entries) {
      for (const auto& [field, value] : fields) {
        bytes += field.size() + value.size();
      }
    }
  }
  return bytes;
}

} // namespace hivestate::ephemeral::memory
