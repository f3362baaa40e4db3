#include "internal/ephemeral/memory/memory_backend.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using hivestate::ephemeral::Fields;
using hivestate::ephemeral::memory::MemoryBackend;
using hivestate::util::ErrorCode;
using hivestate::util::StoreError;
using namespace std::chrono_literals;

struct FakeClock {
  std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();

  MemoryBackend::Clock Fn() {
    return [this] { return now; };
  }
};

void TestTtlExpiry() {
  FakeClock     clock;
  MemoryBackend backend(clock.Fn());

  backend.SetEx("k", "v", 10s);
  assert(backend.Get("k") == "v");

  clock.now += 9s;
  assert(backend.Get("k").has_value());

  // Extending re-arms from the current time.
  assert(backend.Expire("k", 10s));
  clock.now += 9s;
  assert(backend.Get("k").has_value());

  clock.now += 2s;
  assert(!backend.Get("k").has_value());
  assert(!backend.Expire("k", 10s));
  assert(!backend.Del("k"));
}

void TestIncrByRearmsTtl() {
  FakeClock     clock;
  MemoryBackend backend(clock.Fn());

  assert(backend.IncrBy("c", 1, 5s) == 1);
  assert(backend.IncrBy("c", 4, 5s) == 5);
  assert(backend.IncrBy("c", -2, 5s) == 3);

  clock.now += 6s;
  assert(backend.IncrBy("c", 1, 5s) == 1);

  backend.SetEx("text", "abc", 5s);
  bool threw = false;
  try {
    backend.IncrBy("text", 1, 5s);
  } catch (const StoreError& e) {
    threw = e.Code() == ErrorCode::InvalidArgument;
  }
  assert(threw);
}

void TestStreamGroupsDeliverOnce() {
  MemoryBackend backend;

  backend.XAdd("s", Fields{{"n", "0"}}, 0);
  assert(backend.XGroupCreate("s", "g"));
  assert(!backend.XGroupCreate("s", "g"));

  const auto id1 = backend.XAdd("s", Fields{{"n", "1"}}, 0);
  const auto id2 = backend.XAdd("s", Fields{{"n", "2"}}, 0);
  assert(id1 != id2);

  // Groups start at 0, so the entry added before the group is delivered too.
  auto first = backend.XReadGroup("s", "g", "c1", 2, 0ms);
  assert(first.size() == 2);
  assert(first[0].fields[0].second == "0");
  assert(first[1].id == id1);

  auto second = backend.XReadGroup("s", "g", "c2", 10, 0ms);
  assert(second.size() == 1);
  assert(second[0].id == id2);

  assert(backend.XReadGroup("s", "g", "c1", 10, 0ms).empty());
  assert(backend.PendingCount("s", "g") == 3);

  assert(backend.XAck("s", "g", id1));
  assert(!backend.XAck("s", "g", id1));
  assert(backend.PendingCount("s", "g") == 2);

  // A second group sees the whole stream independently.
  assert(backend.XGroupCreate("s", "other"));
  assert(backend.XReadGroup("s", "other", "c", 10, 0ms).size() == 3);
}

void TestUnknownGroupIsNotFound() {
  MemoryBackend backend;
  backend.XAdd("s", Fields{{"a", "b"}}, 0);

  bool threw = false;
  try {
    backend.XReadGroup("s", "missing", "c", 1, 0ms);
  } catch (const StoreError& e) {
    threw = e.Code() == ErrorCode::NotFound;
  }
  assert(threw);
}

void TestMaxlenTrims() {
  MemoryBackend backend;
  for (int i = 0; i < 10; ++i) {
    backend.XAdd("s", Fields{{"i", std::to_string(i)}}, 4);
  }
  assert(backend.XLen("s") == 4);
  assert(backend.XLen("unknown") == 0);
}

void TestBlockingReadWakesOnAppend() {
  MemoryBackend backend;
  assert(backend.XGroupCreate("s", "g"));

  std::thread producer([&] {
    std::this_thread::sleep_for(50ms);
    backend.XAdd("s", Fields{{"late", "1"}}, 0);
  });

  auto entries = backend.XReadGroup("s", "g", "c", 1, 5000ms);
  producer.join();
  assert(entries.size() == 1);
  assert(entries[0].fields[0].first == "late");
}

void TestUnavailableThrows() {
  MemoryBackend backend;
  backend.SetAvailable(false);

  bool threw = false;
  try {
    backend.Ping();
  } catch (const StoreError& e) {
    threw = e.Code() == ErrorCode::Unavailable;
  }
  assert(threw);

  backend.SetAvailable(true);
  backend.Ping();
}

} // namespace

int main() {
  TestTtlExpiry();
  TestIncrByRearmsTtl();
  TestStreamGroupsDeliverOnce();
  TestUnknownGroupIsNotFound();
  TestMaxlenTrims();
  TestBlockingReadWakesOnAppend();
  TestUnavailableThrows();

  std::cout << "hivestate_unit_memory_backend: pass\n";
  return 0;
}
