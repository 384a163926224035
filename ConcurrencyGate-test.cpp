#include "ConcurrencyGate.hpp"

#include "SQLite.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
void basic(CounterStore& store)
{
  ConcurrencyGate gate(store, 120s);

  auto const key = ConcurrencyGate::mx_key("mx.example.com");
  CHECK_EQ(key, "sem:mx:mx.example.com");

  CHECK(gate.acquire(key, 2));
  CHECK(gate.acquire(key, 2));
  CHECK(!gate.acquire(key, 2));
  CHECK_EQ(*store.get(key), 2);

  gate.release(key);
  CHECK_EQ(*store.get(key), 1);
  gate.release(key);
  CHECK(!store.get(key)); // removed at zero

  // Never goes negative.
  gate.release(key);
  gate.release(key);
  CHECK(!store.get(key));
  CHECK(gate.acquire(key, 1));
  CHECK(!gate.acquire(key, 1));
  gate.release(key);

  // Leases release in reverse order on scope exit.
  {
    auto global = gate.try_lease(ConcurrencyGate::global_key(), 1);
    CHECK(global);
    auto mx = gate.try_lease(key, 1);
    CHECK(mx);
    CHECK(!gate.try_lease(key, 1));
    CHECK_EQ(*store.get(ConcurrencyGate::global_key()), 1);
  }
  CHECK(!store.get(ConcurrencyGate::global_key()));
  CHECK(!store.get(key));

  // A moved lease is released once.
  {
    auto a = gate.try_lease(key, 1);
    auto b = std::move(a);
    CHECK(!a);
    CHECK(b);
    CHECK_EQ(*store.get(key), 1);
  }
  CHECK(!store.get(key));

  // Rate windows are per second.
  auto const rps = ConcurrencyGate::mx_rps_key("mx.example.com");
  CHECK(gate.consume_rps(rps, 2, 1000));
  CHECK(gate.consume_rps(rps, 2, 1000));
  CHECK(!gate.consume_rps(rps, 2, 1000));
  CHECK(gate.consume_rps(rps, 2, 1001));
  CHECK_EQ(*store.get("rps:mx:mx.example.com:1000"), 3);
}

void lease_expiry()
{
  std::time_t now = 1000;

  MemoryCounterStore store([&now] { return now; });
  ConcurrencyGate    gate(store, 120s);

  // A holder that dies keeps its lease only until the TTL.
  CHECK(gate.acquire("sem:global", 1));
  CHECK(!gate.acquire("sem:global", 1));
  now += 119;
  CHECK(!gate.acquire("sem:global", 1));
  now += 1;
  CHECK(gate.acquire("sem:global", 1));

  // The rate window TTL is set by the first increment only.
  CHECK_EQ(store.increment("w", 2s), 1);
  now += 1;
  CHECK_EQ(store.increment("w", 2s), 2);
  now += 1;
  CHECK(!store.get("w"));
}

void never_more_than_k(CounterStore& store, int threads)
{
  ConcurrencyGate gate(store, 120s);

  constexpr int limit = 3;

  std::atomic<int> holders{0};
  std::atomic<int> max_holders{0};
  std::atomic<int> admitted{0};

  auto worker = [&] {
    for (auto i = 0; i < 200; ++i) {
      if (auto lease = gate.try_lease("sem:global", limit); lease) {
        auto const h = ++holders;
        auto       m = max_holders.load();
        while (h > m && !max_holders.compare_exchange_weak(m, h))
          ;
        ++admitted;
        std::this_thread::yield();
        --holders;
      }
    }
  };

  std::vector<std::thread> pool;
  for (auto t = 0; t < threads; ++t)
    pool.emplace_back(worker);
  for (auto& t : pool)
    t.join();

  LOG(INFO) << admitted.load() << " admissions, at most " << max_holders.load()
            << " at once";
  CHECK_LE(max_holders.load(), limit);
  CHECK_GT(admitted.load(), 0);
  CHECK(!store.get("sem:global"));
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  MemoryCounterStore mem;
  basic(mem);

  SQLite::DB         db(":memory:");
  SQLiteCounterStore sql(db);
  basic(sql);

  lease_expiry();

  MemoryCounterStore shared;
  never_more_than_k(shared, 16);
}
