#ifndef COUNTERSTORE_DOT_HPP
#define COUNTERSTORE_DOT_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace SQLite {
class DB;
}

// Atomic integer counters with an optional expiry.  An expired key
// reads as absent.

class CounterStore {
public:
  using Clock = std::function<std::time_t()>;

  virtual ~CounterStore() = default;

  // Increment iff the current value is below limit.  Refreshes the TTL.
  virtual bool
  try_acquire(std::string const& key, int64_t limit, std::chrono::seconds ttl)
      = 0;

  // Floors at zero, deletes the key at zero.
  virtual void decrement(std::string const& key, std::chrono::seconds ttl) = 0;

  // Returns the new value.  The TTL is only set by the first increment.
  virtual int64_t increment(std::string const& key, std::chrono::seconds ttl)
      = 0;

  virtual std::optional<int64_t> get(std::string const& key) = 0;
  virtual void
  put(std::string const& key, int64_t value, std::chrono::seconds ttl)
      = 0;
  virtual void erase(std::string const& key) = 0;
};

class MemoryCounterStore : public CounterStore {
public:
  explicit MemoryCounterStore(Clock clock = [] { return std::time(nullptr); })
    : clock_(std::move(clock))
  {
  }

  bool try_acquire(std::string const&   key,
                   int64_t              limit,
                   std::chrono::seconds ttl) override;
  void decrement(std::string const& key, std::chrono::seconds ttl) override;
  int64_t increment(std::string const& key, std::chrono::seconds ttl) override;
  std::optional<int64_t> get(std::string const& key) override;
  void                   put(std::string const&   key,
                             int64_t              value,
                             std::chrono::seconds ttl) override;
  void                   erase(std::string const& key) override;

private:
  struct Entry {
    int64_t     value;
    std::time_t expires; // 0 is never
  };

  Entry* live_(std::string const& key, std::time_t now);

  Clock                                  clock_;
  std::mutex                             mtx_;
  std::unordered_map<std::string, Entry> map_;
};

// Counters in a table of a shared database file, so that separate
// worker processes see the same values.

class SQLiteCounterStore : public CounterStore {
public:
  explicit SQLiteCounterStore(SQLite::DB& db,
                              Clock clock = [] { return std::time(nullptr); });

  bool try_acquire(std::string const&   key,
                   int64_t              limit,
                   std::chrono::seconds ttl) override;
  void decrement(std::string const& key, std::chrono::seconds ttl) override;
  int64_t increment(std::string const& key, std::chrono::seconds ttl) override;
  std::optional<int64_t> get(std::string const& key) override;
  void                   put(std::string const&   key,
                             int64_t              value,
                             std::chrono::seconds ttl) override;
  void                   erase(std::string const& key) override;

private:
  std::optional<int64_t> live_(std::string const& key, std::time_t now);

  SQLite::DB& db_;
  Clock       clock_;
};

#endif // COUNTERSTORE_DOT_HPP
