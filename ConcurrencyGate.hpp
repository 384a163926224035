#ifndef CONCURRENCYGATE_DOT_HPP
#define CONCURRENCYGATE_DOT_HPP

#include <chrono>
#include <ctime>
#include <string>

#include "CounterStore.hpp"

// Non-blocking admission control for probes: concurrency leases that
// expire on their own if a holder dies, and one second rate windows.

class ConcurrencyGate {
public:
  ConcurrencyGate(CounterStore& store, std::chrono::seconds lease_ttl);

  // True iff fewer than limit leases are held; takes one.
  bool acquire(std::string const& key, int limit);
  void release(std::string const& key);

  // Counts one event in the window of the current second.
  bool consume_rps(std::string const& key, int limit, std::time_t now);

  static std::string global_key() { return "sem:global"; }
  static std::string mx_key(std::string const& mx);
  static std::string global_rps_key() { return "rps:global"; }
  static std::string mx_rps_key(std::string const& mx);

  // A held lease, released on destruction.
  class Lease {
  public:
    Lease(Lease const&) = delete;
    Lease& operator=(Lease const&) = delete;

    Lease() = default;
    Lease(ConcurrencyGate* gate, std::string key);
    Lease(Lease&& that) noexcept;
    Lease& operator=(Lease&& that) noexcept;
    ~Lease();

    explicit operator bool() const { return gate_ != nullptr; }
    void     release();

  private:
    ConcurrencyGate* gate_{nullptr};
    std::string      key_;
  };

  // An empty Lease when the gate is full.
  Lease try_lease(std::string const& key, int limit);

private:
  CounterStore&        store_;
  std::chrono::seconds lease_ttl_;
};

#endif // CONCURRENCYGATE_DOT_HPP
