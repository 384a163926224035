#include "ConcurrencyGate.hpp"

#include "Settings.hpp"

#include <stdexcept>

#include <glog/logging.h>

#include <fmt/format.h>

ConcurrencyGate::ConcurrencyGate(CounterStore&        store,
                                 std::chrono::seconds lease_ttl)
  : store_(store)
  , lease_ttl_(lease_ttl)
{
}

std::string ConcurrencyGate::mx_key(std::string const& mx)
{
  return fmt::format("sem:mx:{}", mx);
}

std::string ConcurrencyGate::mx_rps_key(std::string const& mx)
{
  return fmt::format("rps:mx:{}", mx);
}

bool ConcurrencyGate::acquire(std::string const& key, int limit)
{
  return store_.try_acquire(key, limit, lease_ttl_);
}

void ConcurrencyGate::release(std::string const& key)
{
  // Runs from destructors, so a store failure must not escape.
  try {
    store_.decrement(key, lease_ttl_);
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "release of " << key << " failed: " << e.what();
  }
}

bool ConcurrencyGate::consume_rps(std::string const& key,
                                  int                limit,
                                  std::time_t        now)
{
  auto const window = fmt::format("{}:{}", key, now);
  return store_.increment(window, Config::rps_window_ttl) <= limit;
}

ConcurrencyGate::Lease ConcurrencyGate::try_lease(std::string const& key,
                                                  int                limit)
{
  if (acquire(key, limit))
    return Lease(this, key);
  return Lease();
}

ConcurrencyGate::Lease::Lease(ConcurrencyGate* gate, std::string key)
  : gate_(gate)
  , key_(std::move(key))
{
}

ConcurrencyGate::Lease::Lease(Lease&& that) noexcept
  : gate_(that.gate_)
  , key_(std::move(that.key_))
{
  that.gate_ = nullptr;
}

ConcurrencyGate::Lease& ConcurrencyGate::Lease::operator=(Lease&& that) noexcept
{
  if (this != &that) {
    release();
    gate_      = that.gate_;
    key_       = std::move(that.key_);
    that.gate_ = nullptr;
  }
  return *this;
}

ConcurrencyGate::Lease::~Lease() { release(); }

void ConcurrencyGate::Lease::release()
{
  if (gate_) {
    gate_->release(key_);
    gate_ = nullptr;
  }
}
