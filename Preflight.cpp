#include "Preflight.hpp"

#include "CounterStore.hpp"
#include "MX.hpp"
#include "POSIX.hpp"

#include <stdexcept>
#include <vector>

#include <arpa/inet.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
// Multi-homed exchangers can cost a timeout per address.
constexpr std::size_t max_addrs = 2;
} // namespace

Preflight::Preflight(CounterStore&             cache,
                     MX::Lookup&               lookup,
                     uint16_t                  port,
                     std::chrono::milliseconds timeout,
                     std::chrono::seconds      ttl)
  : cache_(cache)
  , lookup_(lookup)
  , port_(port)
  , timeout_(timeout)
  , ttl_(ttl)
{
}

std::string Preflight::cache_key(std::string const& host)
{
  return fmt::format("tcp25_preflight:{}", host);
}

Preflight::Result Preflight::check(std::string const& host)
{
  Result     result;
  auto const key = cache_key(host);

  if (auto const hit = cache_.get(key)) {
    result.ok      = *hit != 0;
    result.blocked = !result.ok;
    result.cached  = true;
    if (!result.ok)
      result.error = "tcp25_blocked";
    return result;
  }

  std::vector<std::string> addrs;
  in6_addr                 buf;
  if (inet_pton(AF_INET, host.c_str(), &buf) == 1
      || inet_pton(AF_INET6, host.c_str(), &buf) == 1) {
    addrs.push_back(host);
  }
  else {
    try {
      addrs = lookup_.addresses(host);
    }
    catch (std::exception const& e) {
      // Not cached: name service trouble says nothing about port 25.
      result.error = fmt::format("resolve:{}", e.what());
      LOG(WARNING) << "preflight of " << host << ": " << result.error;
      return result;
    }
    if (addrs.empty()) {
      result.error = fmt::format("no_address:{}", host);
      LOG(WARNING) << "preflight of " << host << ": " << result.error;
      return result;
    }
  }

  for (std::size_t i = 0; i < addrs.size() && i < max_addrs; ++i) {
    std::string error;
    auto const  fd = POSIX::connect(addrs[i], port_, timeout_, error);
    if (fd >= 0) {
      close(fd);
      result.ok   = true;
      result.addr = addrs[i];
      break;
    }
    result.error = error;
  }

  result.blocked = !result.ok;
  cache_.put(key, result.ok ? 1 : 0, ttl_);
  if (result.ok) {
    result.error.clear();
    LOG(INFO) << "preflight of " << host << " at " << result.addr << " ok";
  }
  else {
    LOG(WARNING) << "preflight of " << host << " failed: " << result.error;
  }
  return result;
}
