#ifndef PREFLIGHT_DOT_HPP
#define PREFLIGHT_DOT_HPP

#include <chrono>
#include <cstdint>
#include <string>

class CounterStore;

namespace MX {
class Lookup;
}

// Can we open TCP/25 to an exchanger at all?  Answers are cached in the
// counter store as "tcp25_preflight:{host}" holding 1 or 0, so a network
// that blocks outbound port 25 costs one timeout per host per TTL.

class Preflight {
public:
  struct Result {
    bool        ok{false};
    bool        blocked{false}; // connects failed, now or when cached
    bool        cached{false};
    std::string addr;
    std::string error;
  };

  Preflight(CounterStore&             cache,
            MX::Lookup&               lookup,
            uint16_t                  port,
            std::chrono::milliseconds timeout,
            std::chrono::seconds      ttl);

  Result check(std::string const& host);

  static std::string cache_key(std::string const& host);

private:
  CounterStore&             cache_;
  MX::Lookup&               lookup_;
  uint16_t                  port_;
  std::chrono::milliseconds timeout_;
  std::chrono::seconds      ttl_;
};

#endif // PREFLIGHT_DOT_HPP
