#ifndef STATUSCLASSIFIER_DOT_HPP
#define STATUSCLASSIFIER_DOT_HPP

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

#include "VerificationResult.hpp"

// Folds everything known about an address into one verify_status and
// the reason for it.

namespace Status {

// What RCPT said, if it got that far.
enum class Rcpt {
  none,      // never probed
  accept,    // 2xx
  hard_fail, // 5xx
  soft_fail, // 4xx, timeout, port 25 blocked, throttled
  unknown,   // probed, nothing conclusive
};

constexpr char const* c_str(Rcpt rcpt)
{
  switch (rcpt) { // clang-format off
  case Rcpt::none:      return "none";
  case Rcpt::accept:    return "accept";
  case Rcpt::hard_fail: return "hard_fail";
  case Rcpt::soft_fail: return "soft_fail";
  case Rcpt::unknown:   return "unknown";
  } // clang-format on
  return "*** unknown Rcpt ***";
}

struct Signals {
  Rcpt                          rcpt{Rcpt::none};
  std::optional<CatchAllStatus> catch_all;
  std::optional<FallbackStatus> fallback;
  std::optional<std::time_t>    verified_at;
};

struct Classification {
  VerifyStatus status{VerifyStatus::unknown_timeout};
  std::string  reason;
};

Classification
classify(Signals const& sig, std::time_t now, std::chrono::seconds ttl);

} // namespace Status

#endif // STATUSCLASSIFIER_DOT_HPP
