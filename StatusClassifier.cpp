#include "StatusClassifier.hpp"

namespace Status {

Classification
classify(Signals const& sig, std::time_t now, std::chrono::seconds ttl)
{
  auto const fb_valid   = sig.fallback == FallbackStatus::valid;
  auto const fb_invalid = sig.fallback == FallbackStatus::invalid;

  if (sig.verified_at && (now - *sig.verified_at) > ttl.count())
    return {VerifyStatus::unknown_timeout, "stale_result_ttl_exceeded"};

  switch (sig.rcpt) {
  case Rcpt::hard_fail:
    if (fb_valid)
      return {VerifyStatus::valid, "fallback_valid_overrides_rcpt_5xx"};
    return {VerifyStatus::invalid, "rcpt_5xx_user_unknown"};

  case Rcpt::accept:
    // tempfail, error and no_mx tell us nothing about catch-all.
    if (sig.catch_all == CatchAllStatus::not_catch_all)
      return {VerifyStatus::valid, "rcpt_2xx_non_catchall"};
    if (sig.catch_all == CatchAllStatus::catch_all) {
      if (fb_invalid)
        return {VerifyStatus::invalid, "fallback_invalid_on_catchall"};
      if (fb_valid)
        return {VerifyStatus::valid, "fallback_valid_on_catchall"};
      return {VerifyStatus::risky_catch_all, "rcpt_2xx_catchall"};
    }
    if (fb_valid)
      return {VerifyStatus::valid, "fallback_valid_on_unknown_catchall"};
    return {VerifyStatus::risky_catch_all, "rcpt_2xx_unknown_catchall"};

  case Rcpt::soft_fail:
    if (fb_valid)
      return {VerifyStatus::valid, "fallback_valid_after_tempfail"};
    if (fb_invalid)
      return {VerifyStatus::invalid, "fallback_invalid_after_tempfail"};
    return {VerifyStatus::unknown_timeout, "tempfail_or_timeout"};

  case Rcpt::none:
  case Rcpt::unknown:
    if (fb_valid)
      return {VerifyStatus::valid, "fallback_valid_no_smtp"};
    if (fb_invalid)
      return {VerifyStatus::invalid, "fallback_invalid_no_smtp"};
    break;
  }

  return {VerifyStatus::unknown_timeout, "no_verification_attempt"};
}

} // namespace Status
