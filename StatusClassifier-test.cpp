#include "StatusClassifier.hpp"

#include "FallbackVerifier.hpp"

#include <stdexcept>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
std::time_t const now = 1700000000;

Status::Classification
cls(Status::Rcpt                  rcpt,
    std::optional<CatchAllStatus> catch_all = {},
    std::optional<FallbackStatus> fallback  = {})
{
  Status::Signals sig;
  sig.rcpt      = rcpt;
  sig.catch_all = catch_all;
  sig.fallback  = fallback;
  return Status::classify(sig, now, 90 * 24h);
}

void expect(Status::Classification const& c,
            VerifyStatus                  status,
            char const*                   reason)
{
  CHECK(c.status == status) << c_str(c.status) << " " << c.reason;
  CHECK_EQ(c.reason, reason);
}

class ThrowingVerifier : public FallbackVerifier {
public:
  FallbackResult verify(std::string const&) override
  {
    throw std::runtime_error("provider down");
  }
};
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using Status::Rcpt;

  expect(cls(Rcpt::hard_fail), VerifyStatus::invalid, "rcpt_5xx_user_unknown");
  expect(cls(Rcpt::hard_fail, {}, FallbackStatus::valid), VerifyStatus::valid,
         "fallback_valid_overrides_rcpt_5xx");

  expect(cls(Rcpt::accept, CatchAllStatus::not_catch_all), VerifyStatus::valid,
         "rcpt_2xx_non_catchall");
  expect(cls(Rcpt::accept, CatchAllStatus::catch_all),
         VerifyStatus::risky_catch_all, "rcpt_2xx_catchall");
  expect(cls(Rcpt::accept, CatchAllStatus::catch_all, FallbackStatus::invalid),
         VerifyStatus::invalid, "fallback_invalid_on_catchall");
  expect(cls(Rcpt::accept, CatchAllStatus::catch_all, FallbackStatus::valid),
         VerifyStatus::valid, "fallback_valid_on_catchall");
  expect(cls(Rcpt::accept), VerifyStatus::risky_catch_all,
         "rcpt_2xx_unknown_catchall");
  expect(cls(Rcpt::accept, CatchAllStatus::tempfail),
         VerifyStatus::risky_catch_all, "rcpt_2xx_unknown_catchall");
  expect(cls(Rcpt::accept, CatchAllStatus::error, FallbackStatus::valid),
         VerifyStatus::valid, "fallback_valid_on_unknown_catchall");

  expect(cls(Rcpt::soft_fail), VerifyStatus::unknown_timeout,
         "tempfail_or_timeout");
  expect(cls(Rcpt::soft_fail, {}, FallbackStatus::valid), VerifyStatus::valid,
         "fallback_valid_after_tempfail");
  expect(cls(Rcpt::soft_fail, {}, FallbackStatus::invalid),
         VerifyStatus::invalid, "fallback_invalid_after_tempfail");
  expect(cls(Rcpt::soft_fail, {}, FallbackStatus::catch_all),
         VerifyStatus::unknown_timeout, "tempfail_or_timeout");

  expect(cls(Rcpt::none, {}, FallbackStatus::valid), VerifyStatus::valid,
         "fallback_valid_no_smtp");
  expect(cls(Rcpt::unknown, {}, FallbackStatus::invalid),
         VerifyStatus::invalid, "fallback_invalid_no_smtp");
  expect(cls(Rcpt::none), VerifyStatus::unknown_timeout,
         "no_verification_attempt");
  expect(cls(Rcpt::unknown, {}, FallbackStatus::unknown),
         VerifyStatus::unknown_timeout, "no_verification_attempt");

  // Staleness comes first.
  Status::Signals old;
  old.rcpt        = Rcpt::accept;
  old.catch_all   = CatchAllStatus::not_catch_all;
  old.verified_at = now - 91 * 24 * 3600;
  expect(Status::classify(old, now, 90 * 24h), VerifyStatus::unknown_timeout,
         "stale_result_ttl_exceeded");
  old.verified_at = now - 89 * 24 * 3600;
  expect(Status::classify(old, now, 90 * 24h), VerifyStatus::valid,
         "rcpt_2xx_non_catchall");

  // Provider words.
  CHECK(map_provider_status("Deliverable") == FallbackStatus::valid);
  CHECK(map_provider_status(" ok ") == FallbackStatus::valid);
  CHECK(map_provider_status("hard_bounce") == FallbackStatus::invalid);
  CHECK(map_provider_status("catchall") == FallbackStatus::catch_all);
  CHECK(map_provider_status("risky") == FallbackStatus::unknown);
  CHECK(map_provider_status("") == FallbackStatus::unknown);

  NoFallback none;
  CHECK(consult(none, "a@example.com").status == FallbackStatus::unknown);
  ThrowingVerifier throwing;
  auto const res = consult(throwing, "a@example.com");
  CHECK(res.status == FallbackStatus::unknown);
  CHECK_EQ(res.raw, "provider down");
}
