#include "CatchAllProbe.hpp"

#include "MX.hpp"
#include "Probe.hpp"
#include "Store.hpp"

#include <regex>
#include <stdexcept>
#include <vector>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
class ScriptedProber : public Probe::Prober {
public:
  Probe::Outcome probe(std::string const& email,
                       std::string const& mx_host) override
  {
    emails.push_back(email);
    Probe::Outcome outcome;
    outcome.mx_host = mx_host;
    outcome.code    = code;
    outcome.error   = error;
    outcome.verdict = Probe::verdict_for(code, error);
    return outcome;
  }

  std::optional<int>       code;
  std::string              error;
  std::vector<std::string> emails;
};
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(CatchAllProbe::classify(250, "") == CatchAllStatus::catch_all);
  CHECK(CatchAllProbe::classify(550, "") == CatchAllStatus::not_catch_all);
  CHECK(CatchAllProbe::classify(451, "") == CatchAllStatus::tempfail);
  CHECK(CatchAllProbe::classify(354, "") == CatchAllStatus::error);
  CHECK(CatchAllProbe::classify({}, "timeout:rcpt") == CatchAllStatus::tempfail);
  CHECK(CatchAllProbe::classify({}, "connect_failed:mx")
        == CatchAllStatus::error);

  CHECK(std::regex_match(CatchAllProbe::random_localpart(),
                         std::regex{"_ca_[0-9a-f]{16}"}));
  CHECK_NE(CatchAllProbe::random_localpart(),
           CatchAllProbe::random_localpart());

  SQLite::DB db{":memory:"};
  Store      store{db};

  MX::StaticLookup lookup;
  lookup.add_mx("example.com", "mx.example.com", 10);
  lookup.fail("broken.example");

  ScriptedProber prober;
  CatchAllProbe  probe{store, lookup, prober, 24h};

  std::time_t const now = 1700000000;

  prober.code = 250;
  auto res    = probe.check(" Example.COM ", now);
  CHECK(res.status == CatchAllStatus::catch_all);
  CHECK(!res.cached);
  CHECK_EQ(res.mx_host, "mx.example.com");
  CHECK_EQ(prober.emails.size(), 1u);
  CHECK_EQ(prober.emails[0], res.localpart + "@example.com");

  // Fresh verdicts come from the domain row.
  prober.code = 550;
  res         = probe.check("example.com", now + 3600);
  CHECK(res.cached);
  CHECK(res.status == CatchAllStatus::catch_all);
  CHECK_EQ(*res.code, 250);
  CHECK_EQ(prober.emails.size(), 1u);

  // force, or age, probes again.
  res = probe.check("example.com", now + 3600, true);
  CHECK(!res.cached);
  CHECK(res.status == CatchAllStatus::not_catch_all);
  prober.code.reset();
  prober.error = "timeout:rcpt";
  res          = probe.check("example.com", now + 3600 + 24 * 3600);
  CHECK(res.status == CatchAllStatus::tempfail);
  CHECK_EQ(res.error, "timeout:rcpt");
  CHECK(store.domain("example.com")->catch_all_status
        == CatchAllStatus::tempfail);
  CHECK_EQ(prober.emails.size(), 3u);

  res = probe.check("a-only.example", now);
  CHECK(res.status == CatchAllStatus::no_mx);
  CHECK_EQ(prober.emails.size(), 3u);

  res = probe.check("broken.example", now);
  CHECK(res.status == CatchAllStatus::error);
  CHECK(!res.error.empty());

  bool threw = false;
  try {
    probe.check("user@example.com", now);
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);
}
