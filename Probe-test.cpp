#include "Probe.hpp"

#include "MX.hpp"
#include "ScriptedServer.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
Probe::Outcome probe_with(ScriptedServer::Script script)
{
  ScriptedServer server{std::move(script)};

  MX::StaticLookup lookup;
  lookup.add_address("mx.example.com", "127.0.0.1");

  SMTP::Options opts;
  opts.helo_domain     = "verifier.example.com";
  opts.port            = server.port();
  opts.starttls        = false;
  opts.connect_timeout = 2s;
  opts.command_timeout = 2s;

  Probe::SmtpProber prober{lookup, opts, "bounce@verifier.example.com"};
  auto outcome = prober.probe("Brett@Example.COM", "mx.example.com");

  auto const& lines = server.transcript();
  CHECK(!lines.empty());
  return outcome;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(Probe::classify(250) == Probe::Category::accept);
  CHECK(Probe::classify(550) == Probe::Category::hard_fail);
  CHECK(Probe::classify(452) == Probe::Category::temp_fail);
  CHECK(Probe::classify(199) == Probe::Category::unknown);
  CHECK(Probe::classify({}) == Probe::Category::unknown);

  {
    auto const o = probe_with({});
    CHECK(o.category() == Probe::Category::accept);
    CHECK(std::holds_alternative<Probe::Accepted>(o.verdict));
    CHECK_EQ(*o.code, 250);
    CHECK(o.ok());
    CHECK_EQ(o.mx_host, "mx.example.com");
    CHECK_EQ(o.helo_domain, "verifier.example.com");
  }
  {
    ScriptedServer::Script script;
    script.rcpt = "550 5.1.1 <brett@example.com>: user unknown\r\n";
    auto const o = probe_with(script);
    CHECK(o.category() == Probe::Category::hard_fail);
    CHECK_EQ(*o.code, 550);
    CHECK(o.error.empty());
    auto const& fail = std::get<Probe::PermanentFailure>(o.verdict);
    CHECK_NE(fail.reason.find("user unknown"), std::string::npos);
  }
  {
    ScriptedServer::Script script;
    script.rcpt = "451 4.7.1 greylisted, try again later\r\n";
    auto const o = probe_with(script);
    CHECK(o.category() == Probe::Category::temp_fail);
    CHECK_EQ(*o.code, 451);
  }
  {
    // MAIL refused is as good an answer as RCPT refused.
    ScriptedServer::Script script;
    script.mail = "553 5.7.1 sender rejected\r\n";
    auto const o = probe_with(script);
    CHECK(o.category() == Probe::Category::hard_fail);
    CHECK_EQ(*o.code, 553);
  }
  {
    ScriptedServer::Script script;
    script.greeting = "421 4.3.2 too busy\r\n";
    ScriptedServer server{script};

    MX::StaticLookup lookup;
    lookup.add_address("mx.example.com", "127.0.0.1");
    SMTP::Options opts;
    opts.port     = server.port();
    opts.starttls = false;

    Probe::SmtpProber prober{lookup, opts, "bounce@verifier.example.com"};
    auto const o = prober.probe("brett@example.com", "mx.example.com");
    CHECK(o.category() == Probe::Category::temp_fail);
    CHECK_EQ(*o.code, 421);
  }

  // Nothing to talk to.
  MX::StaticLookup lookup;
  SMTP::Options    opts;
  opts.connect_timeout = 1s;
  Probe::SmtpProber prober{lookup, opts, "bounce@verifier.example.com"};

  auto o = prober.probe("brett@example.com", "nowhere.example.com");
  CHECK(o.category() == Probe::Category::unknown);
  CHECK(!o.code);
  CHECK_EQ(o.error, "connect_failed:nowhere.example.com");

  o = prober.probe("not-an-address", "mx.example.com");
  CHECK(o.category() == Probe::Category::unknown);
  CHECK_EQ(o.error.rfind("invalid_email:", 0), 0u);

  LOG(INFO) << "Probe-test passed";
}
