#include "VerificationTask.hpp"

#include "CatchAllProbe.hpp"
#include "ConcurrencyGate.hpp"
#include "CounterStore.hpp"
#include "FallbackVerifier.hpp"
#include "MX.hpp"
#include "Now.hpp"
#include "Preflight.hpp"
#include "Store.hpp"
#include "TestSend.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include <boost/algorithm/string/predicate.hpp>

using namespace std::chrono_literals;

namespace {
std::time_t const now = 1700000000;

// Answers RCPT by local-part; the random catch-all local-part gets
// catch_all_code.
class ScriptedProber : public Probe::Prober {
public:
  Probe::Outcome probe(std::string const& email,
                       std::string const& mx_host) override
  {
    if (throws)
      throw std::runtime_error("resolver exploded");

    auto const local = email.substr(0, email.find('@'));
    probes.push_back(local);

    Probe::Outcome o;
    o.mx_host = mx_host;
    if (boost::starts_with(local, "_ca_"))
      o.code = catch_all_code;
    else if (codes.count(local))
      o.code = codes[local];
    else
      o.error = "timeout:rcpt_to";
    o.verdict = Probe::verdict_for(o.code, o.error);
    return o;
  }

  std::map<std::string, int> codes;
  int                        catch_all_code{550};
  bool                       throws{false};
  std::vector<std::string>   probes;
};

class FixedFallback : public FallbackVerifier {
public:
  FallbackResult verify(std::string const&) override
  {
    ++calls;
    FallbackResult r;
    r.status = status;
    r.raw    = "{\"result\":\"ok\"}";
    return r;
  }

  FallbackStatus status{FallbackStatus::unknown};
  int            calls{0};
};

struct Fixture {
  Settings settings;

  SQLite::DB db{":memory:"};
  Store      store{db};

  MX::StaticLookup   lookup;
  MemoryCounterStore counters;
  ConcurrencyGate    gate{counters, 120s};
  Preflight          preflight{counters, lookup, 25, 1500ms, 300s};
  ScriptedProber     prober;
  CatchAllProbe      catch_all{store, lookup, prober, 24h};
  FixedFallback      fallback;

  std::vector<int64_t>     queued;
  std::vector<std::time_t> queued_at;
  TestSendEscalator        escalator{store, "bounce", "verifier.example.com",
                              [this](int64_t id, std::time_t when) {
                                queued.push_back(id);
                                queued_at.push_back(when);
                              }};

  int64_t person{0};
  int64_t company{0};

  Fixture()
  {
    settings.preflight    = false;
    settings.global_rps   = 0;
    settings.per_mx_rps   = 0;
    settings.max_attempts = 3;

    lookup.add_mx("example.com", "mx.example.com", 10);
    lookup.add_address("mx.example.com", "127.0.0.1");

    company = store.ensure_company("t1", "example.com", "run-a", now);
    Person p;
    p.company_id = company;
    p.first_name = "Brett";
    p.last_name  = "Anderson";
    p.full_name  = "Brett Anderson";
    person       = store.upsert_person(p);
  }

  VerificationTask task()
  {
    return VerificationTask{settings, store,     lookup,   preflight, gate,
                            prober,   catch_all, fallback, &escalator};
  }

  VerificationTask::Request request(std::string const& local, int attempt = 1)
  {
    EmailRow e;
    e.person_id  = person;
    e.company_id = company;
    e.email      = local + "@example.com";

    VerificationTask::Request req;
    req.email_id = store.upsert_email(e, now);
    req.email    = e.email;
    req.attempt  = attempt;
    req.job_id   = "job-" + local;
    return req;
  }
};

VerificationTask::Done done(VerificationTask::Result const& r)
{
  CHECK(std::holds_alternative<VerificationTask::Done>(r));
  return std::get<VerificationTask::Done>(r);
}

void outcomes()
{
  Fixture f;
  f.prober.codes = {{"brett", 250}, {"nobody", 550}};

  auto const ok = done(f.task().run(f.request("brett"), now));
  CHECK(ok.status == VerifyStatus::valid);
  CHECK_EQ(ok.reason, "rcpt_2xx_non_catchall");
  CHECK_EQ(ok.mx_host, "mx.example.com");
  CHECK(ok.result_id);
  CHECK(f.store.domain("example.com")->catch_all_status
        == CatchAllStatus::not_catch_all);
  CHECK(f.queued.empty());

  auto const bad = done(f.task().run(f.request("nobody"), now));
  CHECK(bad.status == VerifyStatus::invalid);
  CHECK_EQ(bad.reason, "rcpt_5xx_user_unknown");
  CHECK_EQ(f.fallback.calls, 0);

  // Same address again updates the same row.
  auto const again = done(f.task().run(f.request("brett"), now + 10));
  CHECK_EQ(*again.result_id, *ok.result_id);

  auto junk_req  = f.request("junk");
  junk_req.email = "not-an-address";
  auto const junk = done(f.task().run(junk_req, now));
  CHECK_EQ(junk.error, "bad_input");
  CHECK(!junk.result_id);
}

void catch_all_escalates()
{
  Fixture f;
  f.prober.codes          = {{"brett", 250}, {"banderson", 250}};
  f.prober.catch_all_code = 250;

  auto const b = f.request("banderson");
  auto const r = done(f.task().run(f.request("brett"), now));
  CHECK(r.status == VerifyStatus::risky_catch_all);
  CHECK_EQ(r.reason, "rcpt_2xx_catchall");

  // Only brett has a result row yet, so brett is the candidate.
  CHECK_EQ(f.queued.size(), 1u);
  CHECK_EQ(f.queued[0], *r.result_id);
  CHECK_EQ(f.queued_at[0], now);

  // A second ambiguous result does not start a second test-send.
  done(f.task().run(b, now));
  CHECK_EQ(f.queued.size(), 1u);

  // Catch-all was probed once, then cached.
  auto const n_ca = std::count_if(
      f.prober.probes.begin(), f.prober.probes.end(),
      [](auto const& local) { return boost::starts_with(local, "_ca_"); });
  CHECK_EQ(n_ca, 1);
}

void bounced_stays_invalid()
{
  Fixture f;
  f.prober.codes          = {{"brett", 250}};
  f.prober.catch_all_code = 250;

  auto const r = done(f.task().run(f.request("brett"), now));
  CHECK(r.status == VerifyStatus::risky_catch_all);
  CHECK_EQ(f.queued.size(), 1u);

  auto const token = f.escalator.request(*r.result_id);
  CHECK(f.escalator.mark_sent(*r.result_id, now));
  CHECK(f.escalator
            .apply_bounce(token, true, "5.1.1", "550 5.1.1 user unknown",
                          now + 60)
            .applied);

  // The catch-all domain still accepts brett, but the bounce decides.
  auto const again = done(f.task().run(f.request("brett"), now + 3600));
  CHECK_EQ(*again.result_id, *r.result_id);
  CHECK(again.status == VerifyStatus::invalid);
  CHECK_EQ(again.reason, "hard_bounce_user_unknown");
  CHECK_EQ(f.queued.size(), 1u);

  auto const row = f.store.result(*r.result_id);
  CHECK(row->verify_status == VerifyStatus::invalid);
  CHECK(row->test_send_status == TestSendStatus::bounce_hard);
  CHECK_EQ(*row->verified_at, Now(now + 3600).string());
}

void temporary_failures()
{
  Fixture f;
  f.prober.codes = {{"brett", 451}};

  auto r = f.task().run(f.request("brett", 1), now);
  CHECK(std::holds_alternative<VerificationTask::Retry>(r));
  auto const& retry = std::get<VerificationTask::Retry>(r);
  CHECK_LE(retry.delay.count(), 2000);
  CHECK_EQ(retry.reason.rfind("451", 0), 0u);
  CHECK_EQ(f.fallback.calls, 1);
  CHECK(!f.store.result_for_email(f.request("brett").email_id));

  // The last attempt keeps what it has.
  auto const last = done(f.task().run(f.request("brett", 3), now));
  CHECK(last.status == VerifyStatus::unknown_timeout);
  CHECK_EQ(last.reason, "tempfail_or_timeout");
  CHECK_EQ(f.store.dead_letter_count(), 1);

  // A definite second opinion settles it without a retry.
  f.fallback.status = FallbackStatus::valid;
  auto const fb     = done(f.task().run(f.request("brett", 1), now));
  CHECK(fb.status == VerifyStatus::valid);
  CHECK_EQ(fb.reason, "fallback_valid_after_tempfail");
  CHECK(f.store.result(*fb.result_id)->fallback_status
        == FallbackStatus::valid);
}

void timeouts()
{
  Fixture f; // brett has no scripted code, so RCPT times out

  auto const req = f.request("brett", 1);
  auto const r   = f.task().run(req, now);
  CHECK(std::holds_alternative<VerificationTask::Retry>(r));
  CHECK_EQ(std::get<VerificationTask::Retry>(r).reason, "timeout:rcpt_to");
  CHECK_EQ(f.fallback.calls, 1);
  CHECK(!f.store.result_for_email(req.email_id));
  CHECK_EQ(f.store.dead_letter_count(), 0);

  auto const last = done(f.task().run(f.request("brett", 3), now));
  CHECK(last.status == VerifyStatus::unknown_timeout);
  CHECK_EQ(last.reason, "tempfail_or_timeout");
  CHECK_EQ(last.error, "timeout:rcpt_to");
  CHECK_EQ(f.store.dead_letter_count(), 1);

  SQLite::Stmt stmt{f.db, "SELECT error_type, error_message FROM dead_letters"};
  CHECK(stmt.step());
  CHECK_EQ(stmt.text(0), "temporary_failure");
  CHECK_EQ(stmt.text(1), "timeout:rcpt_to");

  // A definite second opinion still settles it at once.
  f.fallback.status = FallbackStatus::invalid;
  auto const fb     = done(f.task().run(f.request("brett", 1), now));
  CHECK(fb.status == VerifyStatus::invalid);
  CHECK_EQ(fb.reason, "fallback_invalid_after_tempfail");
}

void gates()
{
  Fixture f;
  f.prober.codes                    = {{"brett", 250}};
  f.settings.global_max_concurrency = 1;

  {
    auto const held = f.gate.try_lease(ConcurrencyGate::global_key(), 1);
    CHECK(held);
    auto const r = f.task().run(f.request("brett"), now);
    CHECK(std::holds_alternative<VerificationTask::Retry>(r));
    CHECK_EQ(std::get<VerificationTask::Retry>(r).reason,
             "global concurrency cap reached");
    CHECK(f.prober.probes.empty());
  }

  f.settings.per_mx_rps = 1;
  done(f.task().run(f.request("brett"), now));
  auto const r = f.task().run(f.request("brett"), now);
  CHECK_EQ(std::get<VerificationTask::Retry>(r).reason, "MX RPS throttle");

  // Leases are given back.
  CHECK(!f.counters.get(ConcurrencyGate::global_key()).value_or(0));
}

void preflight_blocked()
{
  Fixture f;
  f.settings.preflight = true;
  f.prober.codes       = {{"brett", 250}};
  f.counters.put(Preflight::cache_key("mx.example.com"), 0, 300s);

  auto const r = done(f.task().run(f.request("brett"), now));
  CHECK_EQ(r.error, "tcp25_blocked");
  CHECK(r.status == VerifyStatus::unknown_timeout);
  CHECK(f.prober.probes.empty());

  // Forced, the probe runs but no catch-all probe does.
  auto req  = f.request("brett");
  req.force = true;
  auto const forced = done(f.task().run(req, now));
  CHECK(forced.status == VerifyStatus::risky_catch_all);
  CHECK_EQ(forced.reason, "rcpt_2xx_unknown_catchall");
  CHECK_EQ(f.prober.probes.size(), 1u);
}

void preflight_unresolved()
{
  Fixture f;
  f.settings.preflight = true;
  f.prober.codes       = {{"brett", 250}};
  f.lookup.fail("mx.example.com");

  // Name service trouble is not a port 25 block.
  auto const req = f.request("brett", 1);
  auto const r   = f.task().run(req, now);
  CHECK(std::holds_alternative<VerificationTask::Retry>(r));
  CHECK_EQ(std::get<VerificationTask::Retry>(r).reason.rfind("resolve:", 0), 0u);
  CHECK(f.prober.probes.empty());
  CHECK(!f.store.result_for_email(req.email_id));
  CHECK(!f.counters.get(Preflight::cache_key("mx.example.com")));

  auto const last = done(f.task().run(f.request("brett", 3), now));
  CHECK(last.status == VerifyStatus::unknown_timeout);
  CHECK_EQ(last.reason, "tempfail_or_timeout");
  CHECK_NE(last.error, "tcp25_blocked");
  CHECK_EQ(f.store.dead_letter_count(), 1);
}

void errors()
{
  Fixture f;
  f.prober.throws = true;

  for (auto attempt : {1, 3}) {
    bool threw = false;
    try {
      f.task().run(f.request("brett", attempt), now);
    }
    catch (std::runtime_error const&) {
      threw = true;
    }
    CHECK(threw);
  }
  // Only the last attempt leaves a dead letter.
  CHECK_EQ(f.store.dead_letter_count(), 1);

  SQLite::Stmt stmt{f.db, "SELECT error_type, job_id FROM dead_letters"};
  CHECK(stmt.step());
  CHECK_EQ(stmt.text(0), "std::runtime_error");
  CHECK_EQ(stmt.text(1), "job-brett");
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  outcomes();
  catch_all_escalates();
  bounced_stays_invalid();
  temporary_failures();
  timeouts();
  gates();
  preflight_blocked();
  preflight_unresolved();
  errors();

  LOG(INFO) << "VerificationTask-test passed";
}
