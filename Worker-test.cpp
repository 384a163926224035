#include "Worker.hpp"

#include "CatchAllProbe.hpp"
#include "ConcurrencyGate.hpp"
#include "CounterStore.hpp"
#include "Discovery.hpp"
#include "FallbackVerifier.hpp"
#include "JobQueue.hpp"
#include "MX.hpp"
#include "Now.hpp"
#include "Pipeline.hpp"
#include "Preflight.hpp"
#include "Store.hpp"
#include "TestSend.hpp"
#include "TestSender.hpp"
#include "VerificationTask.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <map>

#include <unistd.h>

#include <glog/logging.h>

#include <boost/algorithm/string/predicate.hpp>

#include <fmt/format.h>

using namespace std::chrono_literals;
using nlohmann::json;

namespace {
std::time_t const now = 1700000000;

class ScriptedProber : public Probe::Prober {
public:
  Probe::Outcome probe(std::string const& email,
                       std::string const& mx_host) override
  {
    auto const local = email.substr(0, email.find('@'));

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
};

class RecordingSender : public TestSender {
public:
  bool send(std::string const& email,
            std::string const& return_path,
            std::string const& token) override
  {
    sent.push_back(email);
    return_paths.push_back(return_path);
    tokens.push_back(token);
    return accept;
  }

  bool                     accept{true};
  std::vector<std::string> sent;
  std::vector<std::string> return_paths;
  std::vector<std::string> tokens;
};

std::string candidates_file()
{
  auto const path
      = fmt::format("/tmp/Worker-test-{}.jsonl", static_cast<long>(getpid()));
  std::ofstream out{path};
  out << R"({"domain": "example.com", "full_name": "Alice Smith",)"
         R"( "email": "ASmith@example.com",)"
         R"( "source_url": "https://example.com/team"})"
      << '\n'
      << R"({"domain": "example.com", "full_name": "Bob Jones",)"
         R"( "email": "bjones@example.com",)"
         R"( "source_url": "https://example.com/team"})"
      << '\n'
      << R"({"domain": "example.com", "first_name": "Brett",)"
         R"( "last_name": "Anderson", "title": "CTO"})"
      << '\n'
      << "# not for us\n"
      << R"({"domain": "example.com", "email": "not an address"})" << '\n'
      << R"({"full_name": "No Domain"})" << '\n';
  return path;
}

struct Fixture {
  Settings settings;

  SQLite::DB db{":memory:"};
  Store      store{db};
  JobQueue   queue{db};

  MX::StaticLookup   lookup;
  MemoryCounterStore counters;
  ConcurrencyGate    gate{counters, 120s};
  Preflight          preflight{counters, lookup, 25, 1500ms, 300s};
  ScriptedProber     prober;
  CatchAllProbe      catch_all{store, lookup, prober, 24h};
  NoFallback         fallback;
  TestSendEscalator  escalator{store, "bounce", "verifier.example.com",
                              test_send_enqueuer(queue)};
  VerificationTask   task{settings, store,     lookup,   preflight, gate,
                        prober,   catch_all, fallback, &escalator};
  Pipeline           pipeline{settings, store, queue};
  RecordingSender    sender;
  std::string        path{candidates_file()};
  CandidateFile      discovery{store, path};

  Worker worker{settings,  store,  queue,     pipeline,
                task,      escalator, sender, discovery,
                {Config::discovery_queue, Config::generate_queue,
                 Config::verify_queue, Config::test_send_queue}};

  Fixture()
  {
    settings.preflight  = false;
    settings.global_rps = 0;
    settings.per_mx_rps = 0;

    lookup.add_mx("example.com", "mx.example.com", 10);
    lookup.add_address("mx.example.com", "127.0.0.1");
  }

  ~Fixture() { std::remove(path.c_str()); }

  int drain()
  {
    int n = 0;
    while (worker.run_one(now))
      ++n;
    return n;
  }
};

void full_run()
{
  Fixture f;
  CHECK_EQ(f.discovery.size(), 4u);

  f.prober.codes["asmith"]    = 250;
  f.prober.codes["bjones"]    = 250;
  f.prober.codes["banderson"] = 550;

  auto const run = f.store.create_run("t1", json::array({"example.com"}),
                                      json{{"modes", "full"}}, now);
  f.pipeline.start(run, now);

  // discovery, generate_company, three generate_person, the sweep, and
  // the probes.
  CHECK_GE(f.drain(), 8);

  auto const done = f.store.run(run);
  CHECK_EQ(done->status, "completed_with_errors"); // the bad address
  CHECK_EQ(f.queue.live_jobs(run), 0);

  auto const metrics = *f.store.run_metrics(run);
  CHECK_EQ(metrics["total_companies"].get<int>(), 1);
  CHECK_EQ(metrics["companies_with_pages"].get<int>(), 1);
  CHECK_EQ(metrics["total_candidates"].get<int>(), 4);
  CHECK_EQ(metrics["people_upserted"].get<int>(), 3);
  CHECK_EQ(metrics["emails_upserted"].get<int>(), 2);
  CHECK_EQ(metrics["emails_valid"].get<int>(), 2);
  CHECK_EQ(metrics["emails_invalid"].get<int>(), 1);
  CHECK_EQ(metrics["jobs_failed"].get<int>(), 0);
  CHECK_EQ(metrics["errors"].size(), 1u);
  CHECK(boost::contains(metrics["errors"][0].get<std::string>(),
                        "bad address"));

  auto const brett = f.store.email_id("banderson@example.com");
  CHECK(brett);
  auto const r = f.store.result_for_email(*brett);
  CHECK(r);
  CHECK(r->verify_status == VerifyStatus::invalid);

  CHECK_EQ(*f.store.domain("example.com")->email_pattern, "flast");
  CHECK(f.sender.sent.empty());
}

void risky_goes_to_test_send()
{
  Fixture f;
  f.prober.catch_all_code = 250;
  f.prober.codes["asmith"] = 250;
  f.prober.codes["bjones"] = 250;

  auto const run = f.store.create_run(
      "t1", json::array({"example.com"}),
      json{{"modes", "discovery+verify"}}, now);
  f.pipeline.start(run, now);
  f.drain();

  CHECK_EQ(f.store.run(run)->status, "completed_with_errors");

  auto const alice = f.store.result_for_email(
      *f.store.email_id("asmith@example.com"));
  CHECK(alice);
  CHECK(alice->verify_status == VerifyStatus::risky_catch_all);

  // One test-send per person, each sent with its token in the
  // return-path.
  CHECK_EQ(f.sender.sent.size(), 2u);
  for (std::size_t i = 0; i < f.sender.sent.size(); ++i) {
    CHECK_EQ(f.sender.return_paths[i],
             fmt::format("bounce+{}@verifier.example.com", f.sender.tokens[i]));
    auto const row = f.store.result_for_token(f.sender.tokens[i]);
    CHECK(row);
    CHECK(row->test_send_status == TestSendStatus::sent);
  }
  CHECK_EQ(f.queue.count(Config::test_send_queue, JobStatus::finished), 2);

  // Queued outside the run, at the time of the probe that asked for it.
  auto const sends = f.queue.jobs_of_run("");
  CHECK_EQ(sends.size(), 2u);
  for (auto const& job : sends) {
    CHECK_EQ(job.stage, Stage::test_send);
    CHECK_EQ(job.scheduled_at, Now(now).string());
  }
}

void failures()
{
  Fixture f;
  f.sender.accept = false;

  // An unknown stage fails at once.
  auto const bogus = f.queue.enqueue(Config::verify_queue, "bogus",
                                     json::object(), "", {}, now);
  CHECK(f.worker.run_one(now));
  auto const job = f.queue.job(bogus);
  CHECK(job->status == JobStatus::failed);
  CHECK(boost::starts_with(job->error, "std::invalid_argument: unknown stage"));

  // A refused test-send is tried again later, then given up on.
  f.settings.max_attempts = 2;
  EmailRow e;
  e.email        = "carol@example.com";
  auto const eid = f.store.upsert_email(e, now);
  ResultWrite w;
  w.email_id        = eid;
  w.verify_status   = VerifyStatus::risky_catch_all;
  auto const rid    = f.store.upsert_result(w, now);
  auto const token  = f.escalator.request(rid);
  auto const send   = f.queue.enqueue(Config::test_send_queue, Stage::test_send,
                                      json{{"result_id", rid}}, "", {}, now);

  CHECK(f.worker.run_one(now));
  CHECK(f.queue.job(send)->status == JobStatus::queued);
  CHECK(f.worker.run_one(now + 600));
  CHECK(f.queue.job(send)->status == JobStatus::failed);
  CHECK_EQ(f.sender.sent.size(), 2u);
  CHECK_EQ(f.sender.tokens[0], token);
  CHECK(f.store.result(rid)->test_send_status == TestSendStatus::pending);

  // Nothing left.
  CHECK(!f.worker.run_one(now + 600));
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  full_run();
  risky_goes_to_test_send();
  failures();

  LOG(INFO) << "Worker-test passed";
}
