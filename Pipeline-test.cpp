#include "Pipeline.hpp"

#include "JobQueue.hpp"
#include "Store.hpp"

#include <algorithm>
#include <stdexcept>

#include <glog/logging.h>

#include <boost/algorithm/string/predicate.hpp>

using nlohmann::json;

namespace {
std::time_t const now = 1700000000;

std::vector<std::string> const all_queues{
    Config::discovery_queue, Config::generate_queue, Config::verify_queue};

bool same(std::vector<std::string> const& got,
          std::vector<std::string> const& want)
{
  return got == want;
}

void modes()
{
  using V = std::vector<std::string>;
  CHECK(same(Modes::normalize("gen+verify"), V{"generate", "verify"}));
  CHECK(same(Modes::normalize("crawl, verif"), V{"autodiscovery", "verify"}));
  CHECK(same(Modes::normalize(json::array({"generate_verify", "gen"})),
             V{"generate", "verify"}));
  CHECK(same(Modes::normalize("Discovery discovery"), V{"autodiscovery"}));
  CHECK(same(Modes::normalize("genverify"), V{"generate", "verify"}));
  CHECK(same(Modes::normalize("verify+all"), V{"full"}));
  CHECK(same(Modes::normalize("everything"), V{"full"}));
  CHECK(same(Modes::normalize(""), V{"full"}));
  CHECK(same(Modes::normalize(json{}), V{"full"}));
  CHECK(same(Modes::normalize("bogus"), V{"full"}));
  CHECK(same(Modes::normalize(json(42)), V{"full"}));
}

void fanout()
{
  Settings   settings;
  SQLite::DB db{":memory:"};
  Store      store{db};
  JobQueue   queue{db};
  Pipeline   pipeline{settings, store, queue};

  auto const run = store.create_run(
      "t1", json::array({" Example.COM ", "", "b.example", "c.example"}),
      json{{"modes", "full"}, {"company_limit", 2}}, now);

  auto const progress = pipeline.start(run, now);
  CHECK_EQ(progress["phase"].get<std::string>(), "fanout_complete");
  CHECK_EQ(progress["limits"]["original_count"].get<int>(), 3);
  CHECK(progress["limits"]["company_limit_applied"].get<bool>());
  CHECK(!progress["limits"]["hard_24h_applied"].get<bool>());
  CHECK_EQ(progress["limits"]["used_24h_method"].get<std::string>(), "runs");
  CHECK_EQ(progress["metrics"]["companies_enqueued"].get<int>(), 2);
  CHECK_EQ(progress["metrics"]["verify_jobs_enqueued"].get<int>(), 2);
  CHECK_EQ(progress["domains"].size(), 2u);
  CHECK_EQ(progress["domains"][0]["domain"].get<std::string>(), "example.com");

  CHECK_EQ(store.run(run)->status, "running");
  CHECK_EQ(store.run(run)->progress["phase"].get<std::string>(),
           "fanout_complete");

  // discovery <- generate_company <- verify_sweep, per domain
  auto const jobs = queue.jobs_of_run(run);
  CHECK_EQ(jobs.size(), 6u);
  for (auto const& d : progress["domains"]) {
    auto const& chain = d["jobs"];
    CHECK_EQ(chain.size(), 3u);
    auto const disc  = queue.job(chain[0]["job_id"].get<std::string>());
    auto const gen   = queue.job(chain[1]["job_id"].get<std::string>());
    auto const sweep = queue.job(chain[2]["job_id"].get<std::string>());
    CHECK_EQ(disc->stage, Stage::autodiscovery);
    CHECK(!disc->depends_on);
    CHECK_EQ(*gen->depends_on, disc->id);
    CHECK_EQ(*sweep->depends_on, gen->id);
    CHECK(sweep->payload["only_with_source_url"].get<bool>());
    CHECK_EQ(sweep->payload["domain"], d["domain"]);
  }

  // Not twice.
  auto threw = false;
  try {
    pipeline.start(run, now);
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);

  // Verification alone sweeps everything, right away.
  auto const verify_only = store.create_run(
      "t1", json::array({"d.example"}), json{{"modes", "verif"}}, now);
  pipeline.start(verify_only, now);
  auto const vjobs = queue.jobs_of_run(verify_only);
  CHECK_EQ(vjobs.size(), 1u);
  CHECK_EQ(vjobs[0].stage, Stage::verify_sweep);
  CHECK(!vjobs[0].depends_on);
  CHECK(!vjobs[0].payload["only_with_source_url"].get<bool>());

  // Generation without its own probes sweeps everything too.
  settings.max_probes_per_person = 0;
  auto const gen_only = store.create_run(
      "t1", json::array({"e.example"}), json{{"modes", "gen+verify"}}, now);
  pipeline.start(gen_only, now);
  auto const gjobs = queue.jobs_of_run(gen_only);
  CHECK_EQ(gjobs.size(), 2u);
  for (auto const& j : gjobs) {
    if (j.stage == Stage::verify_sweep) {
      CHECK(!j.payload["only_with_source_url"].get<bool>());
      CHECK(j.depends_on);
    }
  }
}

void quotas()
{
  Settings settings;
  settings.daily_domain_cap = 3;

  SQLite::DB db{":memory:"};
  Store      store{db};
  JobQueue   queue{db};
  Pipeline   pipeline{settings, store, queue};

  auto const a = store.create_run("t1", json::array({"a.example", "b.example"}),
                                  json{{"modes", "verify"}}, now);
  pipeline.start(a, now);

  auto const b
      = store.create_run("t1", json::array({"c.example", "d.example"}),
                         json{{"modes", "verify"}}, now + 60);
  auto const pb = pipeline.start(b, now + 60);
  CHECK_EQ(pb["limits"]["used_24h"].get<int>(), 2);
  CHECK_EQ(pb["limits"]["used_24h_method"].get<std::string>(), "user_activity");
  CHECK_EQ(pb["limits"]["remaining_24h"].get<int>(), 1);
  CHECK(pb["limits"]["hard_24h_applied"].get<bool>());
  CHECK_EQ(queue.jobs_of_run(b).size(), 1u);

  auto const c = store.create_run("t1", json::array({"e.example"}),
                                  json{{"modes", "verify"}}, now + 120);
  auto threw = false;
  try {
    pipeline.start(c, now + 120);
  }
  catch (std::runtime_error const& e) {
    threw = true;
    CHECK(boost::contains(e.what(), "24h company limit exceeded"));
  }
  CHECK(threw);
  auto const failed = store.run(c);
  CHECK_EQ(failed->status, "failed");
  CHECK(boost::contains(failed->error, "runtime_error: 24h company limit"));
  CHECK(queue.jobs_of_run(c).empty());

  // A day later there is room again.
  auto const d = store.create_run("t1", json::array({"f.example"}),
                                  json{{"modes", "verify"}}, now + 86400 + 121);
  auto const pd = pipeline.start(d, now + 86400 + 121);
  CHECK_EQ(pd["limits"]["remaining_24h"].get<int>(), 3);

  // No activity to go by; the tenant's other runs are counted.
  store.create_run("t2", json::array({"a.example", "b.example", "c.example"}),
                   json::object(), now);
  auto const e = store.create_run("t2", json::array({"d.example"}),
                                  json::object(), now);
  auto const usage = pipeline.used_last_24h("t2", e, now);
  CHECK_EQ(usage.used, 3);
  CHECK_EQ(usage.method, "runs");
  threw = false;
  try {
    pipeline.start(e, now);
  }
  catch (std::runtime_error const&) {
    threw = true;
  }
  CHECK(threw);
}

// Claims and hands generation jobs to the pipeline until only
// verification is left.
void drive_generation(JobQueue& queue, Pipeline& pipeline)
{
  while (auto const job = queue.claim({Config::discovery_queue,
                                       Config::generate_queue},
                                      now)) {
    if (job->stage == Stage::generate_company)
      queue.finish(job->id, pipeline.generate_company(*job, now), now);
    else if (job->stage == Stage::generate_person)
      queue.finish(job->id, pipeline.generate_person(*job, now), now);
    else
      queue.finish(job->id, json::object(), now);
  }
}

void generation_and_completion()
{
  Settings settings;
  settings.cleanup_permutations = true;

  SQLite::DB db{":memory:"};
  Store      store{db};
  JobQueue   queue{db};
  Pipeline   pipeline{settings, store, queue};

  auto const run = store.create_run("t1", json::array({"example.com"}),
                                    json{{"modes", "gen+verify"}}, now);

  // Found on the web before the run: two flast addresses, one person
  // without.
  auto const company = store.ensure_company("t1", "example.com", run, now);
  auto const add     = [&](char const* full, char const* email) {
    Person p;
    p.company_id   = company;
    p.full_name    = full;
    auto const id  = store.upsert_person(p);
    if (email) {
      EmailRow e;
      e.person_id   = id;
      e.company_id  = company;
      e.email       = email;
      e.source_url  = "https://example.com/team";
      e.source_note = "team page";
      store.upsert_email(e, now);
    }
    return id;
  };
  add("Alice Smith", "asmith@example.com");
  add("Bob Jones", "bjones@example.com");
  add("Brett Anderson", nullptr);

  pipeline.start(run, now);
  CHECK(!pipeline.maybe_complete(run, now));

  drive_generation(queue, pipeline);

  auto const d = store.domain("example.com");
  CHECK(d);
  CHECK_EQ(*d->email_pattern, "flast");

  auto const generated = store.email_id("banderson@example.com");
  CHECK(generated);
  CHECK_EQ(*store.email(*generated)->source_note, "generated:flast");
  // The sourced address keeps its provenance.
  CHECK_EQ(*store.email(*store.email_id("asmith@example.com"))->source_note,
           "team page");
  CHECK(!store.email_id("brett.anderson@example.com"));

  // The sweep, then the probes it and generation queued.
  std::vector<std::string> probed;
  while (auto const job = queue.claim({Config::verify_queue}, now)) {
    if (job->stage == Stage::verify_sweep) {
      auto const r = pipeline.verify_sweep(*job, now);
      CHECK(r["only_with_source_url"].get<bool>());
      CHECK_EQ(r["emails_enqueued"].get<int>(), 2);
      queue.finish(job->id, r, now);
      continue;
    }
    CHECK_EQ(job->stage, Stage::verify_email);
    CHECK(!pipeline.maybe_complete(run, now));

    auto const email = job->payload["email"].get<std::string>();
    probed.push_back(email);

    ResultWrite w;
    w.email_id      = job->payload["email_id"].get<int64_t>();
    w.verify_status = email == "banderson@example.com" ? VerifyStatus::invalid
                                                       : VerifyStatus::valid;
    store.upsert_result(w, now);
    queue.finish(job->id, json::object(), now);
  }
  // Three from generation, two from the sweep.
  CHECK_EQ(probed.size(), 5u);
  CHECK(std::count(begin(probed), end(probed), "banderson@example.com") == 1);

  CHECK(pipeline.maybe_complete(run, now + 10));
  CHECK(!pipeline.maybe_complete(run, now + 11));

  auto const done = store.run(run);
  CHECK_EQ(done->status, "succeeded");
  CHECK_EQ(done->progress["phase"].get<std::string>(), "completed");
  CHECK_EQ(done->progress["permutation_cleanup"]["emails_deleted"].get<int>(),
           1);

  auto const metrics = store.run_metrics(run);
  CHECK(metrics);
  CHECK_EQ((*metrics)["emails_valid"].get<int>(), 2);
  CHECK_EQ((*metrics)["emails_invalid"].get<int>(), 1);
  CHECK_EQ((*metrics)["jobs_failed"].get<int>(), 0);

  // The invalid permutation is gone, with its result.
  CHECK(!store.email_id("banderson@example.com"));
  CHECK(!store.result_for_email(*generated));
  CHECK(store.email_id("asmith@example.com"));

  SQLite::Stmt activity{db, "SELECT action FROM user_activity"
                            " WHERE resource_id = ? ORDER BY id"};
  activity.bind(1, run);
  CHECK(activity.step());
  CHECK_EQ(activity.text(0), "run_started");
  CHECK(activity.step());
  CHECK_EQ(activity.text(0), "run_completed");
}

void failures_complete_with_errors()
{
  Settings   settings;
  SQLite::DB db{":memory:"};
  Store      store{db};
  JobQueue   queue{db};
  Pipeline   pipeline{settings, store, queue};

  auto const run = store.create_run("t1", json::array({"x.example"}),
                                    json{{"modes", "discovery+verify"}}, now);
  pipeline.start(run, now);

  auto const job = queue.claim(all_queues, now);
  CHECK(job);
  CHECK_EQ(job->stage, Stage::autodiscovery);
  queue.fail(job->id, "std::runtime_error: site unreachable", now);

  // The sweep went down with it.
  CHECK_EQ(queue.live_jobs(run), 0);
  CHECK(pipeline.maybe_complete(run, now));

  auto const done = store.run(run);
  CHECK_EQ(done->status, "completed_with_errors");
  auto const metrics = *store.run_metrics(run);
  CHECK_EQ(metrics["jobs_failed"].get<int>(), 2);
  CHECK_EQ(metrics["error_types"]["std::runtime_error"].get<int>(), 1);
  CHECK_EQ(metrics["error_types"]["dependency_failed"].get<int>(), 1);
  CHECK_EQ(metrics["errors"].size(), 2u);
  CHECK(done->progress["permutation_cleanup"]["skipped"].get<bool>());

  // Nothing to do finishes at once.
  auto const empty = store.create_run("t1", json::array({" ", ""}),
                                      json::object(), now);
  pipeline.start(empty, now);
  CHECK_EQ(store.run(empty)->status, "succeeded");
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  modes();
  fanout();
  quotas();
  generation_and_completion();
  failures_complete_with_errors();

  LOG(INFO) << "Pipeline-test passed";
}
