#include "JobQueue.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(job_status_from("finished") == JobStatus::finished);
  CHECK(!job_status_from("deferred"));

  SQLite::DB db{":memory:"};
  JobQueue   q{db};

  std::time_t const now = 1700000000;

  std::vector<std::string> const queues{"discovery", "generate", "verify"};

  // A chain runs in dependency order.
  auto const a = q.enqueue("discovery", "autodiscovery",
                           nlohmann::json{{"company_id", 1}}, "run-1", {}, now);
  auto const b = q.enqueue("generate", "generate_company", {}, "run-1", a, now);
  auto const c = q.enqueue("verify", "verify_sweep", {}, "run-1", b, now);
  CHECK_EQ(q.live_jobs("run-1"), 3);

  auto job = q.claim(queues, now);
  CHECK(job);
  CHECK_EQ(job->id, a);
  CHECK(job->status == JobStatus::started);
  CHECK_EQ(job->attempts, 1);
  CHECK_EQ(job->payload["company_id"].get<int>(), 1);
  CHECK(!q.claim(queues, now));

  q.finish(a, nlohmann::json{{"pages", 3}}, now);
  CHECK_EQ(q.job(a)->result["pages"].get<int>(), 3);

  job = q.claim(queues, now);
  CHECK_EQ(job->id, b);
  CHECK_EQ(*job->depends_on, a);

  // Failure takes the rest of the chain with it.
  q.fail(b, "runtime_error: boom", now);
  CHECK(q.job(c)->status == JobStatus::failed);
  CHECK_EQ(q.job(c)->error, "dependency_failed: " + b);
  CHECK_EQ(q.live_jobs("run-1"), 0);
  CHECK_EQ(q.jobs_of_run("run-1").size(), 3u);

  // Delays and retries.
  auto const d = q.enqueue("verify", "verify_email", {}, "run-2", {}, now, 60s);
  CHECK(!q.claim(queues, now));
  job = q.claim(queues, now + 60);
  CHECK_EQ(job->id, d);

  q.retry(d, 1500ms, "global RPS throttle", now + 60);
  CHECK(q.job(d)->status == JobStatus::queued);
  CHECK(!q.claim(queues, now + 61));
  job = q.claim(queues, now + 62);
  CHECK_EQ(job->id, d);
  CHECK_EQ(job->attempts, 2);
  CHECK_EQ(q.count("verify", JobStatus::started), 1);

  // Earlier queues first.
  auto const v = q.enqueue("verify", "verify_email", {}, "run-3", {}, now);
  auto const g = q.enqueue("generate", "generate_person", {}, "run-3", {}, now);
  CHECK_EQ(q.claim(queues, now)->id, g);
  CHECK_EQ(q.claim(queues, now)->id, v);

  LOG(INFO) << "JobQueue-test passed";
}
