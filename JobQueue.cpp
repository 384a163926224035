#include "JobQueue.hpp"

#include "Now.hpp"
#include "Pill.hpp"

#include <stdexcept>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
// clang-format off
constexpr char const* schema = R"SQL(
CREATE TABLE IF NOT EXISTS jobs (
  id           TEXT PRIMARY KEY,
  queue        TEXT NOT NULL,
  stage        TEXT NOT NULL,
  payload_json TEXT NOT NULL DEFAULT '{}',
  depends_on   TEXT,
  run_id       TEXT NOT NULL DEFAULT '',
  status       TEXT NOT NULL DEFAULT 'queued',
  attempts     INTEGER NOT NULL DEFAULT 0,
  scheduled_at TEXT NOT NULL,
  created_at   TEXT NOT NULL,
  started_at   TEXT,
  finished_at  TEXT,
  result_json  TEXT,
  error        TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS jobs_runnable ON jobs(queue, status, scheduled_at);
CREATE INDEX IF NOT EXISTS jobs_run ON jobs(run_id, status);
CREATE INDEX IF NOT EXISTS jobs_depends ON jobs(depends_on);
)SQL";
// clang-format on

constexpr char const* job_cols
    = "id, queue, stage, payload_json, depends_on, run_id, status, attempts,"
      " scheduled_at, result_json, error";

Job job_from(SQLite::Stmt const& stmt)
{
  Job job;
  job.id         = stmt.text(0);
  job.queue      = stmt.text(1);
  job.stage      = stmt.text(2);
  job.payload    = nlohmann::json::parse(stmt.text(3));
  job.depends_on = stmt.opt_text(4);
  job.run_id     = stmt.text(5);
  auto const st  = job_status_from(stmt.text(6));
  if (!st)
    throw std::runtime_error(
        fmt::format("job {} has bad status \"{}\"", job.id, stmt.text(6)));
  job.status       = *st;
  job.attempts     = static_cast<int>(stmt.int64(7));
  job.scheduled_at = stmt.text(8);
  if (auto const r = stmt.opt_text(9))
    job.result = nlohmann::json::parse(*r);
  job.error = stmt.text(10);
  return job;
}
} // namespace

std::optional<JobStatus> job_status_from(std::string_view s)
{
  for (auto st : {JobStatus::queued, JobStatus::started, JobStatus::finished,
                  JobStatus::failed}) {
    if (s == c_str(st))
      return st;
  }
  return {};
}

JobQueue::JobQueue(SQLite::DB& db)
  : db_(db)
{
  db_.exec(schema);
}

std::string JobQueue::enqueue(std::string const&                queue,
                              std::string const&                stage,
                              nlohmann::json const&             payload,
                              std::string const&                run_id,
                              std::optional<std::string> const& depends_on,
                              std::time_t                       now,
                              std::chrono::seconds              delay)
{
  auto const id = fmt::format("job-{}", Pill{}.as_string_view());
  SQLite::Stmt{db_, "INSERT INTO jobs (id, queue, stage, payload_json,"
                    " depends_on, run_id, scheduled_at, created_at)"
                    " VALUES (?, ?, ?, ?, ?, ?, ?, ?)"}
      .bind(1, id)
      .bind(2, queue)
      .bind(3, stage)
      .bind(4, payload.dump())
      .bind(5, depends_on)
      .bind(6, run_id)
      .bind(7, Now(now + delay.count()).string())
      .bind(8, Now(now).string())
      .run();
  LOG(INFO) << "enqueued " << stage << " " << id << " on " << queue
            << (depends_on ? " after " + *depends_on : std::string{});
  return id;
}

std::optional<Job> JobQueue::claim(std::vector<std::string> const& queues,
                                   std::time_t                     now)
{
  auto const sql = fmt::format(
      "SELECT {} FROM jobs j WHERE queue = ? AND status = 'queued'"
      " AND scheduled_at <= ?"
      " AND (depends_on IS NULL OR EXISTS (SELECT 1 FROM jobs d"
      "      WHERE d.id = j.depends_on AND d.status = 'finished'))"
      " ORDER BY scheduled_at, created_at, rowid LIMIT 1",
      job_cols);
  auto const ts = Now(now).string();

  SQLite::Transaction tx{db_};
  for (auto const& queue : queues) {
    std::optional<Job> job;
    {
      SQLite::Stmt stmt{db_, sql.c_str()};
      stmt.bind(1, queue).bind(2, ts);
      if (stmt.step())
        job = job_from(stmt);
    }
    if (!job)
      continue;

    SQLite::Stmt{db_, "UPDATE jobs SET status = 'started',"
                      " attempts = attempts + 1, started_at = ?"
                      " WHERE id = ?"}
        .bind(1, ts)
        .bind(2, job->id)
        .run();
    tx.commit();

    job->status = JobStatus::started;
    ++job->attempts;
    return job;
  }
  tx.commit();
  return {};
}

void JobQueue::finish(std::string const&    id,
                      nlohmann::json const& result,
                      std::time_t           now)
{
  SQLite::Stmt{db_, "UPDATE jobs SET status = 'finished', result_json = ?,"
                    " error = '', finished_at = ? WHERE id = ?"}
      .bind(1, result.dump())
      .bind(2, Now(now).string())
      .bind(3, id)
      .run();
}

void JobQueue::retry(std::string const&        id,
                     std::chrono::milliseconds delay,
                     std::string const&        error,
                     std::time_t               now)
{
  // Whole seconds, rounded up.
  auto const secs = (delay.count() + 999) / 1000;
  SQLite::Stmt{db_, "UPDATE jobs SET status = 'queued', scheduled_at = ?,"
                    " error = ? WHERE id = ?"}
      .bind(1, Now(now + secs).string())
      .bind(2, error)
      .bind(3, id)
      .run();
  LOG(INFO) << id << " retry in " << secs << "s: " << error;
}

void JobQueue::fail(std::string const& id,
                    std::string const& error,
                    std::time_t        now)
{
  auto const ts = Now(now).string();

  SQLite::Transaction tx{db_};
  SQLite::Stmt{db_, "UPDATE jobs SET status = 'failed', error = ?,"
                    " finished_at = ? WHERE id = ?"}
      .bind(1, error)
      .bind(2, ts)
      .bind(3, id)
      .run();
  SQLite::Stmt{db_, "WITH RECURSIVE dep(id) AS ("
                    "  SELECT id FROM jobs WHERE depends_on = ?"
                    "  UNION SELECT j.id FROM jobs j JOIN dep"
                    "  ON j.depends_on = dep.id)"
                    " UPDATE jobs SET status = 'failed', error = ?,"
                    " finished_at = ?"
                    " WHERE id IN (SELECT id FROM dep) AND status = 'queued'"}
      .bind(1, id)
      .bind(2, fmt::format("dependency_failed: {}", id))
      .bind(3, ts)
      .run();
  auto const cascaded = db_.changes();
  tx.commit();

  LOG(WARNING) << id << " failed: " << error;
  if (cascaded)
    LOG(WARNING) << cascaded << " dependent job(s) of " << id << " failed";
}

std::optional<Job> JobQueue::job(std::string const& id)
{
  auto const   sql = fmt::format("SELECT {} FROM jobs WHERE id = ?", job_cols);
  SQLite::Stmt stmt{db_, sql.c_str()};
  stmt.bind(1, id);
  if (!stmt.step())
    return {};
  return job_from(stmt);
}

std::vector<Job> JobQueue::jobs_of_run(std::string const& run_id)
{
  auto const sql = fmt::format(
      "SELECT {} FROM jobs WHERE run_id = ? ORDER BY created_at, rowid",
      job_cols);
  SQLite::Stmt stmt{db_, sql.c_str()};
  stmt.bind(1, run_id);
  std::vector<Job> jobs;
  while (stmt.step())
    jobs.push_back(job_from(stmt));
  return jobs;
}

int64_t JobQueue::live_jobs(std::string const& run_id)
{
  SQLite::Stmt stmt{db_, "SELECT COUNT(*) FROM jobs WHERE run_id = ?"
                         " AND status IN ('queued', 'started')"};
  stmt.bind(1, run_id);
  CHECK(stmt.step());
  return stmt.int64(0);
}

int64_t JobQueue::count(std::string const& queue, JobStatus status)
{
  SQLite::Stmt stmt{db_,
                    "SELECT COUNT(*) FROM jobs WHERE queue = ? AND status = ?"};
  stmt.bind(1, queue).bind(2, c_str(status));
  CHECK(stmt.step());
  return stmt.int64(0);
}
