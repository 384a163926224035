#ifndef JOBQUEUE_DOT_HPP
#define JOBQUEUE_DOT_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "SQLite.hpp"

enum class JobStatus {
  queued,
  started,
  finished,
  failed,
};

constexpr char const* c_str(JobStatus status)
{
  switch (status) { // clang-format off
  case JobStatus::queued:   return "queued";
  case JobStatus::started:  return "started";
  case JobStatus::finished: return "finished";
  case JobStatus::failed:   return "failed";
  } // clang-format on
  return "*** unknown JobStatus ***";
}

std::optional<JobStatus> job_status_from(std::string_view s);

struct Job {
  std::string                id;
  std::string                queue;
  std::string                stage;
  nlohmann::json             payload = nlohmann::json::object();
  std::optional<std::string> depends_on;
  std::string                run_id;
  JobStatus                  status{JobStatus::queued};
  int                        attempts{0};
  std::string                scheduled_at;
  nlohmann::json             result;
  std::string                error;
};

// Named queues of jobs in a table of the shared database.  Any number of
// worker processes may claim from the same file; a claim is one
// BEGIN IMMEDIATE transaction.
//
// A job becomes runnable once its scheduled time has come and the job
// it depends on, if any, has finished.  When a job fails, every job
// waiting on it fails too.

class JobQueue {
public:
  JobQueue(JobQueue const&) = delete;
  JobQueue& operator=(JobQueue const&) = delete;

  explicit JobQueue(SQLite::DB& db);

  std::string enqueue(std::string const&                queue,
                      std::string const&                stage,
                      nlohmann::json const&             payload,
                      std::string const&                run_id,
                      std::optional<std::string> const& depends_on,
                      std::time_t                       now,
                      std::chrono::seconds delay = std::chrono::seconds{0});

  // The oldest runnable job of the first queue that has one, now
  // started with its attempt count bumped.
  std::optional<Job> claim(std::vector<std::string> const& queues,
                           std::time_t                     now);

  void finish(std::string const&    id,
              nlohmann::json const& result,
              std::time_t           now);

  // Back to queued, runnable again after delay.
  void retry(std::string const&        id,
             std::chrono::milliseconds delay,
             std::string const&        error,
             std::time_t               now);

  void fail(std::string const& id, std::string const& error, std::time_t now);

  std::optional<Job> job(std::string const& id);
  std::vector<Job>   jobs_of_run(std::string const& run_id);

  // Jobs of the run not yet finished or failed.
  int64_t live_jobs(std::string const& run_id);
  int64_t count(std::string const& queue, JobStatus status);

private:
  SQLite::DB& db_;
};

#endif // JOBQUEUE_DOT_HPP
