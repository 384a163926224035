#ifndef PIPELINE_DOT_HPP
#define PIPELINE_DOT_HPP

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Settings.hpp"

class JobQueue;
class Store;
struct Job;
struct Run;

namespace Stage {
constexpr char const* autodiscovery    = "autodiscovery";
constexpr char const* generate_company = "generate_company";
constexpr char const* generate_person  = "generate_person";
constexpr char const* verify_sweep     = "verify_sweep";
constexpr char const* verify_email     = "verify_email";
constexpr char const* test_send        = "test_send";
} // namespace Stage

namespace Modes {
constexpr char const* full          = "full";
constexpr char const* autodiscovery = "autodiscovery";
constexpr char const* generate      = "generate";
constexpr char const* verify        = "verify";

// From a string like "gen+verify" or a list of such.  Aliases are
// folded, duplicates dropped, and "full" swallows everything else.
// Nothing recognizable is {"full"}.
std::vector<std::string> normalize(nlohmann::json const& modes);
} // namespace Modes

// A run: a tenant's list of domains pushed through discovery,
// generation and verification as chains of dependent jobs, and summed
// up once the last of its jobs is done.
//
//   queued -> running -> succeeded | completed_with_errors | failed

class Pipeline {
public:
  Pipeline(Pipeline const&) = delete;
  Pipeline& operator=(Pipeline const&) = delete;

  Pipeline(Settings const& settings, Store& store, JobQueue& queue);

  // Enqueues the job chains of the run and returns its progress.  A
  // failure marks the run failed and is rethrown.
  nlohmann::json start(std::string const& run_id, std::time_t now);

  // The completion step, if the run is still running and none of its
  // jobs are live.  True if it ran.
  bool maybe_complete(std::string const& run_id, std::time_t now);

  // Sums up a run and gives it its final status; returns the metrics.
  nlohmann::json complete(std::string const& run_id, std::time_t now);

  struct Usage {
    int64_t     used{0};
    std::string method;
  };

  // Domains the tenant started runs for in the 24 hours before now.
  Usage used_last_24h(std::string const& tenant_id,
                      std::string const& exclude_run_id,
                      std::time_t        now);

  // Deletes the run's generated addresses that turned out invalid, and
  // with delete_untested those that were never verified.
  int64_t cleanup_permutations(std::string const& run_id,
                               bool               delete_untested);

  // Stage handlers, each returning the job's result.
  nlohmann::json generate_company(Job const& job, std::time_t now);
  nlohmann::json generate_person(Job const& job, std::time_t now);
  nlohmann::json verify_sweep(Job const& job, std::time_t now);

private:
  nlohmann::json start_(Run const& run, std::time_t now);

  std::string enqueue_verify_(nlohmann::json const& from,
                              int64_t               email_id,
                              std::string const&    email,
                              std::string const&    run_id,
                              std::time_t           now);

  Settings const& settings_;
  Store&          store_;
  JobQueue&       queue_;
};

#endif // PIPELINE_DOT_HPP
