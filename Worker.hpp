#ifndef WORKER_DOT_HPP
#define WORKER_DOT_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Settings.hpp"

class Discovery;
class JobQueue;
class Pipeline;
class Store;
class TestSendEscalator;
class TestSender;
class VerificationTask;
struct Job;

// Queues a test-send job for a result row, outside of any run.
std::function<void(int64_t, std::time_t)> test_send_enqueuer(JobQueue& queue);

// Claims jobs from its queues, one at a time, and runs each by its
// stage.  Every job ends finished, failed, or back on its queue with a
// delay; when that leaves a run with nothing live the run is completed.

class Worker {
public:
  Worker(Worker const&) = delete;
  Worker& operator=(Worker const&) = delete;

  Worker(Settings const&          settings,
         Store&                   store,
         JobQueue&                queue,
         Pipeline&                pipeline,
         VerificationTask&        task,
         TestSendEscalator&       escalator,
         TestSender&              sender,
         Discovery&               discovery,
         std::vector<std::string> queues);

  // False if there was nothing to run.
  bool run_one(std::time_t now);

  // Until stop is set, sleeping idle between empty claims.
  void run(std::atomic<bool> const& stop, std::chrono::milliseconds idle);

  struct Outcome {
    nlohmann::json            result;
    bool                      retry{false};
    std::chrono::milliseconds delay{0};
    std::string               reason;
  };

private:
  Outcome dispatch_(Job const& job, std::time_t now);
  Outcome autodiscovery_(Job const& job, std::time_t now);
  Outcome verify_email_(Job const& job, std::time_t now);
  Outcome test_send_(Job const& job, std::time_t now);

  Settings const&          settings_;
  Store&                   store_;
  JobQueue&                queue_;
  Pipeline&                pipeline_;
  VerificationTask&        task_;
  TestSendEscalator&       escalator_;
  TestSender&              sender_;
  Discovery&               discovery_;
  std::vector<std::string> queues_;
};

#endif // WORKER_DOT_HPP
