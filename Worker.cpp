#include "Worker.hpp"

#include "Backoff.hpp"
#include "Discovery.hpp"
#include "JobQueue.hpp"
#include "Pipeline.hpp"
#include "Store.hpp"
#include "TestSend.hpp"
#include "TestSender.hpp"
#include "VerificationTask.hpp"

#include <stdexcept>
#include <thread>
#include <typeinfo>
#include <variant>

#include <glog/logging.h>

#include <boost/core/demangle.hpp>

#include <fmt/format.h>

using nlohmann::json;

std::function<void(int64_t, std::time_t)> test_send_enqueuer(JobQueue& queue)
{
  return [&queue](int64_t result_id, std::time_t now) {
    queue.enqueue(Config::test_send_queue, Stage::test_send,
                  json{{"result_id", result_id}}, "", {}, now);
  };
}

Worker::Worker(Settings const&          settings,
               Store&                   store,
               JobQueue&                queue,
               Pipeline&                pipeline,
               VerificationTask&        task,
               TestSendEscalator&       escalator,
               TestSender&              sender,
               Discovery&               discovery,
               std::vector<std::string> queues)
  : settings_(settings)
  , store_(store)
  , queue_(queue)
  , pipeline_(pipeline)
  , task_(task)
  , escalator_(escalator)
  , sender_(sender)
  , discovery_(discovery)
  , queues_(std::move(queues))
{
  if (queues_.empty())
    throw std::invalid_argument("worker needs at least one queue");
}

bool Worker::run_one(std::time_t now)
{
  auto const job = queue_.claim(queues_, now);
  if (!job)
    return false;

  LOG(INFO) << "job " << job->id << " " << job->stage << " attempt "
            << job->attempts;

  auto terminal = true;
  try {
    auto const out = dispatch_(*job, now);
    if (out.retry) {
      LOG(INFO) << "job " << job->id << " again in " << out.delay.count()
                << "ms: " << out.reason;
      queue_.retry(job->id, out.delay, out.reason, now);
      terminal = false;
    }
    else {
      queue_.finish(job->id, out.result, now);
    }
  }
  catch (std::exception const& e) {
    auto const err = fmt::format(
        "{}: {}", boost::core::demangle(typeid(e).name()), e.what());

    // A probe that blew up gets the same attempts a temporary failure
    // would.
    if (job->stage == Stage::verify_email
        && job->attempts < settings_.max_attempts) {
      auto const delay = Backoff::full_jitter(
          job->attempts - 1, settings_.backoff_base, settings_.backoff_cap);
      LOG(WARNING) << "job " << job->id << " " << err << ", again in "
                   << delay.count() << "ms";
      queue_.retry(job->id, delay, err, now);
      terminal = false;
    }
    else {
      LOG(ERROR) << "job " << job->id << " " << job->stage
                 << " failed: " << err;
      queue_.fail(job->id, err, now);
    }
  }

  if (terminal && !job->run_id.empty())
    pipeline_.maybe_complete(job->run_id, now);

  return true;
}

void Worker::run(std::atomic<bool> const& stop, std::chrono::milliseconds idle)
{
  LOG(INFO) << "worker on " << queues_.size() << " queues";
  while (!stop) {
    if (!run_one(std::time(nullptr)))
      std::this_thread::sleep_for(idle);
  }
  LOG(INFO) << "worker stopped";
}

Worker::Outcome Worker::dispatch_(Job const& job, std::time_t now)
{
  if (job.stage == Stage::autodiscovery)
    return autodiscovery_(job, now);
  if (job.stage == Stage::generate_company)
    return Outcome{pipeline_.generate_company(job, now)};
  if (job.stage == Stage::generate_person)
    return Outcome{pipeline_.generate_person(job, now)};
  if (job.stage == Stage::verify_sweep)
    return Outcome{pipeline_.verify_sweep(job, now)};
  if (job.stage == Stage::verify_email)
    return verify_email_(job, now);
  if (job.stage == Stage::test_send)
    return test_send_(job, now);

  throw std::invalid_argument(fmt::format("unknown stage \"{}\"", job.stage));
}

Worker::Outcome Worker::autodiscovery_(Job const& job, std::time_t now)
{
  auto const company_id = job.payload.at("company_id").get<int64_t>();
  auto const company    = store_.company(company_id);
  if (!company)
    throw std::invalid_argument(fmt::format("no company {}", company_id));

  auto result      = discovery_.discover(*company, job.run_id, now).to_json();
  result["domain"] = company->domain;
  return Outcome{result};
}

Worker::Outcome Worker::verify_email_(Job const& job, std::time_t now)
{
  VerificationTask::Request req;
  req.email_id = job.payload.at("email_id").get<int64_t>();
  req.email    = job.payload.at("email").get<std::string>();
  req.domain   = job.payload.value("domain", std::string{});
  req.attempt  = job.attempts;
  req.force    = job.payload.value("force", false);
  req.job_id   = job.id;
  req.run_id   = job.run_id;

  auto const res = task_.run(req, now);

  if (auto const retry = std::get_if<VerificationTask::Retry>(&res)) {
    Outcome out;
    out.retry  = true;
    out.delay  = retry->delay;
    out.reason = retry->reason;
    return out;
  }

  auto const& done = std::get<VerificationTask::Done>(res);
  return Outcome{json{
      {"result_id", done.result_id ? json(*done.result_id) : json{}},
      {"email", req.email},
      {"status", c_str(done.status)},
      {"reason", done.reason},
      {"category", Probe::category_c_str(done.category)},
      {"code", done.code ? json(*done.code) : json{}},
      {"mx_host", done.mx_host},
      {"error", done.error},
  }};
}

Worker::Outcome Worker::test_send_(Job const& job, std::time_t now)
{
  auto const result_id = job.payload.at("result_id").get<int64_t>();

  auto const row = store_.result(result_id);
  if (!row || row->test_send_status != TestSendStatus::pending
      || !row->test_send_token) {
    LOG(INFO) << "test-send " << result_id << " is no longer pending";
    return Outcome{json{{"skipped", "not_pending"}}};
  }

  auto const email = store_.email(row->email_id);
  if (!email)
    throw std::invalid_argument(
        fmt::format("result {} has no email row", result_id));

  auto const& token = *row->test_send_token;
  if (!sender_.send(email->email, escalator_.return_path(token), token)) {
    if (job.attempts < settings_.max_attempts) {
      Outcome out;
      out.retry  = true;
      out.delay  = Backoff::full_jitter(job.attempts - 1, settings_.backoff_base,
                                       settings_.backoff_cap);
      out.reason = "send_failed";
      return out;
    }
    throw std::runtime_error(
        fmt::format("test-send to {} not accepted", email->email));
  }

  if (!escalator_.mark_sent(result_id, now))
    LOG(WARNING) << "test-send " << result_id << " moved on while sending";
  return Outcome{json{{"sent", true}, {"email", email->email}, {"token", token}}};
}
