#include "VerificationTask.hpp"

#include "Backoff.hpp"
#include "CatchAllProbe.hpp"
#include "ConcurrencyGate.hpp"
#include "FallbackVerifier.hpp"
#include "MX.hpp"
#include "Mailbox.hpp"
#include "Preflight.hpp"
#include "StatusClassifier.hpp"
#include "Store.hpp"
#include "TestSend.hpp"

#include <typeinfo>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/core/demangle.hpp>

#include <fmt/format.h>

namespace {
Status::Rcpt rcpt_of(Probe::Category cat)
{
  switch (cat) {
  case Probe::Category::accept: return Status::Rcpt::accept;
  case Probe::Category::hard_fail: return Status::Rcpt::hard_fail;
  case Probe::Category::temp_fail: return Status::Rcpt::soft_fail;
  case Probe::Category::unknown: break;
  }
  return Status::Rcpt::unknown;
}

bool definite(FallbackStatus status)
{
  return status == FallbackStatus::valid || status == FallbackStatus::invalid;
}
} // namespace

VerificationTask::VerificationTask(Settings const&    settings,
                                   Store&             store,
                                   MX::Lookup&        lookup,
                                   Preflight&         preflight,
                                   ConcurrencyGate&   gate,
                                   Probe::Prober&     prober,
                                   CatchAllProbe&     catch_all,
                                   FallbackVerifier&  fallback,
                                   TestSendEscalator* escalator)
  : settings_(settings)
  , store_(store)
  , lookup_(lookup)
  , preflight_(preflight)
  , gate_(gate)
  , prober_(prober)
  , catch_all_(catch_all)
  , fallback_(fallback)
  , escalator_(escalator)
{
}

VerificationTask::Result VerificationTask::run(Request const& req,
                                               std::time_t    now)
{
  char const* step = "start";
  try {
    return run_(req, now, step);
  }
  catch (std::exception const& e) {
    if (last_attempt_(req)) {
      DeadLetter dl;
      dl.job_id        = req.job_id;
      dl.queue         = Config::verify_queue;
      dl.email         = req.email;
      dl.error_type    = boost::core::demangle(typeid(e).name());
      dl.error_message = e.what();
      dl.traceback     = fmt::format("VerificationTask::run at {}", step);
      dl.meta          = {{"attempt", req.attempt},
                          {"max_attempts", settings_.max_attempts},
                          {"email_id", req.email_id},
                          {"run_id", req.run_id}};
      store_.add_dead_letter(dl, now, settings_.dead_letter_keep);
    }
    LOG(ERROR) << "verification of " << req.email << " failed at " << step
               << ": " << e.what();
    throw;
  }
}

VerificationTask::Result
VerificationTask::run_(Request const& req, std::time_t now, char const*& step)
{
  step = "normalize";
  auto const email = boost::algorithm::trim_copy(req.email);
  auto const mbx   = Mailbox::parse(email);
  if (!mbx) {
    LOG(WARNING) << "not an address: \"" << req.email << "\"";
    Done done;
    done.error = "bad_input";
    return done;
  }
  auto domain = boost::algorithm::to_lower_copy(
      boost::algorithm::trim_copy(req.domain));
  if (domain.empty())
    domain = mbx->domain();

  step = "resolve";
  auto const mx_host = MX::resolve(lookup_, domain);

  auto tcp25_ok = true;
  if (settings_.preflight) {
    step          = "preflight";
    auto const pf = preflight_.check(mx_host);
    tcp25_ok      = pf.ok;
    if (!pf.ok && !pf.blocked && !req.force) {
      // Could not even find the exchanger's address; try again later.
      return temporary_(req, email, mx_host, pf.error, now);
    }
    if (pf.blocked && !req.force) {
      LOG(WARNING) << "port 25 to " << mx_host << " is blocked: " << pf.error;
      step = "persist";
      Status::Signals sig;
      sig.rcpt      = Status::Rcpt::soft_fail;
      auto const cl = Status::classify(sig, now, settings_.result_ttl);
      Done       done;
      done.result_id = persist_(req.email_id, cl.status, cl.reason, mx_host,
                                nullptr, now);
      done.status    = cl.status;
      done.reason    = cl.reason;
      done.category  = Probe::Category::temp_fail;
      done.mx_host   = mx_host;
      done.error     = "tcp25_blocked";
      settle_(done);
      return done;
    }
  }

  step = "gate";
  Probe::Outcome outcome;
  {
    auto const global
        = gate_.try_lease(ConcurrencyGate::global_key(),
                          settings_.global_max_concurrency);
    if (!global)
      return temporary_(req, email, mx_host, "global concurrency cap reached",
                        now);

    auto const per_mx = gate_.try_lease(ConcurrencyGate::mx_key(mx_host),
                                        settings_.per_mx_max_concurrency);
    if (!per_mx)
      return temporary_(req, email, mx_host, "per-MX concurrency cap reached",
                        now);

    if (settings_.global_rps > 0
        && !gate_.consume_rps(ConcurrencyGate::global_rps_key(),
                              settings_.global_rps, now))
      return temporary_(req, email, mx_host, "global RPS throttle", now);

    if (settings_.per_mx_rps > 0
        && !gate_.consume_rps(ConcurrencyGate::mx_rps_key(mx_host),
                              settings_.per_mx_rps, now))
      return temporary_(req, email, mx_host, "MX RPS throttle", now);

    step    = "probe";
    outcome = prober_.probe(email, mx_host);
  }

  auto const cat = outcome.category();

  // A timeout or a dropped connection is as temporary as a 4xx.
  auto const soft = cat == Probe::Category::temp_fail || outcome.transient();

  std::optional<FallbackResult> fb;
  if (cat == Probe::Category::unknown || cat == Probe::Category::temp_fail) {
    step = "fallback";
    fb   = consult(fallback_, email);
    LOG(INFO) << "fallback for " << email << ": " << c_str(fb->status);
  }

  if (soft && !(fb && definite(fb->status))) {
    auto why = outcome.error.empty() ? outcome.message : outcome.error;
    if (outcome.code)
      why = fmt::format("{} {}", *outcome.code, why);
    return temporary_(req, email, mx_host, why, now);
  }

  Status::Signals sig;
  sig.rcpt = soft ? Status::Rcpt::soft_fail : rcpt_of(cat);
  if (fb)
    sig.fallback = fb->status;

  if (cat == Probe::Category::accept) {
    step = "catch_all";
    if (tcp25_ok) {
      sig.catch_all = catch_all_.check(domain, now).status;
    }
    else if (auto const row = store_.domain(domain)) {
      // No active probing without port 25, only what is on record.
      sig.catch_all = row->catch_all_status;
    }
  }

  step          = "persist";
  auto const cl = Status::classify(sig, now, settings_.result_ttl);

  Done done;
  done.result_id
      = persist_(req.email_id, cl.status, cl.reason, mx_host,
                 fb ? &*fb : nullptr, now);
  done.status   = cl.status;
  done.reason   = cl.reason;
  done.category = cat;
  done.code     = outcome.code;
  done.mx_host  = mx_host;
  done.error    = outcome.error;
  settle_(done);

  LOG(INFO) << email << " is " << c_str(done.status) << " (" << done.reason
            << ")";

  if (escalator_ && settings_.test_send
      && (done.status == VerifyStatus::risky_catch_all
          || done.status == VerifyStatus::unknown_timeout)) {
    step = "escalate";
    escalator_->maybe_escalate(req.email_id, now);
  }

  return done;
}

VerificationTask::Result
VerificationTask::temporary_(Request const&     req,
                             std::string const& email,
                             std::string const& mx_host,
                             std::string const& why,
                             std::time_t        now)
{
  if (!last_attempt_(req)) {
    Retry retry;
    retry.delay  = Backoff::full_jitter(req.attempt - 1, settings_.backoff_base,
                                       settings_.backoff_cap);
    retry.reason = why;
    LOG(INFO) << email << ": " << why << ", retry " << req.attempt + 1 << "/"
              << settings_.max_attempts << " in " << retry.delay.count()
              << "ms";
    return retry;
  }

  // Out of attempts; what we have is the answer.
  Status::Signals sig;
  sig.rcpt      = Status::Rcpt::soft_fail;
  auto const cl = Status::classify(sig, now, settings_.result_ttl);

  Done done;
  done.result_id
      = persist_(req.email_id, cl.status, cl.reason, mx_host, nullptr, now);
  done.status   = cl.status;
  done.reason   = cl.reason;
  done.category = Probe::Category::temp_fail;
  done.mx_host  = mx_host;
  done.error    = why;
  settle_(done);

  DeadLetter dl;
  dl.job_id        = req.job_id;
  dl.queue         = Config::verify_queue;
  dl.email         = email;
  dl.mx_host       = mx_host;
  dl.error_type    = "temporary_failure";
  dl.error_message = why;
  dl.meta          = {{"attempt", req.attempt},
                      {"max_attempts", settings_.max_attempts},
                      {"email_id", req.email_id},
                      {"run_id", req.run_id}};
  store_.add_dead_letter(dl, now, settings_.dead_letter_keep);

  if (escalator_ && settings_.test_send
      && done.status == VerifyStatus::unknown_timeout)
    escalator_->maybe_escalate(req.email_id, now);

  return done;
}

void VerificationTask::settle_(Done& done)
{
  auto const row = store_.result(*done.result_id);
  CHECK(row);
  if (row->verify_status && *row->verify_status != done.status) {
    LOG(INFO) << "result " << *done.result_id << " stays "
              << c_str(*row->verify_status) << " (" << row->verify_reason
              << ") from its test-send";
    done.status = *row->verify_status;
    done.reason = row->verify_reason;
  }
}

int64_t VerificationTask::persist_(int64_t               email_id,
                                   VerifyStatus          status,
                                   std::string const&    reason,
                                   std::string const&    mx_host,
                                   FallbackResult const* fallback,
                                   std::time_t           now)
{
  ResultWrite w;
  w.email_id      = email_id;
  w.verify_status = status;
  w.verify_reason = reason;
  w.mx_host       = mx_host;
  if (fallback) {
    w.fallback_status = fallback->status;
    w.fallback_raw    = fallback->raw;
  }
  return store_.upsert_result(w, now);
}
