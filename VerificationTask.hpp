#ifndef VERIFICATIONTASK_DOT_HPP
#define VERIFICATIONTASK_DOT_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <variant>

#include "Probe.hpp"
#include "Settings.hpp"
#include "VerificationResult.hpp"

class CatchAllProbe;
class ConcurrencyGate;
class FallbackVerifier;
struct FallbackResult;
class Preflight;
class Store;
class TestSendEscalator;

namespace MX {
class Lookup;
}

// Verification of one address: one admission-controlled probe, a
// classification, one upserted result row.
//
// Temporary failures are not slept on here; the caller gets a Retry
// with the delay and requeues the job.  Attempts are numbered from 1.

class VerificationTask {
public:
  struct Request {
    int64_t     email_id{0};
    std::string email;
    std::string domain; // from the email when empty
    int         attempt{1};
    bool        force{false};
    std::string job_id;
    std::string run_id;
  };

  struct Done {
    std::optional<int64_t> result_id;
    VerifyStatus           status{VerifyStatus::unknown_timeout};
    std::string            reason;
    Probe::Category        category{Probe::Category::unknown};
    std::optional<int>     code;
    std::string            mx_host;
    std::string            error; // empty when none
  };

  struct Retry {
    std::chrono::milliseconds delay{0};
    std::string               reason;
  };

  using Result = std::variant<Done, Retry>;

  VerificationTask(Settings const&    settings,
                   Store&             store,
                   MX::Lookup&        lookup,
                   Preflight&         preflight,
                   ConcurrencyGate&   gate,
                   Probe::Prober&     prober,
                   CatchAllProbe&     catch_all,
                   FallbackVerifier&  fallback,
                   TestSendEscalator* escalator);

  // Exceptions propagate, after a dead letter on the last attempt.
  Result run(Request const& req, std::time_t now);

private:
  Result run_(Request const& req, std::time_t now, char const*& step);

  // Either a Retry, or on the last attempt a persisted unknown_timeout.
  Result temporary_(Request const&     req,
                    std::string const& email,
                    std::string const& mx_host,
                    std::string const& why,
                    std::time_t        now);

  // What the row says after the upsert, which keeps a status proven by
  // a test-send.
  void settle_(Done& done);

  int64_t persist_(int64_t               email_id,
                   VerifyStatus          status,
                   std::string const&    reason,
                   std::string const&    mx_host,
                   FallbackResult const* fallback,
                   std::time_t           now);

  bool last_attempt_(Request const& req) const
  {
    return req.attempt >= settings_.max_attempts;
  }

  Settings const&    settings_;
  Store&             store_;
  MX::Lookup&        lookup_;
  Preflight&         preflight_;
  ConcurrencyGate&   gate_;
  Probe::Prober&     prober_;
  CatchAllProbe&     catch_all_;
  FallbackVerifier&  fallback_;
  TestSendEscalator* escalator_;
};

#endif // VERIFICATIONTASK_DOT_HPP
