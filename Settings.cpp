#include "Settings.hpp"

#include <algorithm>
#include <stdexcept>

#include <gflags/gflags.h>

#include <fmt/format.h>

DEFINE_string(db, "vrfy.db", "SQLite database shared by all workers");

DEFINE_string(helo_domain, Config::default_helo_domain, "EHLO/HELO identity");
DEFINE_string(mail_from,
              Config::default_mail_from,
              "reverse-path used for probes");
DEFINE_uint32(smtp_port, Config::smtp_port, "port to probe");
DEFINE_bool(starttls, true, "use STARTTLS when offered");

DEFINE_int64(connect_timeout_ms,
             std::chrono::milliseconds(Config::connect_timeout).count(),
             "SMTP connect timeout");
DEFINE_int64(command_timeout_ms,
             std::chrono::milliseconds(Config::command_timeout).count(),
             "SMTP per-command timeout");
DEFINE_int64(dns_timeout_ms,
             std::chrono::milliseconds(Config::dns_timeout).count(),
             "DNS query timeout");

DEFINE_bool(preflight, true, "check TCP/25 reachability before probing");
DEFINE_int64(preflight_timeout_ms,
             Config::preflight_timeout.count(),
             "TCP/25 preflight timeout");
DEFINE_int64(preflight_cache_seconds,
             Config::preflight_cache_ttl.count(),
             "how long a preflight result is reused");

DEFINE_int32(global_max_concurrency,
             Config::global_max_concurrency,
             "concurrent probes across all workers");
DEFINE_int32(per_mx_max_concurrency,
             Config::per_mx_max_concurrency,
             "concurrent probes per MX host");
DEFINE_int32(global_rps, Config::global_rps, "probes per second, 0 is off");
DEFINE_int32(per_mx_rps,
             Config::per_mx_rps,
             "probes per second per MX host, 0 is off");

DEFINE_int32(max_attempts, Config::max_attempts, "verification attempts");
DEFINE_int64(backoff_base_ms,
             std::chrono::milliseconds(Config::backoff_base).count(),
             "retry backoff base");
DEFINE_int64(backoff_cap_ms,
             std::chrono::milliseconds(Config::backoff_cap).count(),
             "retry backoff cap");

DEFINE_bool(test_send, true, "escalate ambiguous results to test-sends");
DEFINE_string(bounce_prefix,
              Config::bounce_prefix,
              "local-part prefix of test-send return-paths");
DEFINE_string(bounce_domain,
              Config::bounce_domain,
              "domain of test-send return-paths");
DEFINE_int64(assume_delivered_hours,
             Config::assume_delivered_after.count(),
             "age after which a sent test-send counts as delivered");

DEFINE_int32(company_limit, Config::company_limit, "companies per run");
DEFINE_int32(daily_domain_cap,
             Config::daily_domain_cap,
             "domains per tenant in any 24 hours");
DEFINE_int32(max_probes_per_person,
             Config::max_probes_per_person,
             "verify jobs queued per generated person");
DEFINE_bool(cleanup_permutations,
            false,
            "delete invalid generated addresses when a run completes");
DEFINE_bool(cleanup_delete_untested,
            false,
            "also delete generated addresses that were never verified");

namespace {
template <typename T>
void check_positive(char const* name, T value)
{
  if (value <= 0)
    throw std::invalid_argument(
        fmt::format("--{} must be positive, not {}", name, value));
}
} // namespace

std::chrono::milliseconds Settings::effective_connect_timeout() const
{
  return std::min(connect_timeout,
                  std::chrono::milliseconds(Config::connect_timeout_clamp));
}

std::chrono::milliseconds Settings::effective_command_timeout() const
{
  return std::min(command_timeout,
                  std::chrono::milliseconds(Config::command_timeout_clamp));
}

Settings Settings::from_flags()
{
  check_positive("connect_timeout_ms", FLAGS_connect_timeout_ms);
  check_positive("command_timeout_ms", FLAGS_command_timeout_ms);
  check_positive("global_max_concurrency", FLAGS_global_max_concurrency);
  check_positive("per_mx_max_concurrency", FLAGS_per_mx_max_concurrency);
  check_positive("max_attempts", FLAGS_max_attempts);
  if (FLAGS_smtp_port == 0 || FLAGS_smtp_port > 65535)
    throw std::invalid_argument(
        fmt::format("--smtp_port out of range: {}", FLAGS_smtp_port));

  Settings s;

  s.db_path = FLAGS_db;

  s.helo_domain = FLAGS_helo_domain;
  s.mail_from   = FLAGS_mail_from;
  s.smtp_port   = static_cast<uint16_t>(FLAGS_smtp_port);
  s.starttls    = FLAGS_starttls;

  s.connect_timeout = std::chrono::milliseconds(FLAGS_connect_timeout_ms);
  s.command_timeout = std::chrono::milliseconds(FLAGS_command_timeout_ms);
  s.dns_timeout     = std::chrono::milliseconds(FLAGS_dns_timeout_ms);

  s.preflight         = FLAGS_preflight;
  s.preflight_timeout = std::chrono::milliseconds(FLAGS_preflight_timeout_ms);
  s.preflight_cache_ttl = std::chrono::seconds(FLAGS_preflight_cache_seconds);

  s.global_max_concurrency = FLAGS_global_max_concurrency;
  s.per_mx_max_concurrency = FLAGS_per_mx_max_concurrency;
  s.global_rps             = FLAGS_global_rps;
  s.per_mx_rps             = FLAGS_per_mx_rps;

  s.max_attempts = FLAGS_max_attempts;
  s.backoff_base = std::chrono::milliseconds(FLAGS_backoff_base_ms);
  s.backoff_cap  = std::chrono::milliseconds(FLAGS_backoff_cap_ms);

  s.test_send     = FLAGS_test_send;
  s.bounce_prefix = FLAGS_bounce_prefix;
  s.bounce_domain = FLAGS_bounce_domain;
  s.assume_delivered_after = std::chrono::hours(FLAGS_assume_delivered_hours);

  s.company_limit           = FLAGS_company_limit;
  s.daily_domain_cap        = FLAGS_daily_domain_cap;
  s.max_probes_per_person   = FLAGS_max_probes_per_person;
  s.cleanup_permutations    = FLAGS_cleanup_permutations;
  s.cleanup_delete_untested = FLAGS_cleanup_delete_untested;

  return s;
}
