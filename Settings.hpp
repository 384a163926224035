#ifndef SETTINGS_DOT_HPP
#define SETTINGS_DOT_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace Config {
// SMTP probe
constexpr char const* default_helo_domain = "verifier.example.com";
constexpr char const* default_mail_from   = "bounce@verifier.example.com";
constexpr uint16_t    smtp_port           = 25;

constexpr std::chrono::seconds connect_timeout{20};
constexpr std::chrono::seconds command_timeout{30};
constexpr std::chrono::seconds connect_timeout_clamp{6};
constexpr std::chrono::seconds command_timeout_clamp{10};
constexpr std::chrono::seconds dns_timeout{5};

// TCP/25 preflight
constexpr std::chrono::milliseconds preflight_timeout{1500};
constexpr std::chrono::seconds      preflight_cache_ttl{300};

// Gates
constexpr int                  global_max_concurrency = 12;
constexpr int                  per_mx_max_concurrency = 2;
constexpr int                  global_rps             = 6;
constexpr int                  per_mx_rps             = 1;
constexpr std::chrono::seconds lease_ttl{120};
constexpr std::chrono::seconds rps_window_ttl{2};

// Retry
constexpr int                  max_attempts = 5;
constexpr std::chrono::seconds backoff_base{2};
constexpr std::chrono::seconds backoff_cap{90};

// Catch-all and evidence
constexpr std::chrono::hours catch_all_ttl{24};
constexpr std::chrono::hours result_ttl{24 * 90};
constexpr std::chrono::hours assume_delivered_after{24};

// Test-send
constexpr char const* bounce_prefix = "bounce";
constexpr char const* bounce_domain = "verifier.example.com";

// Pipeline
constexpr char const* discovery_queue = "discovery";
constexpr char const* generate_queue  = "generate";
constexpr char const* verify_queue    = "verify";
constexpr char const* test_send_queue = "test_send";

constexpr int company_limit         = 1000;
constexpr int daily_domain_cap      = 1000;
constexpr int max_probes_per_person = 6;
constexpr int progress_every        = 10;
constexpr int dead_letter_keep      = 1000;
constexpr int max_discovery_errors  = 50;
} // namespace Config

// Everything the engine is configured with, read once at startup and
// handed to each component by its constructor.

struct Settings {
  std::string db_path{"vrfy.db"};

  std::string helo_domain{Config::default_helo_domain};
  std::string mail_from{Config::default_mail_from};
  uint16_t    smtp_port{Config::smtp_port};
  bool        starttls{true};

  std::chrono::milliseconds connect_timeout{Config::connect_timeout};
  std::chrono::milliseconds command_timeout{Config::command_timeout};
  std::chrono::milliseconds dns_timeout{Config::dns_timeout};

  bool                      preflight{true};
  std::chrono::milliseconds preflight_timeout{Config::preflight_timeout};
  std::chrono::seconds      preflight_cache_ttl{Config::preflight_cache_ttl};

  int                  global_max_concurrency{Config::global_max_concurrency};
  int                  per_mx_max_concurrency{Config::per_mx_max_concurrency};
  int                  global_rps{Config::global_rps};
  int                  per_mx_rps{Config::per_mx_rps};
  std::chrono::seconds lease_ttl{Config::lease_ttl};

  int                       max_attempts{Config::max_attempts};
  std::chrono::milliseconds backoff_base{Config::backoff_base};
  std::chrono::milliseconds backoff_cap{Config::backoff_cap};

  std::chrono::seconds catch_all_ttl{Config::catch_all_ttl};
  std::chrono::seconds result_ttl{Config::result_ttl};
  std::chrono::seconds assume_delivered_after{Config::assume_delivered_after};

  bool        test_send{true};
  std::string bounce_prefix{Config::bounce_prefix};
  std::string bounce_domain{Config::bounce_domain};

  int  company_limit{Config::company_limit};
  int  daily_domain_cap{Config::daily_domain_cap};
  int  max_probes_per_person{Config::max_probes_per_person};
  int  dead_letter_keep{Config::dead_letter_keep};
  bool cleanup_permutations{false};
  bool cleanup_delete_untested{false};

  // Connect timeout as used on the wire: min(connect, clamp).
  std::chrono::milliseconds effective_connect_timeout() const;
  std::chrono::milliseconds effective_command_timeout() const;

  static Settings from_flags();
};

#endif // SETTINGS_DOT_HPP
