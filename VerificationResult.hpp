#ifndef VERIFICATIONRESULT_DOT_HPP
#define VERIFICATIONRESULT_DOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class VerifyStatus {
  pending,
  valid,
  invalid,
  risky_catch_all,
  unknown_timeout,
};

constexpr char const* c_str(VerifyStatus status)
{
  switch (status) { // clang-format off
  case VerifyStatus::pending:         return "pending";
  case VerifyStatus::valid:           return "valid";
  case VerifyStatus::invalid:         return "invalid";
  case VerifyStatus::risky_catch_all: return "risky_catch_all";
  case VerifyStatus::unknown_timeout: return "unknown_timeout";
  } // clang-format on
  return "*** unknown VerifyStatus ***";
}

// Test-send progress only moves forward:
//   not_requested -> pending -> sent -> {bounce_hard, bounce_soft,
//                                        delivered_assumed}
// and a pending row may bounce directly.

enum class TestSendStatus {
  not_requested,
  pending,
  sent,
  bounce_hard,
  bounce_soft,
  delivered_assumed,
};

constexpr char const* c_str(TestSendStatus status)
{
  switch (status) { // clang-format off
  case TestSendStatus::not_requested:     return "not_requested";
  case TestSendStatus::pending:           return "pending";
  case TestSendStatus::sent:              return "sent";
  case TestSendStatus::bounce_hard:       return "bounce_hard";
  case TestSendStatus::bounce_soft:       return "bounce_soft";
  case TestSendStatus::delivered_assumed: return "delivered_assumed";
  } // clang-format on
  return "*** unknown TestSendStatus ***";
}

constexpr bool is_terminal(TestSendStatus status)
{
  return status == TestSendStatus::bounce_hard
         || status == TestSendStatus::bounce_soft
         || status == TestSendStatus::delivered_assumed;
}

// RCPT level catch-all status of a domain.

enum class CatchAllStatus {
  catch_all,
  not_catch_all,
  tempfail,
  error,
  no_mx,
};

constexpr char const* c_str(CatchAllStatus status)
{
  switch (status) { // clang-format off
  case CatchAllStatus::catch_all:     return "catch_all";
  case CatchAllStatus::not_catch_all: return "not_catch_all";
  case CatchAllStatus::tempfail:      return "tempfail";
  case CatchAllStatus::error:         return "error";
  case CatchAllStatus::no_mx:         return "no_mx";
  } // clang-format on
  return "*** unknown CatchAllStatus ***";
}

// Catch-all status as proven by delivery evidence.

enum class DeliveryStatus {
  not_catchall_proven,
  unknown,
};

constexpr char const* c_str(DeliveryStatus status)
{
  switch (status) { // clang-format off
  case DeliveryStatus::not_catchall_proven: return "not_catchall_proven";
  case DeliveryStatus::unknown:             return "unknown";
  } // clang-format on
  return "*** unknown DeliveryStatus ***";
}

// What a fallback verification provider said.

enum class FallbackStatus {
  valid,
  invalid,
  catch_all,
  unknown,
};

constexpr char const* c_str(FallbackStatus status)
{
  switch (status) { // clang-format off
  case FallbackStatus::valid:     return "valid";
  case FallbackStatus::invalid:   return "invalid";
  case FallbackStatus::catch_all: return "catch_all";
  case FallbackStatus::unknown:   return "unknown";
  } // clang-format on
  return "*** unknown FallbackStatus ***";
}

std::optional<VerifyStatus>   verify_status_from(std::string_view str);
std::optional<TestSendStatus> test_send_status_from(std::string_view str);
std::optional<CatchAllStatus> catch_all_status_from(std::string_view str);
std::optional<DeliveryStatus> delivery_status_from(std::string_view str);
std::optional<FallbackStatus> fallback_status_from(std::string_view str);

// One row of verification_results, one per email.

struct VerificationResult {
  int64_t id{0};
  int64_t email_id{0};

  std::optional<VerifyStatus> verify_status;
  std::string                 verify_reason;
  std::string                 mx_host;

  std::optional<FallbackStatus> fallback_status;

  TestSendStatus             test_send_status{TestSendStatus::not_requested};
  std::optional<std::string> test_send_token;
  std::optional<std::string> test_send_at;
  std::optional<std::string> bounce_code;
  std::optional<std::string> bounce_reason;

  std::optional<std::string> verified_at;
  std::optional<std::string> updated_at;
};

#endif // VERIFICATIONRESULT_DOT_HPP
