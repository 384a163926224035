#include "VerificationResult.hpp"

namespace {
template <typename E, std::size_t N>
std::optional<E> from(std::string_view str, E const (&all)[N])
{
  for (auto e : all) {
    if (str == c_str(e))
      return e;
  }
  return {};
}
} // namespace

std::optional<VerifyStatus> verify_status_from(std::string_view str)
{
  constexpr VerifyStatus all[]{
      VerifyStatus::pending,         VerifyStatus::valid,
      VerifyStatus::invalid,         VerifyStatus::risky_catch_all,
      VerifyStatus::unknown_timeout,
  };
  return from(str, all);
}

std::optional<TestSendStatus> test_send_status_from(std::string_view str)
{
  constexpr TestSendStatus all[]{
      TestSendStatus::not_requested, TestSendStatus::pending,
      TestSendStatus::sent,          TestSendStatus::bounce_hard,
      TestSendStatus::bounce_soft,   TestSendStatus::delivered_assumed,
  };
  return from(str, all);
}

std::optional<CatchAllStatus> catch_all_status_from(std::string_view str)
{
  constexpr CatchAllStatus all[]{
      CatchAllStatus::catch_all, CatchAllStatus::not_catch_all,
      CatchAllStatus::tempfail,  CatchAllStatus::error,
      CatchAllStatus::no_mx,
  };
  return from(str, all);
}

std::optional<DeliveryStatus> delivery_status_from(std::string_view str)
{
  constexpr DeliveryStatus all[]{
      DeliveryStatus::not_catchall_proven,
      DeliveryStatus::unknown,
  };
  return from(str, all);
}

std::optional<FallbackStatus> fallback_status_from(std::string_view str)
{
  constexpr FallbackStatus all[]{
      FallbackStatus::valid,
      FallbackStatus::invalid,
      FallbackStatus::catch_all,
      FallbackStatus::unknown,
  };
  return from(str, all);
}
