#include "Backoff.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(Backoff::window(0, 2s, 90s) == 2s);
  CHECK(Backoff::window(1, 2s, 90s) == 4s);
  CHECK(Backoff::window(5, 2s, 90s) == 64s);
  CHECK(Backoff::window(6, 2s, 90s) == 90s);
  CHECK(Backoff::window(-3, 2s, 90s) == 2s);
  CHECK(Backoff::window(1000, 2s, 90s) == 90s);

  for (auto attempt = 0; attempt < 10; ++attempt) {
    for (auto i = 0; i < 100; ++i) {
      auto const w = Backoff::window(attempt, 2s, 90s);

      auto const full = Backoff::full_jitter(attempt, 2s, 90s);
      CHECK(full >= 0ms);
      CHECK(full <= w);

      auto const equal = Backoff::equal_jitter(attempt, 2s, 90s);
      CHECK(equal >= w / 2);
      CHECK(equal <= w);
    }
  }

  // Full jitter actually spreads.
  auto lo = 90s, hi = 0s;
  for (auto i = 0; i < 200; ++i) {
    auto const d = std::chrono::duration_cast<std::chrono::seconds>(
        Backoff::full_jitter(6, 2s, 90s));
    lo = std::min(lo, d);
    hi = std::max(hi, d);
  }
  CHECK(hi - lo > 30s);
}
