#include "Backoff.hpp"

#include <algorithm>
#include <limits>
#include <random>

namespace {
using rep = std::chrono::milliseconds::rep;

rep uniform(rep lo, rep hi)
{
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<rep> dist(lo, hi);
  return dist(rng);
}
} // namespace

namespace Backoff {

std::chrono::milliseconds window(int                       attempt,
                                 std::chrono::milliseconds base,
                                 std::chrono::milliseconds cap)
{
  attempt = std::clamp(attempt, 0, 30);
  auto const mult = rep{1} << attempt;
  // Guard the multiply for large bases.
  if (base.count() > std::numeric_limits<rep>::max() / mult)
    return cap;
  auto const w = base.count() * mult;
  return std::min(cap, std::chrono::milliseconds(w));
}

std::chrono::milliseconds full_jitter(int                       attempt,
                                      std::chrono::milliseconds base,
                                      std::chrono::milliseconds cap)
{
  auto const hi = window(attempt, base, cap).count();
  return std::chrono::milliseconds(uniform(0, std::max(hi, rep{0})));
}

std::chrono::milliseconds equal_jitter(int                       attempt,
                                       std::chrono::milliseconds base,
                                       std::chrono::milliseconds cap)
{
  auto const hi = std::max(window(attempt, base, cap).count(), rep{0});
  return std::chrono::milliseconds(uniform(hi / 2, hi));
}

} // namespace Backoff
