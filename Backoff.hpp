#ifndef BACKOFF_DOT_HPP
#define BACKOFF_DOT_HPP

#include <chrono>

// Exponential backoff windows, min(cap, base * 2^attempt).

namespace Backoff {

// Uniform over [0, window].
std::chrono::milliseconds full_jitter(int                       attempt,
                                      std::chrono::milliseconds base,
                                      std::chrono::milliseconds cap);

// Uniform over [window/2, window].
std::chrono::milliseconds equal_jitter(int                       attempt,
                                       std::chrono::milliseconds base,
                                       std::chrono::milliseconds cap);

std::chrono::milliseconds window(int                       attempt,
                                 std::chrono::milliseconds base,
                                 std::chrono::milliseconds cap);

} // namespace Backoff

#endif // BACKOFF_DOT_HPP
