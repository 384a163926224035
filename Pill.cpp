#include "Pill.hpp"

#include <random>

Pill::Pill()
{
  std::random_device                                 rd;
  std::uniform_int_distribution<unsigned long long> uni_dist;
  s_ = uni_dist(rd);

  // <http://philzimmermann.com/docs/human-oriented-base-32-encoding.txt>

  constexpr char b32_charset[]{"ybndrfg8ejkmcpqxot1uwisza345h769"};

  auto x{s_};
  for (auto resp{b32_ndigits_}; resp > 0; x >>= 5) {
    b32_str_[--resp] = b32_charset[x & 0x1f];
  }
  b32_str_[b32_ndigits_] = '\0';
}
