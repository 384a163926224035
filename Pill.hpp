#ifndef PILL_DOT_HPP
#define PILL_DOT_HPP

#include <climits>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

// A pill is a unit of entropy, rendered in a base32 alphabet that is
// safe to use in the local-part of an address.

class Pill {
public:
  Pill();

  bool operator==(Pill const& that) const { return this->s_ == that.s_; }
  bool operator!=(Pill const& that) const { return !(*this == that); }

  std::string_view as_string_view() const
  {
    return std::string_view{b32_str_, b32_ndigits_};
  }
  std::string as_string() const { return std::string{as_string_view()}; }

private:
  unsigned long long s_;

  auto static constexpr b32_ndigits_ = ((sizeof(s_) * CHAR_BIT) + 4) / 5;
  char b32_str_[b32_ndigits_ + 1];

  friend std::ostream& operator<<(std::ostream& s, Pill const& p)
  {
    return s << p.as_string_view();
  }
};

#endif // PILL_DOT_HPP
