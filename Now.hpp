#ifndef NOW_DOT_HPP
#define NOW_DOT_HPP

#include <ctime>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// A point in time with one second resolution, rendered as an
// ISO 8601 UTC timestamp "YYYY-MM-DDTHH:MM:SSZ".  Timestamps in the
// database use this form so that they compare lexically.

class Now {
public:
  Now();
  explicit Now(std::time_t sec);

  std::time_t sec() const { return sec_; }
  char const* c_str() const { return c_str_; }
  std::string string() const { return c_str_; }

  static std::optional<std::time_t> parse(std::string_view str);

private:
  std::time_t sec_;
  char        c_str_[24];

  friend std::ostream& operator<<(std::ostream& s, Now const& now)
  {
    return s << now.c_str_;
  }
};

#endif // NOW_DOT_HPP
