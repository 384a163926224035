#include "Now.hpp"

#include <glog/logging.h>

Now::Now()
  : Now(std::time(nullptr))
{
}

Now::Now(std::time_t sec)
  : sec_(sec)
{
  tm tm_utc;
  CHECK_NOTNULL(gmtime_r(&sec_, &tm_utc));
  CHECK_EQ(strftime(c_str_, sizeof c_str_, "%Y-%m-%dT%H:%M:%SZ", &tm_utc),
           20U);
}

std::optional<std::time_t> Now::parse(std::string_view str)
{
  // Accept a trailing fraction or offset, only the first 19 octets count.
  if (str.length() < 19)
    return {};

  auto const s = std::string(str.substr(0, 19));

  tm tm_utc{};
  auto const end = strptime(s.c_str(), "%Y-%m-%dT%H:%M:%S", &tm_utc);
  if (end == nullptr || *end != '\0') {
    // SQLite's datetime() uses a space in place of the 'T'.
    tm_utc = tm{};
    auto const end2 = strptime(s.c_str(), "%Y-%m-%d %H:%M:%S", &tm_utc);
    if (end2 == nullptr || *end2 != '\0')
      return {};
  }
  return timegm(&tm_utc);
}
