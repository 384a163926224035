#include "Pill.hpp"

#include <set>
#include <sstream>

#include <glog/logging.h>

#include <boost/algorithm/string/predicate.hpp>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // Tokens and ids are pills, they must not repeat.
  std::set<std::string> seen;
  for (auto i = 0; i < 1000; ++i) {
    Pill const p;
    CHECK(seen.insert(p.as_string()).second) << p;
  }

  Pill const red;
  auto const str = red.as_string();
  CHECK_EQ(str.length(), 13u);
  CHECK_EQ(std::string{red.as_string_view()}, str);

  // Usable in "bounce+TOKEN@domain" without quoting, and lower case so a
  // case-folding bounce still matches.
  CHECK(boost::algorithm::all(str, [](char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
  })) << str;

  std::ostringstream os;
  os << red;
  CHECK_EQ(os.str(), str);

  Pill const copy{red};
  CHECK(copy == red);
  CHECK(copy != Pill{});
}
