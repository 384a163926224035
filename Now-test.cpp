#include "Now.hpp"

#include <iostream>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Now const epoch{0};
  CHECK_EQ(std::string(epoch.c_str()), "1970-01-01T00:00:00Z");

  Now const t{1700000000};
  CHECK_EQ(t.string(), "2023-11-14T22:13:20Z");
  CHECK_EQ(*Now::parse(t.string()), 1700000000);
  CHECK_EQ(*Now::parse("2023-11-14 22:13:20"), 1700000000);
  CHECK_EQ(*Now::parse("2023-11-14T22:13:20.123456+00:00"), 1700000000);

  CHECK(!Now::parse(""));
  CHECK(!Now::parse("yesterday at noon"));

  // Lexical order matches time order.
  CHECK_LT(Now{1699999999}.string(), Now{1700000000}.string());

  Now now;
  std::cout << now << '\n';
}
