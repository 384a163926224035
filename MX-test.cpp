#include "MX.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  MX::StaticLookup lookup;
  lookup.add_mx("example.com", "mx2.example.com", 20);
  lookup.add_mx("example.com", "mx1.example.com", 10);
  lookup.add_mx("example.com", "mx0.example.com", 10);
  lookup.add_mx("null.example", ".", 0);
  lookup.add_mx("local.example", "LocalHost", 5);
  lookup.fail("broken.example");

  // Lowest preference, ties broken by name.
  CHECK_EQ(MX::resolve(lookup, "example.com"), "mx0.example.com");
  CHECK_EQ(*MX::exchanger(lookup, "example.com"), "mx0.example.com");

  // No usable MX falls back to the bare domain.
  CHECK_EQ(MX::resolve(lookup, "a-only.example"), "a-only.example");
  CHECK(!MX::exchanger(lookup, "a-only.example"));
  CHECK_EQ(MX::resolve(lookup, "null.example"), "null.example");
  CHECK_EQ(MX::resolve(lookup, "local.example"), "local.example");

  // So does a failed lookup, but exchanger() lets it through.
  CHECK_EQ(MX::resolve(lookup, "broken.example"), "broken.example");
  bool threw = false;
  try {
    MX::exchanger(lookup, "broken.example");
  }
  catch (std::runtime_error const&) {
    threw = true;
  }
  CHECK(threw);
}
