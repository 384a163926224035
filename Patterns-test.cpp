#include "Patterns.hpp"

#include <algorithm>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using namespace Patterns;

  CHECK_EQ(fold("José-Luis"), "joseluis");
  CHECK_EQ(fold("O'Brien"), "obrien");
  CHECK_EQ(fold("Zoë Ångström"), "zoeangstrom");

  auto const brett = normalize("Brett", "Anderson");
  CHECK_EQ(apply(brett, "first.last"), "brett.anderson");
  CHECK_EQ(apply(brett, "f.last"), "b.anderson");
  CHECK_EQ(apply(brett, "flast"), "banderson");
  CHECK_EQ(apply(brett, "firstl"), "bretta");
  CHECK_EQ(apply(brett, "firstlast"), "brettanderson");
  CHECK_EQ(apply(brett, "first_last"), "brett_anderson");
  CHECK_EQ(apply(brett, "first-last"), "brett-anderson");
  CHECK_EQ(apply(brett, "first"), "brett");
  CHECK_EQ(apply(brett, "last"), "anderson");
  CHECK_EQ(apply(brett, "{first}.{last}"), "");

  auto const cher = normalize("Cher", "");
  CHECK_EQ(apply(cher, "first"), "cher");
  CHECK_EQ(apply(cher, "first.last"), "");

  CHECK_EQ(split("  Brett   van Anderson ").first, "Brett");
  CHECK_EQ(split("Brett van Anderson").last, "Anderson");
  CHECK_EQ(split("Cher").last, "");

  CHECK_EQ(*pattern_of(brett, "banderson"), "flast");
  CHECK_EQ(*pattern_of(brett, "brett"), "first");
  CHECK(!pattern_of(brett, "ba"));

  CHECK_LT(rank("flast"), rank("first.last"));
  CHECK_LT(rank("first.last"), rank("f.last"));
  CHECK_LT(rank("f.last"), rank("first"));
  CHECK_EQ(rank("lastfirst"), n_patterns);

  CHECK(is_role("info"));
  CHECK(!is_role("brett"));

  // Two of two examples agree.
  auto inf = infer({{"Jane", "Doe", "jane.doe"},
                    {"John", "Smith", "john.smith"},
                    {"", "", "info"}});
  CHECK(inf.pattern);
  CHECK_EQ(*inf.pattern, "first.last");
  CHECK_EQ(inf.samples, 2);
  CHECK_EQ(inf.confidence, 1.0);

  // One example is not enough.
  inf = infer({{"Jane", "Doe", "jdoe"}});
  CHECK(!inf.pattern);

  // Two of three is below 80%.
  inf = infer({{"Jane", "Doe", "jdoe"},
               {"John", "Smith", "jsmith"},
               {"Ann", "Lee", "ann"}});
  CHECK(!inf.pattern);
  CHECK_LT(inf.confidence, 0.8);

  auto const one = generate(brett, "example.com", std::string{"flast"});
  CHECK_EQ(one.size(), 1u);
  CHECK_EQ(one[0], "banderson@example.com");

  auto const all = generate(brett, "example.com");
  CHECK_EQ(all.size(), n_patterns);
  CHECK_EQ(all[0], "banderson@example.com");
  CHECK_EQ(all[1], "brett.anderson@example.com");

  // Role addresses and duplicates are never generated.
  auto const info = generate(normalize("Info", ""), "example.com");
  CHECK(info.empty());
  auto const al = generate(normalize("Al", "Al"), "example.com");
  CHECK_EQ(std::count(al.begin(), al.end(), "al@example.com"), 1);
}
