// Periodic upkeep: age sent test-sends nobody bounced, reclassify the
// domains they taught us about, and trim the dead-letter stream.

#include "DeliveryEvidence.hpp"
#include "Engine.hpp"

#include <cstdlib>
#include <iostream>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>

DEFINE_bool(assume_delivered, true, "age sent test-sends");
DEFINE_bool(reclassify, true, "reclassify domains and upgrade risky rows");
DEFINE_bool(trim_dead_letters, true, "keep only the newest dead letters");

int main(int argc, char* argv[])
{
  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    ParseCommandLineFlags(&argc, &argv, true);
  }
  google::InitGoogleLogging(argv[0]);

  Engine engine{Settings::from_flags()};
  DeliveryEvidence::EvidenceStore evidence{engine.store};

  auto const now = std::time(nullptr);

  if (FLAGS_assume_delivered) {
    auto const n = evidence.assume_delivered(
        now, engine.settings.assume_delivered_after);
    std::cout << fmt::format("{} test-sends assumed delivered\n", n);
  }

  if (FLAGS_reclassify) {
    auto const n = evidence.reclassify_domains(now);
    std::cout << fmt::format("{} risky results upgraded\n", n);
  }

  if (FLAGS_trim_dead_letters) {
    auto const n = engine.store.trim_dead_letters(engine.settings.dead_letter_keep);
    std::cout << fmt::format("{} dead letters trimmed\n", n);
  }
}
