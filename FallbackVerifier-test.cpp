#include "FallbackVerifier.hpp"

#include <stdexcept>

#include <glog/logging.h>

namespace {
class Broken : public FallbackVerifier {
public:
  FallbackResult verify(std::string const&) override
  {
    throw std::runtime_error("provider returned 503");
  }
};
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(map_provider_status("valid") == FallbackStatus::valid);
  CHECK(map_provider_status(" Deliverable ") == FallbackStatus::valid);
  CHECK(map_provider_status("UNDELIVERABLE") == FallbackStatus::invalid);
  CHECK(map_provider_status("hard_bounce") == FallbackStatus::invalid);
  CHECK(map_provider_status("catchall") == FallbackStatus::catch_all);
  CHECK(map_provider_status("risky") == FallbackStatus::unknown);
  CHECK(map_provider_status("") == FallbackStatus::unknown);

  NoFallback none;
  CHECK(consult(none, "brett@example.com").status == FallbackStatus::unknown);

  Broken     broken;
  auto const r = consult(broken, "brett@example.com");
  CHECK(r.status == FallbackStatus::unknown);
  CHECK_EQ(r.raw, "provider returned 503");

  LOG(INFO) << "FallbackVerifier-test passed";
}
