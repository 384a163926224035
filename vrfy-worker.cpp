// A worker process; run as many of these as the gates allow.

#include "Discovery.hpp"
#include "Engine.hpp"
#include "TestSender.hpp"
#include "Worker.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <memory>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

DEFINE_string(queues,
              "discovery,generate,verify,test_send",
              "queues to work, highest priority first");
DEFINE_string(candidates, "", "JSON lines of discovered people and addresses");
DEFINE_string(from_address, "", "From: of test-sends, --mail_from if empty");
DEFINE_int64(idle_ms, 500, "sleep when there is nothing to do");

namespace {
std::atomic<bool> stop{false};

void on_signal(int) { stop = true; }
} // namespace

int main(int argc, char* argv[])
{
  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    ParseCommandLineFlags(&argc, &argv, true);
  }
  google::InitGoogleLogging(argv[0]);

  std::vector<std::string> queues;
  boost::algorithm::split(queues, FLAGS_queues, boost::algorithm::is_any_of(","),
                          boost::algorithm::token_compress_on);
  queues.erase(std::remove(begin(queues), end(queues), ""), end(queues));

  Engine engine{Settings::from_flags()};

  std::unique_ptr<Discovery> discovery;
  if (FLAGS_candidates.empty())
    discovery = std::make_unique<NoDiscovery>();
  else
    discovery = std::make_unique<CandidateFile>(engine.store, FLAGS_candidates);

  SmtpTestSender sender{engine.lookup, Engine::smtp_options(engine.settings),
                        FLAGS_from_address.empty() ? engine.settings.mail_from
                                                   : FLAGS_from_address};

  Worker worker{engine.settings, engine.store,     engine.queue,
                engine.pipeline, engine.task,      engine.escalator,
                sender,          *discovery,       queues};

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  worker.run(stop, std::chrono::milliseconds(FLAGS_idle_ms));
  return EXIT_SUCCESS;
}
