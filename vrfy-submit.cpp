// Creates a run from a file of domains, one per line, and queues its
// jobs.

#include "Engine.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <boost/algorithm/string/trim.hpp>

DEFINE_string(tenant, "default", "tenant the run counts against");
DEFINE_string(modes, "full", "stages to run, e.g. \"gen+verify\"");
DEFINE_int32(run_company_limit, 0, "companies in this run, 0 for the default");

int main(int argc, char* argv[])
{
  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    ParseCommandLineFlags(&argc, &argv, true);
  }
  google::InitGoogleLogging(argv[0]);

  auto domains = nlohmann::json::array();
  auto const read = [&domains](std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
      boost::algorithm::trim(line);
      if (!line.empty() && line[0] != '#')
        domains.push_back(line);
    }
  };

  if (argc < 2) {
    read(std::cin);
  }
  else {
    for (int a = 1; a < argc; ++a) {
      std::ifstream in{argv[a]};
      if (!in) {
        LOG(ERROR) << "can't open " << argv[a];
        return EXIT_FAILURE;
      }
      read(in);
    }
  }

  Engine engine{Settings::from_flags()};

  nlohmann::json options{{"modes", FLAGS_modes}};
  if (FLAGS_run_company_limit > 0)
    options["company_limit"] = FLAGS_run_company_limit;

  auto const now = std::time(nullptr);
  auto const run = engine.store.create_run(FLAGS_tenant, domains, options, now);
  auto const progress = engine.pipeline.start(run, now);

  std::cout << run << '\n' << progress["limits"].dump(2) << '\n';
}
