// Imports bounce notifications: each file is one notification, or
// with --lines one per line.  No files means standard input.

#include "BounceImporter.hpp"
#include "Engine.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <boost/algorithm/string/trim.hpp>

#include <fmt/format.h>

DEFINE_bool(lines, false, "one notification per line");

namespace {
void import(BounceImporter& importer, std::istream& in, std::time_t now)
{
  if (FLAGS_lines) {
    std::string line;
    while (std::getline(in, line)) {
      boost::algorithm::trim(line);
      if (!line.empty())
        importer.import(line, now);
    }
    return;
  }
  std::string const body{std::istreambuf_iterator<char>{in},
                         std::istreambuf_iterator<char>{}};
  importer.import(body, now);
}
} // namespace

int main(int argc, char* argv[])
{
  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    ParseCommandLineFlags(&argc, &argv, true);
  }
  google::InitGoogleLogging(argv[0]);

  Engine         engine{Settings::from_flags()};
  BounceImporter importer{engine.store, engine.escalator,
                          engine.settings.bounce_prefix};

  auto const now = std::time(nullptr);
  if (argc < 2) {
    import(importer, std::cin, now);
  }
  else {
    for (int a = 1; a < argc; ++a) {
      std::ifstream in{argv[a]};
      if (!in) {
        LOG(ERROR) << "can't open " << argv[a];
        return EXIT_FAILURE;
      }
      import(importer, in, now);
    }
  }

  auto const& s = importer.stats();
  std::cout << fmt::format("seen {} bounces {} applied {} unresolved {} "
                           "ignored {} malformed {}\n",
                           s.seen, s.bounces, s.applied, s.unresolved,
                           s.ignored, s.malformed);
}
