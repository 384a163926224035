// Probe addresses from the command line and print what the exchanger
// said, or with --verify run the whole verification and record it.

#include "Engine.hpp"
#include "Mailbox.hpp"

#include <cstdlib>
#include <iostream>
#include <variant>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>

DEFINE_string(mx_host, "", "probe this exchanger instead of the domain's MX");
DEFINE_bool(verify, false, "verify and record, gates and all");

namespace {
void probe(Engine& engine, std::string const& email)
{
  auto const mbx = Mailbox::parse(email);
  if (!mbx) {
    std::cout << fmt::format("{}: not an address\n", email);
    return;
  }

  auto const mx_host = FLAGS_mx_host.empty()
                           ? MX::resolve(engine.lookup, mbx->domain())
                           : FLAGS_mx_host;

  auto const o = engine.prober.probe(mbx->as_string(), mx_host);
  std::cout << fmt::format("{}: {} {} at {} in {}ms{}{}\n", email,
                           Probe::category_c_str(o.category()),
                           o.code ? std::to_string(*o.code) : "-", o.mx_host,
                           o.elapsed.count(), o.message.empty() ? "" : " ",
                           o.error.empty() ? o.message : o.error);
}

void verify(Engine& engine, std::string const& email, std::time_t now)
{
  EmailRow row;
  row.email     = email;
  auto const id = engine.store.upsert_email(row, now);

  VerificationTask::Request req;
  req.email_id = id;
  req.email    = email;
  req.attempt  = engine.settings.max_attempts; // no one to retry for us
  req.force    = true;

  auto const res = engine.task.run(req, now);
  if (auto const retry = std::get_if<VerificationTask::Retry>(&res)) {
    std::cout << fmt::format("{}: retry in {}ms, {}\n", email,
                             retry->delay.count(), retry->reason);
    return;
  }
  auto const& done = std::get<VerificationTask::Done>(res);
  std::cout << fmt::format("{}: {} ({}) at {}{}{}\n", email,
                           c_str(done.status), done.reason, done.mx_host,
                           done.error.empty() ? "" : " ", done.error);
}
} // namespace

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    ParseCommandLineFlags(&argc, &argv, true);
  }
  google::InitGoogleLogging(argv[0]);

  if (argc < 2) {
    LOG(ERROR) << "usage: " << argv[0] << " [flags] address...";
    return EXIT_FAILURE;
  }

  Engine engine{Settings::from_flags()};

  for (int a = 1; a < argc; ++a) {
    if (FLAGS_verify)
      verify(engine, argv[a], std::time(nullptr));
    else
      probe(engine, argv[a]);
  }
}
