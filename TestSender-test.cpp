#include "TestSender.hpp"

#include "MX.hpp"
#include "ScriptedServer.hpp"

#include <algorithm>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
bool has(std::vector<std::string> const& lines, std::string const& line)
{
  return std::find(begin(lines), end(lines), line) != end(lines);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  MX::StaticLookup lookup;
  lookup.add_mx("example.com", "mx.example.com", 10);
  lookup.add_address("mx.example.com", "127.0.0.1");

  SMTP::Options opts;
  opts.helo_domain     = "verifier.example.com";
  opts.starttls        = false;
  opts.connect_timeout = 2s;
  opts.command_timeout = 2s;

  auto const token       = std::string{"vr7-ybndrfg8ejkmc"};
  auto const return_path = "bounce+" + token + "@verifier.example.com";

  {
    ScriptedServer server{ScriptedServer::Script{}};
    opts.port = server.port();

    SmtpTestSender sender{lookup, opts, "check@verifier.example.com"};
    CHECK(sender.send("brett@example.com", return_path, token));

    auto const& lines = server.transcript();
    CHECK(has(lines, "MAIL FROM:<" + return_path + ">"));
    CHECK(has(lines, "RCPT TO:<brett@example.com>"));
    CHECK(has(lines, "Subject: Address check (token=" + token + ")"));
    CHECK(has(lines, "To: <brett@example.com>"));
    CHECK(has(lines, "QUIT"));
  }
  {
    ScriptedServer::Script script;
    script.rcpt = "550 5.1.1 user unknown\r\n";
    ScriptedServer server{script};
    opts.port = server.port();

    SmtpTestSender sender{lookup, opts, "check@verifier.example.com"};
    CHECK(!sender.send("brett@example.com", return_path, token));
    CHECK(!has(server.transcript(), "DATA"));
  }

  SmtpTestSender sender{lookup, opts, "check@verifier.example.com"};
  CHECK(!sender.send("no-at-sign", return_path, token));

  auto const msg = sender.message("brett@example.com", token, 0);
  CHECK_EQ(msg.rfind("Date: Thu, 01 Jan 1970 00:00:00 +0000\r\n", 0), 0u);
  CHECK_NE(msg.find("\r\n\r\n"), std::string::npos);

  LOG(INFO) << "TestSender-test passed";
}
