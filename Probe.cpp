#include "Probe.hpp"

#include "MX.hpp"
#include "Mailbox.hpp"

#include <stdexcept>
#include <type_traits>
#include <vector>

#include <arpa/inet.h>

#include <glog/logging.h>

#include <boost/algorithm/string/predicate.hpp>

#include <fmt/format.h>

namespace Probe {

Category classify(std::optional<int> code)
{
  if (!code)
    return Category::unknown;
  if (200 <= *code && *code < 300)
    return Category::accept;
  if (500 <= *code && *code < 600)
    return Category::hard_fail;
  if (400 <= *code && *code < 500)
    return Category::temp_fail;
  return Category::unknown;
}

Verdict verdict_for(std::optional<int> code, std::string reason)
{
  switch (classify(code)) {
  case Category::accept: return Accepted{};
  case Category::hard_fail: return PermanentFailure{std::move(reason)};
  case Category::temp_fail: return TemporaryFailure{std::move(reason)};
  case Category::unknown: break;
  }
  return Unknown{std::move(reason)};
}

Category Outcome::category() const
{
  return std::visit(
      [](auto const& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Accepted>)
          return Category::accept;
        else if constexpr (std::is_same_v<T, PermanentFailure>)
          return Category::hard_fail;
        else if constexpr (std::is_same_v<T, TemporaryFailure>)
          return Category::temp_fail;
        else
          return Category::unknown;
      },
      verdict);
}

bool Outcome::transient() const
{
  if (code)
    return false;
  return boost::algorithm::starts_with(error, "timeout:")
         || boost::algorithm::starts_with(error, "disconnected:")
         || boost::algorithm::starts_with(error, "connect_failed:");
}

SmtpProber::SmtpProber(MX::Lookup&   lookup,
                       SMTP::Options opts,
                       std::string   mail_from)
  : lookup_(lookup)
  , opts_(std::move(opts))
  , mail_from_(std::move(mail_from))
{
}

Outcome SmtpProber::probe(std::string const& email, std::string const& mx_host)
{
  auto const start = std::chrono::steady_clock::now();

  Outcome outcome;
  try {
    outcome = probe_(email, mx_host);
  }
  catch (std::exception const& e) {
    LOG(WARNING) << "probe of " << email << " at " << mx_host
                 << " failed: " << e.what();
    outcome.verdict = Unknown{e.what()};
    outcome.code.reset();
    outcome.message.clear();
    outcome.error = fmt::format("error:{}", e.what());
  }

  outcome.mx_host     = mx_host;
  outcome.helo_domain = opts_.helo_domain;
  outcome.elapsed     = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  LOG(INFO) << email << " at " << mx_host << ": "
            << category_c_str(outcome.category()) << " "
            << (outcome.code ? std::to_string(*outcome.code) : "-") << " "
            << outcome.error << " (" << outcome.elapsed.count() << "ms)";
  return outcome;
}

Outcome SmtpProber::probe_(std::string const& email, std::string const& mx_host)
{
  Outcome outcome;

  auto const mbx = Mailbox::parse(email);
  if (!mbx) {
    outcome.error   = fmt::format("invalid_email:{}", email);
    outcome.verdict = Unknown{outcome.error};
    return outcome;
  }

  if (mx_host.empty())
    throw std::invalid_argument("mx_host required");

  // An address literal is used as is.
  auto       addrs = std::vector<std::string>{};
  in6_addr   buf;
  auto const literal = inet_pton(AF_INET, mx_host.c_str(), &buf) == 1
                       || inet_pton(AF_INET6, mx_host.c_str(), &buf) == 1;
  if (literal)
    addrs.push_back(mx_host);
  else
    addrs = lookup_.addresses(mx_host);

  std::string error;
  int         code = 0;
  auto conn = SMTP::open_session(addrs, mx_host, opts_, error, code);
  if (!conn) {
    outcome.error = error;
    if (code) {
      outcome.code = code;
    }
    outcome.verdict = verdict_for(outcome.code, error);
    return outcome;
  }

  auto const done = [&] {
    outcome.code    = conn->code() ? std::optional<int>{conn->code()}
                                   : std::optional<int>{};
    outcome.message = conn->reply_text;
    outcome.error   = conn->error;
    outcome.verdict = verdict_for(
        outcome.code, outcome.error.empty() ? outcome.message : outcome.error);

    // A failed QUIT does not change the outcome.
    if (!conn->sock.timed_out() && !conn->sock.eof()) {
      if (!SMTP::quit(*conn))
        LOG(INFO) << "QUIT to " << mx_host << ": " << conn->error;
    }
  };

  if (!SMTP::mail_from(*conn, mail_from_)) {
    done();
    return outcome;
  }

  // A negative RCPT reply is the answer we came for, not an error.
  if (!SMTP::rcpt_to(*conn, mbx->as_string()) && !conn->reply_code.empty())
    conn->error.clear();
  done();
  return outcome;
}

} // namespace Probe
