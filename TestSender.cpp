#include "TestSender.hpp"

#include "MX.hpp"
#include "Mailbox.hpp"

#include <ctime>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
// RFC 5322 section 3.3 date-time, always in UTC.
std::string date_time(std::time_t now)
{
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[64];
  auto const len
      = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S +0000", &tm);
  return std::string(buf, len);
}
} // namespace

SmtpTestSender::SmtpTestSender(MX::Lookup&   lookup,
                               SMTP::Options opts,
                               std::string   from_address)
  : lookup_(lookup)
  , opts_(std::move(opts))
  , from_address_(std::move(from_address))
{
}

std::string SmtpTestSender::message(std::string const& email,
                                    std::string const& token,
                                    std::time_t        now) const
{
  std::ostringstream msg;
  msg << "Date: " << date_time(now) << "\r\n"
      << "From: <" << from_address_ << ">\r\n"
      << "To: <" << email << ">\r\n"
      << "Subject: Address check (token=" << token << ")\r\n"
      << "Message-ID: <" << token << '@' << opts_.helo_domain << ">\r\n"
      << "MIME-Version: 1.0\r\n"
      << "Content-Type: text/plain; charset=us-ascii\r\n"
      << "\r\n"
      << "This message confirms that the address is able to receive mail.\r\n"
      << "No reply is needed.\r\n";
  return msg.str();
}

bool SmtpTestSender::send(std::string const& email,
                          std::string const& return_path,
                          std::string const& token)
{
  auto const mbx = Mailbox::parse(email);
  if (!mbx) {
    LOG(WARNING) << "test-send to invalid address " << email;
    return false;
  }

  auto const host = MX::resolve(lookup_, mbx->domain());

  std::vector<std::string> addrs;
  try {
    addrs = lookup_.addresses(host);
  }
  catch (std::exception const& e) {
    LOG(WARNING) << "test-send to " << email << ": " << e.what();
    return false;
  }

  std::string error;
  int         code = 0;
  auto conn = SMTP::open_session(addrs, host, opts_, error, code);
  if (!conn) {
    LOG(WARNING) << "test-send to " << email << " via " << host << ": "
                 << error;
    return false;
  }

  auto const ok = SMTP::mail_from(*conn, return_path)
                  && SMTP::rcpt_to(*conn, mbx->as_string())
                  && SMTP::data(*conn, message(email, token, std::time(nullptr)));
  if (!ok)
    LOG(WARNING) << "test-send to " << email << " via " << host << ": "
                 << conn->error << " " << conn->reply_text;
  else
    LOG(INFO) << "test-send " << token << " to " << email << " accepted by "
              << host;

  if (!conn->sock.timed_out() && !conn->sock.eof() && !SMTP::quit(*conn))
    LOG(INFO) << "QUIT to " << host << ": " << conn->error;

  return ok;
}
