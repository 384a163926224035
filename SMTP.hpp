#ifndef SMTP_DOT_HPP
#define SMTP_DOT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "Sock.hpp"

// Client side of an SMTP session, just enough for MAIL/RCPT probing
// and sending a short message.
//
// Each exchange returns true for a positive reply.  On false, either a
// reply was parsed and reply_code holds it with error set to
// "smtp_response:<code>", or no reply was had and reply_code is empty
// with error set to "timeout:<stage>", "disconnected:<stage>" or
// "bad_reply:<stage>".

namespace SMTP {

struct Options {
  std::string               helo_domain;
  uint16_t                  port{25};
  bool                      starttls{true};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(6)};
  std::chrono::milliseconds command_timeout{std::chrono::seconds(10)};
};

struct Connection {
  Connection(int fd, std::chrono::milliseconds command_timeout)
    : sock(fd, command_timeout, command_timeout, command_timeout)
  {
  }

  Sock sock;

  std::string server_id;

  std::string                                               ehlo_keyword;
  std::vector<std::string>                                  ehlo_param;
  std::unordered_map<std::string, std::vector<std::string>> ehlo_params;

  std::string reply_code;
  std::string reply_text;
  std::string error;

  bool greeting_ok{false};
  bool ehlo_ok{false};

  bool has_extension(char const* name) const
  {
    return ehlo_params.find(name) != ehlo_params.end();
  }

  // Numeric value of reply_code, 0 when there is none.
  int code() const;
};

// Connect to the first address that answers, then greeting, EHLO (or
// HELO), and STARTTLS with a second EHLO when offered.  Returns nullptr
// with error set when no session could be had; code is set when the
// server refused us with a reply.
std::unique_ptr<Connection> open_session(std::vector<std::string> const& addrs,
                                         std::string const&              host,
                                         Options const&                  opts,
                                         std::string&                    error,
                                         int&                            code);

bool greeting(Connection& conn);
bool hello(Connection& conn, std::string const& helo_domain);
bool starttls(Connection&         conn,
              std::string const& server_name,
              std::string const& helo_domain);
bool mail_from(Connection& conn, std::string_view reverse_path);
bool rcpt_to(Connection& conn, std::string_view forward_path);
bool data(Connection& conn, std::string_view msg);
bool quit(Connection& conn);

} // namespace SMTP

#endif // SMTP_DOT_HPP
