#include "SMTP.hpp"

#include "POSIX.hpp"

#include <glog/logging.h>

#include <gflags/gflags.h>

#include <fmt/format.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

// This needs to be at least the length of each string it's trying to match.
DEFINE_uint64(pbfr_size, 4 * 1024, "parser buffer size");

DEFINE_bool(use_esmtp, true, "use ESMTP (EHLO)");

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace SMTP {

// clang-format off

using dot = one<'.'>;
using dash = one<'-'>;

namespace chars {
struct tail : range<'\x80', '\xBF'> {};
struct ch_2 : seq<range<'\xC2', '\xDF'>, tail> {};
struct ch_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, tail>,
                  seq<range<'\xE1', '\xEC'>, rep<2, tail>>,
                  seq<one<'\xED'>, range<'\x80', '\x9F'>, tail>,
                  seq<range<'\xEE', '\xEF'>, rep<2, tail>>> {};
struct ch_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, tail>>,
                  seq<range<'\xF1', '\xF3'>, rep<3, tail>>,
                  seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, tail>>> {};
struct non_ascii : sor<ch_2, ch_3, ch_4> {};
} // namespace chars

struct let_dig : sor<ALPHA, DIGIT, chars::non_ascii> {};

struct ldh_tail : star<sor<seq<plus<dash>, let_dig>, let_dig>> {};

struct sub_domain : seq<let_dig, ldh_tail> {};

struct domain : list<sub_domain, dot> {};

// Servers identify with all sorts of literals, we only need to skip
// over them: "[" 1*dcontent "]"

struct dcontent : ranges<33, 90, 94, 126> {};

struct address_literal : seq<one<'['>, plus<dcontent>, one<']'>> {};

// Although not explicit in the grammar of RFC-6531, in practice UTF-8
// is used in the replys.

struct textstring : plus<sor<one<9>, range<32, 126>, chars::non_ascii>> {};

struct server_id : sor<domain, address_literal> {};

// Greeting       = ( "220 " (Domain / address-literal) [ SP textstring ] CRLF )
//                  /
//                  ( "220-" (Domain / address-literal) [ SP textstring ] CRLF
//                 *( "220-" [ textstring ] CRLF )
//                    "220 " [ textstring ] CRLF )

struct greeting_ok
: sor<seq<TAO_PEGTL_ISTRING("220 "), server_id, opt<textstring>, CRLF>,
      seq<TAO_PEGTL_ISTRING("220-"), server_id, opt<textstring>, CRLF,
 star<seq<TAO_PEGTL_ISTRING("220-"), opt<textstring>, CRLF>>,
      seq<TAO_PEGTL_ISTRING("220 "), opt<textstring>, CRLF>>> {};

// Reply-code     = %x32-35 %x30-35 %x30-39

struct reply_code
: seq<range<0x32, 0x35>, range<0x30, 0x35>, range<0x30, 0x39>> {};

// Reply-line     = *( Reply-code "-" [ textstring ] CRLF )
//                     Reply-code  [ SP textstring ] CRLF

struct reply_lines
: seq<star<seq<reply_code, one<'-'>, opt<textstring>, CRLF>>,
           seq<reply_code, opt<seq<SP, textstring>>, CRLF>> {};

struct greeting
  : sor<greeting_ok, reply_lines> {};

// ehlo-greet     = 1*(%d0-9 / %d11-12 / %d14-127)

struct ehlo_greet : plus<ranges<0, 9, 11, 12, 14, 127>> {};

// The '.' we also allow in ehlo-keyword since it has been seen in the
// wild.

struct ehlo_keyword : seq<sor<ALPHA, DIGIT>, star<sor<ALPHA, DIGIT, dash, dot>>> {};

struct ehlo_param : plus<range<33, 126>> {};

// The AUTH= thing is so common with some servers (postfix) that we
// have to accept it.

struct ehlo_line
    : seq<ehlo_keyword, star<seq<sor<SP,one<'='>>, ehlo_param>>> {};

// ehlo-ok-rsp    = ( "250 " Domain [ SP ehlo-greet ] CRLF )
//                  /
//                  ( "250-" Domain [ SP ehlo-greet ] CRLF
//                 *( "250-" ehlo-line CRLF )
//                    "250 " ehlo-line CRLF )

struct ehlo_ok_rsp
: sor<seq<TAO_PEGTL_ISTRING("250 "), server_id, opt<ehlo_greet>, CRLF>,

      seq<TAO_PEGTL_ISTRING("250-"), server_id, opt<ehlo_greet>, CRLF,
 star<seq<TAO_PEGTL_ISTRING("250-"), ehlo_line, CRLF>>,
      seq<TAO_PEGTL_ISTRING("250 "), opt<ehlo_line>, CRLF>>
      > {};

struct ehlo_rsp
  : sor<ehlo_ok_rsp, reply_lines> {};

struct helo_ok_rsp
  : seq<TAO_PEGTL_ISTRING("250 "), server_id, opt<ehlo_greet>, CRLF> {};

struct helo_rsp
  : sor<helo_ok_rsp, reply_lines> {};

// clang-format on

// Log each line of a reply, and keep its text without the codes.
void take_reply(std::string_view reply, Connection& conn)
{
  conn.reply_text.clear();
  while (!reply.empty()) {
    auto const eol  = reply.find("\r\n");
    auto const line = reply.substr(0, eol);
    LOG(INFO) << "S: " << line;
    if (line.length() > 4) {
      if (!conn.reply_text.empty())
        conn.reply_text += ' ';
      conn.reply_text += line.substr(4);
    }
    if (eol == std::string_view::npos)
      break;
    reply.remove_prefix(eol + 2);
  }
}

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<server_id> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.server_id = in.string();
  }
};

template <>
struct action<greeting_ok> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.greeting_ok = true;
    conn.reply_code  = "220";
    take_reply(in.string(), conn);
  }
};

template <>
struct action<ehlo_ok_rsp> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.ehlo_ok    = true;
    conn.reply_code = "250";
    take_reply(in.string(), conn);
  }
};

template <>
struct action<helo_ok_rsp> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.reply_code = "250";
    take_reply(in.string(), conn);
  }
};

template <>
struct action<ehlo_keyword> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.ehlo_keyword = in.string();
    boost::to_upper(conn.ehlo_keyword);
  }
};

template <>
struct action<ehlo_param> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.ehlo_param.push_back(in.string());
  }
};

template <>
struct action<ehlo_line> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.ehlo_params.emplace(std::move(conn.ehlo_keyword),
                             std::move(conn.ehlo_param));
    conn.ehlo_keyword.clear();
    conn.ehlo_param.clear();
  }
};

template <>
struct action<reply_lines> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    take_reply(in.string(), conn);
  }
};

template <>
struct action<reply_code> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.reply_code = in.string();
  }
};

namespace {

// Parse one reply with Rule, set error on failure.
template <typename Rule>
bool read_reply(Connection& conn, char const* stage)
{
  conn.reply_code.clear();
  conn.reply_text.clear();

  auto in{istream_input<eol::crlf, 1>{conn.sock.in(), FLAGS_pbfr_size, stage}};
  if (parse<Rule, action>(in, conn))
    return true;

  conn.reply_code.clear();
  if (conn.sock.timed_out()) {
    conn.error = fmt::format("timeout:{}", stage);
  }
  else if (conn.sock.eof()) {
    conn.error = fmt::format("disconnected:{}", stage);
  }
  else {
    conn.error = fmt::format("bad_reply:{}", stage);
  }
  LOG(WARNING) << stage << ": " << conn.error;
  return false;
}

bool send_cmd(Connection& conn, std::string_view cmd, char const* stage)
{
  LOG(INFO) << "C: " << cmd;
  conn.sock.out() << cmd << "\r\n" << std::flush;
  if (!conn.sock.out().good()) {
    conn.error = conn.sock.timed_out() ? fmt::format("timeout:{}", stage)
                                       : fmt::format("disconnected:{}", stage);
    LOG(WARNING) << stage << ": " << conn.error;
    return false;
  }
  return true;
}

bool positive(Connection& conn, char first = '2')
{
  if (conn.reply_code.empty() || conn.reply_code.at(0) != first) {
    conn.error = fmt::format("smtp_response:{}", conn.reply_code);
    LOG(WARNING) << "negative reply " << conn.reply_code << " "
                 << conn.reply_text;
    return false;
  }
  conn.error.clear();
  return true;
}

} // namespace

int Connection::code() const
{
  if (reply_code.length() != 3)
    return 0;
  return std::stoi(reply_code);
}

bool greeting(Connection& conn)
{
  if (!read_reply<SMTP::greeting>(conn, "greeting"))
    return false;
  if (!conn.greeting_ok) {
    LOG(WARNING) << "greeting was not in the affirmative";
    return positive(conn);
  }
  conn.error.clear();
  return true;
}

bool hello(Connection& conn, std::string const& helo_domain)
{
  conn.ehlo_params.clear();
  conn.ehlo_ok = false;

  auto use_esmtp = FLAGS_use_esmtp;
  if (use_esmtp) {
    if (!send_cmd(conn, fmt::format("EHLO {}", helo_domain), "ehlo"))
      return false;
    if (!read_reply<ehlo_rsp>(conn, "ehlo"))
      return false;
    if (!conn.ehlo_ok) {
      LOG(WARNING) << "EHLO refused with " << conn.reply_code
                   << ", trying HELO";
      use_esmtp = false;
    }
  }
  if (!use_esmtp) {
    if (!send_cmd(conn, fmt::format("HELO {}", helo_domain), "helo"))
      return false;
    if (!read_reply<helo_rsp>(conn, "helo"))
      return false;
  }
  return positive(conn);
}

bool starttls(Connection&         conn,
              std::string const& server_name,
              std::string const& helo_domain)
{
  if (!send_cmd(conn, "STARTTLS", "starttls"))
    return false;
  if (!read_reply<reply_lines>(conn, "starttls"))
    return false;
  if (!positive(conn))
    return false;

  if (!conn.sock.starttls_client(server_name.c_str())) {
    conn.error = "tls_failed";
    LOG(WARNING) << "failed to STARTTLS with " << server_name;
    return false;
  }
  LOG(INFO) << conn.sock.tls_info();

  // RFC 3207 section 4.2: forget what we knew, ask again.
  return hello(conn, helo_domain);
}

bool mail_from(Connection& conn, std::string_view reverse_path)
{
  if (!send_cmd(conn, fmt::format("MAIL FROM:<{}>", reverse_path), "mail_from"))
    return false;
  if (!read_reply<reply_lines>(conn, "mail_from"))
    return false;
  return positive(conn);
}

bool rcpt_to(Connection& conn, std::string_view forward_path)
{
  if (!send_cmd(conn, fmt::format("RCPT TO:<{}>", forward_path), "rcpt_to"))
    return false;
  if (!read_reply<reply_lines>(conn, "rcpt_to"))
    return false;
  return positive(conn);
}

bool data(Connection& conn, std::string_view msg)
{
  if (!send_cmd(conn, "DATA", "data"))
    return false;
  if (!read_reply<reply_lines>(conn, "data"))
    return false;
  if (!positive(conn, '3'))
    return false;

  auto lineno = 0;
  while (!msg.empty()) {
    ++lineno;
    auto const eol  = msg.find('\n');
    auto       line = msg.substr(0, eol);
    msg.remove_prefix(eol == std::string_view::npos ? msg.size() : eol + 1);

    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    if (!line.empty() && line.front() == '.')
      conn.sock.out() << '.';
    conn.sock.out() << line << "\r\n";

    if (!conn.sock.out().good()) {
      conn.error = "disconnected:data";
      LOG(ERROR) << "output no good at line " << lineno;
      return false;
    }
  }

  // Done!
  if (!send_cmd(conn, ".", "data_end"))
    return false;
  if (!read_reply<reply_lines>(conn, "data_end"))
    return false;
  return positive(conn);
}

bool quit(Connection& conn)
{
  if (!send_cmd(conn, "QUIT", "quit"))
    return false;
  return read_reply<reply_lines>(conn, "quit");
}

std::unique_ptr<Connection> open_session(std::vector<std::string> const& addrs,
                                         std::string const&              host,
                                         Options const&                  opts,
                                         std::string&                    error,
                                         int&                            code)
{
  code = 0;
  error.clear();

  if (addrs.empty()) {
    error = fmt::format("connect_failed:{}", host);
    return nullptr;
  }

  int  fd        = -1;
  bool timed_out = false;
  for (auto const& addr : addrs) {
    std::string why;
    fd = POSIX::connect(addr, opts.port, opts.connect_timeout, why);
    if (fd != -1) {
      LOG(INFO) << "connected to " << host << " [" << addr << "]:" << opts.port;
      break;
    }
    LOG(WARNING) << host << ": " << why;
    timed_out = why.rfind("timeout:", 0) == 0;
  }
  if (fd == -1) {
    error = timed_out ? "timeout:connect" : fmt::format("connect_failed:{}", host);
    return nullptr;
  }

  auto conn = std::make_unique<Connection>(fd, opts.command_timeout);

  auto const fail = [&]() -> std::unique_ptr<Connection> {
    error = conn->error;
    code  = conn->code();
    return nullptr;
  };

  if (!greeting(*conn))
    return fail();
  if (!hello(*conn, opts.helo_domain))
    return fail();

  if (opts.starttls && conn->has_extension("STARTTLS")) {
    if (!starttls(*conn, host, opts.helo_domain)) {
      if (conn->error == "tls_failed")
        return fail();
      // A refused STARTTLS leaves the plain session usable.
      if (!conn->reply_code.empty() && !conn->sock.tls()) {
        LOG(INFO) << "continuing without TLS";
        conn->error.clear();
      }
      else {
        return fail();
      }
    }
  }

  return conn;
}

} // namespace SMTP
