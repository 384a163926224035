#ifndef SCRIPTEDSERVER_DOT_HPP
#define SCRIPTEDSERVER_DOT_HPP

// A one-connection SMTP server on an ephemeral loopback port that
// answers each command from a script, for tests only.

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

#include <boost/algorithm/string/predicate.hpp>

class ScriptedServer {
public:
  struct Script {
    std::string greeting{"220 mx.example.com ESMTP\r\n"};
    std::string ehlo{"250-mx.example.com\r\n250 8BITMIME\r\n"};
    std::string mail{"250 2.1.0 ok\r\n"};
    std::string rcpt{"250 2.1.5 ok\r\n"};
    std::string data{"354 go ahead\r\n"};
    std::string data_end{"250 2.0.0 queued\r\n"};
  };

  explicit ScriptedServer(Script script)
    : script_(std::move(script))
  {
    lfd_ = socket(AF_INET, SOCK_STREAM, 0);
    PCHECK(lfd_ >= 0) << "socket";

    auto sin{sockaddr_in{}};
    sin.sin_family      = AF_INET;
    sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    sin.sin_port        = 0;
    PCHECK(bind(lfd_, reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) == 0);
    PCHECK(listen(lfd_, 1) == 0);

    socklen_t len = sizeof(sin);
    PCHECK(getsockname(lfd_, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
    port_ = ntohs(sin.sin_port);

    thread_ = std::thread([this] { serve_(); });
  }

  ~ScriptedServer()
  {
    if (thread_.joinable())
      thread_.join();
    close(lfd_);
  }

  uint16_t port() const { return port_; }

  // Waits for the session to end, then returns every line received.
  std::vector<std::string> const& transcript()
  {
    if (thread_.joinable())
      thread_.join();
    return lines_;
  }

private:
  bool read_line_(int fd, std::string& line)
  {
    line.clear();
    char ch;
    while (read(fd, &ch, 1) == 1) {
      if (ch == '\n') {
        if (!line.empty() && line.back() == '\r')
          line.pop_back();
        return true;
      }
      line.push_back(ch);
    }
    return false;
  }

  void write_(int fd, std::string const& reply)
  {
    PCHECK(write(fd, reply.data(), reply.size())
           == static_cast<ssize_t>(reply.size()));
  }

  void serve_()
  {
    auto const fd = accept(lfd_, nullptr, nullptr);
    PCHECK(fd >= 0) << "accept";

    write_(fd, script_.greeting);
    if (!boost::starts_with(script_.greeting, "220")) {
      close(fd);
      return;
    }

    std::string line;
    while (read_line_(fd, line)) {
      lines_.push_back(line);
      if (boost::istarts_with(line, "EHLO")) {
        write_(fd, script_.ehlo);
      }
      else if (boost::istarts_with(line, "HELO")) {
        write_(fd, "250 mx.example.com\r\n");
      }
      else if (boost::istarts_with(line, "MAIL")) {
        write_(fd, script_.mail);
      }
      else if (boost::istarts_with(line, "RCPT")) {
        write_(fd, script_.rcpt);
      }
      else if (boost::istarts_with(line, "DATA")) {
        write_(fd, script_.data);
        if (boost::starts_with(script_.data, "354")) {
          while (read_line_(fd, line) && line != ".")
            lines_.push_back(line);
          write_(fd, script_.data_end);
        }
      }
      else if (boost::istarts_with(line, "QUIT")) {
        write_(fd, "221 2.0.0 bye\r\n");
        break;
      }
      else {
        write_(fd, "500 5.5.1 what?\r\n");
      }
    }
    close(fd);
  }

  Script                   script_;
  int                      lfd_{-1};
  uint16_t                 port_{0};
  std::thread              thread_;
  std::vector<std::string> lines_;
};

#endif // SCRIPTEDSERVER_DOT_HPP
