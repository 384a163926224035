#include "Sock.hpp"

#include <string>

#include <glog/logging.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using namespace std::chrono_literals;

  auto const lfd = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(lfd >= 0);

  auto sin{sockaddr_in{}};
  sin.sin_family      = AF_INET;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(lfd, reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) == 0);
  PCHECK(listen(lfd, 1) == 0);
  socklen_t len = sizeof(sin);
  PCHECK(getsockname(lfd, reinterpret_cast<sockaddr*>(&sin), &len) == 0);

  auto const cfd = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(cfd >= 0);
  PCHECK(connect(cfd, reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) == 0);
  auto const sfd = accept(lfd, nullptr, nullptr);
  PCHECK(sfd >= 0);

  {
    Sock sock(cfd, 200ms, 1s, 1s);
    CHECK_EQ(sock.them_c_str(), "127.0.0.1");
    CHECK(!sock.input_ready(0ms));

    std::string const greeting{"220 mx.example.com ESMTP\r\n"};
    PCHECK(write(sfd, greeting.data(), greeting.size())
           == static_cast<ssize_t>(greeting.size()));
    CHECK(sock.input_ready(1s));

    std::string line;
    CHECK(std::getline(sock.in(), line));
    CHECK_EQ(line, "220 mx.example.com ESMTP\r");

    sock.out() << "QUIT\r\n" << std::flush;
    char buf[6]{};
    PCHECK(read(sfd, buf, sizeof(buf)) == static_cast<ssize_t>(sizeof(buf)));
    CHECK_EQ(std::string(buf, sizeof(buf)), "QUIT\r\n");

    // Nothing more is coming.
    CHECK(!std::getline(sock.in(), line));
    CHECK(sock.timed_out());
    CHECK(!sock.tls());
  } // closes cfd

  char c;
  CHECK_EQ(read(sfd, &c, 1), 0);

  close(sfd);
  close(lfd);
}
