#include "POSIX.hpp"

#include <cstring>

#include <glog/logging.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

using namespace std::chrono_literals;

static uint16_t listen_loopback(int& lfd)
{
  PCHECK((lfd = socket(AF_INET, SOCK_STREAM, 0)) != -1);

  auto sin{sockaddr_in{}};
  sin.sin_family      = AF_INET;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  sin.sin_port        = 0;
  PCHECK(bind(lfd, reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) == 0);
  PCHECK(listen(lfd, 4) == 0);

  socklen_t len = sizeof(sin);
  PCHECK(getsockname(lfd, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
  return ntohs(sin.sin_port);
}

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(POSIX::set_nonblocking(0));

  // Input /might/ be ready, so no CHECK().
  POSIX::input_ready(0, 1ms);
  CHECK(POSIX::output_ready(1, 1ms));

  int        lfd;
  auto const port = listen_loopback(lfd);

  std::string error;
  auto const  fd = POSIX::connect("127.0.0.1", port, 1000ms, error);
  CHECK_NE(fd, -1) << error;
  CHECK(error.empty());

  int afd;
  PCHECK((afd = accept(lfd, nullptr, nullptr)) != -1);

  bool t_o = false;
  CHECK_EQ(POSIX::write(fd, "HELO\r\n", 6, 1000ms, t_o), 6);
  CHECK(!t_o);

  char bfr[16];
  CHECK(POSIX::set_nonblocking(afd));
  CHECK_EQ(POSIX::read(afd, bfr, sizeof(bfr), 1000ms, t_o), 6);
  CHECK_EQ(std::memcmp(bfr, "HELO\r\n", 6), 0);

  // Nothing more to read: times out.
  CHECK_EQ(POSIX::read(afd, bfr, sizeof(bfr), 50ms, t_o), -1);
  CHECK(t_o);

  close(afd);
  close(fd);
  close(lfd);

  // The listener is gone, so this port refuses.
  error.clear();
  CHECK_EQ(POSIX::connect("127.0.0.1", port, 1000ms, error), -1);
  CHECK(!error.empty());

  error.clear();
  CHECK_EQ(POSIX::connect("not-an-address", 25, 1000ms, error), -1);
  CHECK_EQ(error, "bad_address:not-an-address");
}
