#include "Sock.hpp"

#include <glog/logging.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

Sock::Sock(int                       fd,
           std::chrono::milliseconds read_timeout,
           std::chrono::milliseconds write_timeout,
           std::chrono::milliseconds starttls_timeout)
  : fd_(fd)
  , iostream_(fd, fd, read_timeout, write_timeout, starttls_timeout)
{
  auto      them{sockaddr_storage{}};
  socklen_t them_len = sizeof(them);

  if (-1 == getpeername(fd_, reinterpret_cast<sockaddr*>(&them), &them_len)) {
    // Ignore ENOTSOCK errors from getpeername, useful for testing.
    PLOG_IF(WARNING, ENOTSOCK != errno) << "getpeername failed";
    return;
  }

  char str[INET6_ADDRSTRLEN]{'\0'};

  switch (them.ss_family) {
  case AF_INET:
    inet_ntop(AF_INET, &reinterpret_cast<sockaddr_in*>(&them)->sin_addr, str,
              sizeof str);
    break;
  case AF_INET6:
    inet_ntop(AF_INET6, &reinterpret_cast<sockaddr_in6*>(&them)->sin6_addr,
              str, sizeof str);
    break;
  default: break;
  }
  them_addr_str_ = str;
}

Sock::~Sock()
{
  if (fd_ != -1) {
    iostream_.close();
    ::close(fd_);
  }
}
