#include "POSIX.hpp"

#include <cerrno>
#include <cstring>

#include <glog/logging.h>

#include <fmt/format.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {
bool poll_one(int fd, short events, milliseconds wait)
{
  auto pfd{pollfd{}};
  pfd.fd     = fd;
  pfd.events = events;

  for (;;) {
    auto const n = poll(&pfd, 1, static_cast<int>(wait.count()));
    if (n == -1) {
      if (errno == EINTR)
        continue;
      PLOG(WARNING) << "poll(2) failed";
      return false;
    }
    return n != 0;
  }
}
} // namespace

bool POSIX::set_nonblocking(int fd)
{
  int flags;
  if ((flags = fcntl(fd, F_GETFL, 0)) == -1) {
    PLOG(WARNING) << "fcntl(F_GETFL) failed";
    return false;
  }
  if (0 == (flags & O_NONBLOCK)) {
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
      PLOG(WARNING) << "fcntl(F_SETFL) failed";
      return false;
    }
  }
  return true;
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  return poll_one(fd_in, POLLIN, wait);
}

bool POSIX::output_ready(int fd_out, milliseconds wait)
{
  return poll_one(fd_out, POLLOUT, wait);
}

int POSIX::connect(std::string const& addr,
                   uint16_t           port,
                   milliseconds       timeout,
                   std::string&       error)
{
  auto ss{sockaddr_storage{}};
  socklen_t len;

  auto in4 = reinterpret_cast<sockaddr_in*>(&ss);
  auto in6 = reinterpret_cast<sockaddr_in6*>(&ss);

  if (inet_pton(AF_INET, addr.c_str(), &in4->sin_addr) == 1) {
    in4->sin_family = AF_INET;
    in4->sin_port   = htons(port);
    len             = sizeof(sockaddr_in);
  }
  else if (inet_pton(AF_INET6, addr.c_str(), &in6->sin6_addr) == 1) {
    in6->sin6_family = AF_INET6;
    in6->sin6_port   = htons(port);
    len              = sizeof(sockaddr_in6);
  }
  else {
    error = fmt::format("bad_address:{}", addr);
    return -1;
  }

  int fd = socket(ss.ss_family, SOCK_STREAM, 0);
  if (fd < 0) {
    error = fmt::format("socket:{}", std::strerror(errno));
    return -1;
  }
  if (!set_nonblocking(fd)) {
    error = "socket:nonblocking";
    close(fd);
    return -1;
  }

  if (::connect(fd, reinterpret_cast<sockaddr const*>(&ss), len) == 0)
    return fd;

  if (errno != EINPROGRESS) {
    error = fmt::format("connect_failed:{}:{}", addr, std::strerror(errno));
    close(fd);
    return -1;
  }

  if (!output_ready(fd, timeout)) {
    error = fmt::format("timeout:connect:{}", addr);
    close(fd);
    return -1;
  }

  int       so_error = 0;
  socklen_t so_len   = sizeof(so_error);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) == -1) {
    error = fmt::format("getsockopt:{}", std::strerror(errno));
    close(fd);
    return -1;
  }
  if (so_error != 0) {
    error = fmt::format("connect_failed:{}:{}", addr, std::strerror(so_error));
    close(fd);
    return -1;
  }

  return fd;
}

std::streamsize POSIX::read(int             fd,
                            char*           s,
                            std::streamsize n,
                            milliseconds    timeout,
                            bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  for (;;) {
    auto const n_ret = ::read(fd, static_cast<void*>(s), n);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: continue; // try read again

      case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
      case EAGAIN:
#endif
        break;

      default: PLOG(WARNING) << "read(2) failed"; return -1;
      }
    }
    else {
      return n_ret;
    }

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (input_ready(fd, time_left))
        continue; // try read again
    }
    t_o = true;
    LOG(WARNING) << "read(2) timed out";
    return -1;
  }
}

std::streamsize POSIX::write(int             fd,
                             const char*     s,
                             std::streamsize n,
                             milliseconds    timeout,
                             bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  auto written = std::streamsize{};

  for (;;) {
    auto const n_ret = ::write(fd, static_cast<const void*>(s), n - written);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: continue; // try write again

      case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
      case EAGAIN:
#endif
        break;

      default: PLOG(WARNING) << "write(2) failed"; return -1;
      }
    }
    else {
      s += n_ret;
      written += n_ret;
    }

    if (written == n)
      return n;

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (output_ready(fd, time_left))
        continue; // write some more
    }
    t_o = true;
    LOG(WARNING) << "write(2) timed out";
    return -1;
  }
}
