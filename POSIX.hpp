#ifndef POSIX_DOT_HPP
#define POSIX_DOT_HPP

#include <chrono>
#include <cstdint>
#include <ios>
#include <string>

#include <unistd.h>

class POSIX {
public:
  POSIX()             = delete;
  POSIX(POSIX const&) = delete;

  static bool set_nonblocking(int fd);

  static bool input_ready(int fd_in, std::chrono::milliseconds wait);
  static bool output_ready(int fd_out, std::chrono::milliseconds wait);

  // Non-blocking connect to an IPv4 or IPv6 literal, bounded by
  // timeout.  Returns the connected fd or -1 with error filled in.
  static int connect(std::string const&        addr,
                     uint16_t                  port,
                     std::chrono::milliseconds timeout,
                     std::string&              error);

  static std::streamsize read(int                       fd,
                              char*                     s,
                              std::streamsize           n,
                              std::chrono::milliseconds timeout,
                              bool&                     t_o);

  static std::streamsize write(int                       fd,
                               const char*               s,
                               std::streamsize           n,
                               std::chrono::milliseconds timeout,
                               bool&                     t_o);
};

#endif // POSIX_DOT_HPP
