#include "SockBuffer.hpp"

#include <iostream>
#include <string>

#include <glog/logging.h>

#include <sys/socket.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

  boost::iostreams::stream<SockBuffer> near{fds[0], fds[0],
                                            std::chrono::milliseconds(200),
                                            std::chrono::seconds(1),
                                            std::chrono::seconds(1)};
  boost::iostreams::stream<SockBuffer> far{fds[1], fds[1],
                                           std::chrono::milliseconds(200),
                                           std::chrono::seconds(1),
                                           std::chrono::seconds(1)};

  near << "220 mx.example.com ESMTP\r\n" << std::flush;

  std::string line;
  CHECK(std::getline(far, line));
  CHECK_EQ(line, "220 mx.example.com ESMTP\r");
  CHECK(!far->timed_out());

  // Nothing further arrives, so the next read times out.
  CHECK(!std::getline(far, line));
  CHECK(far->timed_out());

  far->log_totals();

  close(fds[0]);
  close(fds[1]);

  std::cout << "sizeof(SockBuffer) == " << sizeof(SockBuffer) << '\n';
}
