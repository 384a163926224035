#include "Preflight.hpp"

#include "CounterStore.hpp"
#include "MX.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
// A listening socket on an ephemeral loopback port.
int listener(uint16_t& port)
{
  auto const fd = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(fd >= 0) << "socket";

  auto sin{sockaddr_in{}};
  sin.sin_family      = AF_INET;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  sin.sin_port        = 0;
  PCHECK(bind(fd, reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) == 0);
  PCHECK(listen(fd, 4) == 0);

  socklen_t len = sizeof(sin);
  PCHECK(getsockname(fd, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
  port = ntohs(sin.sin_port);
  return fd;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  MX::StaticLookup lookup;
  lookup.add_address("open.example", "127.0.0.1");
  lookup.add_address("closed.example", "127.0.0.1");
  lookup.fail("broken.example");

  MemoryCounterStore cache;

  uint16_t   open_port = 0;
  auto const lfd       = listener(open_port);

  Preflight open{cache, lookup, open_port, 1500ms, 300s};
  auto      res = open.check("open.example");
  CHECK(res.ok);
  CHECK(!res.blocked);
  CHECK(!res.cached);
  CHECK_EQ(res.addr, "127.0.0.1");
  CHECK_EQ(*cache.get(Preflight::cache_key("open.example")), 1);
  CHECK(open.check("open.example").cached);

  // A port nobody listens on refuses the connection.
  uint16_t closed_port = 0;
  close(listener(closed_port));

  Preflight closed{cache, lookup, closed_port, 1500ms, 300s};
  res = closed.check("closed.example");
  CHECK(!res.ok);
  CHECK(res.blocked);
  CHECK(!res.error.empty());
  CHECK_EQ(*cache.get(Preflight::cache_key("closed.example")), 0);

  res = closed.check("closed.example");
  CHECK(!res.ok);
  CHECK(res.cached);
  CHECK(res.blocked);
  CHECK_EQ(res.error, "tcp25_blocked");

  // Name service failures are not remembered.
  res = closed.check("broken.example");
  CHECK(!res.ok);
  CHECK(!res.blocked);
  CHECK_EQ(res.error.rfind("resolve:", 0), 0u);
  CHECK(!cache.get(Preflight::cache_key("broken.example")));

  // Nor is a host without an address, and it is not a block either.
  res = closed.check("nowhere.example");
  CHECK(!res.ok);
  CHECK(!res.blocked);
  CHECK(!cache.get(Preflight::cache_key("nowhere.example")));

  close(lfd);
}
