#ifndef MX_DOT_HPP
#define MX_DOT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <tuple>
#include <vector>

namespace DNS_ldns {
class Resolver;
}

namespace MX {

struct Exchanger {
  std::string host;
  uint16_t    preference;

  bool operator<(Exchanger const& rhs) const
  {
    return std::tie(preference, host) < std::tie(rhs.preference, rhs.host);
  }
};

// Name service as seen by the prober.

class Lookup {
public:
  virtual ~Lookup() = default;

  virtual std::vector<Exchanger> exchangers(std::string const& domain) = 0;
  virtual std::vector<std::string> addresses(std::string const& host)  = 0;
};

class LdnsLookup : public Lookup {
public:
  explicit LdnsLookup(std::chrono::milliseconds timeout);
  ~LdnsLookup() override;

  std::vector<Exchanger>  exchangers(std::string const& domain) override;
  std::vector<std::string> addresses(std::string const& host) override;

private:
  std::unique_ptr<DNS_ldns::Resolver> res_;
};

// Fixed answers, for tests and for pinning a domain to a host.

class StaticLookup : public Lookup {
public:
  void add_mx(std::string const& domain, std::string exchange, uint16_t pref);
  void add_address(std::string const& host, std::string addr);
  void fail(std::string const& domain) { failing_.push_back(domain); }

  std::vector<Exchanger>  exchangers(std::string const& domain) override;
  std::vector<std::string> addresses(std::string const& host) override;

private:
  std::unordered_map<std::string, std::vector<Exchanger>>  mxs_;
  std::unordered_map<std::string, std::vector<std::string>> addrs_;
  std::vector<std::string>                                  failing_;
};

// The usable exchanger with the lowest preference, none if there are
// no MX records.  Lookup failures throw.
std::optional<std::string> exchanger(Lookup& lookup, std::string const& domain);

// RFC 5321 section 5.1: the exchanger with the lowest preference, or
// the bare domain when there are none or the lookup failed.
std::string resolve(Lookup& lookup, std::string const& domain);

} // namespace MX

#endif // MX_DOT_HPP
