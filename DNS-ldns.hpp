#ifndef DNS_LDNS_DOT_HPP
#define DNS_LDNS_DOT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// forward decl
typedef struct ldns_struct_pkt      ldns_pkt;
typedef struct ldns_struct_resolver ldns_resolver;

namespace DNS_ldns {

// Only what the mail exchanger lookup asks for.
enum class RR_type : uint16_t {
  A    = 1,  // RFC 1035
  MX   = 15, // RFC 1035
  AAAA = 28, // RFC 3596
};

constexpr char const* RR_type_c_str(RR_type type)
{
  switch (type) { // clang-format off
  case RR_type::A:    return "A";
  case RR_type::MX:   return "MX";
  case RR_type::AAAA: return "AAAA";
  } // clang-format on
  return "*** unknown RR_type ***";
}

struct MX_record {
  uint16_t    preference;
  std::string exchange;
};

// Stub resolver configured from /etc/resolv.conf.  A name that does
// not exist gives an empty answer, a lookup that fails throws.

class Resolver {
public:
  Resolver(Resolver const&) = delete;
  Resolver& operator=(Resolver const&) = delete;

  explicit Resolver(std::chrono::milliseconds timeout);
  ~Resolver();

  std::vector<MX_record> mx(std::string const& domain) const;

  // Text form of the A or AAAA records.
  std::vector<std::string> addresses(RR_type typ, std::string const& host) const;

  ldns_resolver* get() const { return res_; }

private:
  ldns_resolver* res_;
};

class Query {
public:
  Query(Query const&) = delete;
  Query& operator=(Query const&) = delete;

  Query(Resolver const& res, RR_type type, std::string const& domain);
  ~Query();

  ldns_pkt* get() const { return p_; }

  bool nx_domain() const { return nx_domain_; }

private:
  ldns_pkt* p_{nullptr};

  bool nx_domain_{false};
};

} // namespace DNS_ldns

#endif // DNS_LDNS_DOT_HPP
