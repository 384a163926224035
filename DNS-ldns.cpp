#include "DNS-ldns.hpp"

#include <cstdbool> // needs to be above ldns includes
#include <ldns/ldns.h>
#include <ldns/packet.h>
#include <ldns/rr.h>

#include <memory>
#include <stdexcept>

#include <arpa/inet.h>
#include <sys/time.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
constexpr char const* rcode_c_str(unsigned rcode)
{
  switch (rcode) { // clang-format off
  case 0:  return "no error";            // [RFC1035]
  case 1:  return "format error";        // [RFC1035]
  case 2:  return "server failure";      // [RFC1035]
  case 3:  return "non-existent domain"; // [RFC1035]
  case 4:  return "not implemented";     // [RFC1035]
  case 5:  return "query refused";       // [RFC1035]
  } // clang-format on
  return "*** rcode not expected from a recursive resolver ***";
}

// Presentation form without the trailing dot; the root is "".
std::string dname_str(ldns_rdf const* rdf)
{
  std::unique_ptr<char, decltype(&free)> s{ldns_rdf2str(rdf), &free};
  if (!s)
    return "";
  std::string str{s.get()};
  if (!str.empty() && str.back() == '.')
    str.pop_back();
  return str;
}

std::string addr_str(ldns_rdf const* rdf, int af)
{
  char buf[INET6_ADDRSTRLEN];
  PCHECK(inet_ntop(af, ldns_rdf_data(rdf), buf, sizeof buf));
  return buf;
}
} // namespace

namespace DNS_ldns {

Resolver::Resolver(std::chrono::milliseconds timeout)
{
  auto status = ldns_resolver_new_frm_file(&res_, nullptr);
  if (status != LDNS_STATUS_OK)
    throw std::runtime_error(
        fmt::format("failed to initialize DNS resolver: {}",
                    ldns_get_errorstr_by_id(status)));

  auto const secs  = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  auto const usecs = std::chrono::duration_cast<std::chrono::microseconds>(
      timeout - secs);

  timeval tv;
  tv.tv_sec  = secs.count();
  tv.tv_usec = usecs.count();
  ldns_resolver_set_timeout(res_, tv);
  ldns_resolver_set_retry(res_, 1);
}

Resolver::~Resolver() { ldns_resolver_deep_free(res_); }

std::vector<MX_record> Resolver::mx(std::string const& domain) const
{
  std::vector<MX_record> ret;

  Query q(*this, RR_type::MX, domain);
  auto const answer = ldns_pkt_answer(q.get());
  if (!answer)
    return ret;

  // CNAMEs traversed by the resolver come back mixed in with the MXs.
  for (unsigned i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
    auto const rr = ldns_rr_list_rr(answer, i);
    if (!rr || ldns_rr_get_type(rr) != LDNS_RR_TYPE_MX)
      continue;
    if (ldns_rr_rd_count(rr) != 2) {
      LOG(WARNING) << "malformed MX record for " << domain;
      continue;
    }
    ret.push_back(MX_record{ldns_rdf2native_int16(ldns_rr_rdf(rr, 0)),
                            dname_str(ldns_rr_rdf(rr, 1))});
  }

  return ret;
}

std::vector<std::string> Resolver::addresses(RR_type typ,
                                             std::string const& host) const
{
  std::vector<std::string> ret;

  Query q(*this, typ, host);
  auto const answer = ldns_pkt_answer(q.get());
  if (!answer)
    return ret;

  auto const want = (typ == RR_type::AAAA) ? LDNS_RR_TYPE_AAAA : LDNS_RR_TYPE_A;
  auto const af   = (typ == RR_type::AAAA) ? AF_INET6 : AF_INET;

  for (unsigned i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
    auto const rr = ldns_rr_list_rr(answer, i);
    if (!rr || ldns_rr_get_type(rr) != want || ldns_rr_rd_count(rr) != 1)
      continue;
    ret.push_back(addr_str(ldns_rr_rdf(rr, 0), af));
  }

  return ret;
}

Query::Query(Resolver const& res, RR_type type, std::string const& domain)
{
  auto const dom = ldns_dname_new_frm_str(domain.c_str());
  if (dom == nullptr)
    throw std::invalid_argument(fmt::format("bad domain name: {}", domain));

  auto const status = ldns_resolver_query_status(
      &p_, res.get(), dom, static_cast<ldns_enum_rr_type>(type),
      LDNS_RR_CLASS_IN, LDNS_RD);
  ldns_rdf_deep_free(dom);

  if (status != LDNS_STATUS_OK) {
    // With a single nameserver, reset the RTT or every later query on
    // this resolver fails too.
    ldns_resolver_set_nameserver_rtt(res.get(), 0, LDNS_RESOLV_RTT_MIN);

    throw std::runtime_error(fmt::format("{}/{} lookup failed: {}", domain,
                                         RR_type_c_str(type),
                                         ldns_get_errorstr_by_id(status)));
  }

  auto const rcode = ldns_pkt_get_rcode(p_);
  switch (rcode) {
  case LDNS_RCODE_NOERROR: break;

  case LDNS_RCODE_NXDOMAIN: nx_domain_ = true; break;

  default:
    ldns_pkt_free(p_);
    p_ = nullptr;
    throw std::runtime_error(fmt::format("{}/{} lookup failed: {}", domain,
                                         RR_type_c_str(type),
                                         rcode_c_str(rcode)));
  }
}

Query::~Query()
{
  if (p_)
    ldns_pkt_free(p_);
}

} // namespace DNS_ldns
