#include "MX.hpp"

#include "DNS-ldns.hpp"

#include <algorithm>
#include <stdexcept>

#include <glog/logging.h>

#include <boost/algorithm/string/predicate.hpp>

namespace MX {

LdnsLookup::LdnsLookup(std::chrono::milliseconds timeout)
  : res_(std::make_unique<DNS_ldns::Resolver>(timeout))
{
}

LdnsLookup::~LdnsLookup() = default;

std::vector<Exchanger> LdnsLookup::exchangers(std::string const& domain)
{
  std::vector<Exchanger> mxs;
  for (auto const& rr : res_->mx(domain))
    mxs.push_back(Exchanger{rr.exchange, rr.preference});
  return mxs;
}

std::vector<std::string> LdnsLookup::addresses(std::string const& host)
{
  auto addrs = res_->addresses(DNS_ldns::RR_type::A, host);
  if (addrs.empty())
    addrs = res_->addresses(DNS_ldns::RR_type::AAAA, host);
  return addrs;
}

void StaticLookup::add_mx(std::string const& domain,
                          std::string        exchange,
                          uint16_t           pref)
{
  mxs_[domain].push_back(Exchanger{std::move(exchange), pref});
}

void StaticLookup::add_address(std::string const& host, std::string addr)
{
  addrs_[host].push_back(std::move(addr));
}

std::vector<Exchanger> StaticLookup::exchangers(std::string const& domain)
{
  if (std::find(begin(failing_), end(failing_), domain) != end(failing_))
    throw std::runtime_error("SERVFAIL for " + domain);
  auto const it = mxs_.find(domain);
  if (it == mxs_.end())
    return {};
  return it->second;
}

std::vector<std::string> StaticLookup::addresses(std::string const& host)
{
  if (std::find(begin(failing_), end(failing_), host) != end(failing_))
    throw std::runtime_error("SERVFAIL for " + host);
  auto const it = addrs_.find(host);
  if (it == addrs_.end())
    return {};
  return it->second;
}

std::optional<std::string> exchanger(Lookup& lookup, std::string const& domain)
{
  auto mxs = lookup.exchangers(domain);

  mxs.erase(std::remove_if(begin(mxs), end(mxs),
                           [](Exchanger const& mx) {
                             // RFC 7505 null MX and the obviously bogus
                             return mx.host.empty() || (mx.host == ".")
                                    || boost::iequals(mx.host, "localhost");
                           }),
            end(mxs));

  if (mxs.empty())
    return {};

  auto const best = std::min_element(begin(mxs), end(mxs));
  LOG(INFO) << "MX for " << domain << " is " << best->preference << " "
            << best->host;
  return best->host;
}

std::string resolve(Lookup& lookup, std::string const& domain)
{
  try {
    if (auto const mx = exchanger(lookup, domain))
      return *mx;
  }
  catch (std::exception const& e) {
    LOG(WARNING) << "MX lookup for " << domain << " failed: " << e.what();
    return domain;
  }
  LOG(INFO) << "no usable MX for " << domain << ", using the domain itself";
  return domain;
}

} // namespace MX
