#include "CatchAllProbe.hpp"

#include "MX.hpp"
#include "Now.hpp"
#include "Probe.hpp"
#include "Store.hpp"

#include <random>
#include <stdexcept>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <fmt/format.h>

CatchAllProbe::CatchAllProbe(Store&               store,
                             MX::Lookup&          lookup,
                             Probe::Prober&       prober,
                             std::chrono::seconds ttl)
  : store_(store)
  , lookup_(lookup)
  , prober_(prober)
  , ttl_(ttl)
{
}

CatchAllStatus CatchAllProbe::classify(std::optional<int> code,
                                       std::string const& error)
{
  if (code) {
    if (200 <= *code && *code < 300)
      return CatchAllStatus::catch_all;
    if (500 <= *code && *code < 600)
      return CatchAllStatus::not_catch_all;
    if (400 <= *code && *code < 500)
      return CatchAllStatus::tempfail;
    return CatchAllStatus::error;
  }

  auto const e = boost::algorithm::to_lower_copy(error);
  if (boost::contains(e, "timeout") || boost::contains(e, "tempor")
      || boost::contains(e, "tempfail") || boost::contains(e, "temp_fail"))
    return CatchAllStatus::tempfail;
  return CatchAllStatus::error;
}

std::string CatchAllProbe::random_localpart()
{
  std::random_device                      rd;
  std::uniform_int_distribution<uint64_t> uni;
  return fmt::format("_ca_{:016x}", uni(rd));
}

CatchAllProbe::Result
CatchAllProbe::check(std::string const& domain, std::time_t now, bool force)
{
  Result result;
  result.domain = boost::algorithm::to_lower_copy(
      boost::algorithm::trim_copy(domain));
  if (result.domain.empty() || boost::contains(result.domain, "@"))
    throw std::invalid_argument("domain required");

  if (!force) {
    auto const row = store_.domain(result.domain);
    if (row && row->catch_all_status && row->catch_all_checked_at) {
      auto const checked = Now::parse(*row->catch_all_checked_at);
      if (checked && (now - *checked) < ttl_.count()) {
        result.status    = *row->catch_all_status;
        result.cached    = true;
        result.localpart = row->catch_all_localpart.value_or("");
        if (row->catch_all_code)
          result.code = static_cast<int>(*row->catch_all_code);
        return result;
      }
    }
  }

  std::optional<std::string> mx;
  try {
    mx = MX::exchanger(lookup_, result.domain);
  }
  catch (std::exception const& e) {
    result.status = CatchAllStatus::error;
    result.error  = e.what();
    LOG(WARNING) << "catch-all check of " << result.domain << ": " << e.what();
    store_.save_catch_all(result.domain, result.status, "", {}, now);
    return result;
  }

  if (!mx) {
    result.status = CatchAllStatus::no_mx;
    LOG(INFO) << result.domain << " has no MX";
    store_.save_catch_all(result.domain, result.status, "", {}, now);
    return result;
  }

  result.mx_host   = *mx;
  result.localpart = random_localpart();

  auto const outcome = prober_.probe(
      fmt::format("{}@{}", result.localpart, result.domain), result.mx_host);

  result.code   = outcome.code;
  result.status = classify(outcome.code, outcome.error);
  if (result.status == CatchAllStatus::error
      || result.status == CatchAllStatus::tempfail) {
    result.error = !outcome.error.empty()     ? outcome.error
                   : !outcome.message.empty() ? outcome.message
                                              : "tempfail";
  }

  store_.save_catch_all(result.domain, result.status, result.localpart,
                        result.code, now);
  LOG(INFO) << result.domain << " at " << result.mx_host << " is "
            << c_str(result.status);
  return result;
}
