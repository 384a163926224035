#include "FallbackVerifier.hpp"

#include <stdexcept>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

FallbackStatus map_provider_status(std::string_view raw)
{
  auto const s = boost::algorithm::to_lower_copy(
      boost::algorithm::trim_copy(std::string{raw}));

  if (s == "valid" || s == "deliverable" || s == "ok" || s == "success")
    return FallbackStatus::valid;
  if (s == "invalid" || s == "undeliverable" || s == "bad"
      || s == "hard_bounce")
    return FallbackStatus::invalid;
  if (s == "catch_all" || s == "catchall")
    return FallbackStatus::catch_all;
  return FallbackStatus::unknown;
}

FallbackResult consult(FallbackVerifier& verifier, std::string const& email)
{
  try {
    auto res = verifier.verify(email);
    LOG(INFO) << "fallback for " << email << ": " << c_str(res.status);
    return res;
  }
  catch (std::exception const& e) {
    LOG(WARNING) << "fallback for " << email << " failed: " << e.what();
    FallbackResult res;
    res.raw = e.what();
    return res;
  }
}
