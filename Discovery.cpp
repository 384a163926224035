#include "Discovery.hpp"

#include "Mailbox.hpp"
#include "Patterns.hpp"
#include "Store.hpp"

#include <fstream>
#include <optional>
#include <set>
#include <stdexcept>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <fmt/format.h>

namespace {
std::string field(nlohmann::json const& j, char const* key)
{
  auto const it = j.find(key);
  if (it == j.end() || !it->is_string())
    return {};
  return boost::algorithm::trim_copy(it->get<std::string>());
}
} // namespace

nlohmann::json DiscoveryResult::to_json() const
{
  return {
      {"pages_fetched", pages_fetched},
      {"candidates", candidates},
      {"people_upserted", people_upserted},
      {"emails_upserted", emails_upserted},
      {"errors", errors},
  };
}

DiscoveryResult NoDiscovery::discover(Company const& company,
                                      std::string const&,
                                      std::time_t)
{
  LOG(INFO) << "no discovery for " << company.domain;
  return {};
}

//.............................................................................

CandidateFile::CandidateFile(Store& store, std::string const& path)
  : store_(store)
{
  std::ifstream in{path};
  if (!in)
    throw std::invalid_argument(fmt::format("can't open {}", path));

  std::string line;
  int         lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    boost::algorithm::trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      LOG(WARNING) << path << ":" << lineno << ": not a JSON object";
      continue;
    }
    auto const domain = boost::algorithm::to_lower_copy(field(j, "domain"));
    if (domain.empty()) {
      LOG(WARNING) << path << ":" << lineno << ": no domain";
      continue;
    }
    by_domain_[domain].push_back(std::move(j));
  }
  LOG(INFO) << "read " << size() << " candidates for " << by_domain_.size()
            << " domains from " << path;
}

std::size_t CandidateFile::size() const
{
  std::size_t n = 0;
  for (auto const& [domain, candidates] : by_domain_)
    n += candidates.size();
  return n;
}

DiscoveryResult CandidateFile::discover(Company const&     company,
                                        std::string const& run_id,
                                        std::time_t        now)
{
  DiscoveryResult result;

  auto const it = by_domain_.find(company.domain);
  if (it == by_domain_.end())
    return result;

  std::set<std::string> pages;
  for (auto const& c : it->second) {
    ++result.candidates;

    auto const source_url = field(c, "source_url");
    if (!source_url.empty())
      pages.insert(source_url);

    std::optional<int64_t> person_id;

    auto full_name  = field(c, "full_name");
    auto first_name = field(c, "first_name");
    auto last_name  = field(c, "last_name");
    if (full_name.empty())
      full_name = boost::algorithm::trim_copy(
          fmt::format("{} {}", first_name, last_name));
    if (!full_name.empty()) {
      if (first_name.empty() && last_name.empty()) {
        auto const parts = Patterns::split(full_name);
        first_name       = parts.first;
        last_name        = parts.last;
      }
      Person p;
      p.company_id = company.id;
      p.first_name = first_name;
      p.last_name  = last_name;
      p.full_name  = full_name;
      p.title      = field(c, "title");
      p.source_url = source_url;
      person_id    = store_.upsert_person(p);
      ++result.people_upserted;
    }

    auto const email = field(c, "email");
    if (!email.empty()) {
      auto const mbx = Mailbox::parse(email);
      if (!mbx) {
        result.errors.push_back(fmt::format("bad address \"{}\"", email));
        continue;
      }
      EmailRow row;
      row.person_id  = person_id;
      row.company_id = company.id;
      row.email      = boost::algorithm::to_lower_copy(mbx->as_string());
      if (!source_url.empty())
        row.source_url = source_url;
      row.source_note = "discovered";
      row.run_id      = run_id;
      store_.upsert_email(row, now);
      ++result.emails_upserted;
    }
    else if (!person_id) {
      result.errors.push_back("candidate with neither name nor email");
    }
  }

  result.pages_fetched = static_cast<int64_t>(pages.size());

  LOG(INFO) << company.domain << ": " << result.candidates << " candidates, "
            << result.people_upserted << " people, " << result.emails_upserted
            << " emails";
  return result;
}
