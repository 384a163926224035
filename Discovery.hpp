#ifndef DISCOVERY_DOT_HPP
#define DISCOVERY_DOT_HPP

#include <cstdint>
#include <ctime>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class Store;
struct Company;

struct DiscoveryResult {
  int64_t                  pages_fetched{0};
  int64_t                  candidates{0};
  int64_t                  people_upserted{0};
  int64_t                  emails_upserted{0};
  std::vector<std::string> errors;

  nlohmann::json to_json() const;
};

// Finds the people of a company, and whatever addresses of theirs are
// published, and records them in the store.

class Discovery {
public:
  virtual ~Discovery() = default;

  virtual DiscoveryResult discover(Company const&     company,
                                   std::string const& run_id,
                                   std::time_t        now)
      = 0;
};

class NoDiscovery : public Discovery {
public:
  DiscoveryResult discover(Company const&     company,
                           std::string const& run_id,
                           std::time_t        now) override;
};

// Candidates collected elsewhere, one JSON object per line:
//
//   {"domain": "example.com", "full_name": "Brett Anderson",
//    "title": "CTO", "email": "brett@example.com",
//    "source_url": "https://example.com/team"}
//
// Every field but domain is optional; a line with neither a name nor
// an email is counted as an error.

class CandidateFile : public Discovery {
public:
  CandidateFile(Store& store, std::string const& path);

  DiscoveryResult discover(Company const&     company,
                           std::string const& run_id,
                           std::time_t        now) override;

  std::size_t size() const;

private:
  Store&                                             store_;
  std::map<std::string, std::vector<nlohmann::json>> by_domain_;
};

#endif // DISCOVERY_DOT_HPP
