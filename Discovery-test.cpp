#include "Discovery.hpp"

#include "SQLite.hpp"
#include "Store.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

#include <glog/logging.h>

#include <fmt/format.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::time_t const now = 1700000000;

  auto const path
      = fmt::format("/tmp/Discovery-test-{}.jsonl", static_cast<long>(getpid()));
  {
    std::ofstream out{path};
    out << "# comment\n"
        << "\n"
        << R"({"domain": "Example.COM", "full_name": "Alice Smith",)"
           R"( "title": "CEO", "email": "ASmith@Example.com",)"
           R"( "source_url": "https://example.com/team"})"
        << '\n'
        << R"({"domain": "example.com", "first_name": "Bob",)"
           R"( "last_name": "Jones", "source_url": "https://example.com/about"})"
        << '\n'
        << R"({"domain": "example.com", "email": "info@example.com",)"
           R"( "source_url": "https://example.com/team"})"
        << '\n'
        << R"({"domain": "example.com", "email": "nope"})" << '\n'
        << R"({"domain": "example.com", "title": "nobody"})" << '\n'
        << R"({"domain": "other.example", "full_name": "Carol"})" << '\n'
        << "not json\n"
        << R"({"full_name": "No Domain"})" << '\n';
  }

  SQLite::DB db{":memory:"};
  Store      store{db};

  CandidateFile discovery{store, path};
  std::remove(path.c_str());

  CHECK_EQ(discovery.size(), 6u);

  auto const cid = store.ensure_company("t1", "example.com", "run-1", now);
  auto const company = store.company(cid);
  CHECK(company);

  auto const result = discovery.discover(*company, "run-1", now);
  CHECK_EQ(result.candidates, 5);
  CHECK_EQ(result.pages_fetched, 2);
  CHECK_EQ(result.people_upserted, 2);
  CHECK_EQ(result.emails_upserted, 2);
  CHECK_EQ(result.errors.size(), 2u);
  CHECK_EQ(result.errors[0], "bad address \"nope\"");
  CHECK_EQ(result.errors[1], "candidate with neither name nor email");

  auto const people = store.people_of_company(cid);
  CHECK_EQ(people.size(), 2u);

  auto const alice = store.email_id("asmith@example.com");
  CHECK(alice);
  auto const row = store.email(*alice);
  CHECK(row->person_id);
  CHECK_EQ(*row->source_note, "discovered");
  CHECK_EQ(*row->source_url, "https://example.com/team");
  CHECK_EQ(row->run_id, "run-1");

  auto const named = store.named_addresses_at_domain("example.com");
  CHECK_EQ(named.size(), 1u);
  CHECK_EQ(named[0].first_name, "Alice");
  CHECK_EQ(named[0].last_name, "Smith");

  auto const json = result.to_json();
  CHECK_EQ(json["errors"].size(), 2u);

  // Nothing known about a domain is not an error.
  auto const none = store.ensure_company("t1", "nothing.example", "run-1", now);
  auto const empty = discovery.discover(*store.company(none), "run-1", now);
  CHECK_EQ(empty.candidates, 0);
  CHECK(empty.errors.empty());

  NoDiscovery no;
  CHECK_EQ(no.discover(*company, "run-1", now).candidates, 0);

  bool threw = false;
  try {
    CandidateFile missing{store, "/nonexistent/candidates.jsonl"};
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);
}
