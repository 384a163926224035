#include "BounceImporter.hpp"

#include "Store.hpp"
#include "TestSend.hpp"

#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {
std::time_t const now = 1700000000;

json ses_bounce(std::string const& recipient)
{
  return json{
      {"notificationType", "Bounce"},
      {"bounce",
       {{"bounceType", "Permanent"},
        {"bounceSubType", "General"},
        {"bouncedRecipients",
         json::array({{{"emailAddress", recipient},
                       {"status", "5.1.1"},
                       {"diagnosticCode", "smtp; 550 5.1.1 user unknown"}}})}}},
      {"mail", json::object()},
  };
}

void token_sources()
{
  auto ev = ses_bounce("brett@example.com");
  ev["mail"]["commonHeaders"]["subject"] = "Hello (token=vr3-subject)";
  ev["mail"]["commonHeaders"]["returnPath"]
      = "bounce+vr2-returnpath@verifier.example.com";
  ev["mail"]["tags"]["iq_test_token"] = json::array({"vr1-tag"});

  auto n = BounceImporter::parse(ev.dump(), "bounce");
  CHECK(n);
  CHECK_EQ(*n->token, "vr1-tag");
  CHECK_EQ(std::string(n->token_source), "tags");
  CHECK(n->is_hard);
  CHECK_EQ(n->code, "5.1.1");
  CHECK_EQ(n->reason, "smtp; 550 5.1.1 user unknown");
  CHECK_EQ(n->recipient, "brett@example.com");

  ev["mail"].erase("tags");
  n = BounceImporter::parse(ev.dump(), "bounce");
  CHECK_EQ(*n->token, "vr2-returnpath");

  // A return-path with some other prefix is not ours.
  ev["mail"]["commonHeaders"]["returnPath"]
      = "other+vr2-returnpath@verifier.example.com";
  n = BounceImporter::parse(ev.dump(), "bounce");
  CHECK_EQ(*n->token, "vr3-subject");
  CHECK_EQ(std::string(n->token_source), "subject");

  ev["mail"]["commonHeaders"].erase("subject");
  ev["mail"]["source"] = "Verifier <bounce+vr4-source@verifier.example.com>";
  n = BounceImporter::parse(ev.dump(), "bounce");
  CHECK_EQ(*n->token, "vr4-source");

  ev["mail"].erase("source");
  ev["mail"]["headers"] = json::array(
      {{{"name", "X-Original"}, {"value", "bounce+vr5-free@x.example"}}});
  n = BounceImporter::parse(ev.dump(), "bounce");
  CHECK_EQ(*n->token, "vr5-free");
  CHECK_EQ(std::string(n->token_source), "body");

  ev["mail"].erase("headers");
  n = BounceImporter::parse(ev.dump(), "bounce");
  CHECK(!n->token);

  // Transient bounce, reason from the sub-type.
  ev["bounce"]["bounceType"] = "Transient";
  ev["bounce"]["bouncedRecipients"][0].erase("diagnosticCode");
  n = BounceImporter::parse(ev.dump(), "bounce");
  CHECK(!n->is_hard);
  CHECK_EQ(n->reason, "General");

  // SNS envelope.
  auto const sns = json{{"Type", "Notification"}, {"Message", ev.dump()}};
  n = BounceImporter::parse(sns.dump(), "bounce");
  CHECK(n);
  CHECK_EQ(n->recipient, "brett@example.com");

  CHECK(!BounceImporter::parse(R"({"notificationType":"Delivery"})", "bounce"));

  bool threw = false;
  try {
    BounceImporter::parse("not json", "bounce");
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);
}

void return_paths()
{
  CHECK_EQ(*BounceImporter::token_from_return_path("bounce+vr1-x@d.example",
                                                   "bounce"),
           "vr1-x");
  CHECK(!BounceImporter::token_from_return_path("bounce@d.example", "bounce"));
  CHECK(!BounceImporter::token_from_return_path("bounce+@d.example", "bounce"));
  CHECK(!BounceImporter::token_from_return_path("b+vr1-x@d.example", "bounce"));
}

void import()
{
  SQLite::DB db{":memory:"};
  Store      store{db};

  auto const company = store.ensure_company("t1", "example.com", "run-a", now);
  Person     p;
  p.company_id      = company;
  p.first_name      = "Brett";
  p.last_name       = "Anderson";
  p.full_name       = "Brett Anderson";
  auto const person = store.upsert_person(p);

  std::vector<int64_t> results;
  for (auto const address : {"banderson@example.com", "brett@example.com"}) {
    EmailRow e;
    e.person_id  = person;
    e.company_id = company;
    e.email      = address;
    ResultWrite w;
    w.email_id      = store.upsert_email(e, now);
    w.verify_status = VerifyStatus::risky_catch_all;
    results.push_back(store.upsert_result(w, now));
  }

  std::vector<int64_t> queued;
  TestSendEscalator    esc{store, "bounce", "verifier.example.com",
                        [&](int64_t id, std::time_t) { queued.push_back(id); }};
  BounceImporter       importer{store, esc, "bounce"};

  auto const token = esc.request(results[0]);
  CHECK(esc.mark_sent(results[0], now));

  // No token anywhere: attributed to the newest test-send to the
  // recipient, and the hard bounce escalates to brett@.
  CHECK(importer.import(ses_bounce("banderson@example.com").dump(), now + 60));
  auto const row = store.result(results[0]);
  CHECK(row->test_send_status == TestSendStatus::bounce_hard);
  CHECK(row->verify_status == VerifyStatus::invalid);
  CHECK_EQ(*row->bounce_code, "5.1.1");
  CHECK_EQ(queued.size(), 1u);
  CHECK_EQ(queued[0], results[1]);

  // Same bounce again changes nothing.
  auto ev = ses_bounce("banderson@example.com");
  ev["mail"]["tags"]["iq_test_token"] = token;
  CHECK(!importer.import(ev.dump(), now + 120));

  CHECK(!importer.import("{", now));
  CHECK(!importer.import(R"({"notificationType":"Complaint"})", now));
  CHECK(!importer.import(ses_bounce("nobody@example.com").dump(), now));

  auto const& s = importer.stats();
  CHECK_EQ(s.seen, 5);
  CHECK_EQ(s.bounces, 3);
  CHECK_EQ(s.applied, 1);
  CHECK_EQ(s.malformed, 1);
  CHECK_EQ(s.ignored, 1);
  CHECK_EQ(s.unresolved, 1);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  token_sources();
  return_paths();
  import();

  LOG(INFO) << "BounceImporter-test passed";
}
