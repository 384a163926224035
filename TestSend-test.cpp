#include "TestSend.hpp"

#include "Store.hpp"

#include <regex>
#include <stdexcept>
#include <vector>

#include <glog/logging.h>

namespace {
std::time_t const now = 1700000000;

struct Fixture {
  SQLite::DB db{":memory:"};
  Store      store{db};

  int64_t company{0};
  int64_t person{0};

  Fixture()
  {
    company = store.ensure_company("t1", "example.com", "run-a", now);
    Person p;
    p.company_id = company;
    p.first_name = "Brett";
    p.last_name  = "Anderson";
    p.full_name  = "Brett Anderson";
    person       = store.upsert_person(p);
  }

  int64_t add(std::string const& address, VerifyStatus status)
  {
    EmailRow e;
    e.person_id   = person;
    e.company_id  = company;
    e.email       = address;
    e.source_note = "generated";
    ResultWrite w;
    w.email_id      = store.upsert_email(e, now);
    w.verify_status = status;
    w.verify_reason = "rcpt_2xx_catchall";
    store.upsert_result(w, now);
    return w.email_id;
  }

  std::string token_of(int64_t email_id)
  {
    return *store.result_for_email(email_id)->test_send_token;
  }
};

void brett_anderson()
{
  Fixture f;

  auto const banderson = f.add("banderson@example.com",
                               VerifyStatus::risky_catch_all);
  auto const brett_anderson
      = f.add("brett.anderson@example.com", VerifyStatus::risky_catch_all);
  auto const brett = f.add("brett@example.com", VerifyStatus::risky_catch_all);

  std::vector<int64_t> queued;
  TestSendEscalator    esc{f.store, "bounce", "verifier.example.com",
                        [&](int64_t id, std::time_t) { queued.push_back(id); }};

  // Ranked flast, first.last, first.
  auto const first = esc.choose_next(brett);
  CHECK(first);
  CHECK_EQ(first->email_id, banderson);
  CHECK_EQ(*first->pattern, "flast");

  CHECK(esc.maybe_escalate(banderson, now));
  CHECK_EQ(queued.size(), 1u);
  CHECK(esc.mark_sent(queued.back(), now));

  // Nothing more while one is in flight.
  CHECK(!esc.maybe_escalate(brett, now));
  CHECK_EQ(queued.size(), 1u);

  auto b = esc.apply_bounce(f.token_of(banderson), true, "5.1.1",
                            "550 5.1.1 user unknown", now);
  CHECK(b.applied);
  CHECK(b.next);
  CHECK_EQ(b.next->email_id, brett_anderson);
  CHECK_EQ(*b.next->pattern, "first.last");
  CHECK_EQ(queued.size(), 2u);

  auto const bounced = f.store.result_for_email(banderson);
  CHECK(bounced->test_send_status == TestSendStatus::bounce_hard);
  CHECK(bounced->verify_status == VerifyStatus::invalid);
  CHECK_EQ(bounced->verify_reason, "hard_bounce_user_unknown");
  CHECK_EQ(*bounced->bounce_code, "5.1.1");

  CHECK(esc.mark_sent(queued.back(), now));
  b = esc.apply_bounce(f.token_of(brett_anderson), true, "5.1.1", "", now);
  CHECK(b.next);
  CHECK_EQ(b.next->email_id, brett);
  CHECK_EQ(*f.store.result_for_email(brett_anderson)->bounce_reason,
           "hard_bounce");

  // A pending row may bounce directly.
  b = esc.apply_bounce(f.token_of(brett), true, "5.1.1", "", now);
  CHECK(b.applied);
  CHECK(!b.next);
  CHECK_EQ(queued.size(), 3u);
  CHECK(!esc.choose_next(brett));

  // Terminal rows are never rewritten.
  b = esc.apply_bounce(f.token_of(brett), false, "4.2.2", "", now);
  CHECK(!b.applied);
  CHECK(f.store.result_for_email(brett)->test_send_status
        == TestSendStatus::bounce_hard);
  CHECK(!esc.apply_bounce("vr999-nope", true, "", "", now).applied);
}

void transitions()
{
  Fixture f;

  auto const valid = f.add("brett@example.com", VerifyStatus::valid);
  auto const risky = f.add("banderson@example.com", VerifyStatus::unknown_timeout);

  std::vector<int64_t> queued;
  TestSendEscalator    esc{f.store, "bounce", "verifier.example.com",
                        [&](int64_t id, std::time_t) { queued.push_back(id); }};

  // Only ambiguous rows are candidates.
  auto const next = esc.choose_next(valid);
  CHECK(next);
  CHECK_EQ(next->email_id, risky);

  auto const rid   = next->result_id;
  auto const token = esc.request(rid);
  CHECK(std::regex_match(token, std::regex{"vr[0-9]+-[a-z0-9]{13}"}))
      << token;
  CHECK_EQ(token.substr(0, 2 + std::to_string(rid).size() + 1),
           "vr" + std::to_string(rid) + "-");
  CHECK_EQ(esc.request(rid), token); // reused

  CHECK_EQ(esc.return_path(token),
           "bounce+" + token + "@verifier.example.com");

  auto row = f.store.result(rid);
  CHECK(row->test_send_status == TestSendStatus::pending);
  CHECK(!row->test_send_at);

  CHECK(esc.mark_sent(rid, now));
  CHECK(!esc.mark_sent(rid, now + 1)); // already sent
  row = f.store.result(rid);
  CHECK(row->test_send_status == TestSendStatus::sent);
  CHECK_EQ(*row->test_send_at, "2023-11-14T22:13:20Z");

  // Soft bounces do not touch verify_status nor escalate.
  auto const b = esc.apply_bounce(token, false, "4.2.2", "", now);
  CHECK(b.applied);
  CHECK(!b.next);
  row = f.store.result(rid);
  CHECK(row->test_send_status == TestSendStatus::bounce_soft);
  CHECK(row->verify_status == VerifyStatus::unknown_timeout);
  CHECK_EQ(*row->bounce_reason, "soft_bounce");
  CHECK(queued.empty());

  // A terminal row is not requested again.
  CHECK_EQ(esc.request(rid), token);
  CHECK(f.store.result(rid)->test_send_status == TestSendStatus::bounce_soft);

  bool threw = false;
  try {
    esc.request(4242);
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  brett_anderson();
  transitions();
}
