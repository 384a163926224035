#include "Store.hpp"

#include "Now.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  SQLite::DB db{":memory:"};
  Store      store{db};

  std::time_t const now = 1700000000;

  auto const company = store.ensure_company("t1", "example.com", "run-a", now);
  CHECK_EQ(store.ensure_company("t1", "example.com", "run-b", now), company);
  CHECK_NE(store.ensure_company("t2", "example.com", "run-b", now), company);
  CHECK_EQ(store.company(company)->run_id, "run-b");

  Person p;
  p.company_id = company;
  p.first_name = "Brett";
  p.last_name  = "Anderson";
  p.full_name  = "Brett Anderson";
  p.title      = "CTO";
  auto const person = store.upsert_person(p);
  p.title.clear();
  CHECK_EQ(store.upsert_person(p), person);
  CHECK_EQ(store.person(person)->title, "CTO"); // not blanked
  CHECK_EQ(store.people_of_company(company).size(), 1u);

  // A generated address, later found on a page, takes the page as its
  // source.
  EmailRow e;
  e.person_id   = person;
  e.company_id  = company;
  e.email       = "brett@example.com";
  e.source_note = "generated:first";
  auto const email = store.upsert_email(e, now);

  e.source_url  = "https://example.com/team";
  e.source_note = "team page";
  CHECK_EQ(store.upsert_email(e, now), email);
  auto const row = store.email(email);
  CHECK(row);
  CHECK_EQ(*row->source_url, "https://example.com/team");
  CHECK_EQ(*row->source_note, "team page");

  e.email      = "banderson@example.com";
  e.source_url.reset();
  e.source_note = "generated:flast";
  auto const other = store.upsert_email(e, now);
  CHECK_EQ(store.emails_of_person(person, "example.com").size(), 2u);
  CHECK_EQ(store.emails_of_person(person, "example.org").size(), 0u);
  CHECK_EQ(store.emails_at_domain("example.com").size(), 2u);

  // Only found addresses teach us the domain's convention.
  auto const named = store.named_addresses_at_domain("example.com");
  CHECK_EQ(named.size(), 1u);
  CHECK_EQ(named[0].email, "brett@example.com");
  CHECK_EQ(named[0].first_name, "Brett");

  CHECK_EQ(store.unverified_emails(company, false).size(), 2u);
  CHECK_EQ(store.unverified_emails(company, true).size(), 1u);

  // One result per email, and the probe writer leaves test-send state
  // alone.
  CHECK(!store.result_for_email(email));
  ResultWrite w;
  w.email_id      = email;
  w.verify_status = VerifyStatus::risky_catch_all;
  w.verify_reason = "rcpt_2xx_catchall";
  w.mx_host       = "mx.example.com";
  auto const rid  = store.upsert_result(w, now);

  SQLite::Stmt{db, "UPDATE verification_results SET test_send_status = 'sent',"
                   " test_send_token = 'vr1-abc' WHERE id = ?"}
      .bind(1, rid)
      .run();

  w.verify_status   = VerifyStatus::valid;
  w.verify_reason   = "rcpt_2xx_non_catchall";
  w.fallback_status = FallbackStatus::valid;
  CHECK_EQ(store.upsert_result(w, now + 60), rid);

  auto const r = store.result(rid);
  CHECK(r);
  CHECK(r->verify_status == VerifyStatus::valid);
  CHECK(r->fallback_status == FallbackStatus::valid);
  CHECK(r->test_send_status == TestSendStatus::sent);
  CHECK_EQ(*r->verified_at, Now(now + 60).string());
  CHECK_EQ(store.result_for_token("vr1-abc")->id, rid);
  CHECK(!store.result_for_token("vr1-xyz"));

  // What a test-send proved survives a later probe.
  SQLite::Stmt{db, "UPDATE verification_results SET"
                   " test_send_status = 'bounce_hard' WHERE id = ?"}
      .bind(1, rid)
      .run();
  store.set_verify_status(rid, VerifyStatus::invalid,
                          "hard_bounce_user_unknown", now + 120);
  w.verify_status = VerifyStatus::risky_catch_all;
  w.verify_reason = "rcpt_2xx_catchall";
  CHECK_EQ(store.upsert_result(w, now + 180), rid);
  auto const bounced = store.result(rid);
  CHECK(bounced->verify_status == VerifyStatus::invalid);
  CHECK_EQ(bounced->verify_reason, "hard_bounce_user_unknown");
  CHECK_EQ(*bounced->verified_at, Now(now + 180).string());

  ResultWrite w2;
  w2.email_id      = other;
  w2.verify_status = VerifyStatus::risky_catch_all;
  w2.verify_reason = "rcpt_2xx_catchall";
  auto const rid2  = store.upsert_result(w2, now);
  store.set_verify_status(rid2, VerifyStatus::valid,
                          "no_bounce_after_test_send", now + 60);
  store.upsert_result(w2, now + 120);
  CHECK(store.result(rid2)->verify_status == VerifyStatus::valid);
  CHECK_EQ(store.result(rid2)->verify_reason, "no_bounce_after_test_send");

  // Any other earlier answer is simply replaced.
  store.set_verify_status(rid2, VerifyStatus::valid, "rcpt_2xx_non_catchall",
                          now + 180);
  store.upsert_result(w2, now + 240);
  CHECK(store.result(rid2)->verify_status == VerifyStatus::risky_catch_all);

  // Domain cache.
  CHECK(!store.domain("example.com"));
  store.save_catch_all("example.com", CatchAllStatus::catch_all, "_ca_1f2e",
                       250, now);
  store.save_delivery_status("example.com",
                             DeliveryStatus::not_catchall_proven, now);
  store.save_pattern("example.com", "first.last", 0.9, 10, now);
  auto const d = store.domain("example.com");
  CHECK(d);
  CHECK(d->catch_all_status == CatchAllStatus::catch_all);
  CHECK_EQ(*d->catch_all_code, 250);
  CHECK(d->delivery_catchall_status == DeliveryStatus::not_catchall_proven);
  CHECK_EQ(*d->email_pattern, "first.last");
  CHECK_EQ(d->pattern_samples, 10);

  // Runs.
  auto const run = store.create_run("t1", nlohmann::json::array({"example.com"}),
                                    nlohmann::json{{"modes", "full"}}, now);
  CHECK_EQ(store.run(run)->status, "queued");
  store.set_run_status(run, RunStatus::running, "", now + 1);
  store.set_run_status(run, RunStatus::failed, "runtime_error: boom", now + 2);
  auto const got = store.run(run);
  CHECK_EQ(got->status, "failed");
  CHECK_EQ(got->error, "runtime_error: boom");
  CHECK_EQ(got->started_at, Now(now + 1).string());
  CHECK_EQ(got->finished_at, Now(now + 2).string());
  CHECK_EQ(got->options["modes"].get<std::string>(), "full");
  CHECK_EQ(got->domains.size(), 1u);

  bool threw = false;
  try {
    store.set_run_status("run-nope", RunStatus::running, "", now);
  }
  catch (std::runtime_error const&) {
    threw = true;
  }
  CHECK(threw);

  store.save_run_metrics(run, "t1", nlohmann::json{{"valid", 3}}, now);
  CHECK_EQ((*store.run_metrics(run))["valid"].get<int>(), 3);

  // Only the newest dead letters are kept.
  for (auto i = 0; i < 5; ++i) {
    DeadLetter dl;
    dl.email      = "x@example.com";
    dl.error_type = "unknown_timeout";
    store.add_dead_letter(dl, now + i, 3);
  }
  CHECK_EQ(store.dead_letter_count(), 3);
  CHECK_EQ(store.trim_dead_letters(1), 2);
  CHECK_EQ(store.dead_letter_count(), 1);

  LOG(INFO) << "Store-test passed";
}
