#include "DeliveryEvidence.hpp"

#include "Store.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;
using namespace DeliveryEvidence;

namespace {
std::time_t const now = 1700000000;

VerificationResult risky_sent()
{
  VerificationResult row;
  row.verify_status    = VerifyStatus::risky_catch_all;
  row.test_send_status = TestSendStatus::sent;
  return row;
}

void rules()
{
  CHECK(is_user_unknown(std::string{"5.1.1"}, {}));
  CHECK(is_user_unknown(std::string{"5.1.10"}, {}));
  CHECK(!is_user_unknown(std::string{"5.7.1"}, {}));
  CHECK(is_user_unknown({}, std::string{"550 Recipient address rejected"}));
  CHECK(is_user_unknown(std::string{""}, std::string{"No Such User here"}));
  CHECK(!is_user_unknown({}, std::string{"mailbox full"}));
  CHECK(!is_user_unknown({}, {}));

  CHECK(classify({true, true}) == DeliveryStatus::not_catchall_proven);
  CHECK(classify({true, false}) == DeliveryStatus::unknown);
  CHECK(classify({false, true}) == DeliveryStatus::unknown);
  CHECK(classify({false, false}) == DeliveryStatus::unknown);

  // Each precondition, flipped alone, stops the upgrade.
  auto const proven = DeliveryStatus::not_catchall_proven;
  CHECK(should_upgrade_risky_to_valid(risky_sent(), proven));

  auto row          = risky_sent();
  row.verify_status = VerifyStatus::unknown_timeout;
  CHECK(!should_upgrade_risky_to_valid(row, proven));

  CHECK(!should_upgrade_risky_to_valid(risky_sent(), DeliveryStatus::unknown));
  CHECK(!should_upgrade_risky_to_valid(risky_sent(), std::nullopt));

  row                  = risky_sent();
  row.test_send_status = TestSendStatus::pending;
  CHECK(!should_upgrade_risky_to_valid(row, proven));
  row.test_send_status = TestSendStatus::delivered_assumed;
  CHECK(should_upgrade_risky_to_valid(row, proven));

  row             = risky_sent();
  row.bounce_code = "5.1.1";
  CHECK(!should_upgrade_risky_to_valid(row, proven));
}

struct Rows {
  SQLite::DB db{":memory:"};
  Store      store{db};
  int64_t    company{store.ensure_company("t1", "example.com", "r", now)};

  int64_t add(std::string const& address,
              VerifyStatus       status,
              char const*        test_send,
              char const*        code,
              std::string const& test_send_at = "2023-11-14T00:00:00Z")
  {
    EmailRow e;
    e.company_id = company;
    e.email      = address;
    ResultWrite w;
    w.email_id      = store.upsert_email(e, now);
    w.verify_status = status;
    auto const id   = store.upsert_result(w, now);
    SQLite::Stmt{db, "UPDATE verification_results SET test_send_status = ?,"
                     " test_send_token = ?, bounce_code = ?, test_send_at = ?"
                     " WHERE id = ?"}
        .bind(1, test_send)
        .bind(2, "tok-" + address)
        .bind(3, code ? std::optional<std::string>{code} : std::nullopt)
        .bind(4, test_send_at)
        .bind(5, id)
        .run();
    return id;
  }
};

void store_backed()
{
  Rows r;
  EvidenceStore ev{r.store};

  auto const risky = r.add("brett@example.com", VerifyStatus::risky_catch_all,
                           "sent", nullptr);
  CHECK(ev.evidence("example.com") == (Evidence{true, false}));
  CHECK_EQ(ev.reclassify_domains(now), 0);
  CHECK(r.store.domain("example.com")->delivery_catchall_status
        == DeliveryStatus::unknown);

  r.add("_ca_0123@example.com", VerifyStatus::invalid, "bounce_hard", "5.1.1");
  CHECK(ev.evidence("example.com") == (Evidence{true, true}));

  CHECK_EQ(ev.reclassify_domains(now), 1);
  auto const row = r.store.result(risky);
  CHECK(row->verify_status == VerifyStatus::valid);
  CHECK_EQ(row->verify_reason, "no_bounce_after_test_send");
  CHECK(r.store.domain("example.com")->delivery_catchall_status
        == DeliveryStatus::not_catchall_proven);

  // Idempotent.
  CHECK_EQ(ev.reclassify_domains(now), 0);
  CHECK(ev.evidence("example.com") == (Evidence{true, true}));

  // Other domains are untouched.
  CHECK(ev.evidence("example.org") == (Evidence{false, false}));
}

void aging()
{
  Rows r;
  EvidenceStore ev{r.store};

  // 2023-11-13T22:13:20Z is exactly 24h before now.
  auto const old_risky = r.add("a@example.com", VerifyStatus::risky_catch_all,
                               "sent", nullptr, "2023-11-13T22:13:20Z");
  auto const old_invalid = r.add("b@example.com", VerifyStatus::invalid,
                                 "sent", nullptr, "2023-11-13T10:00:00Z");
  auto const fresh = r.add("c@example.com", VerifyStatus::unknown_timeout,
                           "sent", nullptr, "2023-11-14T20:00:00Z");
  auto const pending = r.add("d@example.com", VerifyStatus::unknown_timeout,
                             "pending", nullptr, "2023-11-10T00:00:00Z");

  CHECK_EQ(ev.assume_delivered(now, 24h), 2);

  auto row = r.store.result(old_risky);
  CHECK(row->test_send_status == TestSendStatus::delivered_assumed);
  CHECK(row->verify_status == VerifyStatus::valid);
  CHECK_EQ(row->verify_reason, "no_bounce_after_test_send");

  row = r.store.result(old_invalid);
  CHECK(row->test_send_status == TestSendStatus::delivered_assumed);
  CHECK(row->verify_status == VerifyStatus::invalid);

  CHECK(r.store.result(fresh)->test_send_status == TestSendStatus::sent);
  CHECK(r.store.result(pending)->test_send_status == TestSendStatus::pending);

  CHECK_EQ(ev.assume_delivered(now, 24h), 0);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  rules();
  store_backed();
  aging();
}
