#include "DeliveryEvidence.hpp"

#include "Now.hpp"
#include "Store.hpp"

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace DeliveryEvidence {

namespace {
constexpr char const* const user_unknown_phrases[]{
    "user unknown",        "unknown user",        "no such user",
    "recipient not found", "mailbox unavailable", "recipient address rejected",
};

bool delivered(TestSendStatus status)
{
  return status == TestSendStatus::sent
         || status == TestSendStatus::delivered_assumed;
}
} // namespace

bool is_user_unknown(std::optional<std::string> const& code,
                     std::optional<std::string> const& reason)
{
  if (code && boost::starts_with(*code, "5.1."))
    return true;

  if (reason) {
    auto const lowered = boost::algorithm::to_lower_copy(*reason);
    for (auto const phrase : user_unknown_phrases) {
      if (boost::contains(lowered, phrase))
        return true;
    }
  }

  return false;
}

bool is_good_real(VerificationResult const& row)
{
  return delivered(row.test_send_status)
         && !is_user_unknown(row.bounce_code, row.bounce_reason);
}

bool is_bad_invalid(VerificationResult const& row)
{
  return row.test_send_status == TestSendStatus::bounce_hard
         && is_user_unknown(row.bounce_code, row.bounce_reason);
}

DeliveryStatus classify(Evidence const& ev)
{
  if (ev.has_good_real && ev.has_bad_invalid)
    return DeliveryStatus::not_catchall_proven;
  return DeliveryStatus::unknown;
}

bool should_upgrade_risky_to_valid(VerificationResult const&     row,
                                   std::optional<DeliveryStatus> domain_status)
{
  return row.verify_status == VerifyStatus::risky_catch_all
         && domain_status == DeliveryStatus::not_catchall_proven
         && is_good_real(row);
}

//.............................................................................

EvidenceStore::EvidenceStore(Store& store)
  : store_(store)
{
}

Evidence EvidenceStore::evidence(std::string const& domain)
{
  Evidence ev;
  for (auto const& row : store_.test_sent_results(domain)) {
    ev.has_good_real   = ev.has_good_real || is_good_real(row);
    ev.has_bad_invalid = ev.has_bad_invalid || is_bad_invalid(row);
  }
  return ev;
}

DeliveryStatus EvidenceStore::refresh(std::string const& domain,
                                      std::time_t        now)
{
  auto const ev     = evidence(domain);
  auto const status = classify(ev);
  store_.save_delivery_status(domain, status, now);
  LOG(INFO) << domain << " delivery evidence good_real=" << ev.has_good_real
            << " bad_invalid=" << ev.has_bad_invalid << ": " << c_str(status);
  return status;
}

int EvidenceStore::upgrade_domain_(std::string const& domain,
                                   DeliveryStatus     status,
                                   std::time_t        now)
{
  auto upgraded = 0;
  for (auto const& row : store_.test_sent_results(domain)) {
    if (should_upgrade_risky_to_valid(row, status)) {
      store_.set_verify_status(row.id, VerifyStatus::valid, upgrade_reason,
                               now);
      ++upgraded;
    }
  }
  if (upgraded)
    LOG(INFO) << "upgraded " << upgraded << " risky rows at " << domain;
  return upgraded;
}

int EvidenceStore::reclassify_domains(std::time_t now)
{
  auto upgraded = 0;
  for (auto const& domain : store_.test_sent_domains()) {
    auto const status = refresh(domain, now);
    upgraded += upgrade_domain_(domain, status, now);
  }
  return upgraded;
}

int EvidenceStore::assume_delivered(std::time_t now, std::chrono::seconds window)
{
  auto& db = store_.db();

  auto const cutoff = Now(now - window.count()).string();
  auto const ts     = Now(now).string();

  SQLite::Transaction tx{db};

  // Only rows without a stronger verdict become valid.
  SQLite::Stmt{db, "UPDATE verification_results"
                   " SET verify_status = 'valid', verify_reason = ?,"
                   " updated_at = ?"
                   " WHERE test_send_status = 'sent'"
                   " AND test_send_at IS NOT NULL AND test_send_at <= ?"
                   " AND bounce_code IS NULL AND bounce_reason IS NULL"
                   " AND (verify_status IS NULL"
                   "   OR verify_status IN ('unknown_timeout',"
                   "                        'risky_catch_all'))"}
      .bind(1, upgrade_reason)
      .bind(2, ts)
      .bind(3, cutoff)
      .run();

  SQLite::Stmt{db, "UPDATE verification_results"
                   " SET test_send_status = 'delivered_assumed',"
                   " updated_at = ?"
                   " WHERE test_send_status = 'sent'"
                   " AND test_send_at IS NOT NULL AND test_send_at <= ?"
                   " AND bounce_code IS NULL AND bounce_reason IS NULL"}
      .bind(1, ts)
      .bind(2, cutoff)
      .run();
  auto const aged = db.changes();

  tx.commit();

  if (aged)
    LOG(INFO) << aged << " test-sends sent before " << cutoff
              << " assumed delivered";
  return aged;
}

} // namespace DeliveryEvidence
