#include "TestSend.hpp"

#include "Now.hpp"
#include "Patterns.hpp"
#include "Pill.hpp"
#include "Store.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <fmt/format.h>

namespace {
constexpr char const* hard_bounce_reason = "hard_bounce";
constexpr char const* soft_bounce_reason = "soft_bounce";

bool ambiguous(std::optional<VerifyStatus> status)
{
  return status == VerifyStatus::risky_catch_all
         || status == VerifyStatus::unknown_timeout;
}

bool in_flight(TestSendStatus status)
{
  return status == TestSendStatus::pending || status == TestSendStatus::sent;
}

struct Where {
  int64_t     person_id;
  std::string domain;
};

std::optional<Where> where(Store& store, int64_t email_id)
{
  auto const email = store.email(email_id);
  if (!email || !email->person_id)
    return {};
  auto const at = email->email.find('@');
  if (at == std::string::npos || at + 1 == email->email.size())
    return {};
  return Where{*email->person_id,
               boost::algorithm::to_lower_copy(email->email.substr(at + 1))};
}
} // namespace

TestSendEscalator::TestSendEscalator(Store&      store,
                                     std::string bounce_prefix,
                                     std::string bounce_domain,
                                     Enqueue     enqueue)
  : store_(store)
  , bounce_prefix_(std::move(bounce_prefix))
  , bounce_domain_(std::move(bounce_domain))
  , enqueue_(std::move(enqueue))
{
}

std::string TestSendEscalator::return_path(std::string const& token) const
{
  return fmt::format("{}+{}@{}", bounce_prefix_, token, bounce_domain_);
}

std::string TestSendEscalator::mint_token(int64_t result_id)
{
  return fmt::format("vr{}-{}", result_id, Pill{}.as_string_view());
}

std::optional<TestSendEscalator::Candidate>
TestSendEscalator::choose_next(int64_t email_id)
{
  auto const w = where(store_, email_id);
  if (!w)
    return {};

  auto const person = store_.person(w->person_id);
  if (!person)
    return {};
  auto const name = Patterns::normalize(person->first_name, person->last_name);

  std::vector<std::tuple<std::size_t, std::string, Candidate>> ranked;

  for (auto const& e : store_.emails_of_person(w->person_id, w->domain)) {
    auto const row = store_.result_for_email(e.id);
    if (!row || !ambiguous(row->verify_status)
        || row->test_send_status != TestSendStatus::not_requested)
      continue;

    auto const local = boost::algorithm::to_lower_copy(
        e.email.substr(0, e.email.find('@')));
    if (local.empty())
      continue;

    Candidate cand;
    cand.result_id = row->id;
    cand.email_id  = e.id;
    cand.email     = e.email;
    cand.pattern   = Patterns::pattern_of(name, local);

    auto const rank
        = cand.pattern ? Patterns::rank(*cand.pattern) : Patterns::n_patterns;
    ranked.emplace_back(rank, local, std::move(cand));
  }

  if (ranked.empty()) {
    LOG(INFO) << "no test-send candidates left for person " << w->person_id
              << " at " << w->domain;
    return {};
  }

  auto const best = std::min_element(
      begin(ranked), end(ranked), [](auto const& a, auto const& b) {
        return std::tie(std::get<0>(a), std::get<1>(a))
               < std::tie(std::get<0>(b), std::get<1>(b));
      });
  return std::get<2>(*best);
}

std::string TestSendEscalator::request(int64_t result_id)
{
  auto const row = store_.result(result_id);
  if (!row)
    throw std::invalid_argument(
        fmt::format("no verification result {}", result_id));

  auto const token = row->test_send_token ? *row->test_send_token
                                          : mint_token(result_id);

  SQLite::Stmt{store_.db(),
               "UPDATE verification_results SET test_send_token = ?,"
               " test_send_status = 'pending', test_send_at = NULL"
               " WHERE id = ? AND test_send_status = 'not_requested'"}
      .bind(1, token)
      .bind(2, result_id)
      .run();

  if (store_.db().changes())
    LOG(INFO) << "test-send requested for result " << result_id << " as "
              << token;
  return token;
}

bool TestSendEscalator::mark_sent(int64_t result_id, std::time_t now)
{
  SQLite::Stmt{store_.db(),
               "UPDATE verification_results SET test_send_status = 'sent',"
               " test_send_at = ?, updated_at = ?"
               " WHERE id = ? AND test_send_status = 'pending'"}
      .bind(1, Now(now).string())
      .bind(2, Now(now).string())
      .bind(3, result_id)
      .run();
  return store_.db().changes() != 0;
}

TestSendEscalator::Bounce
TestSendEscalator::apply_bounce(std::string const& token,
                                bool               is_hard,
                                std::string const& code,
                                std::string const& reason,
                                std::time_t        now)
{
  Bounce bounce;

  auto const row = store_.result_for_token(token);
  if (!row) {
    LOG(WARNING) << "bounce for unknown token " << token;
    return bounce;
  }
  if (!in_flight(row->test_send_status)) {
    LOG(INFO) << "bounce for " << token << " ignored, test-send is "
              << c_str(row->test_send_status);
    return bounce;
  }

  auto const ts = Now(now).string();

  {
    SQLite::Transaction tx{store_.db()};
    SQLite::Stmt{store_.db(),
                 "UPDATE verification_results SET test_send_status = ?,"
                 " bounce_code = ?, bounce_reason = ?, updated_at = ?"
                 " WHERE id = ? AND test_send_status IN ('pending', 'sent')"}
        .bind(1, c_str(is_hard ? TestSendStatus::bounce_hard
                               : TestSendStatus::bounce_soft))
        .bind(2, code)
        .bind(3, !reason.empty() ? reason
                 : is_hard       ? hard_bounce_reason
                                 : soft_bounce_reason)
        .bind(4, ts)
        .bind(5, row->id)
        .run();
    bounce.applied = store_.db().changes() != 0;

    if (bounce.applied && is_hard)
      store_.set_verify_status(row->id, VerifyStatus::invalid,
                               "hard_bounce_user_unknown", now);
    tx.commit();
  }

  if (!bounce.applied)
    return bounce;

  LOG(INFO) << (is_hard ? "hard" : "soft") << " bounce " << code << " for "
            << token;

  if (is_hard)
    bounce.next = escalate_(row->email_id, now);
  return bounce;
}

std::optional<TestSendEscalator::Candidate>
TestSendEscalator::escalate_(int64_t email_id, std::time_t now)
{
  auto next = choose_next(email_id);
  if (next) {
    auto const token = request(next->result_id);
    LOG(INFO) << "escalating to " << next->email << " ("
              << next->pattern.value_or("?") << ") with " << token;
    enqueue_(next->result_id, now);
  }
  return next;
}

std::optional<TestSendEscalator::Candidate>
TestSendEscalator::maybe_escalate(int64_t email_id, std::time_t now)
{
  auto const w = where(store_, email_id);
  if (!w)
    return {};

  for (auto const& e : store_.emails_of_person(w->person_id, w->domain)) {
    auto const row = store_.result_for_email(e.id);
    if (row && in_flight(row->test_send_status)) {
      LOG(INFO) << "test-send to " << e.email << " already in flight";
      return {};
    }
  }

  return escalate_(email_id, now);
}
