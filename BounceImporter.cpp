#include "BounceImporter.hpp"

#include "Store.hpp"
#include "TestSend.hpp"

#include <regex>
#include <stdexcept>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <nlohmann/json.hpp>

#include <fmt/format.h>

using nlohmann::json;

namespace {
constexpr char const* token_tag = "iq_test_token";

json const& member(json const& obj, char const* key)
{
  static json const null_json;
  if (!obj.is_object())
    return null_json;
  auto const it = obj.find(key);
  return it == obj.end() ? null_json : *it;
}

std::string str(json const& obj, char const* key)
{
  auto const& v = member(obj, key);
  return v.is_string() ? v.get<std::string>() : std::string{};
}

std::optional<std::string> nonblank(std::string s)
{
  boost::algorithm::trim(s);
  if (s.empty())
    return {};
  return s;
}

std::optional<std::string> token_from_tags(json const& mail)
{
  auto const& vals = member(member(mail, "tags"), token_tag);
  if (vals.is_array() && !vals.empty() && vals[0].is_string())
    return nonblank(vals[0].get<std::string>());
  if (vals.is_string())
    return nonblank(vals.get<std::string>());
  return {};
}

std::optional<std::string> token_from_subject(json const& mail)
{
  static std::regex const rx{R"(\(token=([^)]+)\))"};

  auto const  subject = str(member(mail, "commonHeaders"), "subject");
  std::smatch m;
  if (std::regex_search(subject, m, rx))
    return nonblank(m[1].str());
  return {};
}

std::string escape_regex(std::string const& s)
{
  static std::regex const special{R"([.^$|()\[\]{}*+?\\])"};
  return std::regex_replace(s, special, R"(\$&)");
}

std::optional<std::string> token_in_text(std::string const& text,
                                         std::string const& prefix)
{
  std::regex const rx{escape_regex(prefix) + R"(\+([A-Za-z0-9_-]+)@)"};
  std::smatch      m;
  if (std::regex_search(text, m, rx))
    return m[1].str();
  return {};
}
} // namespace

BounceImporter::BounceImporter(Store&             store,
                               TestSendEscalator& escalator,
                               std::string        bounce_prefix)
  : store_(store)
  , escalator_(escalator)
  , bounce_prefix_(std::move(bounce_prefix))
{
}

std::optional<std::string>
BounceImporter::token_from_return_path(std::string_view return_path,
                                       std::string_view bounce_prefix)
{
  auto const local = return_path.substr(0, return_path.find('@'));
  auto const plus  = local.find('+');
  if (plus == std::string_view::npos)
    return {};
  auto prefix = local.substr(0, plus);
  // "Name <bounce+tok@...>" as found in a source header.
  if (auto const lt = prefix.rfind('<'); lt != std::string_view::npos)
    prefix.remove_prefix(lt + 1);
  if (prefix != bounce_prefix)
    return {};
  return nonblank(std::string(local.substr(plus + 1)));
}

std::optional<BounceImporter::Notification>
BounceImporter::parse(std::string_view body, std::string const& bounce_prefix)
{
  auto const outer = json::parse(body.begin(), body.end(), nullptr, false);
  if (outer.is_discarded() || !outer.is_object())
    throw std::invalid_argument("bounce notification is not a JSON object");

  json        event;
  auto const& wrapped = member(outer, "Message");
  if (wrapped.is_string()) {
    event = json::parse(wrapped.get<std::string>(), nullptr, false);
    if (event.is_discarded() || !event.is_object())
      throw std::invalid_argument("SNS Message is not a JSON object");
  }
  else {
    event = outer;
  }

  if (str(event, "notificationType") != "Bounce")
    return {};

  auto const& mail       = member(event, "mail");
  auto const& bounce     = member(event, "bounce");
  auto const& recipients = member(bounce, "bouncedRecipients");
  auto const& recipient
      = recipients.is_array() && !recipients.empty() ? recipients[0] : json{};

  Notification n;
  n.recipient = str(recipient, "emailAddress");

  if ((n.token = token_from_tags(mail))) {
    n.token_source = "tags";
  }
  else {
    auto const& headers = member(mail, "commonHeaders");
    for (auto const field : {"returnPath", "source"}) {
      auto rp = str(headers, field);
      if (rp.empty())
        rp = str(mail, field);
      if ((n.token = token_from_return_path(rp, bounce_prefix))) {
        n.token_source = "return_path";
        break;
      }
    }
  }
  if (!n.token && (n.token = token_from_subject(mail)))
    n.token_source = "subject";
  if (!n.token && (n.token = token_in_text(std::string(body), bounce_prefix)))
    n.token_source = "body";

  n.is_hard = boost::algorithm::to_lower_copy(str(bounce, "bounceType"))
              == "permanent";
  n.code    = str(recipient, "status");
  n.reason  = str(recipient, "diagnosticCode");
  if (n.reason.empty())
    n.reason = str(bounce, "bounceSubType");

  return n;
}

bool BounceImporter::import(std::string_view body, std::time_t now)
{
  ++stats_.seen;

  std::optional<Notification> n;
  try {
    n = parse(body, bounce_prefix_);
  }
  catch (std::invalid_argument const& e) {
    ++stats_.malformed;
    LOG(WARNING) << "skipping malformed notification: " << e.what();
    return false;
  }
  if (!n) {
    ++stats_.ignored;
    return false;
  }
  ++stats_.bounces;

  if (!n->token && !n->recipient.empty()) {
    // May pick the wrong row when one address has several test-sends in
    // flight; escalation keeps that to one per person.
    if (auto const row = store_.latest_test_send_to(n->recipient)) {
      n->token        = row->test_send_token;
      n->token_source = "recipient";
      LOG(WARNING) << "bounce for " << n->recipient
                   << " carried no token, attributed to " << *n->token;
    }
  }
  if (!n->token) {
    ++stats_.unresolved;
    LOG(WARNING) << "bounce for " << n->recipient << " has no token";
    return false;
  }

  LOG(INFO) << (n->is_hard ? "hard" : "soft") << " bounce for "
            << n->recipient << " token " << *n->token << " from "
            << n->token_source;

  auto const b
      = escalator_.apply_bounce(*n->token, n->is_hard, n->code, n->reason, now);
  if (b.applied)
    ++stats_.applied;
  return b.applied;
}
