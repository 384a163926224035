#include "Pipeline.hpp"

#include "JobQueue.hpp"
#include "Mailbox.hpp"
#include "Now.hpp"
#include "Patterns.hpp"
#include "Store.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <typeinfo>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/core/demangle.hpp>

#include <fmt/format.h>

using nlohmann::json;

namespace Modes {

std::vector<std::string> normalize(json const& modes)
{
  std::vector<std::string> tokens;

  auto const tokenize = [&tokens](std::string const& str) {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, str, boost::algorithm::is_any_of("+, \t\r\n"),
                            boost::algorithm::token_compress_on);
    for (auto& part : parts) {
      boost::algorithm::trim(part);
      boost::algorithm::to_lower(part);
      if (!part.empty())
        tokens.push_back(part);
    }
  };

  if (modes.is_string()) {
    tokenize(modes.get<std::string>());
  }
  else if (modes.is_array()) {
    for (auto const& m : modes) {
      if (m.is_string())
        tokenize(m.get<std::string>());
    }
  }

  std::vector<std::string> out;
  auto const add = [&out](char const* mode) {
    if (std::find(begin(out), end(out), mode) == end(out))
      out.push_back(mode);
  };

  for (auto const& t : tokens) {
    if (t == "all" || t == "full" || t == "everything")
      return {full};

    if (t == "autodiscovery" || t == "discovery" || t == "crawl") {
      add(autodiscovery);
    }
    else if (t == "generate" || t == "gen" || t == "generation") {
      add(generate);
    }
    else if (t == "verify" || t == "verif" || t == "verification") {
      add(verify);
    }
    else if (t == "genverify" || t == "generateverify"
             || t == "generate_verify" || t == "generation_verify") {
      add(generate);
      add(verify);
    }
    else {
      LOG(WARNING) << "ignoring unknown mode \"" << t << "\"";
    }
  }

  if (out.empty())
    return {full};
  return out;
}

} // namespace Modes

namespace {
bool has_mode(std::vector<std::string> const& modes, char const* mode)
{
  return std::find(begin(modes), end(modes), Modes::full) != end(modes)
         || std::find(begin(modes), end(modes), mode) != end(modes);
}

bool option(json const& options, char const* key, bool dflt)
{
  if (!options.is_object())
    return dflt;
  auto const it = options.find(key);
  if (it == options.end() || !it->is_boolean())
    return dflt;
  return it->get<bool>();
}

int64_t count_of(json const& result, char const* key)
{
  auto const it = result.find(key);
  if (it == result.end() || !it->is_number_integer())
    return 0;
  return it->get<int64_t>();
}

// "std::runtime_error: what" is a std::runtime_error.
std::string error_type_of(std::string const& error)
{
  auto const colon = error.find(": ");
  if (colon == std::string::npos)
    return "unknown";
  auto type = boost::algorithm::trim_copy(error.substr(0, colon));
  if (type.empty())
    return "unknown";
  return type;
}
} // namespace

Pipeline::Pipeline(Settings const& settings, Store& store, JobQueue& queue)
  : settings_(settings)
  , store_(store)
  , queue_(queue)
{
}

json Pipeline::start(std::string const& run_id, std::time_t now)
{
  auto const run = store_.run(run_id);
  if (!run)
    throw std::invalid_argument(fmt::format("no run {}", run_id));
  if (run->status != c_str(RunStatus::queued))
    throw std::invalid_argument(
        fmt::format("run {} is {}, not queued", run_id, run->status));

  try {
    return start_(*run, now);
  }
  catch (std::exception const& e) {
    auto const err = fmt::format("{}: {}", boost::core::demangle(typeid(e).name()),
                                 e.what());
    LOG(ERROR) << "run " << run_id << " failed: " << err;
    store_.set_run_status(run_id, RunStatus::failed, err, now);
    throw;
  }
}

json Pipeline::start_(Run const& run, std::time_t now)
{
  if (!run.domains.is_array())
    throw std::invalid_argument(
        fmt::format("domains of run {} are not a list", run.id));

  auto const& options = run.options;
  auto const  modes   = Modes::normalize(
      options.is_object() && options.contains("modes") ? options["modes"]
                                                          : json{});
  auto const run_discovery = has_mode(modes, Modes::autodiscovery);
  auto const run_generate  = has_mode(modes, Modes::generate);
  auto const run_verify    = has_mode(modes, Modes::verify);

  // Generation queues its own probes; the sweep is then for what was
  // found on the web.
  auto const sourced_only = run_generate && settings_.max_probes_per_person > 0;

  auto company_limit = settings_.company_limit;
  if (options.is_object()) {
    auto const it = options.find("company_limit");
    if (it != options.end() && it->is_number_integer())
      company_limit = it->get<int>();
  }
  company_limit = std::max(company_limit, 0);

  std::vector<std::string> domains;
  for (auto const& d : run.domains) {
    if (!d.is_string())
      continue;
    auto domain = boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy(d.get<std::string>()));
    if (!domain.empty())
      domains.push_back(std::move(domain));
  }

  auto const original_count = domains.size();
  auto const company_limited
      = domains.size() > static_cast<std::size_t>(company_limit);
  if (company_limited)
    domains.resize(company_limit);

  auto const cap       = settings_.daily_domain_cap;
  auto const usage     = used_last_24h(run.tenant_id, run.id, now);
  auto const remaining = std::max<int64_t>(0, cap - usage.used);
  if (remaining == 0)
    throw std::runtime_error(
        fmt::format("24h company limit exceeded: limit={} per 24h "
                    "(used={}, method={})",
                    cap, usage.used, usage.method));
  auto const hard_limited = domains.size() > static_cast<uint64_t>(remaining);
  if (hard_limited)
    domains.resize(remaining);

  json progress{
      {"phase", "starting"},
      {"started_at", Now(now).string()},
      {"options", options},
      {"modes", modes},
      {"limits",
       {
           {"original_count", original_count},
           {"company_limit", company_limit},
           {"company_limit_applied", company_limited},
           {"hard_24h_limit", cap},
           {"used_24h", usage.used},
           {"used_24h_method", usage.method},
           {"remaining_24h", remaining},
           {"hard_24h_applied", hard_limited},
       }},
      {"domains", json::array()},
  };

  int64_t companies_enqueued = 0;
  int64_t discovery_jobs     = 0;
  int64_t generate_jobs      = 0;
  int64_t verify_jobs        = 0;

  auto const save = [&](char const* phase) {
    progress["phase"]   = phase;
    progress["metrics"] = {
        {"total_companies", domains.size()},
        {"companies_enqueued", companies_enqueued},
        {"autodiscovery_jobs_enqueued", discovery_jobs},
        {"generate_jobs_enqueued", generate_jobs},
        {"verify_jobs_enqueued", verify_jobs},
    };
    store_.save_progress(run.id, progress);
  };

  store_.set_run_status(run.id, RunStatus::running, "", now);
  save("starting");

  LOG(INFO) << "run " << run.id << " for " << run.tenant_id << ": "
            << domains.size() << " of " << original_count << " domains";

  for (std::size_t i = 0; i < domains.size(); ++i) {
    auto const& domain = domains[i];
    auto const  company_id
        = store_.ensure_company(run.tenant_id, domain, run.id, now);

    json const payload{
        {"tenant_id", run.tenant_id},
        {"run_id", run.id},
        {"company_id", company_id},
        {"domain", domain},
    };

    auto                       jobs = json::array();
    std::optional<std::string> discovery;
    std::optional<std::string> generate;

    if (run_discovery) {
      discovery = queue_.enqueue(Config::discovery_queue, Stage::autodiscovery,
                                 payload, run.id, {}, now);
      jobs.push_back(json{{"stage", Stage::autodiscovery},
                          {"job_id", *discovery},
                          {"queue", Config::discovery_queue}});
      ++discovery_jobs;
    }

    if (run_generate) {
      generate = queue_.enqueue(Config::generate_queue, Stage::generate_company,
                                payload, run.id, discovery, now);
      jobs.push_back(json{{"stage", Stage::generate_company},
                          {"job_id", *generate},
                          {"queue", Config::generate_queue},
                          {"depends_on", discovery ? json(*discovery) : json{}}});
      ++generate_jobs;
    }

    if (run_verify) {
      auto sweep                    = payload;
      sweep["only_with_source_url"] = sourced_only;
      auto const after              = generate ? generate : discovery;
      auto const id = queue_.enqueue(Config::verify_queue, Stage::verify_sweep,
                                     sweep, run.id, after, now);
      jobs.push_back(json{{"stage", Stage::verify_sweep},
                          {"job_id", id},
                          {"queue", Config::verify_queue},
                          {"depends_on", after ? json(*after) : json{}}});
      ++verify_jobs;
    }

    progress["domains"].push_back(json{{"domain", domain},
                                       {"company_id", company_id},
                                       {"state", "enqueued"},
                                       {"jobs", jobs}});
    ++companies_enqueued;

    if ((i + 1) % Config::progress_every == 0)
      save("fanout");
  }

  progress["fanout_finished_at"] = Now(now).string();
  save("fanout_complete");

  store_.log_activity(run.tenant_id, "run_started", run.id,
                      {{"domains_count", domains.size()}, {"modes", modes}},
                      now);

  // Nothing was enqueued, there is nothing to wait for.
  maybe_complete(run.id, now);

  return progress;
}

//.............................................................................

Pipeline::Usage Pipeline::used_last_24h(std::string const& tenant_id,
                                        std::string const& exclude_run_id,
                                        std::time_t        now)
{
  auto const since = Now(now - 24 * 60 * 60).string();

  Usage usage;

  SQLite::Stmt activity{store_.db(),
                        "SELECT metadata_json FROM user_activity"
                        " WHERE tenant_id = ? AND action = 'run_started'"
                        " AND resource_id <> ? AND created_at >= ?"};
  activity.bind(1, tenant_id).bind(2, exclude_run_id).bind(3, since);
  auto found = false;
  while (activity.step()) {
    found           = true;
    auto const meta = json::parse(activity.text(0), nullptr, false);
    if (!meta.is_discarded() && meta.is_object())
      usage.used += count_of(meta, "domains_count");
  }
  if (found) {
    usage.method = "user_activity";
    return usage;
  }

  SQLite::Stmt runs{store_.db(),
                    "SELECT domains_json FROM runs"
                    " WHERE tenant_id = ? AND id <> ?"
                    " AND COALESCE(started_at, created_at) >= ?"};
  runs.bind(1, tenant_id).bind(2, exclude_run_id).bind(3, since);
  while (runs.step()) {
    auto const domains = json::parse(runs.text(0), nullptr, false);
    if (!domains.is_discarded() && domains.is_array())
      usage.used += static_cast<int64_t>(domains.size());
  }
  usage.method = "runs";
  return usage;
}

//.............................................................................

bool Pipeline::maybe_complete(std::string const& run_id, std::time_t now)
{
  // Two workers may finish the last two jobs at once; only one of them
  // gets to see a running run with nothing live.
  SQLite::Transaction txn{store_.db()};

  auto const run = store_.run(run_id);
  if (!run || run->status != c_str(RunStatus::running))
    return false;
  if (queue_.live_jobs(run_id) != 0)
    return false;

  complete(run_id, now);
  txn.commit();
  return true;
}

json Pipeline::complete(std::string const& run_id, std::time_t now)
{
  auto const run = store_.run(run_id);
  if (!run)
    throw std::invalid_argument(fmt::format("no run {}", run_id));

  int64_t discovered            = 0;
  int64_t with_pages            = 0;
  int64_t zero_pages            = 0;
  int64_t with_candidates       = 0;
  int64_t zero_candidates       = 0;
  int64_t total_candidates      = 0;
  int64_t people_upserted       = 0;
  int64_t emails_upserted       = 0;
  int64_t jobs_failed           = 0;
  auto    errors                = json::array();
  std::map<std::string, int64_t> error_types;

  auto const add_error = [&errors](std::string msg) {
    if (errors.size() < static_cast<std::size_t>(Config::max_discovery_errors))
      errors.push_back(std::move(msg));
  };

  for (auto const& job : queue_.jobs_of_run(run_id)) {
    if (job.status == JobStatus::failed) {
      ++jobs_failed;
      ++error_types[error_type_of(job.error)];
      add_error(fmt::format("{} {}: {}", job.stage, job.id, job.error));
      continue;
    }
    if (job.stage != Stage::autodiscovery || job.status != JobStatus::finished
        || !job.result.is_object())
      continue;

    ++discovered;
    auto const& r = job.result;

    if (count_of(r, "pages_fetched") > 0)
      ++with_pages;
    else
      ++zero_pages;

    auto const candidates = count_of(r, "candidates");
    if (candidates > 0)
      ++with_candidates;
    else
      ++zero_candidates;
    total_candidates += candidates;

    people_upserted += count_of(r, "people_upserted");
    emails_upserted += count_of(r, "emails_upserted");

    auto const it = r.find("errors");
    if (it != r.end() && it->is_array()) {
      auto const domain = job.payload.value("domain", std::string{});
      for (auto const& e : *it) {
        if (e.is_string())
          add_error(fmt::format("{}: {}", domain, e.get<std::string>()));
      }
    }
  }

  // Verification outcomes of the run's companies.
  std::map<std::string, int64_t> verified;
  SQLite::Stmt counts{store_.db(),
                      "SELECT vr.verify_status, COUNT(*)"
                      " FROM verification_results vr"
                      " JOIN emails e ON e.id = vr.email_id"
                      " JOIN companies c ON c.id = e.company_id"
                      " WHERE c.run_id = ? AND vr.verify_status IS NOT NULL"
                      " GROUP BY vr.verify_status"};
  counts.bind(1, run_id);
  int64_t emails_verified = 0;
  while (counts.step()) {
    verified[counts.text(0)] = counts.int64(1);
    emails_verified += counts.int64(1);
  }

  SQLite::Stmt dead{store_.db(),
                    "SELECT error_type, COUNT(*) FROM dead_letters"
                    " WHERE json_extract(meta_json, '$.run_id') = ?"
                    " GROUP BY error_type"};
  dead.bind(1, run_id);
  while (dead.step())
    error_types[dead.text(0)] += dead.int64(1);

  auto total_companies = discovered;
  if (run->progress.is_object() && run->progress.contains("metrics"))
    total_companies = std::max(
        total_companies, count_of(run->progress["metrics"], "total_companies"));

  json metrics{
      {"total_companies", total_companies},
      {"companies_with_pages", with_pages},
      {"companies_zero_pages", zero_pages},
      {"companies_with_candidates", with_candidates},
      {"companies_zero_candidates", zero_candidates},
      {"total_candidates", total_candidates},
      {"people_upserted", people_upserted},
      {"emails_upserted", emails_upserted},
      {"emails_verified", emails_verified},
      {"emails_valid", verified[c_str(VerifyStatus::valid)]},
      {"emails_invalid", verified[c_str(VerifyStatus::invalid)]},
      {"emails_risky_catch_all", verified[c_str(VerifyStatus::risky_catch_all)]},
      {"emails_unknown_timeout", verified[c_str(VerifyStatus::unknown_timeout)]},
      {"jobs_failed", jobs_failed},
      {"error_types", error_types},
      {"errors", errors},
  };

  store_.save_run_metrics(run_id, run->tenant_id, metrics, now);

  json cleanup;
  if (option(run->options, "cleanup_permutations",
             settings_.cleanup_permutations)) {
    auto const deleted = cleanup_permutations(
        run_id, option(run->options, "cleanup_delete_untested",
                       settings_.cleanup_delete_untested));
    cleanup = {{"ok", true}, {"emails_deleted", deleted}};
  }
  else {
    cleanup = {{"skipped", true}, {"reason", "cleanup_disabled"}};
  }

  auto const status
      = errors.empty() ? RunStatus::succeeded : RunStatus::completed_with_errors;

  auto progress = run->progress.is_object() ? run->progress : json::object();
  progress["phase"]               = "completed";
  progress["completed_at"]        = Now(now).string();
  progress["permutation_cleanup"] = cleanup;
  auto& pm                        = progress["metrics"];
  if (!pm.is_object())
    pm = json::object();
  for (auto const& el : metrics.items())
    pm[el.key()] = el.value();
  store_.save_progress(run_id, progress);

  store_.set_run_status(run_id, status, "", now);
  store_.log_activity(run->tenant_id, "run_completed", run_id,
                      {{"status", c_str(status)},
                       {"total_companies", total_companies},
                       {"emails_valid", metrics["emails_valid"]}},
                      now);

  LOG(INFO) << "run " << run_id << " " << c_str(status) << ": "
            << total_companies << " companies, " << emails_verified
            << " verified, " << jobs_failed << " failed jobs";
  return metrics;
}

int64_t Pipeline::cleanup_permutations(std::string const& run_id,
                                       bool               delete_untested)
{
  // Result rows go with their email.
  SQLite::Stmt{store_.db(),
               "DELETE FROM emails WHERE id IN ("
               " SELECT e.id FROM emails e"
               " LEFT JOIN verification_results vr ON vr.email_id = e.id"
               " WHERE e.run_id = ? AND e.source_note LIKE 'generated:%'"
               " AND TRIM(COALESCE(e.source_url, '')) = ''"
               " AND (vr.verify_status = 'invalid'"
               "      OR (? <> 0 AND vr.id IS NULL)))"}
      .bind(1, run_id)
      .bind(2, delete_untested ? 1 : 0)
      .run();
  auto const deleted = store_.db().changes();
  LOG(INFO) << "run " << run_id << ": deleted " << deleted
            << " generated addresses";
  return deleted;
}

//.............................................................................

json Pipeline::generate_company(Job const& job, std::time_t now)
{
  auto const company_id = job.payload.at("company_id").get<int64_t>();
  auto const people     = store_.people_of_company(company_id);

  for (auto const& p : people) {
    auto payload         = job.payload;
    payload["person_id"] = p.id;
    queue_.enqueue(Config::generate_queue, Stage::generate_person, payload,
                   job.run_id, {}, now);
  }

  LOG(INFO) << job.payload.value("domain", std::string{}) << ": "
            << people.size() << " people to generate for";
  return {{"people", people.size()}, {"jobs_enqueued", people.size()}};
}

json Pipeline::generate_person(Job const& job, std::time_t now)
{
  auto const person_id = job.payload.at("person_id").get<int64_t>();
  auto const domain    = job.payload.at("domain").get<std::string>();

  auto const person = store_.person(person_id);
  if (!person) {
    LOG(WARNING) << "person " << person_id << " is gone";
    return {{"generated", 0}, {"skipped", "no_person"}};
  }

  auto name = Patterns::normalize(person->first_name, person->last_name);
  if (name.first.empty() && name.last.empty()) {
    auto const parts = Patterns::split(person->full_name);
    name             = Patterns::normalize(parts.first, parts.last);
  }
  if (name.first.empty() && name.last.empty())
    return {{"generated", 0}, {"skipped", "no_name"}};

  std::optional<std::string> pattern;
  auto const                 cached = store_.domain(domain);
  if (cached && cached->email_pattern) {
    pattern = cached->email_pattern;
  }
  else {
    std::vector<Patterns::Example> examples;
    for (auto const& a : store_.named_addresses_at_domain(domain)) {
      auto const mbx = Mailbox::parse(a.email);
      if (!mbx)
        continue;
      auto first = a.first_name;
      auto last  = a.last_name;
      if (first.empty() && last.empty()) {
        auto const parts = Patterns::split(a.full_name);
        first            = parts.first;
        last             = parts.last;
      }
      examples.push_back({first, last, mbx->local_part()});
    }
    auto const inf = Patterns::infer(examples);
    if (inf.pattern) {
      LOG(INFO) << domain << " uses " << *inf.pattern << " (" << inf.confidence
                << " of " << inf.samples << ")";
      store_.save_pattern(domain, *inf.pattern, inf.confidence, inf.samples,
                          now);
      pattern = inf.pattern;
    }
  }

  auto const addrs = Patterns::generate(name, domain, pattern);

  int enqueued = 0;
  for (auto const& addr : addrs) {
    auto const local = addr.substr(0, addr.find('@'));
    auto const which = Patterns::pattern_of(name, local);

    EmailRow row;
    row.person_id   = person->id;
    row.company_id  = person->company_id;
    row.email       = addr;
    row.source_note = fmt::format("generated:{}", which.value_or("unknown"));
    row.run_id      = job.run_id;
    auto const id   = store_.upsert_email(row, now);

    if (enqueued < settings_.max_probes_per_person) {
      enqueue_verify_(job.payload, id, addr, job.run_id, now);
      ++enqueued;
    }
  }

  return {{"generated", addrs.size()},
          {"pattern", pattern ? json(*pattern) : json{}},
          {"verify_jobs_enqueued", enqueued}};
}

json Pipeline::verify_sweep(Job const& job, std::time_t now)
{
  auto const company_id = job.payload.at("company_id").get<int64_t>();
  auto const sourced_only
      = option(job.payload, "only_with_source_url", false);

  auto const rows = store_.unverified_emails(company_id, sourced_only);
  for (auto const& row : rows)
    enqueue_verify_(job.payload, row.id, row.email, job.run_id, now);

  LOG(INFO) << job.payload.value("domain", std::string{}) << ": sweeping "
            << rows.size() << (sourced_only ? " sourced" : "")
            << " addresses";
  return {{"emails_enqueued", rows.size()},
          {"only_with_source_url", sourced_only}};
}

std::string Pipeline::enqueue_verify_(json const&        from,
                                      int64_t            email_id,
                                      std::string const& email,
                                      std::string const& run_id,
                                      std::time_t        now)
{
  json const payload{
      {"tenant_id", from.value("tenant_id", std::string{})},
      {"run_id", run_id},
      {"company_id", from.value("company_id", int64_t{0})},
      {"domain", from.value("domain", std::string{})},
      {"email_id", email_id},
      {"email", email},
  };
  return queue_.enqueue(Config::verify_queue, Stage::verify_email, payload,
                        run_id, {}, now);
}
