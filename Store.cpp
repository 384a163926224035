#include "Store.hpp"

#include "Now.hpp"
#include "Pill.hpp"

#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
// clang-format off
constexpr char const* schema = R"SQL(
CREATE TABLE IF NOT EXISTS companies (
  id         INTEGER PRIMARY KEY,
  tenant_id  TEXT NOT NULL,
  domain     TEXT NOT NULL,
  name       TEXT NOT NULL DEFAULT '',
  run_id     TEXT NOT NULL DEFAULT '',
  created_at TEXT NOT NULL,
  UNIQUE (tenant_id, domain)
);
CREATE TABLE IF NOT EXISTS people (
  id         INTEGER PRIMARY KEY,
  company_id INTEGER NOT NULL REFERENCES companies(id) ON DELETE CASCADE,
  first_name TEXT NOT NULL DEFAULT '',
  last_name  TEXT NOT NULL DEFAULT '',
  full_name  TEXT NOT NULL,
  title      TEXT NOT NULL DEFAULT '',
  source_url TEXT NOT NULL DEFAULT '',
  UNIQUE (company_id, full_name)
);
CREATE TABLE IF NOT EXISTS emails (
  id          INTEGER PRIMARY KEY,
  person_id   INTEGER REFERENCES people(id) ON DELETE SET NULL,
  company_id  INTEGER REFERENCES companies(id) ON DELETE SET NULL,
  email       TEXT NOT NULL UNIQUE,
  source_url  TEXT,
  source_note TEXT,
  run_id      TEXT NOT NULL DEFAULT '',
  created_at  TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS emails_person ON emails(person_id);
CREATE TABLE IF NOT EXISTS verification_results (
  id               INTEGER PRIMARY KEY,
  email_id         INTEGER NOT NULL UNIQUE REFERENCES emails(id) ON DELETE CASCADE,
  verify_status    TEXT,
  verify_reason    TEXT NOT NULL DEFAULT '',
  mx_host          TEXT NOT NULL DEFAULT '',
  fallback_status  TEXT,
  fallback_raw     TEXT NOT NULL DEFAULT '',
  test_send_status TEXT NOT NULL DEFAULT 'not_requested',
  test_send_token  TEXT,
  test_send_at     TEXT,
  bounce_code      TEXT,
  bounce_reason    TEXT,
  verified_at      TEXT,
  updated_at       TEXT
);
CREATE UNIQUE INDEX IF NOT EXISTS results_token
  ON verification_results(test_send_token);
CREATE TABLE IF NOT EXISTS domains (
  domain                       TEXT PRIMARY KEY,
  catch_all_status             TEXT,
  catch_all_checked_at         TEXT,
  catch_all_localpart          TEXT,
  catch_all_code               INTEGER,
  delivery_catchall_status     TEXT,
  delivery_catchall_checked_at TEXT,
  email_pattern                TEXT,
  pattern_confidence           REAL NOT NULL DEFAULT 0,
  pattern_samples              INTEGER NOT NULL DEFAULT 0,
  updated_at                   TEXT
);
CREATE TABLE IF NOT EXISTS runs (
  id            TEXT PRIMARY KEY,
  tenant_id     TEXT NOT NULL,
  domains_json  TEXT NOT NULL DEFAULT '[]',
  options_json  TEXT NOT NULL DEFAULT '{}',
  progress_json TEXT,
  status        TEXT NOT NULL DEFAULT 'queued',
  error         TEXT NOT NULL DEFAULT '',
  created_at    TEXT NOT NULL,
  started_at    TEXT,
  finished_at   TEXT
);
CREATE TABLE IF NOT EXISTS run_metrics (
  run_id       TEXT PRIMARY KEY,
  tenant_id    TEXT NOT NULL,
  summary_json TEXT NOT NULL,
  created_at   TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS user_activity (
  id            INTEGER PRIMARY KEY,
  tenant_id     TEXT NOT NULL,
  action        TEXT NOT NULL,
  resource_id   TEXT NOT NULL DEFAULT '',
  metadata_json TEXT NOT NULL DEFAULT '{}',
  created_at    TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS activity_tenant
  ON user_activity(tenant_id, action, created_at);
CREATE TABLE IF NOT EXISTS dead_letters (
  id            INTEGER PRIMARY KEY,
  ts            TEXT NOT NULL,
  job_id        TEXT NOT NULL DEFAULT '',
  queue         TEXT NOT NULL DEFAULT '',
  retries_left  INTEGER NOT NULL DEFAULT 0,
  email         TEXT NOT NULL DEFAULT '',
  mx_host       TEXT NOT NULL DEFAULT '',
  error_type    TEXT NOT NULL DEFAULT '',
  error_message TEXT NOT NULL DEFAULT '',
  traceback     TEXT NOT NULL DEFAULT '',
  meta_json     TEXT NOT NULL DEFAULT '{}'
);
)SQL";

constexpr char const* result_cols =
  "id, email_id, verify_status, verify_reason, mx_host, fallback_status, "
  "test_send_status, test_send_token, test_send_at, bounce_code, "
  "bounce_reason, verified_at, updated_at";
// clang-format on

VerificationResult result_from(SQLite::Stmt const& stmt)
{
  VerificationResult r;
  r.id       = stmt.int64(0);
  r.email_id = stmt.int64(1);
  if (auto const s = stmt.opt_text(2))
    r.verify_status = verify_status_from(*s);
  r.verify_reason = stmt.text(3);
  r.mx_host       = stmt.text(4);
  if (auto const s = stmt.opt_text(5))
    r.fallback_status = fallback_status_from(*s);
  r.test_send_status = test_send_status_from(stmt.text(6))
                           .value_or(TestSendStatus::not_requested);
  r.test_send_token = stmt.opt_text(7);
  r.test_send_at    = stmt.opt_text(8);
  r.bounce_code     = stmt.opt_text(9);
  r.bounce_reason   = stmt.opt_text(10);
  r.verified_at     = stmt.opt_text(11);
  r.updated_at      = stmt.opt_text(12);
  return r;
}

EmailRow email_from(SQLite::Stmt const& stmt)
{
  EmailRow e;
  e.id          = stmt.int64(0);
  e.person_id   = stmt.opt_int64(1);
  e.company_id  = stmt.opt_int64(2);
  e.email       = stmt.text(3);
  e.source_url  = stmt.opt_text(4);
  e.source_note = stmt.opt_text(5);
  e.run_id      = stmt.text(6);
  return e;
}

Person person_from(SQLite::Stmt const& stmt)
{
  Person p;
  p.id         = stmt.int64(0);
  p.company_id = stmt.int64(1);
  p.first_name = stmt.text(2);
  p.last_name  = stmt.text(3);
  p.full_name  = stmt.text(4);
  p.title      = stmt.text(5);
  p.source_url = stmt.text(6);
  return p;
}

nlohmann::json json_or(std::optional<std::string> const& text,
                       nlohmann::json                    dflt)
{
  if (!text || text->empty())
    return dflt;
  auto j = nlohmann::json::parse(*text, nullptr, false);
  if (j.is_discarded()) {
    LOG(WARNING) << "bad JSON in database: " << *text;
    return dflt;
  }
  return j;
}

void ensure_domain(SQLite::DB& db, std::string const& domain)
{
  SQLite::Stmt{db, "INSERT OR IGNORE INTO domains (domain) VALUES (?)"}
      .bind(1, domain)
      .run();
}
} // namespace

Store::Store(SQLite::DB& db)
  : db_(db)
{
  db_.exec(schema);
}

//.............................................................................

int64_t Store::ensure_company(std::string const& tenant_id,
                              std::string const& domain,
                              std::string const& run_id,
                              std::time_t        now)
{
  SQLite::Transaction tx{db_};

  std::optional<int64_t> existing;
  {
    SQLite::Stmt sel{db_, "SELECT id FROM companies"
                          " WHERE tenant_id = ? AND domain = ?"};
    sel.bind(1, tenant_id).bind(2, domain);
    if (sel.step())
      existing = sel.int64(0);
  }

  if (existing) {
    SQLite::Stmt{db_, "UPDATE companies SET run_id = ? WHERE id = ?"}
        .bind(1, run_id)
        .bind(2, *existing)
        .run();
    tx.commit();
    return *existing;
  }

  SQLite::Stmt{db_, "INSERT INTO companies"
                    " (tenant_id, domain, name, run_id, created_at)"
                    " VALUES (?, ?, ?, ?, ?)"}
      .bind(1, tenant_id)
      .bind(2, domain)
      .bind(3, domain)
      .bind(4, run_id)
      .bind(5, Now(now).string())
      .run();
  auto const id = db_.last_insert_rowid();
  tx.commit();
  return id;
}

std::optional<Company> Store::company(int64_t id)
{
  SQLite::Stmt stmt{db_, "SELECT id, tenant_id, domain, name, run_id"
                         " FROM companies WHERE id = ?"};
  stmt.bind(1, id);
  if (!stmt.step())
    return {};
  Company c;
  c.id        = stmt.int64(0);
  c.tenant_id = stmt.text(1);
  c.domain    = stmt.text(2);
  c.name      = stmt.text(3);
  c.run_id    = stmt.text(4);
  return c;
}

//.............................................................................

int64_t Store::upsert_person(Person const& p)
{
  CHECK(!p.full_name.empty());
  SQLite::Stmt{db_, "INSERT INTO people (company_id, first_name, last_name,"
                    " full_name, title, source_url) VALUES (?, ?, ?, ?, ?, ?)"
                    " ON CONFLICT (company_id, full_name) DO UPDATE SET"
                    " first_name = excluded.first_name,"
                    " last_name = excluded.last_name,"
                    " title = CASE WHEN excluded.title <> ''"
                    "   THEN excluded.title ELSE title END,"
                    " source_url = CASE WHEN excluded.source_url <> ''"
                    "   THEN excluded.source_url ELSE source_url END"}
      .bind(1, p.company_id)
      .bind(2, p.first_name)
      .bind(3, p.last_name)
      .bind(4, p.full_name)
      .bind(5, p.title)
      .bind(6, p.source_url)
      .run();

  SQLite::Stmt sel{db_, "SELECT id FROM people"
                        " WHERE company_id = ? AND full_name = ?"};
  sel.bind(1, p.company_id).bind(2, p.full_name);
  CHECK(sel.step());
  return sel.int64(0);
}

std::optional<Person> Store::person(int64_t id)
{
  SQLite::Stmt stmt{db_, "SELECT id, company_id, first_name, last_name,"
                         " full_name, title, source_url"
                         " FROM people WHERE id = ?"};
  stmt.bind(1, id);
  if (!stmt.step())
    return {};
  return person_from(stmt);
}

std::vector<Person> Store::people_of_company(int64_t company_id)
{
  SQLite::Stmt stmt{db_, "SELECT id, company_id, first_name, last_name,"
                         " full_name, title, source_url"
                         " FROM people WHERE company_id = ? ORDER BY id"};
  stmt.bind(1, company_id);
  std::vector<Person> people;
  while (stmt.step())
    people.push_back(person_from(stmt));
  return people;
}

//.............................................................................

int64_t Store::upsert_email(EmailRow const& e, std::time_t now)
{
  // A sourced address keeps its provenance over a generated one.
  SQLite::Stmt{
      db_, "INSERT INTO emails (person_id, company_id, email, source_url,"
           " source_note, run_id, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)"
           " ON CONFLICT (email) DO UPDATE SET"
           " person_id = COALESCE(excluded.person_id, person_id),"
           " company_id = COALESCE(excluded.company_id, company_id),"
           " source_url = COALESCE(source_url, excluded.source_url),"
           " source_note = CASE WHEN source_url IS NULL"
           "   AND excluded.source_url IS NOT NULL"
           "   THEN excluded.source_note"
           "   ELSE COALESCE(source_note, excluded.source_note) END"}
      .bind(1, e.person_id)
      .bind(2, e.company_id)
      .bind(3, e.email)
      .bind(4, e.source_url)
      .bind(5, e.source_note)
      .bind(6, e.run_id)
      .bind(7, Now(now).string())
      .run();

  auto const id = email_id(e.email);
  CHECK(id) << "email row for " << e.email;
  return *id;
}

std::optional<EmailRow> Store::email(int64_t id)
{
  SQLite::Stmt stmt{db_, "SELECT id, person_id, company_id, email, source_url,"
                         " source_note, run_id FROM emails WHERE id = ?"};
  stmt.bind(1, id);
  if (!stmt.step())
    return {};
  return email_from(stmt);
}

std::optional<int64_t> Store::email_id(std::string const& address)
{
  SQLite::Stmt stmt{db_, "SELECT id FROM emails WHERE email = ?"};
  stmt.bind(1, address);
  if (!stmt.step())
    return {};
  return stmt.int64(0);
}

std::vector<EmailRow> Store::emails_of_person(int64_t            person_id,
                                              std::string const& domain)
{
  SQLite::Stmt stmt{db_, "SELECT id, person_id, company_id, email, source_url,"
                         " source_note, run_id FROM emails"
                         " WHERE person_id = ? AND email LIKE ? ORDER BY id"};
  stmt.bind(1, person_id).bind(2, fmt::format("%@{}", domain));
  std::vector<EmailRow> rows;
  while (stmt.step())
    rows.push_back(email_from(stmt));
  return rows;
}

std::vector<std::string> Store::emails_at_domain(std::string const& domain)
{
  SQLite::Stmt stmt{db_, "SELECT email FROM emails WHERE email LIKE ?"
                         " ORDER BY id"};
  stmt.bind(1, fmt::format("%@{}", domain));
  std::vector<std::string> addrs;
  while (stmt.step())
    addrs.push_back(stmt.text(0));
  return addrs;
}

std::vector<NamedAddress>
Store::named_addresses_at_domain(std::string const& domain)
{
  SQLite::Stmt stmt{db_, "SELECT p.first_name, p.last_name, p.full_name,"
                         " e.email FROM emails e"
                         " JOIN people p ON p.id = e.person_id"
                         " WHERE e.email LIKE ?"
                         " AND (e.source_note IS NULL"
                         "      OR e.source_note NOT LIKE 'generated:%')"
                         " ORDER BY e.id"};
  stmt.bind(1, fmt::format("%@{}", domain));
  std::vector<NamedAddress> addrs;
  while (stmt.step()) {
    NamedAddress a;
    a.first_name = stmt.text(0);
    a.last_name  = stmt.text(1);
    a.full_name  = stmt.text(2);
    a.email      = stmt.text(3);
    addrs.push_back(std::move(a));
  }
  return addrs;
}

std::vector<EmailRow> Store::unverified_emails(int64_t company_id,
                                               bool    sourced_only)
{
  SQLite::Stmt stmt{
      db_, "SELECT e.id, e.person_id, e.company_id, e.email, e.source_url,"
           " e.source_note, e.run_id FROM emails e"
           " LEFT JOIN verification_results vr ON vr.email_id = e.id"
           " WHERE e.company_id = ? AND vr.id IS NULL"
           " AND (? = 0 OR TRIM(COALESCE(e.source_url, '')) <> '')"
           " ORDER BY e.id"};
  stmt.bind(1, company_id).bind(2, sourced_only ? 1 : 0);
  std::vector<EmailRow> rows;
  while (stmt.step())
    rows.push_back(email_from(stmt));
  return rows;
}

//.............................................................................

std::optional<VerificationResult> Store::result(int64_t id)
{
  auto const   sql = fmt::format("SELECT {} FROM verification_results"
                               " WHERE id = ?",
                               result_cols);
  SQLite::Stmt stmt{db_, sql.c_str()};
  stmt.bind(1, id);
  if (!stmt.step())
    return {};
  return result_from(stmt);
}

std::optional<VerificationResult> Store::result_for_email(int64_t email_id)
{
  auto const   sql = fmt::format("SELECT {} FROM verification_results"
                               " WHERE email_id = ?",
                               result_cols);
  SQLite::Stmt stmt{db_, sql.c_str()};
  stmt.bind(1, email_id);
  if (!stmt.step())
    return {};
  return result_from(stmt);
}

std::optional<VerificationResult>
Store::result_for_token(std::string const& token)
{
  auto const   sql = fmt::format("SELECT {} FROM verification_results"
                               " WHERE test_send_token = ?",
                               result_cols);
  SQLite::Stmt stmt{db_, sql.c_str()};
  stmt.bind(1, token);
  if (!stmt.step())
    return {};
  return result_from(stmt);
}

int64_t Store::upsert_result(ResultWrite const& w, std::time_t now)
{
  auto const ts = Now(now).string();
  std::optional<std::string> fallback;
  if (w.fallback_status)
    fallback = c_str(*w.fallback_status);

  SQLite::Stmt{db_,
               "INSERT INTO verification_results (email_id, verify_status,"
               " verify_reason, mx_host, fallback_status, fallback_raw,"
               " verified_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
               " ON CONFLICT (email_id) DO UPDATE SET"
               // A test-send outcome outranks any later probe.
               " verify_status = CASE WHEN"
               "   (test_send_status = 'bounce_hard'"
               "    OR (verify_status = 'valid'"
               "        AND verify_reason = 'no_bounce_after_test_send'))"
               "   THEN verify_status ELSE excluded.verify_status END,"
               " verify_reason = CASE WHEN"
               "   (test_send_status = 'bounce_hard'"
               "    OR (verify_status = 'valid'"
               "        AND verify_reason = 'no_bounce_after_test_send'))"
               "   THEN verify_reason ELSE excluded.verify_reason END,"
               " mx_host = excluded.mx_host,"
               " fallback_status = excluded.fallback_status,"
               " fallback_raw = excluded.fallback_raw,"
               " verified_at = excluded.verified_at,"
               " updated_at = excluded.updated_at"}
      .bind(1, w.email_id)
      .bind(2, c_str(w.verify_status))
      .bind(3, w.verify_reason)
      .bind(4, w.mx_host)
      .bind(5, fallback)
      .bind(6, w.fallback_raw)
      .bind(7, ts)
      .bind(8, ts)
      .run();

  SQLite::Stmt sel{db_,
                   "SELECT id FROM verification_results WHERE email_id = ?"};
  sel.bind(1, w.email_id);
  CHECK(sel.step());
  return sel.int64(0);
}

void Store::set_verify_status(int64_t            id,
                              VerifyStatus       status,
                              std::string const& reason,
                              std::time_t        now)
{
  SQLite::Stmt{db_, "UPDATE verification_results SET verify_status = ?,"
                    " verify_reason = ?, updated_at = ? WHERE id = ?"}
      .bind(1, c_str(status))
      .bind(2, reason)
      .bind(3, Now(now).string())
      .bind(4, id)
      .run();
}

std::vector<VerificationResult>
Store::test_sent_results(std::string const& domain)
{
  auto const   sql = fmt::format(
      "SELECT {} FROM verification_results WHERE email_id IN"
      " (SELECT id FROM emails WHERE email LIKE ?)"
      " AND test_send_status <> 'not_requested' ORDER BY id",
      result_cols);
  SQLite::Stmt stmt{db_, sql.c_str()};
  stmt.bind(1, fmt::format("%@{}", domain));
  std::vector<VerificationResult> rows;
  while (stmt.step())
    rows.push_back(result_from(stmt));
  return rows;
}

std::vector<std::string> Store::test_sent_domains()
{
  SQLite::Stmt stmt{db_, "SELECT DISTINCT"
                         " lower(substr(e.email, instr(e.email, '@') + 1))"
                         " FROM emails AS e JOIN verification_results AS vr"
                         " ON vr.email_id = e.id"
                         " WHERE vr.test_send_status <> 'not_requested'"
                         " ORDER BY 1"};
  std::vector<std::string> domains;
  while (stmt.step())
    domains.push_back(stmt.text(0));
  return domains;
}

std::optional<VerificationResult>
Store::latest_test_send_to(std::string const& address)
{
  auto const   sql = fmt::format(
      "SELECT {} FROM verification_results WHERE email_id IN"
      " (SELECT id FROM emails WHERE email = ? COLLATE NOCASE)"
      " AND test_send_token IS NOT NULL"
      " AND test_send_status IN ('sent', 'pending')"
      " ORDER BY test_send_at IS NULL, test_send_at DESC, id DESC LIMIT 1",
      result_cols);
  SQLite::Stmt stmt{db_, sql.c_str()};
  stmt.bind(1, address);
  if (!stmt.step())
    return {};
  return result_from(stmt);
}

//.............................................................................

std::optional<DomainRow> Store::domain(std::string const& domain)
{
  SQLite::Stmt stmt{db_, "SELECT domain, catch_all_status,"
                         " catch_all_checked_at, catch_all_localpart,"
                         " catch_all_code, delivery_catchall_status,"
                         " delivery_catchall_checked_at, email_pattern,"
                         " pattern_confidence, pattern_samples"
                         " FROM domains WHERE domain = ?"};
  stmt.bind(1, domain);
  if (!stmt.step())
    return {};
  DomainRow d;
  d.domain = stmt.text(0);
  if (auto const s = stmt.opt_text(1))
    d.catch_all_status = catch_all_status_from(*s);
  d.catch_all_checked_at = stmt.opt_text(2);
  d.catch_all_localpart  = stmt.opt_text(3);
  d.catch_all_code       = stmt.opt_int64(4);
  if (auto const s = stmt.opt_text(5))
    d.delivery_catchall_status = delivery_status_from(*s);
  d.delivery_catchall_checked_at = stmt.opt_text(6);
  d.email_pattern                = stmt.opt_text(7);
  d.pattern_confidence           = stmt.real(8);
  d.pattern_samples              = stmt.int64(9);
  return d;
}

void Store::save_catch_all(std::string const& domain,
                           CatchAllStatus     status,
                           std::string const& localpart,
                           std::optional<int> code,
                           std::time_t        now)
{
  auto const ts = Now(now).string();
  std::optional<int64_t> code64;
  if (code)
    code64 = *code;

  SQLite::Transaction tx{db_};
  ensure_domain(db_, domain);
  SQLite::Stmt{db_, "UPDATE domains SET catch_all_status = ?,"
                    " catch_all_checked_at = ?, catch_all_localpart = ?,"
                    " catch_all_code = ?, updated_at = ? WHERE domain = ?"}
      .bind(1, c_str(status))
      .bind(2, ts)
      .bind(3, localpart)
      .bind(4, code64)
      .bind(5, ts)
      .bind(6, domain)
      .run();
  tx.commit();
}

void Store::save_delivery_status(std::string const& domain,
                                 DeliveryStatus     status,
                                 std::time_t        now)
{
  auto const ts = Now(now).string();

  SQLite::Transaction tx{db_};
  ensure_domain(db_, domain);
  SQLite::Stmt{db_, "UPDATE domains SET delivery_catchall_status = ?,"
                    " delivery_catchall_checked_at = ?, updated_at = ?"
                    " WHERE domain = ?"}
      .bind(1, c_str(status))
      .bind(2, ts)
      .bind(3, ts)
      .bind(4, domain)
      .run();
  tx.commit();
}

void Store::save_pattern(std::string const& domain,
                         std::string const& pattern,
                         double             confidence,
                         int64_t            samples,
                         std::time_t        now)
{
  SQLite::Transaction tx{db_};
  ensure_domain(db_, domain);
  SQLite::Stmt{db_, "UPDATE domains SET email_pattern = ?,"
                    " pattern_confidence = ?, pattern_samples = ?,"
                    " updated_at = ? WHERE domain = ?"}
      .bind(1, pattern)
      .bind(2, confidence)
      .bind(3, samples)
      .bind(4, Now(now).string())
      .bind(5, domain)
      .run();
  tx.commit();
}

//.............................................................................

std::string Store::create_run(std::string const&    tenant_id,
                              nlohmann::json const& domains,
                              nlohmann::json const& options,
                              std::time_t           now)
{
  auto const id = fmt::format("run-{}", Pill{}.as_string());
  SQLite::Stmt{db_, "INSERT INTO runs (id, tenant_id, domains_json,"
                    " options_json, status, created_at)"
                    " VALUES (?, ?, ?, ?, ?, ?)"}
      .bind(1, id)
      .bind(2, tenant_id)
      .bind(3, domains.dump())
      .bind(4, options.dump())
      .bind(5, c_str(RunStatus::queued))
      .bind(6, Now(now).string())
      .run();
  LOG(INFO) << "created " << id << " for tenant " << tenant_id << " with "
            << domains.size() << " domains";
  return id;
}

std::optional<Run> Store::run(std::string const& id)
{
  SQLite::Stmt stmt{db_, "SELECT id, tenant_id, domains_json, options_json,"
                         " progress_json, status, error, created_at,"
                         " started_at, finished_at FROM runs WHERE id = ?"};
  stmt.bind(1, id);
  if (!stmt.step())
    return {};
  Run r;
  r.id          = stmt.text(0);
  r.tenant_id   = stmt.text(1);
  r.domains     = json_or(stmt.opt_text(2), nlohmann::json::array());
  r.options     = json_or(stmt.opt_text(3), nlohmann::json::object());
  r.progress    = json_or(stmt.opt_text(4), nlohmann::json{});
  r.status      = stmt.text(5);
  r.error       = stmt.text(6);
  r.created_at  = stmt.text(7);
  r.started_at  = stmt.opt_text(8).value_or("");
  r.finished_at = stmt.opt_text(9).value_or("");
  return r;
}

void Store::set_run_status(std::string const& id,
                           RunStatus          status,
                           std::string const& error,
                           std::time_t        now)
{
  auto const ts = Now(now).string();
  std::optional<std::string> started;
  std::optional<std::string> finished;
  if (status == RunStatus::running)
    started = ts;
  if (status != RunStatus::queued && status != RunStatus::running)
    finished = ts;

  SQLite::Stmt{db_, "UPDATE runs SET status = ?, error = ?,"
                    " started_at = COALESCE(?, started_at),"
                    " finished_at = COALESCE(?, finished_at) WHERE id = ?"}
      .bind(1, c_str(status))
      .bind(2, error)
      .bind(3, started)
      .bind(4, finished)
      .bind(5, id)
      .run();
  if (db_.changes() == 0)
    throw std::runtime_error(fmt::format("no such run {}", id));
  LOG(INFO) << id << " is " << c_str(status)
            << (error.empty() ? "" : ": ") << error;
}

void Store::save_progress(std::string const& id, nlohmann::json const& progress)
{
  SQLite::Stmt{db_, "UPDATE runs SET progress_json = ? WHERE id = ?"}
      .bind(1, progress.dump())
      .bind(2, id)
      .run();
}

void Store::save_run_metrics(std::string const&    run_id,
                             std::string const&    tenant_id,
                             nlohmann::json const& summary,
                             std::time_t           now)
{
  SQLite::Stmt{db_, "INSERT INTO run_metrics"
                    " (run_id, tenant_id, summary_json, created_at)"
                    " VALUES (?, ?, ?, ?) ON CONFLICT (run_id) DO UPDATE SET"
                    " summary_json = excluded.summary_json,"
                    " created_at = excluded.created_at"}
      .bind(1, run_id)
      .bind(2, tenant_id)
      .bind(3, summary.dump())
      .bind(4, Now(now).string())
      .run();
}

std::optional<nlohmann::json> Store::run_metrics(std::string const& run_id)
{
  SQLite::Stmt stmt{db_,
                    "SELECT summary_json FROM run_metrics WHERE run_id = ?"};
  stmt.bind(1, run_id);
  if (!stmt.step())
    return {};
  return json_or(stmt.opt_text(0), nlohmann::json::object());
}

//.............................................................................

void Store::log_activity(std::string const&    tenant_id,
                         std::string const&    action,
                         std::string const&    resource_id,
                         nlohmann::json const& metadata,
                         std::time_t           now)
{
  SQLite::Stmt{db_, "INSERT INTO user_activity (tenant_id, action,"
                    " resource_id, metadata_json, created_at)"
                    " VALUES (?, ?, ?, ?, ?)"}
      .bind(1, tenant_id)
      .bind(2, action)
      .bind(3, resource_id)
      .bind(4, metadata.dump())
      .bind(5, Now(now).string())
      .run();
}

void Store::add_dead_letter(DeadLetter const& dl, std::time_t now, int keep)
{
  SQLite::Transaction tx{db_};
  SQLite::Stmt{db_, "INSERT INTO dead_letters (ts, job_id, queue,"
                    " retries_left, email, mx_host, error_type,"
                    " error_message, traceback, meta_json)"
                    " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"}
      .bind(1, Now(now).string())
      .bind(2, dl.job_id)
      .bind(3, dl.queue)
      .bind(4, dl.retries_left)
      .bind(5, dl.email)
      .bind(6, dl.mx_host)
      .bind(7, dl.error_type)
      .bind(8, dl.error_message)
      .bind(9, dl.traceback)
      .bind(10, dl.meta.dump())
      .run();
  trim_dead_letters(keep);
  tx.commit();
  LOG(WARNING) << "dead letter " << dl.error_type << " for " << dl.email
               << " at " << dl.mx_host << ": " << dl.error_message;
}

int64_t Store::trim_dead_letters(int keep)
{
  SQLite::Stmt{db_, "DELETE FROM dead_letters WHERE id NOT IN"
                    " (SELECT id FROM dead_letters ORDER BY id DESC LIMIT ?)"}
      .bind(1, keep)
      .run();
  return db_.changes();
}

int64_t Store::dead_letter_count()
{
  SQLite::Stmt stmt{db_, "SELECT COUNT(*) FROM dead_letters"};
  CHECK(stmt.step());
  return stmt.int64(0);
}
