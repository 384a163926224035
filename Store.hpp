#ifndef STORE_DOT_HPP
#define STORE_DOT_HPP

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "SQLite.hpp"
#include "VerificationResult.hpp"

struct Company {
  int64_t     id{0};
  std::string tenant_id;
  std::string domain;
  std::string name;
  std::string run_id;
};

struct Person {
  int64_t     id{0};
  int64_t     company_id{0};
  std::string first_name;
  std::string last_name;
  std::string full_name;
  std::string title;
  std::string source_url;
};

struct EmailRow {
  int64_t                    id{0};
  std::optional<int64_t>     person_id;
  std::optional<int64_t>     company_id;
  std::string                email;
  std::optional<std::string> source_url;
  std::optional<std::string> source_note;
  std::string                run_id;
};

// An address that was found, not generated, and whose owner we know.
struct NamedAddress {
  std::string first_name;
  std::string last_name;
  std::string full_name;
  std::string email;
};

struct DomainRow {
  std::string domain;

  std::optional<CatchAllStatus> catch_all_status;
  std::optional<std::string>    catch_all_checked_at;
  std::optional<std::string>    catch_all_localpart;
  std::optional<int64_t>        catch_all_code;

  std::optional<DeliveryStatus> delivery_catchall_status;
  std::optional<std::string>    delivery_catchall_checked_at;

  std::optional<std::string> email_pattern;
  double                     pattern_confidence{0.0};
  int64_t                    pattern_samples{0};
};

enum class RunStatus {
  queued,
  running,
  succeeded,
  completed_with_errors,
  failed,
};

constexpr char const* c_str(RunStatus status)
{
  switch (status) { // clang-format off
  case RunStatus::queued:                return "queued";
  case RunStatus::running:               return "running";
  case RunStatus::succeeded:             return "succeeded";
  case RunStatus::completed_with_errors: return "completed_with_errors";
  case RunStatus::failed:                return "failed";
  } // clang-format on
  return "*** unknown RunStatus ***";
}

struct Run {
  std::string    id;
  std::string    tenant_id;
  nlohmann::json domains = nlohmann::json::array();
  nlohmann::json options = nlohmann::json::object();
  nlohmann::json progress;
  std::string    status;
  std::string    error;
  std::string    created_at;
  std::string    started_at;
  std::string    finished_at;
};

struct DeadLetter {
  std::string    job_id;
  std::string    queue;
  int            retries_left{0};
  std::string    email;
  std::string    mx_host;
  std::string    error_type;
  std::string    error_message;
  std::string    traceback;
  nlohmann::json meta = nlohmann::json::object();
};

// What a probe run writes; the test-send columns are left alone.
struct ResultWrite {
  int64_t                       email_id{0};
  VerifyStatus                  verify_status{VerifyStatus::unknown_timeout};
  std::string                   verify_reason;
  std::string                   mx_host;
  std::optional<FallbackStatus> fallback_status;
  std::string                   fallback_raw;
};

// All the relational state of the engine, in one SQLite database.
// Failures throw std::runtime_error.

class Store {
public:
  Store(Store const&) = delete;
  Store& operator=(Store const&) = delete;

  explicit Store(SQLite::DB& db);

  SQLite::DB& db() { return db_; }

  // companies
  int64_t ensure_company(std::string const& tenant_id,
                         std::string const& domain,
                         std::string const& run_id,
                         std::time_t        now);
  std::optional<Company> company(int64_t id);

  // people
  int64_t upsert_person(Person const& person);
  std::optional<Person> person(int64_t id);
  std::vector<Person>   people_of_company(int64_t company_id);

  // emails
  int64_t                  upsert_email(EmailRow const& row, std::time_t now);
  std::optional<EmailRow>  email(int64_t id);
  std::optional<int64_t>   email_id(std::string const& address);
  std::vector<EmailRow>    emails_of_person(int64_t            person_id,
                                            std::string const& domain);
  std::vector<std::string> emails_at_domain(std::string const& domain);
  std::vector<NamedAddress>
  named_addresses_at_domain(std::string const& domain);
  // No result row yet; only those with a source_url when sourced_only.
  std::vector<EmailRow> unverified_emails(int64_t company_id,
                                          bool    sourced_only);

  // verification_results
  std::optional<VerificationResult> result(int64_t id);
  std::optional<VerificationResult> result_for_email(int64_t email_id);
  std::optional<VerificationResult> result_for_token(std::string const& token);
  int64_t upsert_result(ResultWrite const& w, std::time_t now);
  void    set_verify_status(int64_t            id,
                            VerifyStatus       status,
                            std::string const& reason,
                            std::time_t        now);

  // Rows at domain that ever had a test-send requested.
  std::vector<VerificationResult> test_sent_results(std::string const& domain);
  std::vector<std::string>        test_sent_domains();

  // The newest pending or sent test-send to this address.
  std::optional<VerificationResult>
  latest_test_send_to(std::string const& address);

  // domains
  std::optional<DomainRow> domain(std::string const& domain);
  void                     save_catch_all(std::string const& domain,
                                          CatchAllStatus     status,
                                          std::string const& localpart,
                                          std::optional<int> code,
                                          std::time_t        now);
  void                     save_delivery_status(std::string const& domain,
                                                DeliveryStatus     status,
                                                std::time_t        now);
  void                     save_pattern(std::string const& domain,
                                        std::string const& pattern,
                                        double             confidence,
                                        int64_t            samples,
                                        std::time_t        now);

  // runs
  std::string        create_run(std::string const&    tenant_id,
                                nlohmann::json const& domains,
                                nlohmann::json const& options,
                                std::time_t           now);
  std::optional<Run> run(std::string const& id);
  void               set_run_status(std::string const& id,
                                    RunStatus          status,
                                    std::string const& error,
                                    std::time_t        now);
  void save_progress(std::string const& id, nlohmann::json const& progress);
  void save_run_metrics(std::string const&    run_id,
                        std::string const&    tenant_id,
                        nlohmann::json const& summary,
                        std::time_t           now);
  std::optional<nlohmann::json> run_metrics(std::string const& run_id);

  // user_activity
  void log_activity(std::string const&    tenant_id,
                    std::string const&    action,
                    std::string const&    resource_id,
                    nlohmann::json const& metadata,
                    std::time_t           now);

  // dead_letters, keeping only the newest keep records
  void    add_dead_letter(DeadLetter const& dl, std::time_t now, int keep);
  int64_t trim_dead_letters(int keep);
  int64_t dead_letter_count();

private:
  SQLite::DB& db_;
};

#endif // STORE_DOT_HPP
