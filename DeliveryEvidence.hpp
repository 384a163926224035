#ifndef DELIVERYEVIDENCE_DOT_HPP
#define DELIVERYEVIDENCE_DOT_HPP

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

#include "VerificationResult.hpp"

class Store;

// What test-sends have taught us about a domain.  A domain that both
// delivered to a real mailbox (A) and bounced an invalid one as user
// unknown (B) is not a catch-all, whatever RCPT said.

namespace DeliveryEvidence {

struct Evidence {
  bool has_good_real{false};   // A
  bool has_bad_invalid{false}; // B

  bool operator==(Evidence const& that) const
  {
    return has_good_real == that.has_good_real
           && has_bad_invalid == that.has_bad_invalid;
  }
};

// A 5.1.x code, or a reason that says the mailbox does not exist.
bool is_user_unknown(std::optional<std::string> const& code,
                     std::optional<std::string> const& reason);

bool is_good_real(VerificationResult const& row);
bool is_bad_invalid(VerificationResult const& row);

DeliveryStatus classify(Evidence const& ev);

bool should_upgrade_risky_to_valid(VerificationResult const&     row,
                                   std::optional<DeliveryStatus> domain_status);

constexpr char const* upgrade_reason = "no_bounce_after_test_send";

// Evidence gathered from, and conclusions written to, the store.

class EvidenceStore {
public:
  explicit EvidenceStore(Store& store);

  // Over the full test-send history of domain.
  Evidence evidence(std::string const& domain);

  // Recomputes and caches the domain's delivery status.
  DeliveryStatus refresh(std::string const& domain, std::time_t now);

  // refresh() every domain with test-send history and upgrade every
  // eligible row.  Returns the number of rows upgraded.
  int reclassify_domains(std::time_t now);

  // Sent test-sends older than window, with no bounce, are taken as
  // delivered.  Returns the number of rows aged.
  int assume_delivered(std::time_t now, std::chrono::seconds window);

private:
  int upgrade_domain_(std::string const& domain,
                      DeliveryStatus     status,
                      std::time_t        now);

  Store& store_;
};

} // namespace DeliveryEvidence

#endif // DELIVERYEVIDENCE_DOT_HPP
