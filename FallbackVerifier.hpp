#ifndef FALLBACKVERIFIER_DOT_HPP
#define FALLBACKVERIFIER_DOT_HPP

#include <string>
#include <string_view>

#include "VerificationResult.hpp"

struct FallbackResult {
  FallbackStatus status{FallbackStatus::unknown};
  std::string    raw; // provider payload, for the record
};

// A second opinion on an address, from some verification provider.
// Consulted at most once per probe, only when SMTP was inconclusive.

class FallbackVerifier {
public:
  virtual ~FallbackVerifier() = default;

  virtual FallbackResult verify(std::string const& email) = 0;
};

class NoFallback : public FallbackVerifier {
public:
  FallbackResult verify(std::string const&) override { return {}; }
};

// Fold a provider's status word into ours; unrecognized words are
// unknown.
FallbackStatus map_provider_status(std::string_view raw);

// Calls verifier, turning any exception into unknown.
FallbackResult consult(FallbackVerifier& verifier, std::string const& email);

#endif // FALLBACKVERIFIER_DOT_HPP
