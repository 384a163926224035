#ifndef CATCHALLPROBE_DOT_HPP
#define CATCHALLPROBE_DOT_HPP

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

#include "VerificationResult.hpp"

class Store;

namespace MX {
class Lookup;
}

namespace Probe {
class Prober;
}

// Does the domain accept RCPT for a local-part nobody could own?  The
// verdict is kept on the domain row and reused until it ages out.

class CatchAllProbe {
public:
  struct Result {
    std::string        domain;
    CatchAllStatus     status{CatchAllStatus::error};
    std::string        mx_host;
    std::optional<int> code;
    bool               cached{false};
    std::string        localpart;
    std::string        error;
  };

  CatchAllProbe(Store&               store,
                MX::Lookup&          lookup,
                Probe::Prober&       prober,
                std::chrono::seconds ttl);

  // Throws std::invalid_argument for an empty domain or an address.
  Result check(std::string const& domain, std::time_t now, bool force = false);

  // From the probe of the random address.
  static CatchAllStatus classify(std::optional<int> code,
                                 std::string const& error);

  static std::string random_localpart();

private:
  Store&               store_;
  MX::Lookup&          lookup_;
  Probe::Prober&       prober_;
  std::chrono::seconds ttl_;
};

#endif // CATCHALLPROBE_DOT_HPP
