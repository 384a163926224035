#ifndef PROBE_DOT_HPP
#define PROBE_DOT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <variant>

#include "SMTP.hpp"

namespace MX {
class Lookup;
}

namespace Probe {

struct Accepted {
};
struct PermanentFailure {
  std::string reason;
};
struct TemporaryFailure {
  std::string reason;
};
struct Unknown {
  std::string reason;
};

using Verdict
    = std::variant<Accepted, PermanentFailure, TemporaryFailure, Unknown>;

enum class Category { accept, hard_fail, temp_fail, unknown };

constexpr char const* category_c_str(Category cat)
{
  switch (cat) { // clang-format off
  case Category::accept:    return "accept";
  case Category::hard_fail: return "hard_fail";
  case Category::temp_fail: return "temp_fail";
  case Category::unknown:   return "unknown";
  } // clang-format on
  return "*** unknown Category ***";
}

// 2xx accept, 5xx hard_fail, 4xx temp_fail, anything else unknown.
Category classify(std::optional<int> code);

Verdict verdict_for(std::optional<int> code, std::string reason);

struct Outcome {
  Verdict                   verdict{Unknown{"not_probed"}};
  std::optional<int>        code;
  std::string               message;
  std::string               mx_host;
  std::string               helo_domain;
  std::chrono::milliseconds elapsed{0};
  std::string               error; // empty when none

  Category category() const;
  bool     ok() const { return code.has_value() && error.empty(); }

  // No reply because of a timeout, a dropped or a refused connection;
  // worth another try later.
  bool transient() const;
};

// RCPT level probing of one address at one exchanger.  Never throws.

class Prober {
public:
  virtual ~Prober() = default;

  virtual Outcome probe(std::string const& email, std::string const& mx_host)
      = 0;
};

class SmtpProber : public Prober {
public:
  SmtpProber(MX::Lookup& lookup, SMTP::Options opts, std::string mail_from);

  Outcome probe(std::string const& email, std::string const& mx_host) override;

private:
  Outcome probe_(std::string const& email, std::string const& mx_host);

  MX::Lookup&   lookup_;
  SMTP::Options opts_;
  std::string   mail_from_;
};

} // namespace Probe

#endif // PROBE_DOT_HPP
