#ifndef TESTSENDER_DOT_HPP
#define TESTSENDER_DOT_HPP

#include <ctime>
#include <string>

#include "SMTP.hpp"

namespace MX {
class Lookup;
}

// Delivers the message of a test-send.  The return-path carries the
// token, so does the subject; a bounce of either finds its way back.

class TestSender {
public:
  virtual ~TestSender() = default;

  // True once the message has been accepted by the receiving exchanger.
  virtual bool send(std::string const& email,
                    std::string const& return_path,
                    std::string const& token)
      = 0;
};

class SmtpTestSender : public TestSender {
public:
  SmtpTestSender(MX::Lookup&   lookup,
                 SMTP::Options opts,
                 std::string   from_address);

  bool send(std::string const& email,
            std::string const& return_path,
            std::string const& token) override;

  // The whole RFC 5322 message, headers and body.
  std::string message(std::string const& email,
                      std::string const& token,
                      std::time_t        now) const;

private:
  MX::Lookup&   lookup_;
  SMTP::Options opts_;
  std::string   from_address_;
};

#endif // TESTSENDER_DOT_HPP
