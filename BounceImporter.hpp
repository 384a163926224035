#ifndef BOUNCEIMPORTER_DOT_HPP
#define BOUNCEIMPORTER_DOT_HPP

#include <ctime>
#include <optional>
#include <string>
#include <string_view>

class Store;
class TestSendEscalator;

// Feeds provider bounce notifications (SES events, bare or wrapped in an
// SNS envelope) into the test-send state machine.

class BounceImporter {
public:
  struct Notification {
    std::string                recipient;
    std::optional<std::string> token;
    char const*                token_source{"none"};
    bool                       is_hard{false};
    std::string                code;
    std::string                reason;
  };

  struct Stats {
    int seen{0};
    int bounces{0};
    int applied{0};
    int unresolved{0};
    int ignored{0};
    int malformed{0};
  };

  BounceImporter(Store&             store,
                 TestSendEscalator& escalator,
                 std::string        bounce_prefix);

  // Returns nothing for a notification that is not a bounce.  Throws
  // std::invalid_argument if body is not a JSON object.  The token is
  // looked for in the message tags, the return-path, the subject and
  // finally anywhere in body.
  static std::optional<Notification> parse(std::string_view   body,
                                           std::string const& bounce_prefix);

  // "prefix+TOKEN@domain" to TOKEN, for the given prefix only.
  static std::optional<std::string>
  token_from_return_path(std::string_view return_path,
                         std::string_view bounce_prefix);

  // Parses and applies one notification, falling back to the newest
  // active test-send to the recipient when no token was found.  Returns
  // true if a test-send changed state.
  bool import(std::string_view body, std::time_t now);

  Stats const& stats() const { return stats_; }

private:
  Store&             store_;
  TestSendEscalator& escalator_;
  std::string        bounce_prefix_;
  Stats              stats_;
};

#endif // BOUNCEIMPORTER_DOT_HPP
