#ifndef TESTSEND_DOT_HPP
#define TESTSEND_DOT_HPP

#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>

class Store;

// Escalation of an ambiguous address to a real message whose bounce, or
// lack of one, settles the question.  One test-send per person is in
// flight at a time; a hard bounce moves on to the next best address.
//
// Progress of a row only moves forward:
//   not_requested -> pending -> sent -> bounce_hard | bounce_soft |
//                                       delivered_assumed

class TestSendEscalator {
public:
  struct Candidate {
    int64_t                    result_id{0};
    int64_t                    email_id{0};
    std::string                email;
    std::optional<std::string> pattern;
  };

  // Hands a requested test-send to whatever sends it.
  using Enqueue = std::function<void(int64_t result_id, std::time_t now)>;

  TestSendEscalator(Store&      store,
                    std::string bounce_prefix,
                    std::string bounce_domain,
                    Enqueue     enqueue);

  // Best untried ambiguous address of the same person at the same
  // domain as email_id.
  std::optional<Candidate> choose_next(int64_t email_id);

  static std::string mint_token(int64_t result_id);

  // Moves a not_requested row to pending with a token.  Returns the
  // row's token, minted if it had none.  Throws std::invalid_argument if
  // there is no such row.
  std::string request(int64_t result_id);

  // pending to sent.  False if the row was not pending.
  bool mark_sent(int64_t result_id, std::time_t now);

  struct Bounce {
    bool                     applied{false};
    std::optional<Candidate> next;
  };

  // Applies to a pending or sent row only.  A hard bounce makes the
  // address invalid and escalates to the next candidate.
  Bounce apply_bounce(std::string const& token,
                      bool               is_hard,
                      std::string const& code,
                      std::string const& reason,
                      std::time_t        now);

  // After an ambiguous probe result for email_id: request and enqueue
  // the best candidate, unless this person already has one in flight.
  std::optional<Candidate> maybe_escalate(int64_t email_id, std::time_t now);

  // Envelope sender carrying the token, "bounce+TOKEN@domain".
  std::string return_path(std::string const& token) const;

private:
  std::optional<Candidate> escalate_(int64_t email_id, std::time_t now);

  Store&      store_;
  std::string bounce_prefix_;
  std::string bounce_domain_;
  Enqueue     enqueue_;
};

#endif // TESTSEND_DOT_HPP
