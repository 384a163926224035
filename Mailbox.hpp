#ifndef MAILBOX_DOT_HPP
#define MAILBOX_DOT_HPP

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// An address as we verify it: the Local-part keeps its case, the
// domain is lower case.

class Mailbox {
public:
  Mailbox() = default;

  // Throws std::invalid_argument unless there is exactly one '@' with
  // something on both sides.
  explicit Mailbox(std::string_view mailbox);

  Mailbox(std::string_view local_part, std::string_view domain);

  static std::optional<Mailbox> parse(std::string_view mailbox);

  std::string const& local_part() const { return local_part_; }
  std::string const& domain() const { return domain_; }

  bool        empty() const { return local_part_.empty() && domain_.empty(); }
  std::string as_string() const;

  bool operator==(Mailbox const& rhs) const
  {
    return (local_part_ == rhs.local_part_) && (domain_ == rhs.domain_);
  }
  bool operator!=(Mailbox const& rhs) const { return !(*this == rhs); }

private:
  std::string local_part_;
  std::string domain_;
};

inline std::ostream& operator<<(std::ostream& s, Mailbox const& mb)
{
  return s << mb.as_string();
}

#endif // MAILBOX_DOT_HPP
