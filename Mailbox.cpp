#include "Mailbox.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <fmt/format.h>

Mailbox::Mailbox(std::string_view mailbox)
{
  auto mbx = parse(mailbox);
  if (!mbx)
    throw std::invalid_argument(fmt::format("invalid address: {}", mailbox));
  *this = std::move(*mbx);
}

Mailbox::Mailbox(std::string_view local_part, std::string_view domain)
  : local_part_(local_part)
  , domain_(boost::algorithm::to_lower_copy(std::string(domain)))
{
}

std::optional<Mailbox> Mailbox::parse(std::string_view mailbox)
{
  auto const str = boost::algorithm::trim_copy(std::string(mailbox));

  if (std::count(begin(str), end(str), '@') != 1)
    return {};

  auto const at     = str.find('@');
  auto const local  = std::string_view(str).substr(0, at);
  auto const domain = std::string_view(str).substr(at + 1);

  if (local.empty() || domain.empty())
    return {};

  // No white space or controls anywhere.
  if (std::any_of(begin(str), end(str), [](unsigned char ch) {
        return ch <= ' ' || ch == 0x7f;
      }))
    return {};

  return Mailbox(local, domain);
}

std::string Mailbox::as_string() const
{
  if (empty())
    return "";
  return fmt::format("{}@{}", local_part_, domain_);
}
