#include "Patterns.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>

#include <uninorm.h>

#include <glog/logging.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <fmt/format.h>

namespace {
constexpr char const* const role_aliases[]{
    "info", "sales", "support", "hello", "marketing", "press", "admin",
};

constexpr double min_confidence = 0.80;
constexpr int    min_hits       = 2;

// Unicode Normalization Form KD, see <http://unicode.org/reports/tr15/>
std::string nfkd(std::string_view str)
{
  size_t     length = 0;
  auto const udata  = reinterpret_cast<uint8_t const*>(str.data());
  auto const p      = u8_normalize(UNINORM_NFKD, udata, str.size(), nullptr,
                                   &length);
  if (p == nullptr) {
    // Not UTF-8; fold what ASCII there is.
    PLOG(WARNING) << "u8_normalize failed";
    return std::string{str};
  }
  std::unique_ptr<uint8_t, decltype(&std::free)> buf{p, &std::free};
  return std::string{reinterpret_cast<char const*>(buf.get()), length};
}
} // namespace

namespace Patterns {

std::size_t rank(std::string_view pattern)
{
  for (std::size_t i = 0; i < n_patterns; ++i) {
    if (pattern == priority[i])
      return i;
  }
  return n_patterns;
}

bool is_pattern(std::string_view pattern) { return rank(pattern) < n_patterns; }

std::string fold(std::string_view str)
{
  std::string folded;
  for (auto const ch : nfkd(str)) {
    if ('A' <= ch && ch <= 'Z')
      folded += static_cast<char>(ch - 'A' + 'a');
    else if (('a' <= ch && ch <= 'z') || ('0' <= ch && ch <= '9'))
      folded += ch;
  }
  return folded;
}

Name normalize(std::string_view first, std::string_view last)
{
  return Name{fold(first), fold(last)};
}

Name split(std::string_view full_name)
{
  std::vector<std::string> words;
  std::string const        full{full_name};
  boost::algorithm::split(words, full, boost::algorithm::is_space(),
                          boost::algorithm::token_compress_on);
  words.erase(std::remove(begin(words), end(words), ""), end(words));
  if (words.empty())
    return {};
  if (words.size() == 1)
    return Name{words.front(), ""};
  return Name{words.front(), words.back()};
}

std::string apply(Name const& name, std::string_view pattern)
{
  auto const& fn = name.first;
  auto const& ln = name.last;
  auto const  f  = fn.substr(0, 1);
  auto const  l  = ln.substr(0, 1);

  auto const need_both = fn.empty() || ln.empty();

  // clang-format off
  if (pattern == "first")      return fn;
  if (pattern == "last")       return ln;
  if (need_both)               return "";
  if (pattern == "first.last") return fmt::format("{}.{}", fn, ln);
  if (pattern == "f.last")     return fmt::format("{}.{}", f, ln);
  if (pattern == "firstl")     return fn + l;
  if (pattern == "flast")      return f + ln;
  if (pattern == "first_last") return fmt::format("{}_{}", fn, ln);
  if (pattern == "first-last") return fmt::format("{}-{}", fn, ln);
  if (pattern == "firstlast")  return fn + ln;
  // clang-format on

  return "";
}

std::optional<std::string> pattern_of(Name const& name, std::string_view local)
{
  if (local.empty())
    return {};
  for (auto const p : priority) {
    if (apply(name, p) == local)
      return p;
  }
  return {};
}

bool is_role(std::string_view local)
{
  return std::find(std::begin(role_aliases), std::end(role_aliases), local)
         != std::end(role_aliases);
}

Inference infer(std::vector<Example> const& examples)
{
  Inference inf;

  std::vector<Example const*> ex;
  for (auto const& e : examples) {
    if (!is_role(e.local))
      ex.push_back(&e);
  }
  inf.samples = static_cast<int>(ex.size());
  if (inf.samples < min_hits)
    return inf;

  int hits[n_patterns]{};
  for (auto const e : ex) {
    auto const name = normalize(e->first, e->last);
    for (std::size_t i = 0; i < n_patterns; ++i) {
      if (apply(name, priority[i]) == e->local)
        ++hits[i];
    }
  }

  // Ties go to the higher priority.
  auto const best
      = std::max_element(std::begin(hits), std::end(hits)) - std::begin(hits);
  inf.confidence = static_cast<double>(hits[best]) / inf.samples;
  if (hits[best] >= min_hits && inf.confidence >= min_confidence)
    inf.pattern = priority[best];
  return inf;
}

std::vector<std::string> generate(Name const&                       name,
                                  std::string const&                domain,
                                  std::optional<std::string> const& only)
{
  std::vector<std::string> addrs;
  if (domain.empty())
    return addrs;

  auto const add = [&](std::string_view pattern) {
    auto const local = apply(name, pattern);
    if (local.empty() || is_role(local))
      return;
    auto addr = fmt::format("{}@{}", local, domain);
    if (std::find(begin(addrs), end(addrs), addr) == end(addrs))
      addrs.push_back(std::move(addr));
  };

  if (only && is_pattern(*only)) {
    add(*only);
    return addrs;
  }
  for (auto const p : priority)
    add(p);
  return addrs;
}

} // namespace Patterns
