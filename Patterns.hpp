#ifndef PATTERNS_DOT_HPP
#define PATTERNS_DOT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Local-part conventions: "first.last", "flast" and the rest, applied
// to names folded down to [a-z0-9].

namespace Patterns {

// Most common convention first.
constexpr char const* const priority[]{
    "flast",      "first.last", "f.last",     "first", "firstl",
    "firstlast",  "first_last", "first-last", "last",
};
constexpr std::size_t n_patterns = sizeof(priority) / sizeof(priority[0]);

// Position in priority, n_patterns for anything else.
std::size_t rank(std::string_view pattern);

bool is_pattern(std::string_view pattern);

// Compatibility decomposition, then only ASCII letters and digits,
// lower case.  "José-Luis" is "joseluis".
std::string fold(std::string_view str);

struct Name {
  std::string first;
  std::string last;
};

Name normalize(std::string_view first, std::string_view last);

// First and last word of a full name.
Name split(std::string_view full_name);

// Empty when the name lacks a part the pattern needs, or the pattern
// is not one of ours.
std::string apply(Name const& name, std::string_view pattern);

// The best ranked pattern that makes this local-part from the name.
std::optional<std::string> pattern_of(Name const& name, std::string_view local);

// info@, sales@ and friends.
bool is_role(std::string_view local);

struct Example {
  std::string first;
  std::string last;
  std::string local;
};

struct Inference {
  std::optional<std::string> pattern;
  double                     confidence{0.0};
  int                        samples{0};
};

// A pattern wins when it explains at least two examples and at least
// 80% of the non-role ones.
Inference infer(std::vector<Example> const& examples);

// Addresses at domain for the name, the one pattern when given, else
// every pattern in priority order.  No role addresses, no duplicates.
std::vector<std::string> generate(Name const&                       name,
                                  std::string const&                domain,
                                  std::optional<std::string> const& only = {});

} // namespace Patterns

#endif // PATTERNS_DOT_HPP
