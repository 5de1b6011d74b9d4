#pragma once

// replacer/pattern.hpp — Compiled search pattern + replacement template.
//
// DIALECT:
//   Search patterns use RE2 syntax in UTF-8 mode: '.', classes and repetition
//   operate on code points, and matching time is linear in the input size.
//   Backreferences and lookaround are not available. Matching is
//   leftmost-first; substitute() replaces every non-overlapping match, left to
//   right. Empty matches are permitted and counted; after an empty match the
//   scan resumes one code point further on.
//
// REPLACEMENT TEMPLATE:
//   \N, \NN        numbered group (decimal, 1..99)
//   \g<N>          numbered group, unambiguous form; \g<0> is the whole match
//   \g<name>       named group, (?P<name>...)
//   \0, \0o, \0oo  octal character (up to two more octal digits)
//   \ooo           octal character when three octal digits follow the
//                  backslash and the first is 0..3, e.g. \101 = "A"
//   \\ \a \b \f \n \r \t \v
//                  literal backslash and control characters
//   \<letter>      any other ASCII letter escape is a compile error
//   \<other>       any other escape is kept verbatim (backslash included)
//   A reference to a group the pattern does not define is a compile error.
//   A group that did not participate in a match expands to "".
//
// LIFECYCLE:
//   compile() once per run; the matcher is immutable afterwards and safe to
//   share read-only. Copies share the compiled program.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace re2 {
class RE2;
}

namespace replacer {

struct Substitution {
  std::string text;
  std::size_t count{0};
};

class PatternMatcher {
 public:
  // Returns nullopt and fills *error (if non-null) when the pattern is not a
  // valid regex or the template is malformed. The message always quotes the
  // offending pattern text.
  static std::optional<PatternMatcher> compile(const std::string& pattern,
                                               const std::string& replacement,
                                               std::string* error);

  // content must be valid UTF-8.
  Substitution substitute(const std::string& content) const;

  const std::string& pattern() const { return pattern_; }
  std::size_t group_count() const;

 private:
  struct Piece {
    bool is_group{false};
    std::size_t group{0};
    std::string literal;
  };

  PatternMatcher(std::string pattern, std::shared_ptr<const re2::RE2> regex,
                 std::vector<Piece> pieces)
      : pattern_(std::move(pattern)), regex_(std::move(regex)), pieces_(std::move(pieces)) {}

  std::string pattern_;
  std::shared_ptr<const re2::RE2> regex_;
  std::vector<Piece> pieces_;
};

}  // namespace replacer
