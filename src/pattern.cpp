#include "replacer/pattern.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <map>

namespace replacer {
namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_octal(char c) { return c >= '0' && c <= '7'; }
bool is_ascii_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool is_identifier(const std::string& s) {
  if (s.empty() || is_digit(s[0])) return false;
  for (char c : s) {
    if (!is_ascii_letter(c) && !is_digit(c) && c != '_') return false;
  }
  return true;
}

// Code points below 0x100 only (octal escapes are capped at 0o377).
void append_code_point(std::string& out, unsigned value) {
  if (value < 0x80) {
    out += static_cast<char>(value);
  } else {
    out += static_cast<char>(0xC0 | (value >> 6));
    out += static_cast<char>(0x80 | (value & 0x3F));
  }
}

std::size_t code_point_length(unsigned char lead) {
  if (lead >= 0xF0) return 4;
  if (lead >= 0xE0) return 3;
  if (lead >= 0xC0) return 2;
  return 1;
}

char control_escape(char c) {
  switch (c) {
    case 'a': return '\a';
    case 'b': return '\b';
    case 'f': return '\f';
    case 'n': return '\n';
    case 'r': return '\r';
    case 't': return '\t';
    case 'v': return '\v';
    case '\\': return '\\';
    default: return 0;
  }
}

// Parse a replacement template into literal and group pieces.
// Returns false and sets *error on a malformed escape or an undefined group.
template <typename Piece>
bool parse_template(const std::string& tpl, std::size_t group_count,
                    const std::map<std::string, int>& names, std::vector<Piece>& pieces,
                    std::string* error) {
  std::string literal;
  auto fail = [&](const std::string& message) {
    if (error) *error = message;
    return false;
  };
  auto flush = [&]() {
    if (literal.empty()) return;
    Piece p;
    p.literal = std::move(literal);
    pieces.push_back(std::move(p));
    literal.clear();
  };
  auto push_group = [&](std::size_t group) -> bool {
    if (group > group_count) {
      return fail("invalid group reference " + std::to_string(group) + " (pattern defines " +
                  std::to_string(group_count) + " group" + (group_count == 1 ? "" : "s") + ")");
    }
    flush();
    Piece p;
    p.is_group = true;
    p.group = group;
    pieces.push_back(std::move(p));
    return true;
  };

  const std::size_t n = tpl.size();
  for (std::size_t i = 0; i < n; ++i) {
    const char c = tpl[i];
    if (c != '\\') {
      literal += c;
      continue;
    }
    if (i + 1 == n) return fail("bad escape (end of template)");
    const char e = tpl[++i];

    if (e == 'g') {
      if (i + 1 == n || tpl[i + 1] != '<') return fail("missing < after \\g");
      const std::size_t close = tpl.find('>', i + 2);
      if (close == std::string::npos) return fail("missing > in group reference");
      const std::string ref = tpl.substr(i + 2, close - i - 2);
      i = close;
      if (ref.empty()) return fail("missing group name");
      if (is_identifier(ref)) {
        const auto it = names.find(ref);
        if (it == names.end()) return fail("unknown group name '" + ref + "'");
        if (!push_group(static_cast<std::size_t>(it->second))) return false;
        continue;
      }
      bool numeric = ref.size() <= 9;
      for (char d : ref) numeric = numeric && is_digit(d);
      if (!numeric) return fail("bad character in group name '" + ref + "'");
      if (!push_group(static_cast<std::size_t>(std::stoul(ref)))) return false;
    } else if (e == '0') {
      unsigned value = 0;
      for (int k = 0; k < 2 && i + 1 < n && is_octal(tpl[i + 1]); ++k) {
        value = value * 8 + static_cast<unsigned>(tpl[++i] - '0');
      }
      append_code_point(literal, value);
    } else if (is_digit(e)) {
      if (i + 2 < n && is_octal(e) && is_octal(tpl[i + 1]) && is_octal(tpl[i + 2])) {
        const unsigned value = static_cast<unsigned>(e - '0') * 64 +
                               static_cast<unsigned>(tpl[i + 1] - '0') * 8 +
                               static_cast<unsigned>(tpl[i + 2] - '0');
        if (value > 0377) {
          return fail("octal escape value \\" + tpl.substr(i, 3) + " outside of range 0-0o377");
        }
        append_code_point(literal, value);
        i += 2;
        continue;
      }
      std::size_t group = static_cast<std::size_t>(e - '0');
      if (i + 1 < n && is_digit(tpl[i + 1])) {
        group = group * 10 + static_cast<std::size_t>(tpl[++i] - '0');
      }
      if (!push_group(group)) return false;
    } else if (const char ctl = control_escape(e)) {
      literal += ctl;
    } else if (is_ascii_letter(e)) {
      return fail(std::string("bad escape \\") + e + " at template offset " +
                  std::to_string(i - 1));
    } else {
      literal += '\\';
      literal += e;
    }
  }
  flush();
  return true;
}

}  // namespace

std::optional<PatternMatcher> PatternMatcher::compile(const std::string& pattern,
                                                      const std::string& replacement,
                                                      std::string* error) {
  re2::RE2::Options options;
  options.set_log_errors(false);
  auto re = std::make_shared<const re2::RE2>(pattern, options);
  if (!re->ok()) {
    if (error) *error = "invalid pattern '" + pattern + "': " + re->error();
    return std::nullopt;
  }

  std::vector<Piece> pieces;
  std::string tpl_error;
  if (!parse_template(replacement, static_cast<std::size_t>(re->NumberOfCapturingGroups()),
                      re->NamedCapturingGroups(), pieces, &tpl_error)) {
    if (error) {
      *error = "invalid replacement '" + replacement + "' for pattern '" + pattern +
               "': " + tpl_error;
    }
    return std::nullopt;
  }
  return PatternMatcher(pattern, std::move(re), std::move(pieces));
}

std::size_t PatternMatcher::group_count() const {
  return static_cast<std::size_t>(regex_->NumberOfCapturingGroups());
}

Substitution PatternMatcher::substitute(const std::string& content) const {
  Substitution out;
  const int nsub = 1 + regex_->NumberOfCapturingGroups();
  std::vector<re2::StringPiece> groups(static_cast<std::size_t>(nsub));
  const re2::StringPiece text(content.data(), content.size());

  std::string result;
  std::size_t pos = 0;
  std::size_t last = 0;
  while (regex_->Match(text, pos, content.size(), re2::RE2::UNANCHORED, groups.data(), nsub)) {
    const std::size_t start = static_cast<std::size_t>(groups[0].data() - content.data());
    const std::size_t end = start + groups[0].size();
    if (out.count == 0) result.reserve(content.size());
    result.append(content, last, start - last);
    for (const auto& piece : pieces_) {
      if (!piece.is_group) {
        result += piece.literal;
      } else if (groups[piece.group].data() != nullptr) {
        result.append(groups[piece.group].data(), groups[piece.group].size());
      }
    }
    ++out.count;
    last = end;
    pos = end;
    if (end > start) continue;

    // Empty match: copy one code point so the scan makes progress.
    if (end == content.size()) break;
    const std::size_t step = std::min(code_point_length(static_cast<unsigned char>(content[end])),
                                      content.size() - end);
    result.append(content, end, step);
    last = end + step;
    pos = last;
  }

  if (out.count == 0) {
    out.text = content;
    return out;
  }
  result.append(content, last, std::string::npos);
  out.text = std::move(result);
  return out;
}

}  // namespace replacer
