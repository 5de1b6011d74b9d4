#include "replacer/file_processor.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include "replacer/observability.hpp"

namespace replacer {
namespace {

std::string errno_message(const char* what, const std::filesystem::path& path) {
  const int err = errno;
  std::string msg = std::string(what) + " " + path.string();
  if (err != 0) {
    msg += ": ";
    msg += std::strerror(err);
  }
  return msg;
}

}  // namespace

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string* error) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    if (error) *error = "cannot read " + path.string() + ": is a directory";
    return false;
  }
  errno = 0;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = errno_message("cannot open", path);
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  if (ifs.bad()) {
    if (error) *error = errno_message("cannot read", path);
    return false;
  }
  return true;
}

bool write_text_file(const std::filesystem::path& path, const std::string& data,
                     std::string* error) {
  errno = 0;
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    if (error) *error = errno_message("cannot open for writing", path);
    return false;
  }
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  ofs.close();
  if (!ofs) {
    if (error) *error = errno_message("cannot write", path);
    return false;
  }
  return true;
}

std::size_t find_invalid_utf8(const std::string& data) {
  const auto* s = reinterpret_cast<const unsigned char*>(data.data());
  const std::size_t n = data.size();
  std::size_t i = 0;
  while (i < n) {
    const unsigned char c = s[i];
    if (c < 0x80) {
      ++i;
      continue;
    }
    std::size_t len = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return i;
    }
    if (i + len > n) return i;
    for (std::size_t k = 1; k < len; ++k) {
      if ((s[i + k] & 0xC0) != 0x80) return i;
      cp = (cp << 6) | (s[i + k] & 0x3F);
    }
    const bool overlong = (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
                          (len == 4 && cp < 0x10000);
    if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return i;
    i += len;
  }
  return std::string::npos;
}

namespace {

FileOutcome process_untimed(const std::filesystem::path& path, const PatternMatcher& matcher,
                            bool force) {
  FileOutcome outcome;
  outcome.path = path;

  std::string content;
  std::string err;
  if (!read_text_file(path, content, &err)) {
    outcome.error_code = ErrorCode::read_error;
    outcome.error_message = err;
    return outcome;
  }
  const std::size_t bad = find_invalid_utf8(content);
  if (bad != std::string::npos) {
    outcome.error_code = ErrorCode::read_error;
    outcome.error_message = "invalid UTF-8 at byte " + std::to_string(bad);
    return outcome;
  }

  Substitution sub = matcher.substitute(content);
  outcome.match_count = sub.count;
  outcome.matched = sub.count > 0;
  // Byte-level constructs (\C) can cut a code point in half.
  const std::size_t bad_out = find_invalid_utf8(sub.text);
  if (bad_out != std::string::npos) {
    outcome.error_code = ErrorCode::match_error;
    outcome.error_message =
        "substitution would produce invalid UTF-8 at byte " + std::to_string(bad_out);
    return outcome;
  }

  if (!outcome.matched && !force) return outcome;

  if (!write_text_file(path, sub.text, &err)) {
    outcome.error_code = ErrorCode::write_error;
    outcome.error_message = err;
    return outcome;
  }
  outcome.written = true;
  return outcome;
}

}  // namespace

FileOutcome process_file(const std::filesystem::path& path, const PatternMatcher& matcher,
                         bool force) {
  uint64_t ns = 0;
  FileOutcome outcome;
  {
    ScopeTimer timer(ns);
    outcome = process_untimed(path, matcher, force);
  }
  outcome.duration_ns = ns;
  return outcome;
}

}  // namespace replacer
