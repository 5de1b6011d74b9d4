#pragma once

// replacer/jsonlite.hpp — Minimal JSON helpers for flat, machine-written objects.
//
// escape() produces a valid JSON string body for any byte sequence that is
// valid UTF-8.

#include <cstdio>
#include <string>

namespace replacer::jsonlite {

inline std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          o += buf;
        } else {
          o += c;
        }
    }
  }
  return o;
}

inline std::string quote(const std::string& s) { return "\"" + escape(s) + "\""; }

}  // namespace replacer::jsonlite
