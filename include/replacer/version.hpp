#pragma once

// replacer/version.hpp — Version manifest for every machine-readable surface.
//
// INVARIANT:
//   Anything a script may parse (the --json summary, the --event-log NDJSON
//   stream) carries a format version here. Adding an optional field is
//   compatible; renaming or removing a field, or changing a field's type,
//   requires a bump.

#include <cstdint>
#include <string>

#ifndef REPLACER_VERSION
#define REPLACER_VERSION "0.2.0"
#endif

namespace replacer {
namespace version {

// ---------------------------------------------------------------------------
// SUMMARY_FORMAT_VERSION
// Schema of the single JSON object printed by `replacer --json`.
// Version 1 = {ok, error_code, files_visited, files_matched, files_written,
//              total_matches, duration_ns, errors[{path, error_code, message}]}.
// ---------------------------------------------------------------------------
constexpr uint32_t SUMMARY_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// Schema of --event-log lines: {seq, type:"file"|"run_end", ...}.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

constexpr const char* PROJECT_URL = "https://github.com/chabrovs/regex-pattern-replacer";

struct VersionManifest {
  std::string semver{REPLACER_VERSION};
  uint32_t summary_format{SUMMARY_FORMAT_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string regex_dialect{"re2"};
  std::string project_url{PROJECT_URL};
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest();

// Serialize to compact JSON.
std::string manifest_to_json(const VersionManifest& m);

// One line for -V/--version.
std::string version_line();

}  // namespace version
}  // namespace replacer
