#pragma once

// replacer/types.hpp — Core data structures for the replacer substitution engine.
//
// OWNERSHIP:
//   - SubstitutionRequest is built once per process by make_request() and is
//     passed by const reference afterwards. There is no static/global option
//     state anywhere in the library.
//   - FileOutcome and RunSummary are value types. Engine::run() returns the
//     summary by value; the caller owns it.
//
// ERROR MODEL:
//   - Fatal errors (pattern_compile_error, invalid_root) are reported before
//     any file is opened. Nothing is touched.
//   - Per-file errors (read_error, write_error) are recorded in the summary
//     and never stop the traversal.
//   - Nothing in the public API throws; failures travel as ErrorCode plus a
//     human-readable message.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace replacer {

enum class ErrorCode {
  none,
  invalid_argument,
  pattern_compile_error,
  invalid_root,
  read_error,
  write_error,
  match_error,
  event_log_unavailable,
};

std::string to_string(ErrorCode code);

// Fatal errors abort the run before traversal; the rest are per-file.
bool is_fatal(ErrorCode code);

struct SubstitutionRequest {
  std::filesystem::path root_directory;
  std::string search_pattern;
  std::string replacement_template;
  std::set<std::string> extensions;  // normalized: no leading dot, lowercase. Empty = all files.
  bool force{false};
  bool verbose{false};
};

// Normalize one extension token: strip a single leading '.', lowercase.
std::string normalize_extension(const std::string& token);

SubstitutionRequest make_request(const std::filesystem::path& root,
                                 const std::string& pattern,
                                 const std::string& replacement,
                                 const std::vector<std::string>& extensions,
                                 bool force, bool verbose);

struct RequestValidation {
  bool ok{true};
  std::vector<std::string> errors;
};

// Structural checks only (no filesystem access, no regex compilation).
RequestValidation validate_request(const SubstitutionRequest& request);

struct FileOutcome {
  std::filesystem::path path;
  bool matched{false};
  bool written{false};
  std::size_t match_count{0};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
  uint64_t duration_ns{0};

  bool ok() const { return error_code == ErrorCode::none; }
};

struct FileError {
  std::filesystem::path path;
  ErrorCode code{ErrorCode::none};
  std::string message;
};

struct RunSummary {
  std::size_t files_visited{0};
  std::size_t files_matched{0};
  std::size_t files_written{0};
  std::size_t total_matches{0};
  std::vector<FileError> errors;  // walk order
  uint64_t duration_ns{0};

  void record(const FileOutcome& outcome);
  bool completed_with_errors() const { return !errors.empty(); }
};

struct RunResult {
  bool ok{false};                          // false only for fatal errors
  ErrorCode error_code{ErrorCode::none};   // fatal error, if any
  std::string error_message;
  RunSummary summary;
};

}  // namespace replacer
