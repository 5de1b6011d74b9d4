#include "replacer/engine.hpp"

#include <optional>
#include <sstream>
#include <utility>

#include "replacer/file_processor.hpp"
#include "replacer/jsonlite.hpp"
#include "replacer/pattern.hpp"
#include "replacer/tree_walker.hpp"
#include "replacer/version.hpp"

namespace replacer {
namespace {

RunResult fatal(ErrorCode code, std::string message) {
  RunResult r;
  r.ok = false;
  r.error_code = code;
  r.error_message = std::move(message);
  return r;
}

}  // namespace

RunResult Engine::prepare(const SubstitutionRequest& request) {
  request_.reset();
  matcher_.reset();
  walker_.reset();

  const RequestValidation validation = validate_request(request);
  if (!validation.ok) {
    std::string msg;
    for (const auto& e : validation.errors) {
      if (!msg.empty()) msg += "; ";
      msg += e;
    }
    return fatal(ErrorCode::invalid_argument, msg);
  }

  std::string err;
  std::optional<PatternMatcher> matcher =
      PatternMatcher::compile(request.search_pattern, request.replacement_template, &err);
  if (!matcher) return fatal(ErrorCode::pattern_compile_error, err);

  std::optional<TreeWalker> walker =
      TreeWalker::open(request.root_directory, request.extensions, &err);
  if (!walker) return fatal(ErrorCode::invalid_root, err);

  request_ = request;
  matcher_ = std::move(matcher);
  walker_ = std::move(walker);
  RunResult ready;
  ready.ok = true;
  return ready;
}

RunResult Engine::run() {
  if (!request_ || !matcher_ || !walker_) {
    return fatal(ErrorCode::invalid_argument, "run() called without a prepared request");
  }

  RunResult result;
  result.ok = true;
  sink_->on_run_start(*request_);

  uint64_t seq = 0;
  {
    ScopeTimer timer(result.summary.duration_ns);
    while (std::optional<WalkEntry> entry = walker_->next()) {
      if (!entry->ok()) {
        // Not a visited file: reported and listed as an error, not counted.
        FileOutcome unreadable;
        unreadable.path = entry->path;
        unreadable.error_code = entry->error_code;
        unreadable.error_message = entry->error_message;
        result.summary.errors.push_back(
            FileError{entry->path, entry->error_code, entry->error_message});
        sink_->on_file(make_file_event(++seq, unreadable));
        continue;
      }
      const FileOutcome outcome = process_file(entry->path, *matcher_, request_->force);
      result.summary.record(outcome);
      sink_->on_file(make_file_event(++seq, outcome));
    }
  }

  sink_->on_run_end(result, ++seq);
  request_.reset();
  matcher_.reset();
  walker_.reset();
  return result;
}

RunResult Engine::run(const SubstitutionRequest& request) {
  RunResult prepared = prepare(request);
  if (!prepared.ok) return prepared;
  return run();
}

int exit_code_for(const RunResult& result) {
  if (!result.ok) return result.error_code == ErrorCode::invalid_argument ? kExitUsage : kExitFatal;
  return result.summary.completed_with_errors() ? kExitFileErrors : kExitOk;
}

std::string summary_pretty(const RunResult& result) {
  std::ostringstream o;
  if (!result.ok) {
    o << "[ERROR]: " << to_string(result.error_code) << ": " << result.error_message << "\n";
    return o.str();
  }
  const RunSummary& s = result.summary;
  o << "visited=" << s.files_visited << " matched=" << s.files_matched
    << " written=" << s.files_written << " matches=" << s.total_matches
    << " errors=" << s.errors.size() << "\n";
  for (const auto& e : s.errors) {
    o << "  [" << to_string(e.code) << "] " << e.path.string() << ": " << e.message << "\n";
  }
  o << (s.completed_with_errors() ? "completed with errors" : "completed") << "\n";
  return o.str();
}

std::string summary_to_json(const RunResult& result) {
  std::ostringstream o;
  if (!result.ok) {
    o << "{\"ok\":false,\"format\":" << version::SUMMARY_FORMAT_VERSION
      << ",\"error_code\":\"" << to_string(result.error_code) << "\""
      << ",\"message\":" << jsonlite::quote(result.error_message) << "}";
    return o.str();
  }
  const RunSummary& s = result.summary;
  o << "{\"ok\":" << (s.completed_with_errors() ? "false" : "true")
    << ",\"format\":" << version::SUMMARY_FORMAT_VERSION
    << ",\"error_code\":\"\""
    << ",\"files_visited\":" << s.files_visited
    << ",\"files_matched\":" << s.files_matched
    << ",\"files_written\":" << s.files_written
    << ",\"total_matches\":" << s.total_matches
    << ",\"duration_ns\":" << s.duration_ns
    << ",\"errors\":[";
  for (size_t i = 0; i < s.errors.size(); ++i) {
    if (i > 0) o << ",";
    o << "{\"path\":" << jsonlite::quote(s.errors[i].path.string())
      << ",\"error_code\":\"" << to_string(s.errors[i].code) << "\""
      << ",\"message\":" << jsonlite::quote(s.errors[i].message) << "}";
  }
  o << "]}";
  return o.str();
}

}  // namespace replacer
