#include "replacer/observability.hpp"

#include <sstream>

#include "replacer/jsonlite.hpp"
#include "replacer/version.hpp"

namespace replacer {

FileEvent make_file_event(uint64_t sequence, const FileOutcome& outcome) {
  FileEvent ev;
  ev.sequence = sequence;
  ev.path = outcome.path;
  ev.matched = outcome.matched;
  ev.written = outcome.written;
  ev.match_count = outcome.match_count;
  ev.error_code = outcome.error_code;
  ev.error_message = outcome.error_message;
  ev.duration_ns = outcome.duration_ns;
  return ev;
}

std::string file_event_to_json(const FileEvent& ev) {
  std::ostringstream o;
  o << "{\"seq\":" << ev.sequence
    << ",\"type\":\"file\""
    << ",\"path\":" << jsonlite::quote(ev.path.string())
    << ",\"matched\":" << (ev.matched ? "true" : "false")
    << ",\"written\":" << (ev.written ? "true" : "false")
    << ",\"match_count\":" << ev.match_count
    << ",\"error_code\":\"" << to_string(ev.error_code) << "\"";
  if (!ev.error_message.empty()) {
    o << ",\"message\":" << jsonlite::quote(ev.error_message);
  }
  o << ",\"duration_ns\":" << ev.duration_ns << "}";
  return o.str();
}

std::string run_end_to_json(uint64_t sequence, const RunResult& result) {
  const RunSummary& s = result.summary;
  std::ostringstream o;
  o << "{\"seq\":" << sequence
    << ",\"type\":\"run_end\""
    << ",\"format\":" << version::EVENT_LOG_VERSION
    << ",\"ok\":" << (result.ok && s.errors.empty() ? "true" : "false")
    << ",\"error_code\":\"" << to_string(result.error_code) << "\""
    << ",\"files_visited\":" << s.files_visited
    << ",\"files_matched\":" << s.files_matched
    << ",\"files_written\":" << s.files_written
    << ",\"total_matches\":" << s.total_matches
    << ",\"errors\":" << s.errors.size()
    << ",\"duration_ns\":" << s.duration_ns << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ConsoleSink
// ---------------------------------------------------------------------------

void ConsoleSink::on_run_start(const SubstitutionRequest& request) {
  if (!verbose_) return;
  out_ << "[VERBOSE]: Replacing pattern '" << request.search_pattern << "' with '"
       << request.replacement_template << "' under " << request.root_directory.string();
  if (request.extensions.empty()) {
    out_ << " (all extensions)";
  } else {
    out_ << " (extensions:";
    for (const auto& ext : request.extensions) out_ << " " << ext;
    out_ << ")";
  }
  if (request.force) out_ << " [force]";
  out_ << "\n";
}

void ConsoleSink::on_file(const FileEvent& ev) {
  if (!verbose_) return;
  out_ << "[VERBOSE]: #" << ev.sequence << " " << ev.path.string()
       << " matched=" << (ev.matched ? "yes" : "no");
  if (ev.matched) out_ << "(" << ev.match_count << ")";
  out_ << " written=" << (ev.written ? "yes" : "no");
  if (ev.error_code != ErrorCode::none) {
    out_ << " error=" << to_string(ev.error_code) << ": " << ev.error_message;
  }
  out_ << "\n";
}

// ---------------------------------------------------------------------------
// NdjsonEventLog
// ---------------------------------------------------------------------------

NdjsonEventLog::NdjsonEventLog(const std::filesystem::path& path) : path_(path) {
  if (!path_.empty()) file_ = std::fopen(path_.string().c_str(), "a");
}

NdjsonEventLog::~NdjsonEventLog() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void NdjsonEventLog::append_line(const std::string& line) {
  if (!file_) {
    ++failure_count_;
    return;
  }
  const std::size_t n = std::fwrite(line.data(), 1, line.size(), file_);
  const bool newline_ok = std::fputc('\n', file_) != EOF;
  if (n != line.size() || !newline_ok || std::fflush(file_) != 0) {
    ++failure_count_;
    return;
  }
  ++entry_count_;
}

void NdjsonEventLog::on_file(const FileEvent& ev) { append_line(file_event_to_json(ev)); }

void NdjsonEventLog::on_run_end(const RunResult& result, uint64_t sequence) {
  append_line(run_end_to_json(sequence, result));
}

// ---------------------------------------------------------------------------
// FanoutSink
// ---------------------------------------------------------------------------

void FanoutSink::on_run_start(const SubstitutionRequest& request) {
  for (auto* s : sinks_) s->on_run_start(request);
}

void FanoutSink::on_file(const FileEvent& ev) {
  for (auto* s : sinks_) s->on_file(ev);
}

void FanoutSink::on_run_end(const RunResult& result, uint64_t sequence) {
  for (auto* s : sinks_) s->on_run_end(result, sequence);
}

}  // namespace replacer
