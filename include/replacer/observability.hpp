#pragma once

// replacer/observability.hpp — Per-file event reporting.
//
// DESIGN:
//   FileEvent is the observable unit: the Engine emits exactly one per visited
//   file, in walk order, after the file has been fully processed. An entry the
//   walker could not stat or list also gets one, carrying read_error. Sinks
//   see the run bracketed by on_run_start()/on_run_end().
//
//   ConsoleSink:    human-readable "[VERBOSE]" lines (only when verbose).
//   NdjsonEventLog: append-only NDJSON file, one compact object per line,
//                   flushed after every line.
//   FanoutSink:     forwards to several sinks in registration order.
//
// INVARIANTS:
//   - Sinks never influence the run. A sink that fails to write counts the
//     failure; it does not abort the substitution.
//   - Sequence numbers are assigned by the Engine, start at 1, and are never
//     reused within a run. The closing run record takes the next number.

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "replacer/types.hpp"

namespace replacer {

struct FileEvent {
  uint64_t sequence{0};
  std::filesystem::path path;
  bool matched{false};
  bool written{false};
  std::size_t match_count{0};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
  uint64_t duration_ns{0};
};

FileEvent make_file_event(uint64_t sequence, const FileOutcome& outcome);

// Compact single-line JSON (no trailing newline).
std::string file_event_to_json(const FileEvent& ev);
std::string run_end_to_json(uint64_t sequence, const RunResult& result);

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void on_run_start(const SubstitutionRequest& /*request*/) {}
  virtual void on_file(const FileEvent& ev) = 0;
  virtual void on_run_end(const RunResult& /*result*/, uint64_t /*sequence*/) {}
};

class NullSink : public EventSink {
 public:
  void on_file(const FileEvent&) override {}
};

class ConsoleSink : public EventSink {
 public:
  ConsoleSink(std::ostream& out, bool verbose) : out_(out), verbose_(verbose) {}

  void on_run_start(const SubstitutionRequest& request) override;
  void on_file(const FileEvent& ev) override;

 private:
  std::ostream& out_;
  bool verbose_;
};

class NdjsonEventLog : public EventSink {
 public:
  // Opens `path` for appending. Check is_open() before use.
  explicit NdjsonEventLog(const std::filesystem::path& path);
  ~NdjsonEventLog() override;

  NdjsonEventLog(const NdjsonEventLog&) = delete;
  NdjsonEventLog& operator=(const NdjsonEventLog&) = delete;

  bool is_open() const { return file_ != nullptr; }
  const std::filesystem::path& path() const { return path_; }

  void on_file(const FileEvent& ev) override;
  void on_run_end(const RunResult& result, uint64_t sequence) override;

  uint64_t entry_count() const { return entry_count_; }
  uint64_t failure_count() const { return failure_count_; }

 private:
  void append_line(const std::string& line);

  std::filesystem::path path_;
  std::FILE* file_{nullptr};
  uint64_t entry_count_{0};
  uint64_t failure_count_{0};
};

class FanoutSink : public EventSink {
 public:
  // Sinks are borrowed; they must outlive the FanoutSink.
  void add(EventSink* sink) {
    if (sink) sinks_.push_back(sink);
  }

  void on_run_start(const SubstitutionRequest& request) override;
  void on_file(const FileEvent& ev) override;
  void on_run_end(const RunResult& result, uint64_t sequence) override;

 private:
  std::vector<EventSink*> sinks_;
};

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace replacer
