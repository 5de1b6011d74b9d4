#pragma once

// replacer/engine.hpp — Traversal-and-substitution driver.
//
// CONTRACT:
//   prepare() validates the request (structure, pattern, root) and has no
//   side effects; a fatal failure returns ok=false. run() then processes
//   every walked file sequentially in walk order, reports each outcome to
//   the sink and folds it into the summary. Per-file errors (including
//   directories that cannot be listed) never stop the run.
//   run(request) does both in one call.
//
//   There is no rollback: files written before a later failure stay written.

#include <optional>
#include <string>

#include "replacer/observability.hpp"
#include "replacer/pattern.hpp"
#include "replacer/tree_walker.hpp"
#include "replacer/types.hpp"

namespace replacer {

// Process exit codes used by the CLI.
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;
constexpr int kExitFileErrors = 3;

class Engine {
 public:
  // `sink` is borrowed and may be null (events are dropped).
  explicit Engine(EventSink* sink = nullptr) : sink_(sink ? sink : &null_sink_) {}

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // ok=true means run() will proceed; nothing has been opened or emitted yet.
  RunResult prepare(const SubstitutionRequest& request);

  // Runs the prepared request. Without a successful prepare() it returns a
  // fatal invalid_argument result.
  RunResult run();

  RunResult run(const SubstitutionRequest& request);

 private:
  NullSink null_sink_;
  EventSink* sink_;
  std::optional<SubstitutionRequest> request_;
  std::optional<PatternMatcher> matcher_;
  std::optional<TreeWalker> walker_;
};

int exit_code_for(const RunResult& result);

// Human-readable multi-line summary (ends with a newline).
std::string summary_pretty(const RunResult& result);

// Single-line JSON summary, schema version::SUMMARY_FORMAT_VERSION.
std::string summary_to_json(const RunResult& result);

}  // namespace replacer
