#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "replacer/engine.hpp"
#include "replacer/observability.hpp"
#include "replacer/types.hpp"
#include "replacer/version.hpp"

namespace {

struct CliArgs {
  std::vector<std::string> positional;
  std::vector<std::string> extensions;
  std::string event_log;
  bool force{false};
  bool verbose{false};
  bool json{false};
  bool help{false};
  bool version{false};
};

void print_usage(std::ostream& out) {
  out << "Usage: replacer [OPTIONS] <directory> <pattern> <replacement>\n"
      << "\n"
      << "Replace every match of <pattern> (RE2 regex) with <replacement>\n"
      << "in all files under <directory>.\n"
      << "\n"
      << "Options:\n"
      << "  -h, --help               Print this help and exit.\n"
      << "  -V, --version            Print the version and exit.\n"
      << "  -f, --force              Rewrite every visited file, even without a match.\n"
      << "  -v, --verbose            Print one line per visited file.\n"
      << "  -e, --extensions EXT...  Only visit files with these extensions (no dot).\n"
      << "                           Consumes arguments up to the next option.\n"
      << "      --json               Print the summary as one JSON object.\n"
      << "      --event-log PATH     Append one NDJSON record per visited file to PATH.\n"
      << "      --                   Treat all following arguments as positional.\n"
      << "\n"
      << "Replacement: \\1..\\99, \\g<N> or \\g<name> insert a group, \\g<0> the whole\n"
      << "match. \\n \\t \\\\ and octal \\0 / \\NNN escapes are supported.\n"
      << "\n"
      << "Example:\n"
      << "  replacer /home/user/site 'foo(\\d+)' 'bar\\1' -e html js\n"
      << "\n"
      << "Exit codes: 0 ok, 1 usage error, 2 fatal error (nothing touched),\n"
      << "            3 completed with per-file errors.\n";
}

bool is_option(const std::string& arg) { return arg.size() > 1 && arg[0] == '-'; }

// Returns false and sets *error on an unknown option or a missing value.
bool parse_args(int argc, char** argv, CliArgs& args, std::string* error) {
  bool options_done = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (options_done || !is_option(arg)) {
      args.positional.push_back(arg);
      continue;
    }
    if (arg == "--") {
      options_done = true;
    } else if (arg == "-h" || arg == "--help") {
      args.help = true;
    } else if (arg == "-V" || arg == "--version") {
      args.version = true;
    } else if (arg == "-f" || arg == "--force") {
      args.force = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--event-log") {
      if (i + 1 >= argc) {
        *error = "--event-log requires a path";
        return false;
      }
      args.event_log = argv[++i];
    } else if (arg == "-e" || arg == "--extensions") {
      while (i + 1 < argc && !is_option(argv[i + 1])) args.extensions.push_back(argv[++i]);
    } else {
      *error = "unknown option: " + arg;
      return false;
    }
  }
  return true;
}

void report_fatal(const replacer::RunResult& result, bool json) {
  if (json) {
    std::cerr << replacer::summary_to_json(result) << "\n";
  } else {
    std::cerr << replacer::summary_pretty(result);
  }
}

}  // namespace

int main(int argc, char** argv) {
  CliArgs args;
  std::string error;
  if (!parse_args(argc, argv, args, &error)) {
    std::cerr << "Error: " << error << "\n"
              << "For help try: replacer --help\n";
    return replacer::kExitUsage;
  }
  if (args.help) {
    print_usage(std::cout);
    return replacer::kExitOk;
  }
  if (args.version) {
    std::cout << replacer::version::version_line() << "\n";
    return replacer::kExitOk;
  }
  if (args.positional.size() != 3) {
    std::cerr << "Error: expected <directory> <pattern> <replacement>, got "
              << args.positional.size() << " positional argument"
              << (args.positional.size() == 1 ? "" : "s") << "\n"
              << "For help try: replacer --help\n";
    return replacer::kExitUsage;
  }

  const replacer::SubstitutionRequest request =
      replacer::make_request(args.positional[0], args.positional[1], args.positional[2],
                             args.extensions, args.force, args.verbose);

  replacer::ConsoleSink console(std::cout, request.verbose);
  replacer::FanoutSink sinks;
  sinks.add(&console);

  replacer::Engine engine(&sinks);
  const replacer::RunResult prepared = engine.prepare(request);
  if (!prepared.ok) {
    report_fatal(prepared, args.json);
    return replacer::exit_code_for(prepared);
  }

  // Opened only once the request is known to be runnable.
  std::unique_ptr<replacer::NdjsonEventLog> event_log;
  if (!args.event_log.empty()) {
    event_log = std::make_unique<replacer::NdjsonEventLog>(args.event_log);
    if (!event_log->is_open()) {
      replacer::RunResult failed;
      failed.error_code = replacer::ErrorCode::event_log_unavailable;
      failed.error_message = "cannot open event log " + args.event_log;
      report_fatal(failed, args.json);
      return replacer::kExitFatal;
    }
    sinks.add(event_log.get());
  }

  const replacer::RunResult result = engine.run();
  if (!result.ok) {
    report_fatal(result, args.json);
    return replacer::exit_code_for(result);
  }

  if (args.json) {
    std::cout << replacer::summary_to_json(result) << "\n";
  } else {
    std::cout << replacer::summary_pretty(result);
  }
  if (event_log && event_log->failure_count() > 0) {
    std::cerr << "Warning: " << event_log->failure_count() << " event log write"
              << (event_log->failure_count() == 1 ? "" : "s") << " failed ("
              << args.event_log << ")\n";
  }
  return replacer::exit_code_for(result);
}
