#include "replacer/types.hpp"

#include <algorithm>
#include <cctype>

namespace replacer {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::invalid_argument: return "invalid_argument";
    case ErrorCode::pattern_compile_error: return "pattern_compile_error";
    case ErrorCode::invalid_root: return "invalid_root";
    case ErrorCode::read_error: return "read_error";
    case ErrorCode::write_error: return "write_error";
    case ErrorCode::match_error: return "match_error";
    case ErrorCode::event_log_unavailable: return "event_log_unavailable";
  }
  return "";
}

bool is_fatal(ErrorCode code) {
  return code == ErrorCode::invalid_argument ||
         code == ErrorCode::pattern_compile_error ||
         code == ErrorCode::invalid_root ||
         code == ErrorCode::event_log_unavailable;
}

std::string normalize_extension(const std::string& token) {
  std::string out = token;
  if (!out.empty() && out.front() == '.') out.erase(0, 1);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

SubstitutionRequest make_request(const std::filesystem::path& root,
                                 const std::string& pattern,
                                 const std::string& replacement,
                                 const std::vector<std::string>& extensions,
                                 bool force, bool verbose) {
  SubstitutionRequest req;
  req.root_directory = root;
  req.search_pattern = pattern;
  req.replacement_template = replacement;
  for (const auto& ext : extensions) {
    std::string norm = normalize_extension(ext);
    if (!norm.empty()) req.extensions.insert(norm);
  }
  req.force = force;
  req.verbose = verbose;
  return req;
}

RequestValidation validate_request(const SubstitutionRequest& request) {
  RequestValidation v;
  if (request.root_directory.empty()) {
    v.errors.push_back("root directory must not be empty");
  }
  for (const auto& ext : request.extensions) {
    if (ext.empty() || ext.front() == '.') {
      v.errors.push_back("extension '" + ext + "' is not normalized");
    } else if (ext.find('/') != std::string::npos) {
      v.errors.push_back("extension '" + ext + "' contains a path separator");
    }
    for (char c : ext) {
      if (std::isupper(static_cast<unsigned char>(c))) {
        v.errors.push_back("extension '" + ext + "' is not lowercase");
        break;
      }
    }
  }
  v.ok = v.errors.empty();
  return v;
}

void RunSummary::record(const FileOutcome& outcome) {
  ++files_visited;
  if (outcome.matched) ++files_matched;
  if (outcome.written) ++files_written;
  total_matches += outcome.match_count;
  if (!outcome.ok()) {
    errors.push_back(FileError{outcome.path, outcome.error_code, outcome.error_message});
  }
}

}  // namespace replacer
