#include "replacer/version.hpp"

#include <sstream>

#include "replacer/jsonlite.hpp"

namespace replacer {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"semver\":" << jsonlite::quote(m.semver)
    << ",\"summary_format\":" << m.summary_format
    << ",\"event_log\":" << m.event_log
    << ",\"regex_dialect\":" << jsonlite::quote(m.regex_dialect)
    << ",\"project_url\":" << jsonlite::quote(m.project_url)
    << ",\"build_timestamp\":" << jsonlite::quote(m.build_timestamp)
    << "}";
  return o.str();
}

std::string version_line() { return std::string("replacer ") + REPLACER_VERSION; }

}  // namespace version
}  // namespace replacer
