#include "replacer/tree_walker.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace replacer {

bool extension_matches(const fs::path& file, const std::set<std::string>& extensions) {
  if (extensions.empty()) return true;
  std::string ext = file.extension().string();
  if (ext.empty()) return false;
  ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extensions.count(ext) != 0;
}

std::optional<TreeWalker> TreeWalker::open(const fs::path& root,
                                           std::set<std::string> extensions,
                                           std::string* error) {
  std::error_code ec;
  const auto st = fs::status(root, ec);
  if (ec || !fs::exists(st)) {
    if (error) *error = "root directory does not exist: " + root.string();
    return std::nullopt;
  }
  if (!fs::is_directory(st)) {
    if (error) *error = "root is not a directory: " + root.string();
    return std::nullopt;
  }
  return TreeWalker(root, std::move(extensions));
}

bool TreeWalker::descend(const fs::path& dir, std::string* error) {
  Level level;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  const fs::directory_iterator end;
  while (!ec && it != end) {
    level.entries.push_back(it->path());
    it.increment(ec);
  }
  if (ec) {
    if (error) *error = "cannot list directory " + dir.string() + ": " + ec.message();
    return false;
  }
  std::sort(level.entries.begin(), level.entries.end(),
            [](const fs::path& a, const fs::path& b) {
              return a.filename().native() < b.filename().native();
            });
  ++directories_listed_;
  stack_.push_back(std::move(level));
  return true;
}

std::optional<WalkEntry> TreeWalker::next() {
  if (!started_) {
    started_ = true;
    std::string err;
    if (!descend(root_, &err)) {
      WalkEntry failed;
      failed.path = root_;
      failed.error_code = ErrorCode::read_error;
      failed.error_message = err;
      return failed;
    }
  }

  while (!stack_.empty()) {
    Level& top = stack_.back();
    if (top.index == top.entries.size()) {
      stack_.pop_back();
      continue;
    }
    const fs::path entry = top.entries[top.index++];

    std::error_code ec;
    const auto st = fs::symlink_status(entry, ec);
    if (ec) {
      WalkEntry failed;
      failed.path = entry;
      failed.error_code = ErrorCode::read_error;
      failed.error_message = "cannot stat " + entry.string() + ": " + ec.message();
      return failed;
    }
    if (fs::is_symlink(st)) continue;

    if (fs::is_directory(st)) {
      // `top` may dangle after descend() grows the stack.
      std::string err;
      if (!descend(entry, &err)) {
        WalkEntry failed;
        failed.path = entry;
        failed.error_code = ErrorCode::read_error;
        failed.error_message = err;
        return failed;
      }
      continue;
    }
    if (fs::is_regular_file(st) && extension_matches(entry, extensions_)) {
      WalkEntry found;
      found.path = entry;
      return found;
    }
  }
  return std::nullopt;
}

}  // namespace replacer
