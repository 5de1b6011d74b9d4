#pragma once

// replacer/tree_walker.hpp — Lazy, deterministic directory traversal.
//
// ORDER:
//   Depth-first. Each directory is listed once, its entries sorted byte-wise by
//   file name, and visited in that order; a subdirectory is descended into at
//   its sorted position. The same tree snapshot always yields the same order.
//
// MEMORY:
//   Only the listings of the directories on the current descent path are held.
//   Files are yielded one at a time by next(); the full candidate list is never
//   materialized.
//
// SYMLINKS:
//   Never followed and never yielded (neither to files nor to directories), so
//   a cyclic link cannot cause a loop and a write can never escape the tree.
//
// Single pass: once next() returns nullopt the walker is exhausted.

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "replacer/types.hpp"

namespace replacer {

struct WalkEntry {
  std::filesystem::path path;
  // read_error when `path` is a directory that could not be listed; the walk
  // skips that subtree and continues with its siblings.
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;

  bool ok() const { return error_code == ErrorCode::none; }
};

// Candidate test: true iff extensions is empty or the file's extension
// (lowercased, without the dot) is a member.
bool extension_matches(const std::filesystem::path& file, const std::set<std::string>& extensions);

class TreeWalker {
 public:
  // Returns nullopt and sets *error if root does not exist or is not a directory.
  static std::optional<TreeWalker> open(const std::filesystem::path& root,
                                        std::set<std::string> extensions, std::string* error);

  std::optional<WalkEntry> next();

  std::size_t directories_listed() const { return directories_listed_; }

 private:
  struct Level {
    std::vector<std::filesystem::path> entries;
    std::size_t index{0};
  };

  TreeWalker(std::filesystem::path root, std::set<std::string> extensions)
      : root_(std::move(root)), extensions_(std::move(extensions)) {}

  // Lists `dir` and pushes a new level. Returns false with *error on failure.
  bool descend(const std::filesystem::path& dir, std::string* error);

  std::filesystem::path root_;
  std::set<std::string> extensions_;
  std::vector<Level> stack_;
  bool started_{false};
  std::size_t directories_listed_{0};
};

}  // namespace replacer
