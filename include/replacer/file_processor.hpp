#pragma once

// replacer/file_processor.hpp — Per-file read → substitute → conditional write.
//
// WRITE POLICY:
//   A file is written back iff the pattern matched at least once OR force is
//   set. In force mode the write happens even when the result is byte-identical
//   to what was read (a real write, with the mtime change that implies).
//   A substitution result that is not valid UTF-8 (possible only with
//   byte-level patterns such as \C) is a match_error and nothing is written.
//
// RESOURCE MODEL:
//   The file is opened, read in full and closed before substitution. It is
//   reopened (truncating, in place) only if the write decision is true and is
//   closed immediately after. No handle outlives its single operation.
//   Writing in place keeps the inode, owner and permission bits.

#include <filesystem>
#include <string>

#include "replacer/pattern.hpp"
#include "replacer/types.hpp"

namespace replacer {

// Read a whole file. Returns false and sets *error on open/read failure.
bool read_text_file(const std::filesystem::path& path, std::string& out, std::string* error);

// Truncate and write a whole file in place. Returns false and sets *error on failure.
bool write_text_file(const std::filesystem::path& path, const std::string& data,
                     std::string* error);

// Returns the byte offset of the first invalid UTF-8 sequence, or npos if the
// buffer is valid UTF-8 (overlong forms and surrogates are rejected).
std::size_t find_invalid_utf8(const std::string& data);

FileOutcome process_file(const std::filesystem::path& path, const PatternMatcher& matcher,
                         bool force);

}  // namespace replacer
