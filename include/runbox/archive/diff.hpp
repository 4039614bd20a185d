#pragma once

#include "runbox/archive/archive.hpp"
#include "runbox/common/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace runbox::archive {

struct DiffOptions {
  std::size_t context_lines = 3;
  /// Content with a NUL byte in this prefix is treated as binary.
  std::size_t binary_sniff_bytes = 8000;
};

[[nodiscard]] bool looks_binary(const std::string &content, std::size_t sniff_bytes = 8000);

/// Unified diff of one file's content; hunks only, no file headers.
[[nodiscard]] std::string diff_lines(const std::string &before, const std::string &after,
                                     const DiffOptions &options = {});

/// git-style patch turning `before` into `after` for `paths` (sorted in the output).
/// Paths missing from `before` are creations, missing from `after` are deletions. Returns an
/// empty string when nothing differs.
[[nodiscard]] std::string make_patch(const Archive &before, const Archive &after,
                                     std::vector<std::string> paths,
                                     const DiffOptions &options = {});

/// Applies a patch produced by make_patch. Binary sections are rejected.
[[nodiscard]] common::Result<Archive> apply_patch(const Archive &before, const std::string &patch);

} // namespace runbox::archive
