#pragma once

#include "runbox/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace runbox::archive {

enum class EntryType { File, Directory, Symlink };

struct ArchiveEntry {
  /// Relative, normalized, no trailing slash.
  std::string path;
  std::uint32_t mode = 0644;
  EntryType type = EntryType::File;
  std::string content;
  std::string link_target;
  std::int64_t mtime = 0;
};

/// Ordered entries; every directory precedes its children.
struct Archive {
  std::vector<ArchiveEntry> entries;

  [[nodiscard]] const ArchiveEntry *find(const std::string &path) const;
  [[nodiscard]] std::vector<std::string> file_paths() const;
  [[nodiscard]] bool empty() const { return entries.empty(); }
};

constexpr std::size_t kMaxExpandedBytes = 1ULL << 30;

/// Normalizes `raw` ("./a//b/" -> "a/b"). Absolute paths and ".." are ArchiveFormat errors;
/// the archive root itself normalizes to "".
[[nodiscard]] common::Result<std::string> normalize_path(const std::string &raw);

/// Validates and orders entries: parents synthesized before children, later duplicates win,
/// file/directory conflicts and escaping symlinks rejected.
[[nodiscard]] common::Result<Archive> make_archive(std::vector<ArchiveEntry> entries);

enum class Compression { None, Gzip };

/// Reads a tar stream, plain or gzip-compressed. Entry content past `max_bytes` in total is an
/// ArchiveFormat error.
[[nodiscard]] common::Result<Archive> parse_tar(const std::string &bytes,
                                                std::size_t max_bytes = kMaxExpandedBytes);

/// Writes a pax-restricted tar (plain ustar headers unless a name needs more).
[[nodiscard]] common::Result<std::string> write_tar(const Archive &archive,
                                                    Compression compression = Compression::None);

/// base64 of a tar (gzip-compressed or plain) -> Archive.
[[nodiscard]] common::Result<Archive> decode(const std::string &base64_text);

/// Subset of `archive` restricted to `paths` (parents kept); empty `paths` keeps nothing.
[[nodiscard]] Archive select(const Archive &archive, const std::vector<std::string> &paths);

/// base64 of the tar.gz holding the selected paths.
[[nodiscard]] common::Result<std::string> encode(const Archive &archive,
                                                 const std::vector<std::string> &paths);

/// base64 of the tar.gz holding every entry.
[[nodiscard]] common::Result<std::string> encode(const Archive &archive);

} // namespace runbox::archive
