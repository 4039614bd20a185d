#pragma once

#include "runbox/archive/archive.hpp"
#include "runbox/common/result.hpp"
#include "runbox/runtime/client.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace runbox::sandbox {

/// Relative path -> modification time (seconds since epoch).
using FileListing = std::map<std::string, std::int64_t>;

struct FileSnapshot {
  /// Container clock at capture time.
  std::int64_t taken_at = 0;
  FileListing files;
};

struct ChangeSet {
  std::vector<std::string> changed;
  std::vector<std::string> removed;

  [[nodiscard]] bool empty() const { return changed.empty() && removed.empty(); }
  [[nodiscard]] std::vector<std::string> all_paths() const;
};

/// Any path component starting with '.' (dotfiles, .git, ...).
[[nodiscard]] bool is_hidden_path(const std::string &path);

/// Parses `stat -c '%Y %n'` lines produced from inside the scanned directory.
[[nodiscard]] FileListing parse_listing(const std::string &stat_output);

/// A file is changed when it is new, newer than the snapshot, or its mtime moved; removed when
/// it vanished. Hidden paths are ignored. Output is sorted.
[[nodiscard]] ChangeSet detect_changes(const FileSnapshot &snapshot, const FileListing &current);

struct SnapshotCapture {
  FileSnapshot snapshot;
  archive::Archive pre_image;
};

/// Reads a directory of a running container through exec (date, find, stat, tar).
class ContainerScanner {
public:
  ContainerScanner(runtime::IRuntimeClient &client, std::string container, std::string directory);

  [[nodiscard]] common::Result<SnapshotCapture> capture();
  [[nodiscard]] common::Result<FileListing> scan();
  /// Regular files at `paths`, symlinks dereferenced.
  [[nodiscard]] common::Result<archive::Archive> collect(const std::vector<std::string> &paths);

private:
  [[nodiscard]] common::Result<runtime::ExecResult> exec(std::vector<std::string> argv,
                                                         std::string stdin_data = "");

  runtime::IRuntimeClient &client_;
  std::string container_;
  std::string directory_;
};

} // namespace runbox::sandbox
