#include "runbox/sandbox/changes.hpp"

#include "runbox/common/fs.hpp"

#include <sstream>

namespace runbox::sandbox {

namespace {

using common::ErrorCode;

// find and tar report unreadable entries with exit status 1 while still producing output.
bool tolerable_exit(const runtime::ExecResult &result) {
  return result.exit_code == 0 || result.exit_code == 1;
}

std::string describe_failure(const std::string &what, const runtime::ExecResult &result) {
  const std::string detail = common::trim(result.error_output);
  return what + " failed with exit code " + std::to_string(result.exit_code) +
         (detail.empty() ? std::string() : ": " + detail);
}

} // namespace

std::vector<std::string> ChangeSet::all_paths() const {
  std::vector<std::string> paths = changed;
  paths.insert(paths.end(), removed.begin(), removed.end());
  return paths;
}

bool is_hidden_path(const std::string &path) {
  for (const auto &part : common::split(path, '/')) {
    if (!part.empty() && part.front() == '.' && part != "." && part != "..") {
      return true;
    }
  }
  return false;
}

FileListing parse_listing(const std::string &stat_output) {
  FileListing listing;
  std::istringstream stream(stat_output);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto space = line.find(' ');
    if (space == std::string::npos) {
      continue;
    }
    const auto mtime = common::parse_int(line.substr(0, space));
    if (!mtime.has_value()) {
      continue;
    }
    std::string path = line.substr(space + 1);
    while (common::starts_with(path, "./")) {
      path.erase(0, 2);
    }
    if (!path.empty()) {
      listing[path] = *mtime;
    }
  }
  return listing;
}

ChangeSet detect_changes(const FileSnapshot &snapshot, const FileListing &current) {
  ChangeSet changes;
  for (const auto &[path, mtime] : current) {
    if (is_hidden_path(path)) {
      continue;
    }
    const auto before = snapshot.files.find(path);
    if (before == snapshot.files.end() || mtime > snapshot.taken_at || mtime != before->second) {
      changes.changed.push_back(path);
    }
  }
  for (const auto &[path, mtime] : snapshot.files) {
    if (!is_hidden_path(path) && !current.contains(path)) {
      changes.removed.push_back(path);
    }
  }
  return changes;
}

ContainerScanner::ContainerScanner(runtime::IRuntimeClient &client, std::string container,
                                   std::string directory)
    : client_(client), container_(std::move(container)), directory_(std::move(directory)) {}

common::Result<runtime::ExecResult> ContainerScanner::exec(std::vector<std::string> argv,
                                                           std::string stdin_data) {
  return client_.exec(container_, runtime::ExecRequest{.argv = std::move(argv),
                                                       .workdir = directory_,
                                                       .stdin_data = std::move(stdin_data),
                                                       .merge_output = false});
}

common::Result<SnapshotCapture> ContainerScanner::capture() {
  auto clock = exec({"date", "+%s"});
  if (!clock.ok()) {
    return common::Result<SnapshotCapture>::propagate(clock);
  }
  const auto taken_at = common::parse_int(clock.value().output);
  if (clock.value().exit_code != 0 || !taken_at.has_value()) {
    return common::Result<SnapshotCapture>::failure(
        ErrorCode::RuntimeUnavailable, describe_failure("reading the container clock", clock.value()));
  }

  auto listing = scan();
  if (!listing.ok()) {
    return common::Result<SnapshotCapture>::propagate(listing);
  }

  auto tar = exec({"tar", "-chf", "-", "."});
  if (!tar.ok()) {
    return common::Result<SnapshotCapture>::propagate(tar);
  }
  if (!tolerable_exit(tar.value())) {
    return common::Result<SnapshotCapture>::failure(
        ErrorCode::RuntimeUnavailable, describe_failure("archiving " + directory_, tar.value()));
  }
  auto pre_image = archive::parse_tar(tar.value().output);
  if (!pre_image.ok()) {
    return common::Result<SnapshotCapture>::failure(ErrorCode::RuntimeUnavailable,
                                                    "unreadable snapshot archive: " +
                                                        pre_image.error());
  }

  SnapshotCapture capture;
  capture.snapshot.taken_at = *taken_at;
  capture.snapshot.files = std::move(listing.value());
  capture.pre_image = std::move(pre_image.value());
  return common::Result<SnapshotCapture>::success(std::move(capture));
}

common::Result<FileListing> ContainerScanner::scan() {
  auto listed = exec({"find", "-L", ".", "-type", "f", "-exec", "stat", "-L", "-c", "%Y %n", "{}",
                      "+"});
  if (!listed.ok()) {
    return common::Result<FileListing>::propagate(listed);
  }
  if (!tolerable_exit(listed.value())) {
    return common::Result<FileListing>::failure(
        ErrorCode::RuntimeUnavailable, describe_failure("listing " + directory_, listed.value()));
  }
  return common::Result<FileListing>::success(parse_listing(listed.value().output));
}

common::Result<archive::Archive> ContainerScanner::collect(const std::vector<std::string> &paths) {
  if (paths.empty()) {
    return common::Result<archive::Archive>::success(archive::Archive{});
  }

  std::string names;
  for (const auto &path : paths) {
    names += "./" + path + "\n";
  }
  auto tar = exec({"tar", "-chf", "-", "-T", "-"}, names);
  if (!tar.ok()) {
    return common::Result<archive::Archive>::propagate(tar);
  }
  if (!tolerable_exit(tar.value())) {
    return common::Result<archive::Archive>::failure(
        ErrorCode::RuntimeUnavailable, describe_failure("collecting changed files", tar.value()));
  }
  auto collected = archive::parse_tar(tar.value().output);
  if (!collected.ok()) {
    return common::Result<archive::Archive>::failure(ErrorCode::RuntimeUnavailable,
                                                     "unreadable changed-file archive: " +
                                                         collected.error());
  }
  return collected;
}

} // namespace runbox::sandbox
