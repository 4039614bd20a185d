#include "runbox/archive/archive.hpp"

#include "runbox/common/crypto.hpp"
#include "runbox/common/fs.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <array>
#include <functional>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace runbox::archive {

namespace {

constexpr std::size_t kChunk = 64 * 1024;

using common::ErrorCode;

template <typename T> common::Result<T> format_error(const std::string &message) {
  return common::Result<T>::failure(ErrorCode::ArchiveFormat, message);
}

std::string parent_of(const std::string &path) {
  const auto slash = path.rfind('/');
  return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

// `archive` names this namespace, so the libarchive handle is spelled from the global scope.
using Handle = ::archive;

struct ReaderDeleter {
  void operator()(Handle *handle) const { archive_read_free(handle); }
};

struct WriterDeleter {
  void operator()(Handle *handle) const { archive_write_free(handle); }
};

struct EntryDeleter {
  void operator()(archive_entry *entry) const { archive_entry_free(entry); }
};

using Reader = std::unique_ptr<Handle, ReaderDeleter>;
using Writer = std::unique_ptr<Handle, WriterDeleter>;
using Entry = std::unique_ptr<archive_entry, EntryDeleter>;

std::string library_error(Handle *handle, const std::string &what) {
  const char *detail = archive_error_string(handle);
  return what + ": " + (detail != nullptr ? detail : "unknown libarchive error");
}

la_ssize_t append_output(Handle *, void *client_data, const void *buffer, std::size_t length) {
  static_cast<std::string *>(client_data)->append(static_cast<const char *>(buffer), length);
  return static_cast<la_ssize_t>(length);
}

common::Status read_content(Handle *reader, const std::string &path, std::string &content,
                            std::size_t &expanded, const std::size_t max_bytes) {
  std::array<char, kChunk> chunk{};
  while (true) {
    const la_ssize_t read = archive_read_data(reader, chunk.data(), chunk.size());
    if (read == 0) {
      return common::Status::success();
    }
    if (read < 0) {
      return common::Status::error(ErrorCode::ArchiveFormat,
                                   library_error(reader, "tar entry " + path + " is unreadable"));
    }
    expanded += static_cast<std::size_t>(read);
    if (expanded > max_bytes) {
      return common::Status::error(ErrorCode::ArchiveFormat,
                                   "archive expands beyond " + std::to_string(max_bytes) +
                                       " bytes");
    }
    content.append(chunk.data(), static_cast<std::size_t>(read));
  }
}

common::Status write_entry(Handle *writer, const ArchiveEntry &entry) {
  Entry header(archive_entry_new());
  if (!header) {
    return common::Status::error(ErrorCode::Internal, "archive_entry_new failed");
  }
  archive_entry_set_pathname(header.get(), entry.path.c_str());
  archive_entry_set_mtime(header.get(), entry.mtime, 0);
  archive_entry_set_uid(header.get(), 0);
  archive_entry_set_gid(header.get(), 0);
  archive_entry_set_uname(header.get(), "root");
  archive_entry_set_gname(header.get(), "root");

  switch (entry.type) {
  case EntryType::File:
    archive_entry_set_filetype(header.get(), AE_IFREG);
    archive_entry_set_perm(header.get(), entry.mode);
    archive_entry_set_size(header.get(), static_cast<la_int64_t>(entry.content.size()));
    break;
  case EntryType::Directory:
    archive_entry_set_filetype(header.get(), AE_IFDIR);
    archive_entry_set_perm(header.get(), entry.mode);
    archive_entry_set_size(header.get(), 0);
    break;
  case EntryType::Symlink:
    archive_entry_set_filetype(header.get(), AE_IFLNK);
    archive_entry_set_perm(header.get(), entry.mode == 0 ? 0777 : entry.mode);
    archive_entry_set_symlink(header.get(), entry.link_target.c_str());
    archive_entry_set_size(header.get(), 0);
    break;
  }

  if (archive_write_header(writer, header.get()) < ARCHIVE_WARN) {
    return common::Status::error(ErrorCode::Internal,
                                 library_error(writer, "cannot write tar header for " + entry.path));
  }
  std::size_t offset = 0;
  while (entry.type == EntryType::File && offset < entry.content.size()) {
    const la_ssize_t written = archive_write_data(writer, entry.content.data() + offset,
                                                  entry.content.size() - offset);
    if (written <= 0) {
      return common::Status::error(ErrorCode::Internal,
                                   library_error(writer, "cannot write tar data for " + entry.path));
    }
    offset += static_cast<std::size_t>(written);
  }
  return common::Status::success();
}

common::Status check_symlink(const ArchiveEntry &entry) {
  if (entry.link_target.empty()) {
    return common::Status::error(ErrorCode::ArchiveFormat,
                                 "symlink has an empty target: " + entry.path);
  }
  if (entry.link_target.front() == '/') {
    return common::Status::error(ErrorCode::ArchiveFormat,
                                 "symlink points outside the archive: " + entry.path + " -> " +
                                     entry.link_target);
  }
  std::vector<std::string> resolved;
  const std::string parent = parent_of(entry.path);
  if (!parent.empty()) {
    resolved = common::split(parent, '/');
  }
  for (const auto &part : common::split(entry.link_target, '/')) {
    if (part.empty() || part == ".") {
      continue;
    }
    if (part == "..") {
      if (resolved.empty()) {
        return common::Status::error(ErrorCode::ArchiveFormat,
                                     "symlink points outside the archive: " + entry.path +
                                         " -> " + entry.link_target);
      }
      resolved.pop_back();
      continue;
    }
    resolved.push_back(part);
  }
  return common::Status::success();
}

} // namespace

const ArchiveEntry *Archive::find(const std::string &path) const {
  for (const auto &entry : entries) {
    if (entry.path == path) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<std::string> Archive::file_paths() const {
  std::vector<std::string> paths;
  for (const auto &entry : entries) {
    if (entry.type != EntryType::Directory) {
      paths.push_back(entry.path);
    }
  }
  return paths;
}

common::Result<std::string> normalize_path(const std::string &raw) {
  if (raw.empty()) {
    return format_error<std::string>("archive entry has an empty path");
  }
  if (raw.front() == '/') {
    return format_error<std::string>("archive entry has an absolute path: " + raw);
  }
  std::vector<std::string> parts;
  for (auto &part : common::split(raw, '/')) {
    if (part.empty() || part == ".") {
      continue;
    }
    if (part == "..") {
      return format_error<std::string>("archive entry escapes the archive root: " + raw);
    }
    parts.push_back(std::move(part));
  }
  return common::Result<std::string>::success(common::join(parts, "/"));
}

common::Result<Archive> make_archive(std::vector<ArchiveEntry> entries) {
  Archive archive;
  std::unordered_map<std::string, std::size_t> index;

  // Walks up to the root so parents are pushed before children.
  std::function<common::Status(const std::string &, std::int64_t)> ensure_directory =
      [&](const std::string &path, const std::int64_t mtime) -> common::Status {
    if (path.empty()) {
      return common::Status::success();
    }
    if (const auto it = index.find(path); it != index.end()) {
      if (archive.entries[it->second].type != EntryType::Directory) {
        return common::Status::error(ErrorCode::ArchiveFormat,
                                     "archive uses a non-directory as a directory: " + path);
      }
      return common::Status::success();
    }
    if (auto parent = ensure_directory(parent_of(path), mtime); !parent.ok()) {
      return parent;
    }
    index[path] = archive.entries.size();
    archive.entries.push_back(ArchiveEntry{
        .path = path, .mode = 0755, .type = EntryType::Directory, .mtime = mtime});
    return common::Status::success();
  };

  for (auto &entry : entries) {
    auto normalized = normalize_path(entry.path);
    if (!normalized.ok()) {
      return common::Result<Archive>::propagate(normalized);
    }
    if (normalized.value().empty()) {
      if (entry.type == EntryType::Directory) {
        continue;
      }
      return format_error<Archive>("archive entry replaces the archive root: " + entry.path);
    }
    entry.path = normalized.value();
    if (entry.type == EntryType::Symlink) {
      if (auto status = check_symlink(entry); !status.ok()) {
        return common::Result<Archive>::failure(status);
      }
    }
    if (auto parent = ensure_directory(parent_of(entry.path), entry.mtime); !parent.ok()) {
      return common::Result<Archive>::failure(parent);
    }

    const auto existing = index.find(entry.path);
    if (existing == index.end()) {
      index[entry.path] = archive.entries.size();
      archive.entries.push_back(std::move(entry));
      continue;
    }
    auto &current = archive.entries[existing->second];
    const bool current_dir = current.type == EntryType::Directory;
    const bool next_dir = entry.type == EntryType::Directory;
    if (current_dir != next_dir) {
      return format_error<Archive>("archive entry is both a file and a directory: " +
                                   entry.path);
    }
    if (next_dir) {
      current.mode = entry.mode;
      current.mtime = entry.mtime;
    } else {
      current = std::move(entry);
    }
  }

  return common::Result<Archive>::success(std::move(archive));
}

common::Result<Archive> parse_tar(const std::string &bytes, const std::size_t max_bytes) {
  Reader reader(archive_read_new());
  if (!reader) {
    return common::Result<Archive>::failure(ErrorCode::Internal, "archive_read_new failed");
  }
  archive_read_support_filter_gzip(reader.get());
  archive_read_support_format_tar(reader.get());
  if (archive_read_open_memory(reader.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
    return format_error<Archive>(library_error(reader.get(), "unreadable tar stream"));
  }

  std::vector<ArchiveEntry> entries;
  std::size_t expanded = 0;
  archive_entry *header = nullptr;
  while (true) {
    const int rc = archive_read_next_header(reader.get(), &header);
    if (rc == ARCHIVE_EOF) {
      break;
    }
    if (rc < ARCHIVE_WARN) {
      return format_error<Archive>(library_error(reader.get(), "corrupt tar stream"));
    }

    const char *raw_path = archive_entry_pathname(header);
    ArchiveEntry entry;
    entry.path = raw_path != nullptr ? raw_path : "";
    entry.mode = static_cast<std::uint32_t>(archive_entry_perm(header)) & 07777U;
    entry.mtime = static_cast<std::int64_t>(archive_entry_mtime(header));

    if (const char *hardlink = archive_entry_hardlink(header); hardlink != nullptr) {
      auto target = normalize_path(hardlink);
      if (!target.ok()) {
        return common::Result<Archive>::propagate(target);
      }
      const auto source =
          std::find_if(entries.rbegin(), entries.rend(), [&](const ArchiveEntry &candidate) {
            const auto path = normalize_path(candidate.path);
            return candidate.type == EntryType::File && path.ok() && path.value() == target.value();
          });
      if (source == entries.rend()) {
        return format_error<Archive>("hard link to a missing entry: " + entry.path + " -> " +
                                     hardlink);
      }
      entry.content = source->content;
      entries.push_back(std::move(entry));
      continue;
    }

    switch (archive_entry_filetype(header)) {
    case AE_IFREG:
      if (auto status = read_content(reader.get(), entry.path, entry.content, expanded, max_bytes);
          !status.ok()) {
        return common::Result<Archive>::failure(status);
      }
      break;
    case AE_IFDIR:
      entry.type = EntryType::Directory;
      break;
    case AE_IFLNK: {
      const char *target = archive_entry_symlink(header);
      entry.type = EntryType::Symlink;
      entry.link_target = target != nullptr ? target : "";
      break;
    }
    default:
      return format_error<Archive>("unsupported tar entry type for " + entry.path);
    }
    entries.push_back(std::move(entry));
  }

  return make_archive(std::move(entries));
}

common::Result<std::string> write_tar(const Archive &archive, const Compression compression) {
  Writer writer(archive_write_new());
  if (!writer) {
    return common::Result<std::string>::failure(ErrorCode::Internal, "archive_write_new failed");
  }
  std::string out;
  const int filter = compression == Compression::Gzip ? archive_write_add_filter_gzip(writer.get())
                                                      : archive_write_add_filter_none(writer.get());
  if (filter != ARCHIVE_OK || archive_write_set_format_pax_restricted(writer.get()) != ARCHIVE_OK ||
      archive_write_set_bytes_in_last_block(writer.get(), 1) != ARCHIVE_OK ||
      archive_write_open(writer.get(), &out, nullptr, append_output, nullptr) != ARCHIVE_OK) {
    return common::Result<std::string>::failure(
        ErrorCode::Internal, library_error(writer.get(), "cannot start tar stream"));
  }

  for (const auto &entry : archive.entries) {
    if (auto status = write_entry(writer.get(), entry); !status.ok()) {
      return common::Result<std::string>::failure(status);
    }
  }
  if (archive_write_close(writer.get()) != ARCHIVE_OK) {
    return common::Result<std::string>::failure(
        ErrorCode::Internal, library_error(writer.get(), "cannot finish tar stream"));
  }
  return common::Result<std::string>::success(std::move(out));
}

common::Result<Archive> decode(const std::string &base64_text) {
  auto raw = common::base64_decode(base64_text);
  if (!raw.ok()) {
    return common::Result<Archive>::failure(ErrorCode::ArchiveFormat, raw.error());
  }
  if (raw.value().empty()) {
    return common::Result<Archive>::success(Archive{});
  }
  return parse_tar(raw.value());
}

Archive select(const Archive &archive, const std::vector<std::string> &paths) {
  std::unordered_set<std::string> wanted;
  for (const auto &path : paths) {
    std::string current = path;
    while (!current.empty() && wanted.insert(current).second) {
      current = parent_of(current);
    }
  }
  Archive selected;
  for (const auto &entry : archive.entries) {
    if (wanted.contains(entry.path)) {
      selected.entries.push_back(entry);
    }
  }
  return selected;
}

common::Result<std::string> encode(const Archive &archive, const std::vector<std::string> &paths) {
  return encode(select(archive, paths));
}

common::Result<std::string> encode(const Archive &archive) {
  auto compressed = write_tar(archive, Compression::Gzip);
  if (!compressed.ok()) {
    return compressed;
  }
  return common::Result<std::string>::success(common::base64_encode(compressed.value()));
}

} // namespace runbox::archive
