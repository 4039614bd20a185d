#include "runbox/archive/diff.hpp"

#include "runbox/common/fs.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <set>

namespace runbox::archive {

namespace {

using common::ErrorCode;

// Above this edit distance the middle section is emitted as one replacement.
constexpr std::size_t kMaxEditDistance = 2048;

enum class Op { Equal, Delete, Insert };

struct Edit {
  Op op = Op::Equal;
  std::size_t old_index = 0;
  std::size_t new_index = 0;
};

std::vector<std::string> split_lines(const std::string &content) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < content.size()) {
    const auto newline = content.find('\n', start);
    if (newline == std::string::npos) {
      lines.push_back(content.substr(start));
      break;
    }
    lines.push_back(content.substr(start, newline - start + 1));
    start = newline + 1;
  }
  return lines;
}

// Myers' O(ND) shortest edit script over [lo_a, hi_a) x [lo_b, hi_b).
std::optional<std::vector<Edit>> myers(const std::vector<std::string> &a,
                                       const std::vector<std::string> &b, const std::size_t lo_a,
                                       const std::size_t hi_a, const std::size_t lo_b,
                                       const std::size_t hi_b) {
  const auto n = static_cast<long>(hi_a - lo_a);
  const auto m = static_cast<long>(hi_b - lo_b);
  const long max = n + m;
  const long offset = max + 1;
  std::vector<long> v(static_cast<std::size_t>(2 * max + 3), 0);
  std::vector<std::vector<long>> trace;

  long found = -1;
  for (long d = 0; d <= max; ++d) {
    if (static_cast<std::size_t>(d) > kMaxEditDistance) {
      return std::nullopt;
    }
    // Only diagonals [-d-1, d+1] are read when backtracking step d.
    trace.emplace_back(v.begin() + (offset - d - 1), v.begin() + (offset + d + 2));
    for (long k = -d; k <= d; k += 2) {
      long x = 0;
      if (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1])) {
        x = v[offset + k + 1];
      } else {
        x = v[offset + k - 1] + 1;
      }
      long y = x - k;
      while (x < n && y < m && a[lo_a + x] == b[lo_b + y]) {
        ++x;
        ++y;
      }
      v[offset + k] = x;
      if (x >= n && y >= m) {
        found = d;
        break;
      }
    }
    if (found >= 0) {
      break;
    }
  }

  std::vector<Edit> edits;
  long x = n;
  long y = m;
  for (long d = found; d >= 0; --d) {
    const auto &slice = trace[static_cast<std::size_t>(d)];
    const auto prev = [&](const long diagonal) {
      return slice[static_cast<std::size_t>(diagonal + d + 1)];
    };
    const long k = x - y;
    long prev_k = 0;
    if (k == -d || (k != d && prev(k - 1) < prev(k + 1))) {
      prev_k = k + 1;
    } else {
      prev_k = k - 1;
    }
    const long prev_x = prev(prev_k);
    const long prev_y = prev_x - prev_k;
    while (x > prev_x && y > prev_y) {
      --x;
      --y;
      edits.push_back(Edit{Op::Equal, lo_a + static_cast<std::size_t>(x),
                           lo_b + static_cast<std::size_t>(y)});
    }
    if (d > 0) {
      if (x == prev_x) {
        edits.push_back(Edit{Op::Insert, lo_a + static_cast<std::size_t>(prev_x),
                             lo_b + static_cast<std::size_t>(prev_y)});
      } else {
        edits.push_back(Edit{Op::Delete, lo_a + static_cast<std::size_t>(prev_x),
                             lo_b + static_cast<std::size_t>(prev_y)});
      }
    }
    x = prev_x;
    y = prev_y;
  }
  std::reverse(edits.begin(), edits.end());
  return edits;
}

std::vector<Edit> compute_edits(const std::vector<std::string> &a,
                                const std::vector<std::string> &b) {
  std::size_t prefix = 0;
  while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
    ++prefix;
  }
  std::size_t suffix = 0;
  while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
         a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
    ++suffix;
  }

  std::vector<Edit> edits;
  for (std::size_t i = 0; i < prefix; ++i) {
    edits.push_back(Edit{Op::Equal, i, i});
  }

  const std::size_t hi_a = a.size() - suffix;
  const std::size_t hi_b = b.size() - suffix;
  auto middle = myers(a, b, prefix, hi_a, prefix, hi_b);
  if (middle.has_value()) {
    edits.insert(edits.end(), middle->begin(), middle->end());
  } else {
    for (std::size_t i = prefix; i < hi_a; ++i) {
      edits.push_back(Edit{Op::Delete, i, prefix});
    }
    for (std::size_t j = prefix; j < hi_b; ++j) {
      edits.push_back(Edit{Op::Insert, hi_a, j});
    }
  }

  for (std::size_t i = 0; i < suffix; ++i) {
    edits.push_back(Edit{Op::Equal, hi_a + i, hi_b + i});
  }
  return edits;
}

std::string range_text(const std::size_t first_index, const std::size_t length) {
  const std::size_t start = length == 0 ? first_index : first_index + 1;
  if (length == 1) {
    return std::to_string(start);
  }
  return std::to_string(start) + "," + std::to_string(length);
}

void append_line(std::string &out, const char prefix, const std::string &line) {
  out.push_back(prefix);
  out += line;
  if (line.empty() || line.back() != '\n') {
    out += "\n\\ No newline at end of file\n";
  }
}

std::string git_mode(const ArchiveEntry &entry) {
  if (entry.type == EntryType::Symlink) {
    return "120000";
  }
  return (entry.mode & 0111U) != 0 ? "100755" : "100644";
}

const ArchiveEntry *find_leaf(const Archive &archive, const std::string &path) {
  const ArchiveEntry *entry = archive.find(path);
  if (entry == nullptr || entry->type == EntryType::Directory) {
    return nullptr;
  }
  return entry;
}

const std::string &leaf_content(const ArchiveEntry &entry) {
  return entry.type == EntryType::Symlink ? entry.link_target : entry.content;
}

struct HunkLine {
  char op = ' ';
  std::string text;
};

struct Hunk {
  std::size_t old_start = 0;
  std::size_t old_length = 0;
  std::vector<HunkLine> lines;
};

struct FilePatch {
  std::string path;
  bool created = false;
  bool deleted = false;
  bool binary = false;
  std::optional<std::uint32_t> mode;
  std::vector<Hunk> hunks;
};

std::optional<std::pair<std::size_t, std::size_t>> parse_range(const std::string &text) {
  const auto comma = text.find(',');
  const auto start = common::parse_int(text.substr(0, comma));
  std::optional<std::int64_t> length = 1;
  if (comma != std::string::npos) {
    length = common::parse_int(text.substr(comma + 1));
  }
  if (!start.has_value() || !length.has_value() || *start < 0 || *length < 0) {
    return std::nullopt;
  }
  return std::make_pair(static_cast<std::size_t>(*start), static_cast<std::size_t>(*length));
}

std::optional<std::uint32_t> parse_git_mode(const std::string &text) {
  const std::string mode = common::trim(text);
  if (mode == "100755") {
    return 0755;
  }
  if (mode == "100644") {
    return 0644;
  }
  return std::nullopt;
}

common::Result<std::vector<FilePatch>> parse_patch(const std::string &patch) {
  using ParseResult = common::Result<std::vector<FilePatch>>;
  std::vector<FilePatch> files;
  std::vector<std::string> lines = common::split(patch, '\n');
  if (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  std::size_t i = 0;
  while (i < lines.size()) {
    const std::string &line = lines[i];
    if (common::starts_with(line, "diff --git ")) {
      const std::string rest = line.substr(11);
      const auto split_at = rest.find(" b/");
      if (!common::starts_with(rest, "a/") || split_at == std::string::npos) {
        return ParseResult::failure(ErrorCode::InvalidArgument, "malformed diff header: " + line);
      }
      files.push_back(FilePatch{.path = rest.substr(split_at + 3)});
      ++i;
      continue;
    }
    if (files.empty()) {
      ++i;
      continue;
    }

    FilePatch &file = files.back();
    if (common::starts_with(line, "new file mode ")) {
      file.created = true;
      file.mode = parse_git_mode(line.substr(14));
    } else if (common::starts_with(line, "deleted file mode ")) {
      file.deleted = true;
    } else if (common::starts_with(line, "new mode ")) {
      file.mode = parse_git_mode(line.substr(9));
    } else if (common::starts_with(line, "Binary files ")) {
      file.binary = true;
    } else if (common::starts_with(line, "@@ -")) {
      const auto plus = line.find(" +", 4);
      const auto close = line.find(" @@", plus == std::string::npos ? 4 : plus);
      if (plus == std::string::npos || close == std::string::npos) {
        return ParseResult::failure(ErrorCode::InvalidArgument, "malformed hunk header: " + line);
      }
      const auto old_range = parse_range(line.substr(4, plus - 4));
      const auto new_range = parse_range(line.substr(plus + 2, close - plus - 2));
      if (!old_range.has_value() || !new_range.has_value()) {
        return ParseResult::failure(ErrorCode::InvalidArgument, "malformed hunk range: " + line);
      }

      Hunk hunk{.old_start = old_range->first, .old_length = old_range->second};
      std::size_t old_left = old_range->second;
      std::size_t new_left = new_range->second;
      ++i;
      while (i < lines.size() && (old_left > 0 || new_left > 0 ||
                                  common::starts_with(lines[i], "\\"))) {
        const std::string &body = lines[i];
        if (common::starts_with(body, "\\")) {
          if (!hunk.lines.empty() && !hunk.lines.back().text.empty()) {
            hunk.lines.back().text.pop_back();
          }
          ++i;
          continue;
        }
        const char op = body.empty() ? ' ' : body.front();
        const std::string text = (body.empty() ? std::string() : body.substr(1)) + "\n";
        if (op == ' ' && old_left > 0 && new_left > 0) {
          --old_left;
          --new_left;
        } else if (op == '-' && old_left > 0) {
          --old_left;
        } else if (op == '+' && new_left > 0) {
          --new_left;
        } else {
          return ParseResult::failure(ErrorCode::InvalidArgument,
                                      "hunk body does not match its header for " + file.path);
        }
        hunk.lines.push_back(HunkLine{op, text});
        ++i;
      }
      if (old_left > 0 || new_left > 0) {
        return ParseResult::failure(ErrorCode::InvalidArgument, "truncated hunk for " + file.path);
      }
      file.hunks.push_back(std::move(hunk));
      continue;
    }
    ++i;
  }
  return ParseResult::success(std::move(files));
}

} // namespace

bool looks_binary(const std::string &content, const std::size_t sniff_bytes) {
  const std::size_t limit = std::min(content.size(), sniff_bytes);
  return content.find('\0') < limit;
}

std::string diff_lines(const std::string &before, const std::string &after,
                       const DiffOptions &options) {
  const auto old_lines = split_lines(before);
  const auto new_lines = split_lines(after);
  const auto edits = compute_edits(old_lines, new_lines);
  const std::size_t ctx = options.context_lines;
  const std::size_t count = edits.size();

  std::string out;
  std::size_t i = 0;
  while (i < count) {
    while (i < count && edits[i].op == Op::Equal) {
      ++i;
    }
    if (i == count) {
      break;
    }

    const std::size_t start = i >= ctx ? i - ctx : 0;
    std::size_t j = i;
    std::size_t end = i;
    while (true) {
      while (j < count && edits[j].op != Op::Equal) {
        ++j;
      }
      end = j;
      std::size_t k = j;
      while (k < count && edits[k].op == Op::Equal) {
        ++k;
      }
      if (k < count && k - j <= 2 * ctx) {
        j = k;
        continue;
      }
      break;
    }
    const std::size_t stop = std::min(count, end + ctx);

    std::size_t old_length = 0;
    std::size_t new_length = 0;
    for (std::size_t e = start; e < stop; ++e) {
      if (edits[e].op != Op::Insert) {
        ++old_length;
      }
      if (edits[e].op != Op::Delete) {
        ++new_length;
      }
    }
    out += "@@ -" + range_text(edits[start].old_index, old_length) + " +" +
           range_text(edits[start].new_index, new_length) + " @@\n";
    for (std::size_t e = start; e < stop; ++e) {
      switch (edits[e].op) {
      case Op::Equal:
        append_line(out, ' ', old_lines[edits[e].old_index]);
        break;
      case Op::Delete:
        append_line(out, '-', old_lines[edits[e].old_index]);
        break;
      case Op::Insert:
        append_line(out, '+', new_lines[edits[e].new_index]);
        break;
      }
    }
    i = stop;
  }
  return out;
}

std::string make_patch(const Archive &before, const Archive &after,
                       std::vector<std::string> paths, const DiffOptions &options) {
  std::sort(paths.begin(), paths.end());
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

  std::string patch;
  for (const auto &path : paths) {
    const ArchiveEntry *old_entry = find_leaf(before, path);
    const ArchiveEntry *new_entry = find_leaf(after, path);
    if (old_entry == nullptr && new_entry == nullptr) {
      continue;
    }

    static const std::string kEmpty;
    const std::string &old_content = old_entry != nullptr ? leaf_content(*old_entry) : kEmpty;
    const std::string &new_content = new_entry != nullptr ? leaf_content(*new_entry) : kEmpty;
    const bool mode_changed = old_entry != nullptr && new_entry != nullptr &&
                              git_mode(*old_entry) != git_mode(*new_entry);
    if (old_entry != nullptr && new_entry != nullptr && old_content == new_content &&
        !mode_changed) {
      continue;
    }

    std::string section = "diff --git a/" + path + " b/" + path + "\n";
    if (old_entry == nullptr) {
      section += "new file mode " + git_mode(*new_entry) + "\n";
    } else if (new_entry == nullptr) {
      section += "deleted file mode " + git_mode(*old_entry) + "\n";
    } else if (mode_changed) {
      section += "old mode " + git_mode(*old_entry) + "\n";
      section += "new mode " + git_mode(*new_entry) + "\n";
    }

    const std::string old_name = old_entry != nullptr ? "a/" + path : "/dev/null";
    const std::string new_name = new_entry != nullptr ? "b/" + path : "/dev/null";
    if (old_content != new_content) {
      if (looks_binary(old_content, options.binary_sniff_bytes) ||
          looks_binary(new_content, options.binary_sniff_bytes)) {
        section += "Binary files " + old_name + " and " + new_name + " differ\n";
      } else {
        section += "--- " + old_name + "\n";
        section += "+++ " + new_name + "\n";
        section += diff_lines(old_content, new_content, options);
      }
    }
    patch += section;
  }
  return patch;
}

common::Result<Archive> apply_patch(const Archive &before, const std::string &patch) {
  auto parsed = parse_patch(patch);
  if (!parsed.ok()) {
    return common::Result<Archive>::propagate(parsed);
  }

  std::vector<ArchiveEntry> entries = before.entries;
  std::set<std::string> removed;
  for (const auto &file : parsed.value()) {
    if (file.binary) {
      return common::Result<Archive>::failure(ErrorCode::InvalidArgument,
                                              "binary patch sections cannot be applied: " +
                                                  file.path);
    }

    auto existing = std::find_if(entries.begin(), entries.end(), [&](const ArchiveEntry &e) {
      return e.path == file.path && e.type != EntryType::Directory && !removed.contains(e.path);
    });
    if (!file.created && existing == entries.end()) {
      return common::Result<Archive>::failure(ErrorCode::InvalidArgument,
                                              "patch modifies a missing file: " + file.path);
    }

    const std::string old_content =
        (file.created || existing == entries.end()) ? std::string() : leaf_content(*existing);
    const auto old_lines = split_lines(old_content);
    std::string result;
    std::size_t cursor = 0;
    for (const auto &hunk : file.hunks) {
      const std::size_t start = hunk.old_length == 0 ? hunk.old_start : hunk.old_start - 1;
      if (start < cursor || start > old_lines.size()) {
        return common::Result<Archive>::failure(ErrorCode::InvalidArgument,
                                                "hunk out of range for " + file.path);
      }
      for (; cursor < start; ++cursor) {
        result += old_lines[cursor];
      }
      for (const auto &line : hunk.lines) {
        if (line.op == '+') {
          result += line.text;
          continue;
        }
        if (cursor >= old_lines.size() || old_lines[cursor] != line.text) {
          return common::Result<Archive>::failure(ErrorCode::InvalidArgument,
                                                  "patch does not apply to " + file.path);
        }
        if (line.op == ' ') {
          result += line.text;
        }
        ++cursor;
      }
    }
    for (; cursor < old_lines.size(); ++cursor) {
      result += old_lines[cursor];
    }

    if (file.deleted) {
      removed.insert(file.path);
      continue;
    }
    if (existing == entries.end()) {
      entries.push_back(ArchiveEntry{.path = file.path,
                                     .mode = file.mode.value_or(0644),
                                     .type = EntryType::File,
                                     .content = std::move(result)});
      continue;
    }
    existing->type = EntryType::File;
    existing->content = std::move(result);
    existing->link_target.clear();
    if (file.mode.has_value()) {
      existing->mode = *file.mode;
    }
  }

  std::erase_if(entries, [&](const ArchiveEntry &e) {
    return e.type != EntryType::Directory && removed.contains(e.path);
  });
  return make_archive(std::move(entries));
}

} // namespace runbox::archive
