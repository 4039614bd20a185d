#include "runbox/common/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string_view>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace runbox::common {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Drain what is available; closes the descriptor once the writer side is gone.
void read_into_buffer(int &fd, std::string &buffer) {
  if (fd < 0) {
    return;
  }
  std::array<char, 8192> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes == 0) {
      close_fd(fd);
    }
    return;
  }
}

void write_pending(int &fd, const std::string &data, std::size_t &offset) {
  while (fd >= 0 && offset < data.size()) {
    const ssize_t written = write(fd, data.data() + offset, data.size() - offset);
    if (written > 0) {
      offset += static_cast<std::size_t>(written);
      continue;
    }
    if (written < 0 && errno == EINTR) {
      continue;
    }
    if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;
    }
    // EPIPE: the child stopped reading.
    close_fd(fd);
    return;
  }
  if (offset >= data.size()) {
    close_fd(fd);
  }
}

struct Pipe {
  int read_end = -1;
  int write_end = -1;

  // Close-on-exec from creation, so a concurrent fork never inherits the other ends.
  bool open() {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
      return false;
    }
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }

  void close_both() {
    close_fd(read_end);
    close_fd(write_end);
  }
};

/// Parent environment with `overrides` replacing or adding entries.
std::vector<std::string>
merged_environment(const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> merged;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view current(*entry);
    const auto name = current.substr(0, current.find('='));
    bool replaced = false;
    for (const auto &[key, value] : overrides) {
      replaced = replaced || key == name;
    }
    if (!replaced) {
      merged.emplace_back(current);
    }
  }
  for (const auto &[key, value] : overrides) {
    merged.push_back(key + "=" + value);
  }
  return merged;
}

} // namespace

Result<ProcessResult> run_process(const std::string &program, const std::vector<std::string> &args,
                                  const ProcessOptions &options) {
  if (program.empty()) {
    return Result<ProcessResult>::failure(ErrorCode::InvalidArgument, "program is empty");
  }

  for (const auto &[key, value] : options.env) {
    if (key.empty() || key.find('=') != std::string::npos) {
      return Result<ProcessResult>::failure(ErrorCode::InvalidArgument,
                                            "invalid environment variable name '" + key + "'");
    }
  }

  // Everything the child needs is allocated here; after fork it only calls
  // async-signal-safe functions.
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(program.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const std::vector<std::string> env_storage =
      options.env.empty() ? std::vector<std::string>{} : merged_environment(options.env);
  std::vector<char *> envp;
  if (!options.env.empty()) {
    envp.reserve(env_storage.size() + 1);
    for (const auto &entry : env_storage) {
      envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);
  }

  Pipe in_pipe;
  Pipe out_pipe;
  Pipe err_pipe;
  if (!in_pipe.open() || !out_pipe.open() || (!options.merge_output && !err_pipe.open())) {
    in_pipe.close_both();
    out_pipe.close_both();
    err_pipe.close_both();
    return Result<ProcessResult>::failure(ErrorCode::RuntimeUnavailable,
                                          "failed to create pipes for " + program);
  }

  const pid_t pid = fork();
  if (pid < 0) {
    in_pipe.close_both();
    out_pipe.close_both();
    err_pipe.close_both();
    return Result<ProcessResult>::failure(ErrorCode::RuntimeUnavailable,
                                          "failed to fork " + program);
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(in_pipe.read_end, STDIN_FILENO);
    (void)dup2(out_pipe.write_end, STDOUT_FILENO);
    (void)dup2(options.merge_output ? out_pipe.write_end : err_pipe.write_end, STDERR_FILENO);
    if (options.working_dir.has_value() && chdir(options.working_dir->c_str()) != 0) {
      _exit(126);
    }

    (void)signal(SIGPIPE, SIG_DFL);
    if (envp.empty()) {
      execvp(program.c_str(), argv.data());
    } else {
      execvpe(program.c_str(), argv.data(), envp.data());
    }
    _exit(127);
  }

  (void)setpgid(pid, pid);
  close_fd(in_pipe.read_end);
  close_fd(out_pipe.write_end);
  close_fd(err_pipe.write_end);
  set_non_blocking(in_pipe.write_end);
  set_non_blocking(out_pipe.read_end);
  set_non_blocking(err_pipe.read_end);

  auto deadline = std::chrono::steady_clock::now() + options.timeout;
  if (options.deadline.has_value() && *options.deadline < deadline) {
    deadline = *options.deadline;
  }

  ProcessResult result;
  std::size_t stdin_offset = 0;
  int status = 0;
  bool exited = false;

  while (true) {
    write_pending(in_pipe.write_end, options.stdin_data, stdin_offset);
    read_into_buffer(out_pipe.read_end, result.stdout_text);
    read_into_buffer(err_pipe.read_end, result.stderr_text);

    if (!exited) {
      const pid_t waited = waitpid(pid, &status, WNOHANG);
      exited = waited == pid;
    }
    // Wait for EOF too: a grandchild may still hold the pipes after the direct child exits.
    if (exited && out_pipe.read_end < 0 && err_pipe.read_end < 0) {
      break;
    }

    const bool cancelled = options.cancel != nullptr && options.cancel->cancelled();
    if (cancelled || std::chrono::steady_clock::now() >= deadline) {
      result.cancelled = cancelled;
      result.timed_out = !cancelled;
      (void)kill(-pid, SIGKILL);
      if (!exited) {
        (void)kill(pid, SIGKILL);
        (void)waitpid(pid, &status, 0);
      }
      break;
    }

    struct pollfd poll_fds[3] = {
        {.fd = out_pipe.read_end, .events = POLLIN, .revents = 0},
        {.fd = err_pipe.read_end, .events = POLLIN, .revents = 0},
        {.fd = in_pipe.write_end, .events = POLLOUT, .revents = 0},
    };
    (void)poll(poll_fds, 3, 50);
  }

  read_into_buffer(out_pipe.read_end, result.stdout_text);
  read_into_buffer(err_pipe.read_end, result.stderr_text);
  in_pipe.close_both();
  out_pipe.close_both();
  err_pipe.close_both();

  if (result.timed_out || result.cancelled) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }

  if (result.exit_code == 127 && result.stderr_text.empty() && result.stdout_text.empty() &&
      !options.merge_output) {
    return Result<ProcessResult>::failure(ErrorCode::RuntimeUnavailable,
                                          "failed to execute " + program);
  }

  return Result<ProcessResult>::success(std::move(result));
}

} // namespace runbox::common
