#include "runbox/runtime/docker_client.hpp"

#include "runbox/common/fs.hpp"

#include <curl/curl.h>

#include <mutex>

namespace runbox::runtime {

namespace {

constexpr const char *DEFAULT_ENGINE_SOCKET = "/var/run/docker.sock";

bool mentions_missing_object(const DockerProcessResult &result) {
  const std::string text = common::to_lower(result.stderr_text + result.stdout_text);
  return text.find("no such") != std::string::npos ||
         text.find("not found") != std::string::npos;
}

std::string first_line(const std::string &text) {
  const std::string trimmed = common::trim(text);
  const auto newline = trimmed.find('\n');
  return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

common::Status teardown_status(const common::Result<DockerProcessResult> &result,
                               const std::string &what) {
  if (!result.ok()) {
    return result.status();
  }
  if (result.value().exit_code != 0 && !mentions_missing_object(result.value())) {
    return common::Status::error(common::ErrorCode::RuntimeUnavailable,
                                 what + ": " + first_line(result.value().stderr_text));
  }
  return common::Status::success();
}

std::size_t append_body(char *ptr, std::size_t size, std::size_t nmemb, void *userdata) {
  auto *body = static_cast<std::string *>(userdata);
  if (body->size() < 64) {
    body->append(ptr, size * nmemb);
  }
  return size * nmemb;
}

} // namespace

std::pair<std::string, std::string> resolve_ping_endpoint(const std::string &host) {
  const std::string trimmed = common::trim(host);
  if (trimmed.empty()) {
    return {"http://localhost/_ping", DEFAULT_ENGINE_SOCKET};
  }
  if (common::starts_with(trimmed, "unix://")) {
    return {"http://localhost/_ping", trimmed.substr(7)};
  }
  if (trimmed.front() == '/') {
    return {"http://localhost/_ping", trimmed};
  }
  if (common::starts_with(trimmed, "tcp://")) {
    return {"http://" + trimmed.substr(6) + "/_ping", ""};
  }
  if (common::starts_with(trimmed, "http://") || common::starts_with(trimmed, "https://")) {
    std::string base = trimmed;
    while (!base.empty() && base.back() == '/') {
      base.pop_back();
    }
    return {base + "/_ping", ""};
  }
  return {"http://" + trimmed + "/_ping", ""};
}

std::vector<std::string> build_docker_create_args(const ContainerSpec &spec) {
  std::vector<std::string> args = {"create"};
  if (!spec.name.empty()) {
    args.push_back("--name");
    args.push_back(spec.name);
  }
  for (const auto &[key, value] : spec.labels) {
    args.push_back("--label");
    args.push_back(key + "=" + value);
  }
  if (!common::trim(spec.runtime).empty()) {
    args.push_back("--runtime");
    args.push_back(spec.runtime);
  }
  if (!spec.hostname.empty()) {
    args.push_back("--hostname");
    args.push_back(spec.hostname);
  }
  if (!spec.network_enabled) {
    args.push_back("--network");
    args.push_back("none");
  }
  if (spec.memory_bytes > 0) {
    args.push_back("--memory");
    args.push_back(std::to_string(spec.memory_bytes));
  }
  if (spec.cpu_shares > 0) {
    args.push_back("--cpu-shares");
    args.push_back(std::to_string(spec.cpu_shares));
  }
  for (const auto &mount : spec.mounts) {
    args.push_back("-v");
    args.push_back(mount.volume + ":" + mount.target + (mount.read_only ? ":ro" : ""));
  }
  if (!spec.entrypoint.empty()) {
    args.push_back("--entrypoint");
    args.push_back(spec.entrypoint);
  }
  args.push_back(spec.image);
  args.insert(args.end(), spec.command.begin(), spec.command.end());
  return args;
}

DockerRuntimeClient::DockerRuntimeClient(std::shared_ptr<IDockerRunner> runner,
                                         DockerClientOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {}

common::Result<bool> DockerRuntimeClient::image_exists(const std::string &image) {
  auto inspect = runner_->run({"image", "inspect", "--format", "{{.Id}}", image},
                              DockerCommandOptions{.allow_failure = true,
                                                   .timeout = options_.command_timeout});
  if (!inspect.ok()) {
    return common::Result<bool>::propagate(inspect);
  }
  if (inspect.value().exit_code == 0) {
    return common::Result<bool>::success(true);
  }
  if (mentions_missing_object(inspect.value())) {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::failure(common::ErrorCode::RuntimeUnavailable,
                                       "image inspect failed: " +
                                           first_line(inspect.value().stderr_text));
}

common::Status DockerRuntimeClient::pull_image(const std::string &image) {
  auto pulled = runner_->run({"pull", "--quiet", image},
                             DockerCommandOptions{.allow_failure = true,
                                                  .timeout = options_.pull_timeout});
  if (!pulled.ok()) {
    return pulled.status();
  }
  if (pulled.value().exit_code != 0 || pulled.value().timed_out) {
    const std::string detail = first_line(pulled.value().stderr_text);
    return common::Status::error(common::ErrorCode::ImagePull,
                                 "failed to pull image " + image +
                                     (detail.empty() ? std::string() : ": " + detail));
  }
  return common::Status::success();
}

common::Result<ImageInfo> DockerRuntimeClient::inspect_image(const std::string &image) {
  auto inspect = runner_->run(
      {"image", "inspect", "--format", "{{.Id}}\t{{.Config.WorkingDir}}\t{{.Config.User}}", image},
      DockerCommandOptions{.allow_failure = true, .timeout = options_.command_timeout});
  if (!inspect.ok()) {
    return common::Result<ImageInfo>::propagate(inspect);
  }
  if (inspect.value().exit_code != 0) {
    return common::Result<ImageInfo>::failure(common::ErrorCode::ImagePull,
                                              "failed to inspect image " + image + ": " +
                                                  first_line(inspect.value().stderr_text));
  }

  std::string line = inspect.value().stdout_text;
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  const auto fields = common::split(line, '\t');
  ImageInfo info;
  info.id = fields.empty() ? "" : fields[0];
  info.working_dir = fields.size() > 1 ? fields[1] : "";
  info.user = fields.size() > 2 ? fields[2] : "";
  return common::Result<ImageInfo>::success(std::move(info));
}

common::Status DockerRuntimeClient::remove_image(const std::string &image) {
  return teardown_status(runner_->run({"image", "rm", image},
                                      DockerCommandOptions{.allow_failure = true,
                                                           .timeout = options_.command_timeout}),
                         "failed to remove image " + image);
}

common::Result<std::string> DockerRuntimeClient::create_container(const ContainerSpec &spec) {
  auto created = runner_->run(build_docker_create_args(spec),
                              DockerCommandOptions{.allow_failure = true,
                                                   .timeout = options_.command_timeout});
  if (!created.ok()) {
    return common::Result<std::string>::propagate(created);
  }
  if (created.value().exit_code != 0) {
    return common::Result<std::string>::failure(common::ErrorCode::ContainerStart,
                                                "failed to create container from " + spec.image +
                                                    ": " + first_line(created.value().stderr_text));
  }
  const std::string id = common::trim(created.value().stdout_text);
  return common::Result<std::string>::success(id.empty() ? spec.name : id);
}

common::Status DockerRuntimeClient::start_container(const std::string &container) {
  auto started = runner_->run({"start", container},
                              DockerCommandOptions{.allow_failure = true,
                                                   .timeout = options_.command_timeout});
  if (!started.ok()) {
    return started.status();
  }
  if (started.value().exit_code != 0) {
    return common::Status::error(common::ErrorCode::ContainerStart,
                                 "failed to start container " + container + ": " +
                                     first_line(started.value().stderr_text));
  }
  return common::Status::success();
}

common::Result<bool> DockerRuntimeClient::is_running(const std::string &container) {
  auto inspect = runner_->run({"inspect", "-f", "{{.State.Running}}", container},
                              DockerCommandOptions{.allow_failure = true,
                                                   .timeout = options_.command_timeout});
  if (!inspect.ok()) {
    return common::Result<bool>::propagate(inspect);
  }
  if (inspect.value().exit_code != 0) {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::success(common::trim(inspect.value().stdout_text) == "true");
}

common::Result<ExecResult> DockerRuntimeClient::exec(const std::string &container,
                                                     const ExecRequest &request) {
  if (request.argv.empty()) {
    return common::Result<ExecResult>::failure(common::ErrorCode::InvalidArgument,
                                               "exec argv is empty");
  }

  std::vector<std::string> args = {"exec"};
  if (!request.stdin_data.empty()) {
    args.push_back("-i");
  }
  if (!request.user.empty()) {
    args.push_back("--user");
    args.push_back(request.user);
  }
  if (!request.workdir.empty()) {
    args.push_back("--workdir");
    args.push_back(request.workdir);
  }
  for (const auto &[key, value] : request.env) {
    args.push_back("-e");
    args.push_back(key + "=" + value);
  }
  args.push_back(container);
  args.insert(args.end(), request.argv.begin(), request.argv.end());

  // With a session deadline the deadline alone bounds the call.
  const auto timeout = request.deadline.has_value() ? std::chrono::milliseconds(24LL * 3600 * 1000)
                                                    : options_.command_timeout;
  auto ran = runner_->run(args, DockerCommandOptions{.allow_failure = true,
                                                     .timeout = timeout,
                                                     .deadline = request.deadline,
                                                     .cancel = request.cancel,
                                                     .stdin_data = request.stdin_data,
                                                     .merge_output = request.merge_output});
  if (!ran.ok()) {
    return common::Result<ExecResult>::propagate(ran);
  }

  auto &process = ran.value();
  return common::Result<ExecResult>::success(ExecResult{.exit_code = process.exit_code,
                                                        .output = std::move(process.stdout_text),
                                                        .error_output = std::move(process.stderr_text),
                                                        .timed_out = process.timed_out,
                                                        .cancelled = process.cancelled});
}

common::Status DockerRuntimeClient::copy_in(const std::string &container,
                                            const std::string &dest_dir,
                                            const std::string &tar_bytes) {
  auto copied = runner_->run({"cp", "-", container + ":" + dest_dir},
                             DockerCommandOptions{.allow_failure = true,
                                                  .timeout = options_.command_timeout,
                                                  .stdin_data = tar_bytes});
  if (!copied.ok()) {
    return copied.status();
  }
  if (copied.value().exit_code != 0) {
    return common::Status::error(common::ErrorCode::RuntimeUnavailable,
                                 "failed to copy archive into " + container + ":" + dest_dir +
                                     ": " + first_line(copied.value().stderr_text));
  }
  return common::Status::success();
}

common::Status DockerRuntimeClient::stop_container(const std::string &container) {
  return teardown_status(runner_->run({"stop", "--time", "1", container},
                                      DockerCommandOptions{.allow_failure = true,
                                                           .timeout = options_.command_timeout}),
                         "failed to stop container " + container);
}

common::Status DockerRuntimeClient::remove_container(const std::string &container) {
  return teardown_status(runner_->run({"rm", "-f", container},
                                      DockerCommandOptions{.allow_failure = true,
                                                           .timeout = options_.command_timeout}),
                         "failed to remove container " + container);
}

common::Status DockerRuntimeClient::create_volume(const std::string &name) {
  auto created = runner_->run({"volume", "create", "--label", "runbox.managed=1", name},
                              DockerCommandOptions{.allow_failure = true,
                                                   .timeout = options_.command_timeout});
  if (!created.ok()) {
    return created.status();
  }
  if (created.value().exit_code != 0) {
    return common::Status::error(common::ErrorCode::ContainerStart,
                                 "failed to create volume " + name + ": " +
                                     first_line(created.value().stderr_text));
  }
  return common::Status::success();
}

common::Status DockerRuntimeClient::remove_volume(const std::string &name) {
  return teardown_status(runner_->run({"volume", "rm", "-f", name},
                                      DockerCommandOptions{.allow_failure = true,
                                                           .timeout = options_.command_timeout}),
                         "failed to remove volume " + name);
}

bool DockerRuntimeClient::ping() {
  static std::once_flag curl_init;
  std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

  const auto [url, socket_path] = resolve_ping_endpoint(options_.host);
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    return false;
  }

  std::string body;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  if (!socket_path.empty()) {
    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
  }
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.ping_timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "runbox/0.1");

  const CURLcode code = curl_easy_perform(curl);
  long status = 0;
  if (code == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  }
  curl_easy_cleanup(curl);
  return code == CURLE_OK && status == 200 && common::trim(body) == "OK";
}

} // namespace runbox::runtime
