#include "runbox/languages/runner.hpp"

#include "runbox/observability/global.hpp"

namespace runbox::languages {

namespace {

using common::ErrorCode;

// Ordered by language name.
const std::vector<std::string> kLanguages = {"python"};

} // namespace

common::Result<std::string>
PythonRunner::script_header(const std::vector<std::string> &dependencies) {
  if (dependencies.empty()) {
    return common::Result<std::string>::success("");
  }
  std::string header = "# /// script\n# dependencies = [\n";
  for (const auto &dependency : dependencies) {
    if (dependency.empty() || dependency.find_first_of("\"\n\r\\") != std::string::npos) {
      return common::Result<std::string>::failure(ErrorCode::InvalidArgument,
                                                  "invalid dependency specifier: " + dependency);
    }
    header += "#   \"" + dependency + "\",\n";
  }
  header += "# ]\n# ///\n\n";
  return common::Result<std::string>::success(std::move(header));
}

common::Result<archive::Archive>
PythonRunner::materialize(const std::string &code,
                          const std::vector<std::string> &dependencies) const {
  auto header = script_header(dependencies);
  if (!header.ok()) {
    return common::Result<archive::Archive>::propagate(header);
  }
  return archive::make_archive({archive::ArchiveEntry{.path = kEntryFile,
                                                      .mode = 0644,
                                                      .type = archive::EntryType::File,
                                                      .content = header.value() + code}});
}

std::vector<std::string> PythonRunner::run_commands() const {
  return {std::string("uv run ") + kEntryFile};
}

common::Result<std::unique_ptr<ILanguageRunner>>
create_language_runner(const std::string &language) {
  if (language == "python") {
    return common::Result<std::unique_ptr<ILanguageRunner>>::success(
        std::make_unique<PythonRunner>());
  }
  return common::Result<std::unique_ptr<ILanguageRunner>>::failure(
      ErrorCode::UnsupportedLanguage, "unsupported language: " + language);
}

std::vector<std::string> supported_languages() { return kLanguages; }

common::Result<PreparedProgram> prepare(const std::string &language, const std::string &code,
                                        const std::vector<std::string> &dependencies) {
  auto runner = create_language_runner(language);
  if (!runner.ok()) {
    return common::Result<PreparedProgram>::propagate(runner);
  }
  auto files = runner.value()->materialize(code, dependencies);
  if (!files.ok()) {
    return common::Result<PreparedProgram>::propagate(files);
  }
  return common::Result<PreparedProgram>::success(
      PreparedProgram{.image = runner.value()->image(),
                      .files = std::move(files.value()),
                      .commands = runner.value()->run_commands()});
}

common::Result<CodeResult> run_code(sandbox::SessionManager &manager, const CodeRequest &request) {
  auto program = prepare(request.language, request.code, request.dependencies);
  if (!program.ok()) {
    return common::Result<CodeResult>::propagate(program);
  }

  auto session_id = manager.open(sandbox::SessionOptions{.session_id = request.run_id,
                                                         .base_image = program.value().image,
                                                         .limits = sandbox::ResourceLimits{
                                                             .network_enabled = true},
                                                         .keep_image = true});
  if (!session_id.ok()) {
    return common::Result<CodeResult>::propagate(session_id);
  }

  auto outcome = manager.run(session_id.value(),
                             sandbox::RunRequest{.archive = program.value().files,
                                                 .commands = program.value().commands,
                                                 .fail_fast = true});
  if (auto closed = manager.close(session_id.value()); !closed.ok()) {
    observability::log_warn("languages", closed.error());
  }
  if (!outcome.ok()) {
    return common::Result<CodeResult>::propagate(outcome);
  }

  CodeResult result;
  for (const auto &command : outcome.value().results) {
    result.output += command.output;
    result.exit_code = command.exit_code;
  }
  return common::Result<CodeResult>::success(std::move(result));
}

} // namespace runbox::languages
