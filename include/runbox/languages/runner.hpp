#pragma once

#include "runbox/archive/archive.hpp"
#include "runbox/common/result.hpp"
#include "runbox/sandbox/manager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runbox::languages {

/// Turns a code snippet into files plus the commands that run it.
class ILanguageRunner {
public:
  virtual ~ILanguageRunner() = default;

  [[nodiscard]] virtual std::string_view language() const = 0;
  [[nodiscard]] virtual std::string image() const = 0;
  [[nodiscard]] virtual common::Result<archive::Archive>
  materialize(const std::string &code, const std::vector<std::string> &dependencies) const = 0;
  [[nodiscard]] virtual std::vector<std::string> run_commands() const = 0;
};

/// Runs code with uv; dependencies go into an inline script metadata block.
class PythonRunner final : public ILanguageRunner {
public:
  static constexpr const char *kImage = "ghcr.io/astral-sh/uv:python3.12-bookworm-slim";
  static constexpr const char *kEntryFile = "main.py";

  [[nodiscard]] std::string_view language() const override { return "python"; }
  [[nodiscard]] std::string image() const override { return kImage; }
  [[nodiscard]] common::Result<archive::Archive>
  materialize(const std::string &code, const std::vector<std::string> &dependencies) const override;
  [[nodiscard]] std::vector<std::string> run_commands() const override;

  [[nodiscard]] static common::Result<std::string>
  script_header(const std::vector<std::string> &dependencies);
};

[[nodiscard]] common::Result<std::unique_ptr<ILanguageRunner>>
create_language_runner(const std::string &language);
[[nodiscard]] std::vector<std::string> supported_languages();

struct PreparedProgram {
  std::string image;
  archive::Archive files;
  std::vector<std::string> commands;
};

[[nodiscard]] common::Result<PreparedProgram> prepare(const std::string &language,
                                                      const std::string &code,
                                                      const std::vector<std::string> &dependencies);

struct CodeRequest {
  std::optional<std::string> run_id;
  std::string language;
  std::string code;
  std::vector<std::string> dependencies;
};

struct CodeResult {
  std::string output;
  int exit_code = 0;
};

/// One-shot session: open (image kept), run fail-fast, close.
[[nodiscard]] common::Result<CodeResult> run_code(sandbox::SessionManager &manager,
                                                  const CodeRequest &request);

} // namespace runbox::languages
