#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<runbox::tests::TestCase> &tests);
void register_config_tests(std::vector<runbox::tests::TestCase> &tests);
void register_observability_tests(std::vector<runbox::tests::TestCase> &tests);
void register_process_tests(std::vector<runbox::tests::TestCase> &tests);
void register_archive_tests(std::vector<runbox::tests::TestCase> &tests);
void register_diff_tests(std::vector<runbox::tests::TestCase> &tests);
void register_changes_tests(std::vector<runbox::tests::TestCase> &tests);
void register_docker_client_tests(std::vector<runbox::tests::TestCase> &tests);
void register_executor_tests(std::vector<runbox::tests::TestCase> &tests);
void register_sessions_tests(std::vector<runbox::tests::TestCase> &tests);
void register_languages_tests(std::vector<runbox::tests::TestCase> &tests);
void register_gateway_tests(std::vector<runbox::tests::TestCase> &tests);
void register_cli_tests(std::vector<runbox::tests::TestCase> &tests);

int main(int argc, char **argv) {
  // Gateway tests write to sockets the peer may already have closed.
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<runbox::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_process_tests(tests);
  register_archive_tests(tests);
  register_diff_tests(tests);
  register_changes_tests(tests);
  register_docker_client_tests(tests);
  register_executor_tests(tests);
  register_sessions_tests(tests);
  register_languages_tests(tests);
  register_gateway_tests(tests);
  register_cli_tests(tests);

  const std::string filter = argc > 1 ? argv[1] : "";
  const auto summary = runbox::tests::run_tests(tests, filter);

  std::cout << "Ran " << summary.selected << " tests: " << summary.passed << " passed, "
            << summary.failed << " failed\n";
  if (summary.selected == 0) {
    std::cerr << "no test matches '" << filter << "'\n";
    return 1;
  }
  return summary.failed == 0 ? 0 : 1;
}
