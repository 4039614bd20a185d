#pragma once

namespace runbox::cli {

/// Entry point of the runboxd binary; returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace runbox::cli
