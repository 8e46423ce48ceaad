#pragma once

#include <string>

namespace chronicle::cli {

[[nodiscard]] std::string version_string();

/// Entry point of the `chronicle` inspection tool. Results go to stdout as JSON,
/// errors to stderr with a non-zero exit code.
int run_cli(int argc, char **argv);

} // namespace chronicle::cli
