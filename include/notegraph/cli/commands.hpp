#pragma once

namespace notegraph::cli {

/// Entry point of the `notegraph` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace notegraph::cli
