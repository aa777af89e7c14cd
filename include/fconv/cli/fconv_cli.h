#pragma once

namespace fconv::cli {

/**
 * The `fconv` command line: convert, status and gen-cert.
 *
 * run() returns the process exit code, 0 on success and 1 on any failure
 * (including argument errors). `--help` and `--version` return 0.
 */
class FconvCli {
public:
    int run(int argc, char* argv[]);
};

} // namespace fconv::cli
