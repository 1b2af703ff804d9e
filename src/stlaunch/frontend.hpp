#pragma once

#include <cstdio>
#include <filesystem>

struct StartParameters {
    std::filesystem::path run_config{};
    bool dry_run = false;
    bool ignore_failures = false;
    bool verbose = false;
    bool quiet = false;
};

enum ExitStatus {
    EXIT_STATUS_PASSED = 0,
    EXIT_STATUS_TESTS_FAILED = 1,
    EXIT_STATUS_ERROR = 2,
};

// Everything main does after the arguments are parsed and the tool configuration is loaded
// The dry run command line goes to out, one token per line
int run_main(const StartParameters& params, FILE* out = stdout);
