#include "stlaunch/common/config.hpp"
#include "stlaunch/common/global.hpp"
#include "stlaunch/common/log.hpp"

#ifndef STLAUNCH_GIT_HASH
#define STLAUNCH_GIT_HASH "?"
#endif

const char* g_git_hash = STLAUNCH_GIT_HASH;

// Logs go to stderr so they never interleave with a runner whose stdout we inherit
int g_output_fd = STDERR_FILENO;

void initialize_globals() {
    if (g_config.verbose) {
        enable_verbose();
    }

    if (g_config.quiet) {
        disable_logging();
    }

    VERBOSE("Java launcher: %s", g_config.java_executable.c_str());
}
