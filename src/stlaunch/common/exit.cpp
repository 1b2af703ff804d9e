#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include "stlaunch/common/exit.hpp"
#include "stlaunch/common/global.hpp"

void stlaunch_exit(int code) {
    // Anything the runner's stdout shares with us should land before we go
    fflush(stdout);
    fsync(g_output_fd);
    exit(code);
}
