#include "stlaunch/common/log.hpp"

bool g_verbose = false;
bool g_quiet = false;

void enable_verbose() {
    g_verbose = true;
}

void disable_logging() {
    g_quiet = true;
}
