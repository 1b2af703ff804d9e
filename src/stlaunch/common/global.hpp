#pragma once

#include <string>
#include <unistd.h>

extern bool g_verbose;
extern bool g_quiet;
extern int g_output_fd;
extern const char* g_git_hash;

void initialize_globals();
