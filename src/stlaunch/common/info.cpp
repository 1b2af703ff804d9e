#include <string>
#include "stlaunch/common/info.hpp"

extern const char* g_git_hash;

#define YEAR "26"
#define MONTH "10"

const char* get_version_full() {
    static std::string version = "stlaunch " YEAR "." MONTH + (std::string(g_git_hash) == "?" ? "" : " (" + std::string(g_git_hash) + ")");
    return version.c_str();
}
