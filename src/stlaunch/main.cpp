#include <filesystem>
#include <string>
#include <argp.h>
#include <fmt/format.h>
#include "stlaunch/common/config.hpp"
#include "stlaunch/common/info.hpp"
#include "stlaunch/common/log.hpp"
#include "stlaunch/frontend.hpp"

std::string version_full = get_version_full();
const char* argp_program_version = version_full.c_str();

static char doc[] = "stlaunch - runs ScalaTest suites described by a TOML run configuration";
static char args_doc[] = "RUN_CONFIG";

static struct argp_option options[] = {
    {"dry-run", 'n', 0, 0, "Print the runner command line, one token per line, and exit"},
    {"configs", 'c', 0, 0, "Print the launcher configurations"},
    {"ignore-failures", 'i', 0, 0, "Report failing tests as a warning instead of failing"},
    {"verbose", 'v', 0, 0, "Print the command line and progress of the run"},
    {"quiet", 'q', 0, 0, "Only print errors"},
    {0}};

static void print_configs() {
    std::string current_group;
    printf("These are the configurations for stlaunch\n");
    printf("You may edit %s or set the corresponding environment variable\n", g_config.path().c_str());

#define X(group, type, name, def, env, description, required)                                                                                        \
    if (current_group != #group) {                                                                                                                   \
        current_group = #group;                                                                                                                      \
        printf("\n[%s]\n", current_group.c_str());                                                                                                   \
    }                                                                                                                                                \
    fmt::print("{} {} = {} (default: {}) -- Environment variable: {}\n", #type, #name, g_config.name, #def, #env);                                   \
    fmt::print("    {}\n", Config::getDescription(#name));
#include "stlaunch/common/config.inc"
#undef X

    std::string overrides = g_config.getEnvironment();
    if (!overrides.empty()) {
        printf("\nOverridden by the environment:%s\n", overrides.c_str());
    }
}

static error_t parse_opt(int key, char* arg, struct argp_state* state) {
    StartParameters* params = (StartParameters*)state->input;

    switch (key) {
    case ARGP_KEY_ARG: {
        if (!params->run_config.empty()) {
            argp_usage(state);
        }
        params->run_config = arg;
        break;
    }
    case 'n': {
        params->dry_run = true;
        break;
    }
    case 'c': {
        if (!Config::initialize()) {
            printf("Could not create the configuration directory\n");
            exit(EXIT_STATUS_ERROR);
        }
        print_configs();
        exit(0);
        break;
    }
    case 'i': {
        params->ignore_failures = true;
        break;
    }
    case 'v': {
        params->verbose = true;
        break;
    }
    case 'q': {
        params->quiet = true;
        break;
    }
    case ARGP_KEY_END: {
        if (params->run_config.empty()) {
            argp_usage(state);
        }
        break;
    }
    default: {
        return ARGP_ERR_UNKNOWN;
    }
    }
    return 0;
}

static struct argp argp = {options, parse_opt, args_doc, doc};

int main(int argc, char* argv[]) {
    StartParameters params = {};
    argp_parse(&argp, argc, argv, 0, 0, &params);

    if (!Config::initialize()) {
        WARN("Could not load the configuration file, using the defaults");
    }
    initialize_globals();

    return run_main(params);
}
