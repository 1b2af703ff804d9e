#include "stlaunch/common/log.hpp"
#include "stlaunch/frontend.hpp"
#include "stlaunch/runner/arguments.hpp"
#include "stlaunch/runner/execute.hpp"

int run_main(const StartParameters& params, FILE* out) {
    if (params.verbose) {
        enable_verbose();
    }

    if (params.quiet) {
        disable_logging();
    }

    RunConfiguration config;
    try {
        config = RunConfiguration::load(params.run_config);
    } catch (const ConfigurationError& e) {
        FAILURE("%s", e.what());
        return EXIT_STATUS_ERROR;
    }

    if (params.ignore_failures) {
        config.ignore_failures = true;
    }

    if (params.dry_run) {
        // Same tokens a real run would pass, without creating the report directory
        for (const std::string& token : build_command_line(config, build_arguments(config))) {
            fprintf(out, "%s\n", token.c_str());
        }
        fflush(out);
        return EXIT_STATUS_PASSED;
    }

    LogReporter reporter;
    Outcome outcome;
    try {
        outcome = execute(config, reporter);
    } catch (const LaunchError& e) {
        FAILURE("Could not launch the test runner: %s", e.what());
        return EXIT_STATUS_ERROR;
    }

    switch (outcome.kind) {
    case Outcome::Kind::Success: {
        SUCCESS("All tests passed");
        return EXIT_STATUS_PASSED;
    }
    case Outcome::Kind::Warned: {
        // Already reported as a warning
        return EXIT_STATUS_PASSED;
    }
    case Outcome::Kind::Failed: {
        FAILURE("%s", outcome.message.c_str());
        return EXIT_STATUS_TESTS_FAILED;
    }
    }

    UNREACHABLE();
}
