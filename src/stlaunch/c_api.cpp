#include "stlaunch/common/log.hpp"
#include "stlaunch/runner/execute.hpp"
#include "stlaunch/stlaunch.h"

stlaunch_outcome_e stlaunch_run_file(const char* path, bool ignore_failures) {
    if (!path) {
        return STLAUNCH_ERROR;
    }

    try {
        RunConfiguration config = RunConfiguration::load(path);
        config.ignore_failures = config.ignore_failures || ignore_failures;

        LogReporter reporter;
        Outcome outcome = execute(config, reporter);
        switch (outcome.kind) {
        case Outcome::Kind::Success:
            return STLAUNCH_SUCCESS;
        case Outcome::Kind::Warned:
            return STLAUNCH_WARNED;
        case Outcome::Kind::Failed:
            FAILURE("%s", outcome.message.c_str());
            return STLAUNCH_FAILED;
        }
    } catch (const ConfigurationError& e) {
        FAILURE("%s", e.what());
    } catch (const LaunchError& e) {
        FAILURE("Could not launch the test runner: %s", e.what());
    } catch (const std::exception& e) {
        // Nothing may unwind into a C caller
        FAILURE("Unexpected error: %s", e.what());
    }
    return STLAUNCH_ERROR;
}

const char* stlaunch_outcome_name(stlaunch_outcome_e outcome) {
    switch (outcome) {
    case STLAUNCH_SUCCESS:
        return "success";
    case STLAUNCH_WARNED:
        return "warned";
    case STLAUNCH_FAILED:
        return "failed";
    case STLAUNCH_ERROR:
        return "error";
    }
    return "unknown";
}
