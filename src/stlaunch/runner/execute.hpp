#pragma once

#include "stlaunch/runner/launcher.hpp"
#include "stlaunch/runner/outcome.hpp"
#include "stlaunch/runner/run_configuration.hpp"

// One invocation of the runner: Idle -> Launching -> Completed -> Success, Warned or Failed.
// The configuration and reporter must outlive the execution.
struct Execution {
    Execution(const RunConfiguration& config, Reporter& reporter);

    // Blocks until the runner exits. LaunchError propagates and leaves the state at Launching.
    Outcome Run();

    RunState GetState() const {
        return state;
    }

    int GetExitCode() const {
        return exit_code;
    }

private:
    void transition(RunState next);

    const RunConfiguration& config;
    Reporter& reporter;
    RunState state = RunState::Idle;
    int exit_code = -1;
};

Outcome execute(const RunConfiguration& config, Reporter& reporter);
