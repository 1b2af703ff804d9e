#include <fmt/ranges.h>
#include "stlaunch/common/log.hpp"
#include "stlaunch/runner/arguments.hpp"
#include "stlaunch/runner/execute.hpp"

Execution::Execution(const RunConfiguration& config, Reporter& reporter) : config(config), reporter(reporter) {}

void Execution::transition(RunState next) {
    reporter.progress(fmt::format("{} -> {}", print_run_state(state), print_run_state(next)));
    state = next;
}

Outcome Execution::Run() {
    ASSERT_MSG(state == RunState::Idle, "Execution already ran, state: %s", print_run_state(state));

    prepare_reports(config);
    const std::vector<std::string> command_line = build_command_line(config, build_arguments(config));
    reporter.progress(fmt::format("Command line: {}", fmt::join(command_line, " ")));

    transition(RunState::Launching);
    ProcessOutcome process = launch_runner(config, command_line);

    // The output files are closed by now so whatever the message points at is complete
    exit_code = process.exit_code;
    transition(RunState::Completed);

    Outcome outcome = evaluate_outcome(exit_code, config.ignore_failures, config.reports, reporter);
    transition(outcome.state());
    return outcome;
}

Outcome execute(const RunConfiguration& config, Reporter& reporter) {
    Execution execution(config, reporter);
    return execution.Run();
}
