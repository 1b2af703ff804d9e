#pragma once

#include <string>
#include "stlaunch/runner/run_configuration.hpp"

enum class RunState {
    Idle,
    Launching,
    Completed,
    Success,
    Warned,
    Failed,
};

const char* print_run_state(RunState state);

struct Outcome {
    enum class Kind {
        Success,
        Warned,
        Failed,
    };

    Kind kind = Kind::Success;
    std::string message{};

    // Warned runs still count as successful for the build
    bool isSuccessful() const {
        return kind != Kind::Failed;
    }

    RunState state() const;
};

// Where a run reports warnings and progress
struct Reporter {
    virtual ~Reporter() = default;
    virtual void warn(const std::string& message) = 0;
    virtual void progress(const std::string& message) = 0;
};

struct LogReporter final : Reporter {
    void warn(const std::string& message) override;
    void progress(const std::string& message) override;
};

// "There were failing tests" plus a link to the html report, or to the junit results if there's no html report
std::string failure_message(const ReportSettings& reports);

Outcome evaluate_outcome(int exit_code, bool ignore_failures, const ReportSettings& reports, Reporter& reporter);
