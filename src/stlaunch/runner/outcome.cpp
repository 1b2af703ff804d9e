#include "stlaunch/common/log.hpp"
#include "stlaunch/runner/outcome.hpp"

const char* print_run_state(RunState state) {
    switch (state) {
    case RunState::Idle:
        return "Idle";
    case RunState::Launching:
        return "Launching";
    case RunState::Completed:
        return "Completed";
    case RunState::Success:
        return "Success";
    case RunState::Warned:
        return "Warned";
    case RunState::Failed:
        return "Failed";
    }
    return "Unknown";
}

RunState Outcome::state() const {
    switch (kind) {
    case Kind::Success:
        return RunState::Success;
    case Kind::Warned:
        return RunState::Warned;
    case Kind::Failed:
        return RunState::Failed;
    }
    UNREACHABLE();
}

void LogReporter::warn(const std::string& message) {
    WARN("%s", message.c_str());
}

void LogReporter::progress(const std::string& message) {
    VERBOSE("%s", message.c_str());
}

std::string failure_message(const ReportSettings& reports) {
    std::string message = "There were failing tests";
    if (reports.html_enabled && is_set(reports.html_entry_point)) {
        message += ". See the report at: " + clickable_file_url(reports.html_entry_point);
    } else if (reports.junit_xml_enabled && is_set(reports.junit_xml_entry_point)) {
        message += ". See the results at: " + clickable_file_url(reports.junit_xml_entry_point);
    }
    return message;
}

Outcome evaluate_outcome(int exit_code, bool ignore_failures, const ReportSettings& reports, Reporter& reporter) {
    if (exit_code == 0) {
        return Outcome{Outcome::Kind::Success, {}};
    }

    std::string message = failure_message(reports);
    if (ignore_failures) {
        reporter.warn(message);
        return Outcome{Outcome::Kind::Warned, message};
    }

    return Outcome{Outcome::Kind::Failed, message};
}
