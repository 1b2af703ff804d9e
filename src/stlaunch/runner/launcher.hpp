#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <spawn.h>
#include "stlaunch/runner/run_configuration.hpp"

// The runner could not be started at all, as opposed to a run with failing tests
struct LaunchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ProcessOutcome {
    int exit_code = 0;
    std::filesystem::path stdout_file{};
    std::filesystem::path stderr_file{};
};

// Truncates or creates the file, closed when the sink goes out of scope
struct OutputSink {
    explicit OutputSink(const std::filesystem::path& path);
    ~OutputSink();

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;
    OutputSink(OutputSink&&) = delete;
    OutputSink& operator=(OutputSink&&) = delete;

    int fd() const {
        return file_descriptor;
    }

private:
    int file_descriptor = -1;
};

struct SpawnActions {
    SpawnActions();
    ~SpawnActions();

    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;
    SpawnActions(SpawnActions&&) = delete;
    SpawnActions& operator=(SpawnActions&&) = delete;

    void redirect(int fd, int target);
    void changeDirectory(const std::filesystem::path& path);

    const posix_spawn_file_actions_t* get() const {
        return &actions;
    }

private:
    posix_spawn_file_actions_t actions;
};

// Runs command_line with the configuration's environment and working directory and waits for it.
// A nonzero exit code is returned, not thrown. Throws LaunchError if the process can't be started.
ProcessOutcome launch_runner(const RunConfiguration& config, const std::vector<std::string>& command_line);
