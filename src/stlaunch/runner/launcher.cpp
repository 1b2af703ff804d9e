#include <cerrno>
#include <cstring>
#include <optional>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include "stlaunch/common/log.hpp"
#include "stlaunch/runner/launcher.hpp"

OutputSink::OutputSink(const std::filesystem::path& path) {
    file_descriptor = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (file_descriptor == -1) {
        throw LaunchError(fmt::format("Failed to open {} for writing: {}", path, strerror(errno)));
    }
}

OutputSink::~OutputSink() {
    if (file_descriptor != -1) {
        fsync(file_descriptor);
        close(file_descriptor);
    }
}

SpawnActions::SpawnActions() {
    int result = posix_spawn_file_actions_init(&actions);
    if (result != 0) {
        throw LaunchError(fmt::format("posix_spawn_file_actions_init failed: {}", strerror(result)));
    }
}

SpawnActions::~SpawnActions() {
    posix_spawn_file_actions_destroy(&actions);
}

void SpawnActions::redirect(int fd, int target) {
    // dup2 clears O_CLOEXEC on the target so only the standard streams survive the exec
    int result = posix_spawn_file_actions_adddup2(&actions, fd, target);
    if (result != 0) {
        throw LaunchError(fmt::format("Failed to redirect fd {}: {}", target, strerror(result)));
    }
}

void SpawnActions::changeDirectory(const std::filesystem::path& path) {
    int result = posix_spawn_file_actions_addchdir_np(&actions, path.c_str());
    if (result != 0) {
        throw LaunchError(fmt::format("Failed to set working directory {}: {}", path, strerror(result)));
    }
}

static bool same_file(const std::filesystem::path& first, const std::filesystem::path& second) {
    std::error_code ec;
    std::filesystem::path first_canonical = std::filesystem::weakly_canonical(first, ec);
    if (ec) {
        return first.lexically_normal() == second.lexically_normal();
    }

    std::filesystem::path second_canonical = std::filesystem::weakly_canonical(second, ec);
    if (ec) {
        return first.lexically_normal() == second.lexically_normal();
    }

    return first_canonical == second_canonical;
}

ProcessOutcome launch_runner(const RunConfiguration& config, const std::vector<std::string>& command_line) {
    ASSERT_MSG(!command_line.empty(), "Empty command line");

    ProcessOutcome outcome{};
    std::optional<OutputSink> stdout_sink;
    std::optional<OutputSink> stderr_sink;
    SpawnActions actions;

    if (is_set(config.output_file)) {
        stdout_sink.emplace(config.output_file);
        actions.redirect(stdout_sink->fd(), STDOUT_FILENO);
        outcome.stdout_file = config.output_file;
    }

    if (is_set(config.error_file)) {
        // One descriptor for both streams, two opens would truncate and overwrite each other
        if (stdout_sink && same_file(config.output_file, config.error_file)) {
            actions.redirect(stdout_sink->fd(), STDERR_FILENO);
        } else {
            stderr_sink.emplace(config.error_file);
            actions.redirect(stderr_sink->fd(), STDERR_FILENO);
        }
        outcome.stderr_file = config.error_file;
    }

    if (is_set(config.working_directory)) {
        actions.changeDirectory(config.working_directory);
    }

    std::vector<char*> argv;
    argv.reserve(command_line.size() + 1);
    for (const std::string& arg : command_line) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> envs;
    envs.reserve(config.environment.size());
    for (const auto& [name, value] : config.environment) {
        envs.push_back(name + "=" + value);
    }

    std::vector<char*> envp;
    envp.reserve(envs.size() + 1);
    for (std::string& env : envs) {
        envp.push_back(env.data());
    }
    envp.push_back(nullptr);

    // Anything we buffered must not show up after the runner's output
    fflush(stdout);
    fflush(stderr);

    pid_t pid;
    int result = posix_spawnp(&pid, argv[0], actions.get(), nullptr, argv.data(), envp.data());
    if (result != 0) {
        throw LaunchError(fmt::format("Failed to start {}: {}", command_line[0], strerror(result)));
    }

    VERBOSE("Runner started with pid %d", pid);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw LaunchError(fmt::format("waitpid failed for pid {}: {}", pid, strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    } else {
        outcome.exit_code = 1;
    }

    VERBOSE("Runner %d exited with code %d", pid, outcome.exit_code);
    return outcome;
}
