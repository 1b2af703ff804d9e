#include <set>
#include <fmt/ranges.h>
#include "stlaunch/common/config.hpp"
#include "stlaunch/common/log.hpp"
#include "stlaunch/runner/arguments.hpp"

void prepare_reports(const RunConfiguration& config) {
    if (!config.reports.html_enabled || !is_set(config.reports.html_destination)) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.reports.html_destination, ec);
    if (ec) {
        // The runner will complain about it too, let it decide
        WARN("Failed to create the html report directory %s: %s", config.reports.html_destination.c_str(), ec.message().c_str());
    }
}

std::vector<std::string> build_arguments(const RunConfiguration& config) {
    std::vector<std::string> args;

    if (config.color_output) {
        args.push_back("-oD");
    } else {
        args.push_back("-oDW");
    }

    if (config.max_parallel_forks == 0) {
        args.push_back("-PS");
    } else {
        args.push_back(fmt::format("-PS{}", config.max_parallel_forks));
    }

    // An unset path disables its group, std::filesystem::absolute throws on empty paths
    if (is_set(config.test_root)) {
        args.push_back("-R");
        args.push_back(escape_spaces(std::filesystem::absolute(config.test_root).string()));
    }

    for (const std::string& pattern : config.include_patterns) {
        args.push_back("-z");
        args.push_back(pattern);
    }

    if (config.reports.junit_xml_enabled && is_set(config.reports.junit_xml_entry_point)) {
        args.push_back("-u");
        args.push_back(std::filesystem::absolute(config.reports.junit_xml_entry_point).string());
    }

    if (config.reports.html_enabled && is_set(config.reports.html_destination)) {
        args.push_back("-h");
        args.push_back(std::filesystem::absolute(config.reports.html_destination).string());
    }

    if (is_set(config.result_file)) {
        args.push_back("-f");
        args.push_back(config.result_file.string());
    }

    for (const std::string& tag : config.tag_includes) {
        args.push_back("-n");
        args.push_back(tag);
    }

    for (const std::string& tag : config.tag_excludes) {
        args.push_back("-l");
        args.push_back(tag);
    }

    // Set semantics only, the runner gets no ordering guarantee between suites
    const std::set<std::string> suites(config.suites.begin(), config.suites.end());
    for (const std::string& suite : suites) {
        args.push_back("-s");
        args.push_back(suite);
    }

    for (const auto& [key, value] : config.config_entries) {
        args.push_back(fmt::format("-D{}={}", key, display_text(value)));
    }

    return args;
}

std::vector<std::string> build_command_line(const RunConfiguration& config, const std::vector<std::string>& arguments) {
    std::vector<std::string> command_line;
    command_line.push_back(g_config.java_executable.string());

    const std::vector<std::string> jvm_args = config.allJvmArgs();
    command_line.insert(command_line.end(), jvm_args.begin(), jvm_args.end());

    if (!config.classpath.empty()) {
        command_line.push_back("-cp");
        command_line.push_back(fmt::format("{}", fmt::join(config.classpath, ":")));
    }

    command_line.push_back(RUNNER_MAIN_CLASS);
    command_line.insert(command_line.end(), arguments.begin(), arguments.end());
    return command_line;
}
