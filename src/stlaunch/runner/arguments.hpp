#pragma once

#include <string>
#include <vector>
#include "stlaunch/runner/run_configuration.hpp"

constexpr const char* RUNNER_MAIN_CLASS = "org.scalatest.tools.Runner";

// The runner expects the html report directory to already exist, call this before launching
void prepare_reports(const RunConfiguration& config);

// Runner arguments in the order the runner expects them. Doesn't touch the filesystem.
std::vector<std::string> build_arguments(const RunConfiguration& config);

// java, JVM flags, classpath and main class followed by the runner arguments
std::vector<std::string> build_command_line(const RunConfiguration& config, const std::vector<std::string>& arguments);
