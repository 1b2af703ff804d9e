#pragma once

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "stlaunch/common/utility.hpp"

// Values of -D<key>=<value> runner arguments
using ConfigValue = std::variant<std::string, i64, double, bool>;

std::string display_text(const ConfigValue& value);

struct ReportSettings {
    bool junit_xml_enabled = false;
    std::filesystem::path junit_xml_entry_point{};
    bool html_enabled = false;
    std::filesystem::path html_entry_point{};
    std::filesystem::path html_destination{};
};

struct ConfigurationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Everything needed for one invocation of the runner. Built once by the caller and never changed while a run uses it.
// Empty paths and collections mean the feature is off.
struct RunConfiguration {
    std::vector<std::string> classpath{};
    std::vector<std::string> jvm_args{};
    std::map<std::string, std::string> system_properties{};
    std::string min_heap_size{};
    std::string max_heap_size{};

    // Passed to the runner as its whole environment
    std::map<std::string, std::string> environment{};
    std::filesystem::path working_directory{};

    // 0 leaves the fork count to the runner
    u64 max_parallel_forks = 0;
    bool color_output = true;
    std::filesystem::path test_root{};
    std::vector<std::string> include_patterns{};
    std::vector<std::string> tag_includes{};
    std::vector<std::string> tag_excludes{};
    std::vector<std::string> suites{};
    std::map<std::string, ConfigValue> config_entries{};

    std::filesystem::path result_file{};
    std::filesystem::path output_file{};
    std::filesystem::path error_file{};

    ReportSettings reports{};
    bool ignore_failures = false;

    // System properties, heap sizes, then jvm_args
    std::vector<std::string> allJvmArgs() const;

    // Reads a TOML run configuration, relative paths in it are relative to the file.
    // Throws ConfigurationError if the file can't be parsed or a key has the wrong type.
    [[nodiscard]] static RunConfiguration load(const std::filesystem::path& path);

    [[nodiscard]] static RunConfiguration parse(const std::string& toml, const std::filesystem::path& base_directory);
};
