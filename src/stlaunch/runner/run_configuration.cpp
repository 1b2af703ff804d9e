#include <algorithm>
#include <thread>
#include <toml.hpp>
#include <unistd.h>
#include "stlaunch/common/config.hpp"
#include "stlaunch/common/log.hpp"
#include "stlaunch/runner/run_configuration.hpp"

extern char** environ;

std::string display_text(const ConfigValue& value) {
    return std::visit(
        [](const auto& inner) -> std::string {
            using T = std::decay_t<decltype(inner)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return inner;
            } else {
                return fmt::format("{}", inner);
            }
        },
        value);
}

std::vector<std::string> RunConfiguration::allJvmArgs() const {
    std::vector<std::string> args;
    for (const auto& [name, value] : system_properties) {
        args.push_back(fmt::format("-D{}={}", name, value));
    }

    if (!min_heap_size.empty()) {
        args.push_back("-Xms" + min_heap_size);
    }

    if (!max_heap_size.empty()) {
        args.push_back("-Xmx" + max_heap_size);
    }

    args.insert(args.end(), jvm_args.begin(), jvm_args.end());
    return args;
}

namespace {

struct Reader {
    const std::string& origin;
    const std::filesystem::path& base;

    [[noreturn]] void badType(const std::string& key, const char* expected) const {
        throw ConfigurationError(fmt::format("{}: '{}' must be {}", origin, key, expected));
    }

    const toml::value* find(const toml::value& table, const std::string& key) const {
        if (!table.is_table() || !table.contains(key)) {
            return nullptr;
        }
        return &table.at(key);
    }

    void read(const toml::value& table, const std::string& key, bool& out) const {
        const toml::value* value = find(table, key);
        if (!value) {
            return;
        }

        if (!value->is_boolean()) {
            badType(key, "a boolean");
        }
        out = value->as_boolean();
    }

    void read(const toml::value& table, const std::string& key, std::string& out) const {
        const toml::value* value = find(table, key);
        if (!value) {
            return;
        }

        if (!value->is_string()) {
            badType(key, "a string");
        }
        out = value->as_string();
    }

    void readPath(const toml::value& table, const std::string& key, std::filesystem::path& out) const {
        std::string text;
        read(table, key, text);
        if (!text.empty()) {
            out = resolve_against(base, text);
        }
    }

    void read(const toml::value& table, const std::string& key, std::vector<std::string>& out) const {
        const toml::value* value = find(table, key);
        if (!value) {
            return;
        }

        if (!value->is_array()) {
            badType(key, "an array of strings");
        }

        for (const toml::value& element : value->as_array()) {
            if (!element.is_string()) {
                badType(key, "an array of strings");
            }
            out.push_back(element.as_string());
        }
    }

    // Scalars are stored as their display text, -Dkey=1 and -Dkey="1" mean the same to the JVM
    void read(const toml::value& table, const std::string& key, std::map<std::string, std::string>& out) const {
        const toml::value* value = find(table, key);
        if (!value) {
            return;
        }

        if (!value->is_table()) {
            badType(key, "a table");
        }

        for (const auto& [name, element] : value->as_table()) {
            out[name] = display_text(toConfigValue(key + "." + name, element));
        }
    }

    void read(const toml::value& table, const std::string& key, std::map<std::string, ConfigValue>& out) const {
        const toml::value* value = find(table, key);
        if (!value) {
            return;
        }

        if (!value->is_table()) {
            badType(key, "a table");
        }

        for (const auto& [name, element] : value->as_table()) {
            out[name] = toConfigValue(key + "." + name, element);
        }
    }

    ConfigValue toConfigValue(const std::string& key, const toml::value& value) const {
        if (value.is_string()) {
            return value.as_string();
        } else if (value.is_integer()) {
            return (i64)value.as_integer();
        } else if (value.is_floating()) {
            return value.as_floating();
        } else if (value.is_boolean()) {
            return value.as_boolean();
        }
        badType(key, "a string, number or boolean");
    }
};

void readReport(const Reader& reader, const toml::value& reports, const char* name, bool& enabled, std::filesystem::path& destination,
                std::filesystem::path& entry_point) {
    const toml::value* report = reader.find(reports, name);
    if (!report) {
        return;
    }

    if (!report->is_table()) {
        reader.badType(fmt::format("reports.{}", name), "a table");
    }

    reader.read(*report, "enabled", enabled);
    reader.readPath(*report, "destination", destination);
    reader.readPath(*report, "entry_point", entry_point);
}

RunConfiguration fromToml(const toml::value& root, const std::string& origin, const std::filesystem::path& base) {
    Reader reader{origin, base};
    RunConfiguration config{};
    config.color_output = g_config.color_output;
    config.max_parallel_forks = std::max(1u, std::thread::hardware_concurrency());

    std::string classpath;
    if (const toml::value* value = reader.find(root, "classpath"); value && value->is_string()) {
        reader.read(root, "classpath", classpath);
        config.classpath = split_string(classpath, ':');
    } else {
        reader.read(root, "classpath", config.classpath);
    }

    reader.read(root, "jvm_args", config.jvm_args);
    reader.read(root, "system_properties", config.system_properties);
    reader.read(root, "min_heap_size", config.min_heap_size);
    reader.read(root, "max_heap_size", config.max_heap_size);

    bool inherit_environment = false;
    reader.read(root, "inherit_environment", inherit_environment);
    if (inherit_environment) {
        for (char** env = environ; *env; env++) {
            std::string entry = *env;
            size_t equals = entry.find('=');
            if (equals != std::string::npos) {
                config.environment[entry.substr(0, equals)] = entry.substr(equals + 1);
            }
        }
    }
    reader.read(root, "environment", config.environment);

    reader.readPath(root, "working_directory", config.working_directory);

    if (const toml::value* forks = reader.find(root, "max_parallel_forks")) {
        if (!forks->is_integer() || forks->as_integer() < 0) {
            reader.badType("max_parallel_forks", "a non-negative integer");
        }
        config.max_parallel_forks = forks->as_integer();
    }

    reader.read(root, "color_output", config.color_output);
    reader.readPath(root, "test_root", config.test_root);
    reader.read(root, "include_patterns", config.include_patterns);
    reader.read(root, "suites", config.suites);
    reader.read(root, "config", config.config_entries);

    if (const toml::value* tags = reader.find(root, "tags")) {
        if (!tags->is_table()) {
            reader.badType("tags", "a table");
        }
        reader.read(*tags, "include", config.tag_includes);
        reader.read(*tags, "exclude", config.tag_excludes);
    }

    reader.readPath(root, "result_file", config.result_file);
    reader.readPath(root, "output_file", config.output_file);
    reader.readPath(root, "error_file", config.error_file);
    reader.read(root, "ignore_failures", config.ignore_failures);

    if (const toml::value* reports = reader.find(root, "reports")) {
        if (!reports->is_table()) {
            reader.badType("reports", "a table");
        }

        ReportSettings& settings = config.reports;
        std::filesystem::path junit_destination;
        readReport(reader, *reports, "junit_xml", settings.junit_xml_enabled, junit_destination, settings.junit_xml_entry_point);
        readReport(reader, *reports, "html", settings.html_enabled, settings.html_destination, settings.html_entry_point);

        // The junit report is a directory of xml files, the html one starts at its index page
        if (settings.junit_xml_entry_point.empty()) {
            settings.junit_xml_entry_point = junit_destination;
        }

        if (settings.html_entry_point.empty() && !settings.html_destination.empty()) {
            settings.html_entry_point = settings.html_destination / "index.html";
        }

        if (settings.junit_xml_enabled && settings.junit_xml_entry_point.empty()) {
            throw ConfigurationError(fmt::format("{}: the junit_xml report is enabled but has no destination", origin));
        }

        if (settings.html_enabled && settings.html_destination.empty()) {
            throw ConfigurationError(fmt::format("{}: the html report is enabled but has no destination", origin));
        }
    }

    VERBOSE("Loaded run configuration from %s", origin.c_str());
    return config;
}

} // namespace

RunConfiguration RunConfiguration::load(const std::filesystem::path& path) {
    auto attempt = toml::try_parse(path);
    if (attempt.is_err()) {
        std::string message = fmt::format("Could not parse the run configuration {}", path);
        for (const auto& error : attempt.unwrap_err()) {
            message += "\n" + toml::format_error(error);
        }
        throw ConfigurationError(message);
    }

    const std::filesystem::path base = std::filesystem::absolute(path).parent_path();
    return fromToml(attempt.unwrap(), path.string(), base);
}

RunConfiguration RunConfiguration::parse(const std::string& toml, const std::filesystem::path& base_directory) {
    auto attempt = toml::try_parse_str(toml);
    if (attempt.is_err()) {
        std::string message = "Could not parse the run configuration";
        for (const auto& error : attempt.unwrap_err()) {
            message += "\n" + toml::format_error(error);
        }
        throw ConfigurationError(message);
    }

    return fromToml(attempt.unwrap(), "<string>", base_directory);
}
