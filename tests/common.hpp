#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>
#include <catch2/catch_test_macros.hpp>
#include <catch2/interfaces/catch_interfaces_capture.hpp>
#include "stlaunch/common/config.hpp"
#include "stlaunch/common/log.hpp"
#include "stlaunch/runner/outcome.hpp"

#define SUCCESS_MESSAGE() SUCCESS("Test passed: %s", Catch::getResultCapture().getCurrentTestName().c_str())

// Fresh directory per test, removed with everything in it afterwards
struct TempDirectory {
    TempDirectory() {
        static int counter = 0;
        path = std::filesystem::temp_directory_path() / fmt::format("stlaunch_tests_{}_{}", getpid(), counter++);
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    std::filesystem::path path;
};

// Swaps g_config for the duration of a test
struct ConfigGuard {
    ConfigGuard() : saved(g_config) {}

    ~ConfigGuard() {
        g_config = saved;
    }

    ConfigGuard(const ConfigGuard&) = delete;
    ConfigGuard& operator=(const ConfigGuard&) = delete;

private:
    Config saved;
};

struct RecordingReporter final : Reporter {
    void warn(const std::string& message) override {
        warnings.push_back(message);
    }

    void progress(const std::string& message) override {
        messages.push_back(message);
    }

    std::vector<std::string> warnings;
    std::vector<std::string> messages;
};

inline bool has_item(const std::vector<std::string>& args, const std::string& item) {
    return std::find(args.begin(), args.end(), item) != args.end();
}

inline size_t count_item(const std::vector<std::string>& args, const std::string& item) {
    return std::count(args.begin(), args.end(), item);
}

// True if option is followed by value exactly once
inline bool has_option(const std::vector<std::string>& args, const std::string& option, const std::string& value) {
    size_t found = 0;
    for (size_t i = 0; i + 1 < args.size(); i++) {
        if (args[i] == option && args[i + 1] == value) {
            found++;
        }
    }
    return found == 1;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

inline void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << contents;
}
