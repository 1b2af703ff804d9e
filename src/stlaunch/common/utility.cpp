#include <algorithm>
#include <cctype>
#include <cstring>
#include "stlaunch/common/utility.hpp"

bool is_truthy(const char* str) {
    if (!str) {
        return false;
    }

    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on" || lower == "y" || lower == "enable";
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start <= str.size()) {
        size_t end = str.find(delimiter, start);
        if (end == std::string::npos) {
            end = str.size();
        }

        if (end != start) {
            result.push_back(str.substr(start, end - start));
        }
        start = end + 1;
    }
    return result;
}

std::string escape_spaces(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char c : str) {
        if (c == ' ') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string clickable_file_url(const std::filesystem::path& path) {
    if (!is_set(path)) {
        return {};
    }

    constexpr const char* allowed = "-._~/!$&'()*+,;=:@";
    const std::string absolute = std::filesystem::absolute(path).lexically_normal().string();

    std::string url = "file://";
    for (unsigned char c : absolute) {
        if (std::isalnum(c) || strchr(allowed, c)) {
            url += (char)c;
        } else {
            url += fmt::format("%{:02X}", c);
        }
    }
    return url;
}

std::filesystem::path resolve_against(const std::filesystem::path& base, const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute()) {
        return path;
    }
    return base / path;
}
