#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <stdbool.h>
#include <stdint.h>
#include <fmt/format.h>

using u64 = uint64_t;
using u32 = uint32_t;
using u16 = uint16_t;
using u8 = uint8_t;

using i64 = int64_t;
using i32 = int32_t;
using i16 = int16_t;
using i8 = int8_t;

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return formatter<std::string_view>::format(path.string(), ctx);
    }
};

bool is_truthy(const char* str);

std::vector<std::string> split_string(const std::string& str, char delimiter);

// Backslash before every space, the runner splits -R on unescaped spaces
std::string escape_spaces(const std::string& str);

// file:///absolute/path with the path percent-encoded, terminals render these as links
// Empty for an unset path
std::string clickable_file_url(const std::filesystem::path& path);

// Resolves path against base unless it's empty or already absolute
std::filesystem::path resolve_against(const std::filesystem::path& base, const std::filesystem::path& path);

[[nodiscard]] inline bool is_set(const std::filesystem::path& path) {
    return !path.empty();
}
