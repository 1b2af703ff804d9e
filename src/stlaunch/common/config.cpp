#include <cstring>
#include <fstream>
#include <pwd.h>
#include <sys/types.h>
#include <toml.hpp>
#include "stlaunch/common/config.hpp"
#include "stlaunch/common/log.hpp"

Config g_config{};

bool Config::initialize() {
    const char* homedir;
    if ((homedir = getenv("HOME")) == NULL) {
        struct passwd* pw = getpwuid(getuid());
        if (!pw) {
            return false;
        }
        homedir = pw->pw_dir;
    }

    std::filesystem::path config_path = homedir;
    config_path /= ".config";
    config_path /= "stlaunch";

    std::error_code ec;
    if (!std::filesystem::exists(config_path)) {
        if (!std::filesystem::create_directories(config_path, ec)) {
            return false;
        }
    } else if (!std::filesystem::is_directory(config_path)) {
        return false;
    }

    config_path /= "config.toml";
    if (!std::filesystem::exists(config_path)) {
        LOG("Created configuration file: %s", config_path.c_str());
        save(config_path, g_config);
    }

    g_config = load(config_path);

    return true;
}

const char* Config::getDescription(const char* name) {
#define X(group, type, config_name, default_value, env_name, description, required)                                                                  \
    if (strcmp(name, #config_name) == 0) {                                                                                                           \
        return description;                                                                                                                          \
    }
#include "config.inc"
#undef X
    return nullptr;
}

template <typename Type>
bool loadFromToml(const toml::value& toml, const char* group, const char* name, Type& value) {
    if (toml.contains(group)) {
        const toml::value& group_toml = toml.at(group);
        if (!group_toml.is_table()) {
            WARN("Configuration group %s must be a table, using the defaults", group);
            return false;
        }

        if (group_toml.contains(name)) {
            const toml::value& value_toml = group_toml.at(name);
            if constexpr (std::is_same_v<Type, bool>) {
                if (!value_toml.is_boolean()) {
                    WARN("Configuration %s.%s must be a boolean, using the default", group, name);
                    return false;
                }
                value = value_toml.as_boolean();
                return true;
            } else if constexpr (std::is_same_v<Type, std::filesystem::path>) {
                if (!value_toml.is_string()) {
                    WARN("Configuration %s.%s must be a string, using the default", group, name);
                    return false;
                }
                value = value_toml.as_string();
                return true;
            } else {
                static_assert(sizeof(Type) == 0, "Unsupported configuration type");
            }
        }
    }
    return false;
}

void addToEnvironment(Config& config, const char* env_name, const char* env) {
    config.__environment += "\n";
    config.__environment += env_name;
    config.__environment += "=";
    config.__environment += env;
}

template <typename Type>
bool loadFromEnv(Config& config, Type& value, const char* env_name, const char* env) {
    addToEnvironment(config, env_name, env);

    if constexpr (std::is_same_v<Type, bool>) {
        value = is_truthy(env);
        return true;
    } else if constexpr (std::is_same_v<Type, std::filesystem::path>) {
        value = env;
        return true;
    }

    return false;
}

Config Config::load(const std::filesystem::path& path) {
    Config config = {};
    config.config_path = path;

    toml::value toml{toml::table{}};
    auto attempt = toml::try_parse(path);
    if (attempt.is_err()) {
        WARN("Could not parse %s, using the defaults", path.c_str());
    } else {
        toml = attempt.unwrap();
    }

#define X(group, type, name, default_value, env_name, description, required)                                                                         \
    {                                                                                                                                                \
        bool loaded = false;                                                                                                                         \
        const char* env = getenv(#env_name);                                                                                                         \
        if (env) {                                                                                                                                   \
            loaded = loadFromEnv<type>(config, config.name, #env_name, env);                                                                         \
        } else {                                                                                                                                     \
            loaded = loadFromToml<type>(toml, #group, #name, config.name);                                                                           \
        }                                                                                                                                            \
        if (!loaded && required) {                                                                                                                   \
            ERROR("A value for %s is required but was not set. Please set it using the %s environment variable or in the configuration file %s in "  \
                  "group [\"%s\"]",                                                                                                                  \
                  #name, #env_name, path.c_str(), #group);                                                                                           \
        }                                                                                                                                            \
    }
#include "config.inc"
#undef X

    return config;
}

static bool toTomlValue(bool value) {
    return value;
}

static std::string toTomlValue(const std::filesystem::path& value) {
    return value.string();
}

void Config::save(const std::filesystem::path& path, const Config& config) {
    toml::ordered_table toml;

#define X(group, type, name, default_value, env_name, description, required)                                                                         \
    {                                                                                                                                                \
        if (!toml.contains(#group)) {                                                                                                                \
            toml[#group] = toml::ordered_table{};                                                                                                    \
        }                                                                                                                                            \
        auto& value = toml[#group][#name];                                                                                                           \
        value = toTomlValue(config.name);                                                                                                            \
        value.comments().push_back(" " #name " (" #type ")");                                                                                        \
        value.comments().push_back(" Description: " description);                                                                                    \
        value.comments().push_back(" Environment variable: " #env_name);                                                                             \
    }
#include "config.inc"
#undef X

    std::ofstream ofs(path);
    if (!ofs) {
        WARN("Could not write the configuration file %s", path.c_str());
        return;
    }
    ofs << "# Autogenerated TOML configuration file for stlaunch\n";
    ofs << "# You may change any values here, or their respective environment variable\n";
    ofs << "# The environment variables override the values here\n";
    ofs << toml::ordered_value{toml};
}
