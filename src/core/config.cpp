#include "postfx/core/config.hpp"
#include "postfx/core/error.hpp"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace postfx {

namespace {

template <typename T>
void readValue(const YAML::Node& node, const char* key, T& out) {
    const YAML::Node value = node[key];
    if (!value) {
        return;
    }
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void validate(const SandboxSettings& settings) {
    if (settings.width == 0 || settings.height == 0) {
        throw ConfigError("Window size must be positive");
    }
    if (settings.viewCount == 0 || settings.viewCount > SandboxSettings::MAX_VIEWS) {
        throw ConfigError("'views' must be between 1 and " + std::to_string(SandboxSettings::MAX_VIEWS));
    }
    if (settings.effect.pollIntervalMs == 0) {
        throw ConfigError("'effect.poll_interval_ms' must be positive");
    }
    if (spdlog::level::from_str(settings.logLevel) == spdlog::level::off && settings.logLevel != "off") {
        throw ConfigError("Unknown log level: " + settings.logLevel);
    }
}

} // namespace

SandboxSettings parseSandboxSettings(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("YAML parse error: ") + e.what());
    }

    SandboxSettings settings;
    if (!root || root.IsNull()) {
        return settings;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a map");
    }

    readValue(root, "log_level", settings.logLevel);
    readValue(root, "views", settings.viewCount);

    if (const YAML::Node window = root["window"]) {
        readValue(window, "width", settings.width);
        readValue(window, "height", settings.height);
        readValue(window, "title", settings.title);
    }

    if (const YAML::Node effect = root["effect"]) {
        readValue(effect, "body", settings.effect.body);
        readValue(effect, "body_file", settings.effect.bodyFile);
        readValue(effect, "watch", settings.effect.watch);
        readValue(effect, "poll_interval_ms", settings.effect.pollIntervalMs);
    }

    validate(settings);
    return settings;
}

SandboxSettings loadSandboxSettings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config not found at: {}. Using defaults.", path);
        return SandboxSettings{};
    }
    return parseSandboxSettings(readTextFile(path));
}

std::string readTextFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace postfx
