#pragma once

#include <cstdint>
#include <string>

namespace postfx {

struct EffectSettings {
    std::string body;
    std::string bodyFile;
    bool watch = true;
    uint32_t pollIntervalMs = 250;
};

struct SandboxSettings {
    static constexpr uint32_t MAX_VIEWS = 16;

    std::string logLevel = "info";
    uint32_t width = 1600;
    uint32_t height = 900;
    std::string title = "PostFX Sandbox";
    uint32_t viewCount = 1;
    EffectSettings effect;
};

// Both throw ConfigError on malformed YAML, wrong value types or out of range values.
SandboxSettings parseSandboxSettings(const std::string& yaml);
// A missing file yields the defaults.
SandboxSettings loadSandboxSettings(const std::string& path);

std::string readTextFile(const std::string& path);

} // namespace postfx
