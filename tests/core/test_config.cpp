#include <catch2/catch.hpp>
#include "postfx/core/config.hpp"
#include "postfx/core/error.hpp"
#include <filesystem>
#include <fstream>

using namespace postfx;

TEST_CASE("An empty document yields the defaults", "[core][config]") {
    SandboxSettings settings = parseSandboxSettings("");
    CHECK(settings.logLevel == "info");
    CHECK(settings.width == 1600);
    CHECK(settings.height == 900);
    CHECK(settings.viewCount == 1);
    CHECK(settings.effect.body.empty());
    CHECK(settings.effect.watch);
    CHECK(settings.effect.pollIntervalMs == 250);
}

TEST_CASE("All keys are read", "[core][config]") {
    SandboxSettings settings = parseSandboxSettings(R"(
log_level: debug
views: 2
window:
  width: 1280
  height: 720
  title: Stereo
effect:
  body: |
    color.rgb *= 2.0;
  body_file: shaders/body.glsl
  watch: false
  poll_interval_ms: 100
)");

    CHECK(settings.logLevel == "debug");
    CHECK(settings.viewCount == 2);
    CHECK(settings.width == 1280);
    CHECK(settings.height == 720);
    CHECK(settings.title == "Stereo");
    CHECK(settings.effect.body == "color.rgb *= 2.0;\n");
    CHECK(settings.effect.bodyFile == "shaders/body.glsl");
    CHECK_FALSE(settings.effect.watch);
    CHECK(settings.effect.pollIntervalMs == 100);
}

TEST_CASE("Malformed configuration is rejected", "[core][config]") {
    CHECK_THROWS_AS(parseSandboxSettings("window: [1, 2"), ConfigError);
    CHECK_THROWS_AS(parseSandboxSettings("- just\n- a list\n"), ConfigError);
    CHECK_THROWS_AS(parseSandboxSettings("window:\n  width: wide\n"), ConfigError);
    CHECK_THROWS_AS(parseSandboxSettings("window:\n  width: 0\n"), ConfigError);
    CHECK_THROWS_AS(parseSandboxSettings("views: 0\n"), ConfigError);
    CHECK_THROWS_AS(parseSandboxSettings("views: 65\n"), ConfigError);
    CHECK_THROWS_AS(parseSandboxSettings("views: " + std::to_string(SandboxSettings::MAX_VIEWS + 1) + "\n"), ConfigError);
    CHECK(parseSandboxSettings("views: " + std::to_string(SandboxSettings::MAX_VIEWS) + "\n").viewCount == SandboxSettings::MAX_VIEWS);
    CHECK_THROWS_AS(parseSandboxSettings("effect:\n  poll_interval_ms: 0\n"), ConfigError);
    CHECK_THROWS_AS(parseSandboxSettings("log_level: chatty\n"), ConfigError);
}

TEST_CASE("A missing file falls back to defaults", "[core][config]") {
    SandboxSettings settings = loadSandboxSettings("does/not/exist.yaml");
    CHECK(settings.width == 1600);
}

TEST_CASE("Settings load from disk", "[core][config]") {
    auto path = std::filesystem::temp_directory_path() / "postfx_test_config.yaml";
    {
        std::ofstream out(path);
        out << "views: 3\nlog_level: warn\n";
    }

    SandboxSettings settings = loadSandboxSettings(path.string());
    CHECK(settings.viewCount == 3);
    CHECK(settings.logLevel == "warn");

    std::filesystem::remove(path);
    CHECK_THROWS_AS(readTextFile(path.string()), ConfigError);
}
