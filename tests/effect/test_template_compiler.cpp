#include <catch2/catch.hpp>
#include "postfx/core/error.hpp"
#include "postfx/effect/template_compiler.hpp"
#include "support/recording_backend.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include <memory>
#include <sstream>
#include <string>

using namespace postfx;
using postfx::testing::RecordingBackend;

namespace {

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

} // namespace

TEST_CASE("The template declares the fixed binding contract", "[effect][template]") {
    const std::string& source = TemplateCompiler::getTemplateSource();
    CHECK(countOccurrences(source, TemplateCompiler::PLACEHOLDER) == 1);
    CHECK(source.find("layout(set = 0, binding = 0, rgba16f) uniform image2D ColorImage") != std::string::npos);
    CHECK(source.find("vec2 RasterSize;") != std::string::npos);
    CHECK(source.find("vec2 Padding;") != std::string::npos);
    CHECK(source.find("local_size_x = 8, local_size_y = 8") != std::string::npos);
}

TEST_CASE("merge splices the body in place of the placeholder", "[effect][template]") {
    const std::string bodies[] = {
        "color.rgb *= 2.0;",
        "",
        "float l = dot(color.rgb, vec3(0.2126, 0.7152, 0.0722));\ncolor.rgb = vec3(l);",
        "// comment only",
    };

    for (const auto& body : bodies) {
        std::string merged = TemplateCompiler::merge(body);
        CHECK(merged.find(TemplateCompiler::PLACEHOLDER) == std::string::npos);
        if (!body.empty()) {
            CHECK(countOccurrences(merged, body) == 1);
        }
        CHECK(merged.size() == TemplateCompiler::getTemplateSource().size() - std::string(TemplateCompiler::PLACEHOLDER).size() + body.size());
    }
}

TEST_CASE("A body containing the placeholder token keeps it verbatim", "[effect][template]") {
    std::string body = std::string("color.r = 0.0; ") + TemplateCompiler::PLACEHOLDER;
    std::string merged = TemplateCompiler::merge(body);
    CHECK(countOccurrences(merged, TemplateCompiler::PLACEHOLDER) == 1);
    CHECK(countOccurrences(merged, body) == 1);
}

TEST_CASE("compile submits the merged source and returns a shader", "[effect][template]") {
    RecordingBackend backend;
    TemplateCompiler compiler(&backend, "Grade");

    ShaderHandle shader = compiler.compile("color.rgb *= 2.0;");
    CHECK(backend.m_liveShaders.count(shader) == 1);
    CHECK(backend.m_lastSource == TemplateCompiler::merge("color.rgb *= 2.0;"));
    CHECK(backend.countCalls("compile Grade") == 1);
}

TEST_CASE("compile reports diagnostics and the merged source on rejection", "[effect][template]") {
    RecordingBackend backend;
    TemplateCompiler compiler(&backend, "Grade");

    std::string body = "color.rgb = undeclared_identifier;";
    try {
        compiler.compile(body);
        FAIL("expected CompileError");
    } catch (const CompileError& e) {
        CHECK(e.getDiagnostics().find("undeclared identifier") != std::string::npos);
        CHECK(e.getMergedSource() == TemplateCompiler::merge(body));
    }
    CHECK(backend.countCalls("createShader") == 0);
}

TEST_CASE("A rejected body logs the merged source at the default level", "[effect][template]") {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_level(spdlog::level::info);
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(logger);

    RecordingBackend backend;
    TemplateCompiler compiler(&backend, "Logged");
    CHECK_THROWS_AS(compiler.compile("color.r = undeclared_identifier;"), CompileError);

    spdlog::set_default_logger(previous);

    std::string log = captured.str();
    CHECK(log.find("undeclared identifier") != std::string::npos);
    CHECK(log.find("Merged source for Logged") != std::string::npos);
    CHECK(log.find("local_size_x = 8") != std::string::npos);
}

TEST_CASE("compile propagates shader creation failures", "[effect][template]") {
    RecordingBackend backend;
    backend.m_failShaderCreation = true;
    TemplateCompiler compiler(&backend);
    CHECK_THROWS_AS(compiler.compile("color.rgb *= 2.0;"), GpuError);
}
