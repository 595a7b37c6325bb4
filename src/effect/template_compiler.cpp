#include "postfx/effect/template_compiler.hpp"
#include "postfx/core/error.hpp"
#include <spdlog/spdlog.h>

namespace postfx {

namespace {

const std::string kTemplateSource = R"(#version 450

layout(local_size_x = 8, local_size_y = 8, local_size_z = 1) in;

layout(set = 0, binding = 0, rgba16f) uniform image2D ColorImage;

layout(push_constant) uniform Params {
    vec2 RasterSize;
    vec2 Padding;
} params;

void main() {
    ivec2 pixel = ivec2(gl_GlobalInvocationID.xy);
    if (pixel.x >= int(params.RasterSize.x) || pixel.y >= int(params.RasterSize.y)) {
        return;
    }

    vec2 uv = (vec2(pixel) + 0.5) / params.RasterSize;
    vec4 color = imageLoad(ColorImage, pixel);

    /*@POSTFX_BODY@*/

    imageStore(ColorImage, pixel, color);
}
)";

} // namespace

TemplateCompiler::TemplateCompiler(GpuBackend* backend, const std::string& name)
    : m_backend(backend), m_name(name) {}

const std::string& TemplateCompiler::getTemplateSource() {
    return kTemplateSource;
}

std::string TemplateCompiler::merge(const std::string& bodyText) {
    std::string merged = kTemplateSource;
    const std::string token = PLACEHOLDER;
    size_t pos = merged.find(token);
    merged.replace(pos, token.size(), bodyText);
    return merged;
}

ShaderHandle TemplateCompiler::compile(const std::string& bodyText) {
    std::string source = merge(bodyText);

    CompileOutput output = m_backend->compileCompute(source, m_name);
    if (!output.success) {
        spdlog::error("Shader compilation error ({}): {}", m_name, output.diagnostics);
        spdlog::error("Merged source for {}:\n{}", m_name, source);
        throw CompileError(m_name, output.diagnostics, source);
    }

    if (!output.diagnostics.empty()) {
        spdlog::warn("Shader compiled with warnings ({}): {}", m_name, output.diagnostics);
    }

    return m_backend->createShader(output.binary);
}

} // namespace postfx
