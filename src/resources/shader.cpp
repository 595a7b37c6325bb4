#include "postfx/resources/shader.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace postfx {

ShaderCompiler::ShaderCompiler() {
    if (!m_compiler.IsValid()) {
        throw std::runtime_error("Failed to initialize shaderc compiler!");
    }

    m_options.SetTargetEnvironment(shaderc_target_env_vulkan, shaderc_env_version_vulkan_1_3);
    m_options.SetOptimizationLevel(shaderc_optimization_level_performance);
}

CompileOutput ShaderCompiler::compileCompute(const std::string& source, const std::string& name) {
    shaderc::SpvCompilationResult result =
        m_compiler.CompileGlslToSpv(source, shaderc_glsl_compute_shader, name.c_str(), m_options);

    CompileOutput output;
    output.success = result.GetCompilationStatus() == shaderc_compilation_status_success;
    output.diagnostics = result.GetErrorMessage();

    if (output.success) {
        output.binary.assign(result.cbegin(), result.cend());
        spdlog::debug("Compiled {} ({} SPIR-V words, {} warning(s))", name, output.binary.size(), result.GetNumWarnings());
    }

    return output;
}

} // namespace postfx
