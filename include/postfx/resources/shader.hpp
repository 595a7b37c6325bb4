#pragma once

#include "postfx/gpu/backend.hpp"
#include <shaderc/shaderc.hpp>
#include <string>

namespace postfx {

// GLSL compute source to SPIR-V for Vulkan 1.3. Never throws on bad source; the
// diagnostics come back in the output.
class ShaderCompiler {
public:
    ShaderCompiler();

    CompileOutput compileCompute(const std::string& source, const std::string& name);

private:
    shaderc::Compiler m_compiler;
    shaderc::CompileOptions m_options;
};

} // namespace postfx
