#pragma once

#include "postfx/gpu/backend.hpp"
#include <string>

namespace postfx {

class TemplateCompiler {
public:
    static constexpr const char* PLACEHOLDER = "/*@POSTFX_BODY@*/";

    TemplateCompiler(GpuBackend* backend, const std::string& name = "CustomComputeEffect");

    // Splices bodyText into the template in place of the first PLACEHOLDER. The body is
    // inserted verbatim, so a body that itself contains the token keeps it.
    static std::string merge(const std::string& bodyText);
    static const std::string& getTemplateSource();

    // Throws CompileError when the backend rejects the merged source and GpuError when
    // the shader object cannot be created from the compiled binary.
    ShaderHandle compile(const std::string& bodyText);

private:
    GpuBackend* m_backend;
    std::string m_name;
};

} // namespace postfx
