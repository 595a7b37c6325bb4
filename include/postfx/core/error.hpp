#pragma once

#include <stdexcept>
#include <string>

namespace postfx {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// A backend call (shader module, pipeline, descriptor set creation) failed.
class GpuError : public Error {
public:
    explicit GpuError(const std::string& message) : Error(message) {}
};

class CompileError : public Error {
public:
    CompileError(const std::string& name, const std::string& diagnostics, const std::string& mergedSource)
        : Error("Failed to compile shader: " + name), m_diagnostics(diagnostics), m_mergedSource(mergedSource) {}

    const std::string& getDiagnostics() const { return m_diagnostics; }
    const std::string& getMergedSource() const { return m_mergedSource; }

private:
    std::string m_diagnostics;
    std::string m_mergedSource;
};

class PipelineCreationError : public Error {
public:
    explicit PipelineCreationError(const std::string& message) : Error(message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

} // namespace postfx
