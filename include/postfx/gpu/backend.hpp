#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace postfx {

enum class ShaderHandle : uint64_t {};
enum class PipelineHandle : uint64_t {};
enum class ImageHandle : uint64_t {};
enum class BindingSetHandle : uint64_t {};

struct CompileOutput {
    bool success = false;
    std::vector<uint32_t> binary;
    std::string diagnostics;
};

// One begin..end compute sequence. end() must be called before the next beginCompute().
class ComputeCommandList {
public:
    virtual ~ComputeCommandList() = default;

    virtual void bindPipeline(PipelineHandle pipeline) = 0;
    virtual void bindBindingSet(uint32_t slot, BindingSetHandle set) = 0;
    virtual void pushConstants(const void* data, uint32_t size) = 0;
    virtual void dispatch(uint32_t groupsX, uint32_t groupsY, uint32_t groupsZ) = 0;
    virtual void end() = 0;
};

// The GPU surface the effect needs. All calls happen on the render thread.
//
// Ownership edges: a pipeline belongs to the shader it was created from, and binding
// sets belong to the pipeline they were created for. free(shader) releases all three.
// Creation failures throw GpuError.
class GpuBackend {
public:
    virtual ~GpuBackend() = default;

    virtual CompileOutput compileCompute(const std::string& source, const std::string& name) = 0;
    virtual ShaderHandle createShader(const std::vector<uint32_t>& binary) = 0;
    virtual PipelineHandle createComputePipeline(ShaderHandle shader) = 0;
    virtual BindingSetHandle createBindingSet(PipelineHandle pipeline, uint32_t slot, const std::vector<ImageHandle>& images) = 0;
    virtual std::unique_ptr<ComputeCommandList> beginCompute() = 0;
    virtual void free(ShaderHandle shader) = 0;
};

} // namespace postfx
