#pragma once

#include "postfx/core/context.hpp"
#include "postfx/gpu/backend.hpp"
#include "postfx/resources/shader.hpp"
#include <vulkan/vulkan.h>
#include <map>
#include <optional>
#include <vector>

namespace postfx {

// GpuBackend over a Vulkan device. Every pipeline shares one layout: set 0 holds a
// single storage image at binding 0, plus a 16-byte compute push-constant range.
//
// Imported images are expected to stay in VK_IMAGE_LAYOUT_GENERAL. Compute sequences
// are recorded into the command buffer last passed to setCommandBuffer().
class VulkanBackend : public GpuBackend {
public:
    static constexpr uint32_t PUSH_CONSTANT_SIZE = 16;
    static constexpr uint32_t MAX_BINDING_SETS = 64;

    VulkanBackend(Context* context);
    ~VulkanBackend() override;

    VulkanBackend(const VulkanBackend&) = delete;
    VulkanBackend& operator=(const VulkanBackend&) = delete;

    ImageHandle importImage(VkImage image, VkImageView view);
    void forgetImage(ImageHandle image);

    void setCommandBuffer(VkCommandBuffer cmd) { m_cmd = cmd; }

    CompileOutput compileCompute(const std::string& source, const std::string& name) override;
    ShaderHandle createShader(const std::vector<uint32_t>& binary) override;
    PipelineHandle createComputePipeline(ShaderHandle shader) override;
    BindingSetHandle createBindingSet(PipelineHandle pipeline, uint32_t slot, const std::vector<ImageHandle>& images) override;
    std::unique_ptr<ComputeCommandList> beginCompute() override;
    void free(ShaderHandle shader) override;

private:
    class CommandList;

    struct ShaderRecord {
        VkShaderModule module;
        std::optional<PipelineHandle> pipeline;
    };

    struct PipelineRecord {
        VkPipeline pipeline;
        ShaderHandle shader;
        std::vector<BindingSetHandle> bindingSets;
    };

    struct BindingSetRecord {
        VkDescriptorSet set;
        std::vector<ImageHandle> images;
    };

    struct ImageRecord {
        VkImage image;
        VkImageView view;
    };

    void createLayouts();
    void createPool();
    uint64_t nextId() { return m_nextId++; }

    Context* m_context;
    ShaderCompiler m_compiler;

    VkDescriptorSetLayout m_setLayout = VK_NULL_HANDLE;
    VkPipelineLayout m_pipelineLayout = VK_NULL_HANDLE;
    VkDescriptorPool m_pool = VK_NULL_HANDLE;
    VkCommandBuffer m_cmd = VK_NULL_HANDLE;

    std::map<ShaderHandle, ShaderRecord> m_shaders;
    std::map<PipelineHandle, PipelineRecord> m_pipelines;
    std::map<BindingSetHandle, BindingSetRecord> m_bindingSets;
    std::map<ImageHandle, ImageRecord> m_images;
    uint64_t m_nextId = 1;
};

} // namespace postfx
