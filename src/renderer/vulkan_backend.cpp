#include "postfx/renderer/vulkan_backend.hpp"
#include "postfx/core/error.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace postfx {

class VulkanBackend::CommandList : public ComputeCommandList {
public:
    CommandList(VulkanBackend* backend, VkCommandBuffer cmd) : m_backend(backend), m_cmd(cmd) {}

    void bindPipeline(PipelineHandle pipeline) override {
        auto it = m_backend->m_pipelines.find(pipeline);
        if (it == m_backend->m_pipelines.end()) {
            throw GpuError("Unknown compute pipeline: " + std::to_string(static_cast<uint64_t>(pipeline)));
        }
        vkCmdBindPipeline(m_cmd, VK_PIPELINE_BIND_POINT_COMPUTE, it->second.pipeline);
    }

    void bindBindingSet(uint32_t slot, BindingSetHandle set) override {
        auto it = m_backend->m_bindingSets.find(set);
        if (it == m_backend->m_bindingSets.end()) {
            throw GpuError("Unknown binding set: " + std::to_string(static_cast<uint64_t>(set)));
        }
        vkCmdBindDescriptorSets(m_cmd, VK_PIPELINE_BIND_POINT_COMPUTE, m_backend->m_pipelineLayout, slot, 1, &it->second.set, 0, nullptr);
        m_images = it->second.images;
    }

    void pushConstants(const void* data, uint32_t size) override {
        if (size > PUSH_CONSTANT_SIZE) {
            throw GpuError("Push constant block exceeds " + std::to_string(PUSH_CONSTANT_SIZE) + " bytes");
        }
        vkCmdPushConstants(m_cmd, m_backend->m_pipelineLayout, VK_SHADER_STAGE_COMPUTE_BIT, 0, size, data);
    }

    void dispatch(uint32_t groupsX, uint32_t groupsY, uint32_t groupsZ) override {
        // Whatever produced the color image must land before the shader reads it.
        barrier(VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, VK_ACCESS_2_MEMORY_WRITE_BIT,
                VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_READ_BIT | VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT);
        vkCmdDispatch(m_cmd, groupsX, groupsY, groupsZ);
    }

    void end() override {
        barrier(VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
                VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT);
        m_images.clear();
    }

private:
    void barrier(VkPipelineStageFlags2 srcStage, VkAccessFlags2 srcAccess, VkPipelineStageFlags2 dstStage, VkAccessFlags2 dstAccess) {
        std::vector<VkImageMemoryBarrier2> barriers;
        for (ImageHandle handle : m_images) {
            auto it = m_backend->m_images.find(handle);
            if (it == m_backend->m_images.end()) {
                continue;
            }

            VkImageMemoryBarrier2 b = {VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2};
            b.srcStageMask = srcStage;
            b.srcAccessMask = srcAccess;
            b.dstStageMask = dstStage;
            b.dstAccessMask = dstAccess;
            b.oldLayout = VK_IMAGE_LAYOUT_GENERAL;
            b.newLayout = VK_IMAGE_LAYOUT_GENERAL;
            b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            b.image = it->second.image;
            b.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            b.subresourceRange.baseMipLevel = 0;
            b.subresourceRange.levelCount = 1;
            b.subresourceRange.baseArrayLayer = 0;
            b.subresourceRange.layerCount = 1;
            barriers.push_back(b);
        }

        if (barriers.empty()) {
            return;
        }

        VkDependencyInfo depInfo = {VK_STRUCTURE_TYPE_DEPENDENCY_INFO};
        depInfo.imageMemoryBarrierCount = static_cast<uint32_t>(barriers.size());
        depInfo.pImageMemoryBarriers = barriers.data();
        vkCmdPipelineBarrier2(m_cmd, &depInfo);
    }

    VulkanBackend* m_backend;
    VkCommandBuffer m_cmd;
    std::vector<ImageHandle> m_images;
};

VulkanBackend::VulkanBackend(Context* context) : m_context(context) {
    createLayouts();
    createPool();
}

VulkanBackend::~VulkanBackend() {
    while (!m_shaders.empty()) {
        free(m_shaders.begin()->first);
    }

    vkDestroyDescriptorPool(m_context->getDevice(), m_pool, nullptr);
    vkDestroyPipelineLayout(m_context->getDevice(), m_pipelineLayout, nullptr);
    vkDestroyDescriptorSetLayout(m_context->getDevice(), m_setLayout, nullptr);
}

void VulkanBackend::createLayouts() {
    VkDescriptorSetLayoutBinding binding = {};
    binding.binding = 0;
    binding.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    binding.descriptorCount = 1;
    binding.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;

    VkDescriptorSetLayoutCreateInfo layoutInfo = {VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO};
    layoutInfo.bindingCount = 1;
    layoutInfo.pBindings = &binding;

    if (vkCreateDescriptorSetLayout(m_context->getDevice(), &layoutInfo, nullptr, &m_setLayout) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create post-process descriptor set layout!");
    }

    VkPushConstantRange pushConstantRange = {};
    pushConstantRange.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    pushConstantRange.offset = 0;
    pushConstantRange.size = PUSH_CONSTANT_SIZE; // vec2 RasterSize + vec2 Padding

    VkPipelineLayoutCreateInfo pipelineLayoutInfo = {VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO};
    pipelineLayoutInfo.setLayoutCount = 1;
    pipelineLayoutInfo.pSetLayouts = &m_setLayout;
    pipelineLayoutInfo.pushConstantRangeCount = 1;
    pipelineLayoutInfo.pPushConstantRanges = &pushConstantRange;

    if (vkCreatePipelineLayout(m_context->getDevice(), &pipelineLayoutInfo, nullptr, &m_pipelineLayout) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create post-process pipeline layout!");
    }
}

void VulkanBackend::createPool() {
    VkDescriptorPoolSize poolSize = {VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, MAX_BINDING_SETS};

    VkDescriptorPoolCreateInfo poolInfo = {VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO};
    poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    poolInfo.maxSets = MAX_BINDING_SETS;
    poolInfo.poolSizeCount = 1;
    poolInfo.pPoolSizes = &poolSize;

    if (vkCreateDescriptorPool(m_context->getDevice(), &poolInfo, nullptr, &m_pool) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create post-process descriptor pool!");
    }
}

ImageHandle VulkanBackend::importImage(VkImage image, VkImageView view) {
    ImageHandle handle{nextId()};
    m_images[handle] = {image, view};
    return handle;
}

void VulkanBackend::forgetImage(ImageHandle image) {
    m_images.erase(image);
}

CompileOutput VulkanBackend::compileCompute(const std::string& source, const std::string& name) {
    return m_compiler.compileCompute(source, name);
}

ShaderHandle VulkanBackend::createShader(const std::vector<uint32_t>& binary) {
    VkShaderModuleCreateInfo createInfo = {VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO};
    createInfo.codeSize = binary.size() * sizeof(uint32_t);
    createInfo.pCode = binary.data();

    VkShaderModule module;
    if (vkCreateShaderModule(m_context->getDevice(), &createInfo, nullptr, &module) != VK_SUCCESS) {
        throw GpuError("Failed to create shader module!");
    }

    ShaderHandle handle{nextId()};
    m_shaders[handle] = {module, std::nullopt};
    return handle;
}

PipelineHandle VulkanBackend::createComputePipeline(ShaderHandle shader) {
    auto it = m_shaders.find(shader);
    if (it == m_shaders.end()) {
        throw GpuError("Unknown shader: " + std::to_string(static_cast<uint64_t>(shader)));
    }
    if (it->second.pipeline) {
        throw GpuError("Shader already owns a pipeline");
    }

    VkComputePipelineCreateInfo pipelineInfo = {VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO};
    pipelineInfo.stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    pipelineInfo.stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    pipelineInfo.stage.module = it->second.module;
    pipelineInfo.stage.pName = "main";
    pipelineInfo.layout = m_pipelineLayout;

    VkPipeline pipeline;
    if (vkCreateComputePipelines(m_context->getDevice(), VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline) != VK_SUCCESS) {
        throw GpuError("Failed to create compute pipeline!");
    }

    PipelineHandle handle{nextId()};
    m_pipelines[handle] = {pipeline, shader, {}};
    it->second.pipeline = handle;
    return handle;
}

BindingSetHandle VulkanBackend::createBindingSet(PipelineHandle pipeline, uint32_t slot, const std::vector<ImageHandle>& images) {
    auto pipelineIt = m_pipelines.find(pipeline);
    if (pipelineIt == m_pipelines.end()) {
        throw GpuError("Unknown compute pipeline: " + std::to_string(static_cast<uint64_t>(pipeline)));
    }
    if (slot != 0 || images.size() != 1) {
        throw GpuError("Post-process layout takes exactly one image at set 0");
    }
    auto imageIt = m_images.find(images[0]);
    if (imageIt == m_images.end()) {
        throw GpuError("Unknown image: " + std::to_string(static_cast<uint64_t>(images[0])));
    }

    VkDescriptorSetAllocateInfo allocInfo = {VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO};
    allocInfo.descriptorPool = m_pool;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts = &m_setLayout;

    VkDescriptorSet set;
    if (vkAllocateDescriptorSets(m_context->getDevice(), &allocInfo, &set) != VK_SUCCESS) {
        throw GpuError("Failed to allocate post-process descriptor set!");
    }

    VkDescriptorImageInfo imageInfo = {};
    imageInfo.imageView = imageIt->second.view;
    imageInfo.imageLayout = VK_IMAGE_LAYOUT_GENERAL;

    VkWriteDescriptorSet write = {VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET};
    write.dstSet = set;
    write.dstBinding = 0;
    write.dstArrayElement = 0;
    write.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    write.descriptorCount = 1;
    write.pImageInfo = &imageInfo;

    vkUpdateDescriptorSets(m_context->getDevice(), 1, &write, 0, nullptr);

    BindingSetHandle handle{nextId()};
    m_bindingSets[handle] = {set, images};
    pipelineIt->second.bindingSets.push_back(handle);
    return handle;
}

std::unique_ptr<ComputeCommandList> VulkanBackend::beginCompute() {
    if (m_cmd == VK_NULL_HANDLE) {
        throw GpuError("No command buffer to record the compute sequence into");
    }
    return std::make_unique<CommandList>(this, m_cmd);
}

void VulkanBackend::free(ShaderHandle shader) {
    auto it = m_shaders.find(shader);
    if (it == m_shaders.end()) {
        return;
    }

    // The previous frame may still reference the pipeline.
    if (vkDeviceWaitIdle(m_context->getDevice()) != VK_SUCCESS) {
        spdlog::error("vkDeviceWaitIdle failed while releasing shader {}", static_cast<uint64_t>(shader));
    }

    if (it->second.pipeline) {
        auto pipelineIt = m_pipelines.find(*it->second.pipeline);
        if (pipelineIt != m_pipelines.end()) {
            for (BindingSetHandle setHandle : pipelineIt->second.bindingSets) {
                auto setIt = m_bindingSets.find(setHandle);
                if (setIt != m_bindingSets.end()) {
                    vkFreeDescriptorSets(m_context->getDevice(), m_pool, 1, &setIt->second.set);
                    m_bindingSets.erase(setIt);
                }
            }
            vkDestroyPipeline(m_context->getDevice(), pipelineIt->second.pipeline, nullptr);
            m_pipelines.erase(pipelineIt);
        }
    }

    vkDestroyShaderModule(m_context->getDevice(), it->second.module, nullptr);
    m_shaders.erase(it);

    spdlog::debug("Released shader {} and its dependents", static_cast<uint64_t>(shader));
}

} // namespace postfx
