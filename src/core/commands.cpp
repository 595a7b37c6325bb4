#include "postfx/core/commands.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace postfx {

// CommandBuffer
CommandBuffer::CommandBuffer(VkDevice device, VkCommandPool pool) : m_device(device), m_pool(pool) {
    VkCommandBufferAllocateInfo allocInfo = {VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO};
    allocInfo.commandPool = pool;
    allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = 1;

    if (vkAllocateCommandBuffers(m_device, &allocInfo, &m_handle) != VK_SUCCESS) {
        throw std::runtime_error("Failed to allocate command buffer!");
    }
}

CommandBuffer::~CommandBuffer() {
    vkFreeCommandBuffers(m_device, m_pool, 1, &m_handle);
}

void CommandBuffer::begin(VkCommandBufferUsageFlags flags) {
    VkCommandBufferBeginInfo beginInfo = {VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO};
    beginInfo.flags = flags;

    if (vkBeginCommandBuffer(m_handle, &beginInfo) != VK_SUCCESS) {
        throw std::runtime_error("Failed to begin recording command buffer!");
    }
}

void CommandBuffer::end() {
    if (vkEndCommandBuffer(m_handle) != VK_SUCCESS) {
        throw std::runtime_error("Failed to record command buffer!");
    }
}

void CommandBuffer::reset() {
    if (vkResetCommandBuffer(m_handle, 0) != VK_SUCCESS) {
        throw std::runtime_error("Failed to reset command buffer!");
    }
}

// CommandPool
CommandPool::CommandPool(Context* context, uint32_t queueFamilyIndex, VkCommandPoolCreateFlags flags)
    : m_context(context) {

    VkCommandPoolCreateInfo poolInfo = {VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO};
    poolInfo.queueFamilyIndex = queueFamilyIndex;
    poolInfo.flags = flags;

    if (vkCreateCommandPool(m_context->getDevice(), &poolInfo, nullptr, &m_handle) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create command pool!");
    }
}

CommandPool::~CommandPool() {
    vkDestroyCommandPool(m_context->getDevice(), m_handle, nullptr);
}

std::unique_ptr<CommandBuffer> CommandPool::allocateBuffer() {
    return std::make_unique<CommandBuffer>(m_context->getDevice(), m_handle);
}

// ImmediateCommands
ImmediateCommands::ImmediateCommands(Context* context)
    : m_context(context),
      m_pool(context, context->getQueueFamilyIndices().graphicsFamily.value(), VK_COMMAND_POOL_CREATE_TRANSIENT_BIT) {
    VkFenceCreateInfo fenceInfo = {VK_STRUCTURE_TYPE_FENCE_CREATE_INFO};
    if (vkCreateFence(m_context->getDevice(), &fenceInfo, nullptr, &m_fence) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create immediate submit fence!");
    }
    m_buffer = m_pool.allocateBuffer();
    m_buffer->begin(VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT);
}

ImmediateCommands::~ImmediateCommands() {
    if (!m_submitted) {
        spdlog::warn("Immediate commands dropped without submit()");
    }
    m_buffer.reset();
    vkDestroyFence(m_context->getDevice(), m_fence, nullptr);
}

void ImmediateCommands::submit() {
    if (m_submitted) {
        throw std::logic_error("Immediate commands submitted twice");
    }
    m_buffer->end();

    VkCommandBufferSubmitInfo bufferInfo = {VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO};
    bufferInfo.commandBuffer = m_buffer->getHandle();

    VkSubmitInfo2 submitInfo = {VK_STRUCTURE_TYPE_SUBMIT_INFO_2};
    submitInfo.commandBufferInfoCount = 1;
    submitInfo.pCommandBufferInfos = &bufferInfo;

    if (vkQueueSubmit2(m_context->getGraphicsQueue(), 1, &submitInfo, m_fence) != VK_SUCCESS) {
        throw std::runtime_error("Failed to submit immediate commands!");
    }
    m_submitted = true;

    VkResult result = vkWaitForFences(m_context->getDevice(), 1, &m_fence, VK_TRUE, TIMEOUT_NS);
    if (result == VK_TIMEOUT) {
        throw std::runtime_error("Immediate commands timed out!");
    } else if (result != VK_SUCCESS) {
        throw std::runtime_error("Failed to wait for immediate commands!");
    }
}

} // namespace postfx
