#pragma once

#include "postfx/core/context.hpp"
#include <vulkan/vulkan.h>
#include <memory>

namespace postfx {

class CommandBuffer {
public:
    CommandBuffer(VkDevice device, VkCommandPool pool);
    ~CommandBuffer();

    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;

    void begin(VkCommandBufferUsageFlags flags = 0);
    void end();
    void reset();

    VkCommandBuffer getHandle() const { return m_handle; }

private:
    VkDevice m_device;
    VkCommandPool m_pool;
    VkCommandBuffer m_handle;
};

class CommandPool {
public:
    CommandPool(Context* context, uint32_t queueFamilyIndex, VkCommandPoolCreateFlags flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT);
    ~CommandPool();

    CommandPool(const CommandPool&) = delete;
    CommandPool& operator=(const CommandPool&) = delete;

    std::unique_ptr<CommandBuffer> allocateBuffer();

    VkCommandPool getHandle() const { return m_handle; }

private:
    Context* m_context;
    VkCommandPool m_handle;
};

// Records into a one-shot buffer from construction; submit() executes it on the
// graphics queue and blocks on a fence until done.
class ImmediateCommands {
public:
    static constexpr uint64_t TIMEOUT_NS = 5'000'000'000ull;

    ImmediateCommands(Context* context);
    ~ImmediateCommands();

    ImmediateCommands(const ImmediateCommands&) = delete;
    ImmediateCommands& operator=(const ImmediateCommands&) = delete;

    VkCommandBuffer getBuffer() const { return m_buffer->getHandle(); }
    void submit();

private:
    Context* m_context;
    CommandPool m_pool;
    std::unique_ptr<CommandBuffer> m_buffer;
    VkFence m_fence = VK_NULL_HANDLE;
    bool m_submitted = false;
};

} // namespace postfx
