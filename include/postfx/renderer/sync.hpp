#pragma once

#include "postfx/core/context.hpp"
#include <vulkan/vulkan.h>
#include <vector>

namespace postfx {

// Per-frame acquire semaphore and fence, plus one present semaphore per swapchain
// image (a present semaphore is only safe to reuse once its image is acquired again).
class FrameSync {
public:
    FrameSync(Context* context, uint32_t maxFramesInFlight, uint32_t swapchainImageCount);
    ~FrameSync();

    FrameSync(const FrameSync&) = delete;
    FrameSync& operator=(const FrameSync&) = delete;

    void waitForFrame(uint32_t frameIndex);
    void resetFence(uint32_t frameIndex);
    void resizeImageSemaphores(uint32_t swapchainImageCount);

    uint32_t getMaxFramesInFlight() const { return m_maxFramesInFlight; }
    VkSemaphore getImageAvailableSemaphore(uint32_t frameIndex) const { return m_imageAvailableSemaphores[frameIndex]; }
    VkSemaphore getRenderFinishedSemaphore(uint32_t imageIndex) const { return m_renderFinishedSemaphores[imageIndex]; }
    VkFence getInFlightFence(uint32_t frameIndex) const { return m_inFlightFences[frameIndex]; }

private:
    VkSemaphore createSemaphore();
    void destroyImageSemaphores();

    Context* m_context;
    uint32_t m_maxFramesInFlight;

    std::vector<VkSemaphore> m_imageAvailableSemaphores;
    std::vector<VkSemaphore> m_renderFinishedSemaphores;
    std::vector<VkFence> m_inFlightFences;
};

} // namespace postfx
