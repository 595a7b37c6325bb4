#include "postfx/renderer/sync.hpp"
#include <stdexcept>

namespace postfx {

FrameSync::FrameSync(Context* context, uint32_t maxFramesInFlight, uint32_t swapchainImageCount)
    : m_context(context), m_maxFramesInFlight(maxFramesInFlight) {

    VkFenceCreateInfo fenceInfo = {VK_STRUCTURE_TYPE_FENCE_CREATE_INFO};
    fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    for (uint32_t i = 0; i < maxFramesInFlight; i++) {
        m_imageAvailableSemaphores.push_back(createSemaphore());

        VkFence fence;
        if (vkCreateFence(m_context->getDevice(), &fenceInfo, nullptr, &fence) != VK_SUCCESS) {
            throw std::runtime_error("Failed to create frame fence!");
        }
        m_inFlightFences.push_back(fence);
    }

    resizeImageSemaphores(swapchainImageCount);
}

FrameSync::~FrameSync() {
    destroyImageSemaphores();
    for (uint32_t i = 0; i < m_maxFramesInFlight; i++) {
        vkDestroySemaphore(m_context->getDevice(), m_imageAvailableSemaphores[i], nullptr);
        vkDestroyFence(m_context->getDevice(), m_inFlightFences[i], nullptr);
    }
}

void FrameSync::waitForFrame(uint32_t frameIndex) {
    if (vkWaitForFences(m_context->getDevice(), 1, &m_inFlightFences[frameIndex], VK_TRUE, UINT64_MAX) != VK_SUCCESS) {
        throw std::runtime_error("Failed to wait for frame fence!");
    }
}

void FrameSync::resetFence(uint32_t frameIndex) {
    vkResetFences(m_context->getDevice(), 1, &m_inFlightFences[frameIndex]);
}

void FrameSync::resizeImageSemaphores(uint32_t swapchainImageCount) {
    destroyImageSemaphores();
    for (uint32_t i = 0; i < swapchainImageCount; i++) {
        m_renderFinishedSemaphores.push_back(createSemaphore());
    }
}

VkSemaphore FrameSync::createSemaphore() {
    VkSemaphoreCreateInfo semaphoreInfo = {VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO};
    VkSemaphore semaphore;
    if (vkCreateSemaphore(m_context->getDevice(), &semaphoreInfo, nullptr, &semaphore) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create synchronization objects for a frame!");
    }
    return semaphore;
}

void FrameSync::destroyImageSemaphores() {
    for (VkSemaphore semaphore : m_renderFinishedSemaphores) {
        vkDestroySemaphore(m_context->getDevice(), semaphore, nullptr);
    }
    m_renderFinishedSemaphores.clear();
}

} // namespace postfx
