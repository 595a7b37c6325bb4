#pragma once

#include <vulkan/vulkan.h>
#include <vector>

namespace postfx {

class Context;
class Window;

// Swapchain images are blit targets for the views and color attachments for the UI.
class Swapchain {
public:
    Swapchain(Context* context, Window* window);
    ~Swapchain();

    Swapchain(const Swapchain&) = delete;
    Swapchain& operator=(const Swapchain&) = delete;

    // Rebuilds for the window's current framebuffer size. The device must be idle.
    void recreate();

    VkSwapchainKHR getHandle() const { return m_swapchain; }
    VkFormat getImageFormat() const { return m_imageFormat; }
    VkExtent2D getExtent() const { return m_extent; }
    const std::vector<VkImage>& getImages() const { return m_images; }
    const std::vector<VkImageView>& getImageViews() const { return m_imageViews; }

    uint32_t getImageCount() const { return static_cast<uint32_t>(m_images.size()); }

private:
    void create(VkSwapchainKHR oldSwapchain);
    void createImageViews();
    void destroyImageViews();

    Context* m_context;
    Window* m_window;

    VkSwapchainKHR m_swapchain = VK_NULL_HANDLE;
    std::vector<VkImage> m_images;
    std::vector<VkImageView> m_imageViews;
    VkFormat m_imageFormat;
    VkExtent2D m_extent;
};

} // namespace postfx
