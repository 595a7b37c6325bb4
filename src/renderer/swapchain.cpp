#include "postfx/renderer/swapchain.hpp"
#include "postfx/core/context.hpp"
#include "postfx/platform/window.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace postfx {

namespace {

constexpr VkImageUsageFlags kImageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;

struct SurfaceSupport {
    VkSurfaceCapabilitiesKHR capabilities;
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> presentModes;
};

SurfaceSupport querySurface(VkPhysicalDevice device, VkSurfaceKHR surface) {
    SurfaceSupport support;
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device, surface, &support.capabilities);

    uint32_t count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &count, nullptr);
    support.formats.resize(count);
    vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &count, support.formats.data());

    count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &count, nullptr);
    support.presentModes.resize(count);
    vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &count, support.presentModes.data());
    return support;
}

// UNORM so the blit writes the post-processed values unchanged; the UI pipeline is
// created for whatever this returns.
VkSurfaceFormatKHR pickFormat(VkPhysicalDevice device, const std::vector<VkSurfaceFormatKHR>& formats) {
    const VkFormat preferred[] = {VK_FORMAT_B8G8R8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM};
    for (VkFormat format : preferred) {
        auto it = std::find_if(formats.begin(), formats.end(), [&](const VkSurfaceFormatKHR& f) {
            return f.format == format && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
        });
        if (it != formats.end()) {
            return *it;
        }
    }

    for (const auto& f : formats) {
        VkFormatProperties properties;
        vkGetPhysicalDeviceFormatProperties(device, f.format, &properties);
        if (properties.optimalTilingFeatures & VK_FORMAT_FEATURE_BLIT_DST_BIT) {
            spdlog::warn("Preferred swapchain formats unavailable, using format {}", static_cast<int>(f.format));
            return f;
        }
    }
    throw std::runtime_error("No swapchain format accepts blits!");
}

VkPresentModeKHR pickPresentMode(const std::vector<VkPresentModeKHR>& modes) {
    bool mailbox = std::find(modes.begin(), modes.end(), VK_PRESENT_MODE_MAILBOX_KHR) != modes.end();
    return mailbox ? VK_PRESENT_MODE_MAILBOX_KHR : VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D pickExtent(const VkSurfaceCapabilitiesKHR& capabilities, const Window& window) {
    if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max()) {
        return capabilities.currentExtent;
    }
    return {
        std::clamp(window.getWidth(), capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
        std::clamp(window.getHeight(), capabilities.minImageExtent.height, capabilities.maxImageExtent.height)
    };
}

} // namespace

Swapchain::Swapchain(Context* context, Window* window) : m_context(context), m_window(window) {
    create(VK_NULL_HANDLE);
    createImageViews();
}

Swapchain::~Swapchain() {
    destroyImageViews();
    vkDestroySwapchainKHR(m_context->getDevice(), m_swapchain, nullptr);
}

void Swapchain::recreate() {
    VkExtent2D previous = m_extent;
    VkSwapchainKHR old = m_swapchain;

    destroyImageViews();
    create(old);
    vkDestroySwapchainKHR(m_context->getDevice(), old, nullptr);
    createImageViews();

    spdlog::debug("Swapchain recreated: {}x{} -> {}x{}", previous.width, previous.height, m_extent.width, m_extent.height);
}

void Swapchain::create(VkSwapchainKHR oldSwapchain) {
    VkPhysicalDevice physicalDevice = m_context->getPhysicalDevice();
    SurfaceSupport support = querySurface(physicalDevice, m_context->getSurface());
    if (support.formats.empty() || support.presentModes.empty()) {
        throw std::runtime_error("Surface reports no formats or present modes!");
    }
    if ((support.capabilities.supportedUsageFlags & kImageUsage) != kImageUsage) {
        throw std::runtime_error("Surface images cannot be blit targets!");
    }

    VkSurfaceFormatKHR surfaceFormat = pickFormat(physicalDevice, support.formats);
    const VkSurfaceCapabilitiesKHR& caps = support.capabilities;

    uint32_t imageCount = caps.minImageCount + 1;
    if (caps.maxImageCount > 0) {
        imageCount = std::min(imageCount, caps.maxImageCount);
    }

    VkSwapchainCreateInfoKHR createInfo = {VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR};
    createInfo.surface = m_context->getSurface();
    createInfo.minImageCount = imageCount;
    createInfo.imageFormat = surfaceFormat.format;
    createInfo.imageColorSpace = surfaceFormat.colorSpace;
    createInfo.imageExtent = pickExtent(caps, *m_window);
    createInfo.imageArrayLayers = 1;
    createInfo.imageUsage = kImageUsage;
    createInfo.preTransform = caps.currentTransform;
    createInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    createInfo.presentMode = pickPresentMode(support.presentModes);
    createInfo.clipped = VK_TRUE;
    createInfo.oldSwapchain = oldSwapchain;

    QueueFamilyIndices indices = m_context->getQueueFamilyIndices();
    uint32_t families[] = {indices.graphicsFamily.value(), indices.presentFamily.value()};
    if (families[0] != families[1]) {
        createInfo.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        createInfo.queueFamilyIndexCount = 2;
        createInfo.pQueueFamilyIndices = families;
    } else {
        createInfo.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }

    if (vkCreateSwapchainKHR(m_context->getDevice(), &createInfo, nullptr, &m_swapchain) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create swapchain!");
    }

    vkGetSwapchainImagesKHR(m_context->getDevice(), m_swapchain, &imageCount, nullptr);
    m_images.resize(imageCount);
    vkGetSwapchainImagesKHR(m_context->getDevice(), m_swapchain, &imageCount, m_images.data());

    m_imageFormat = surfaceFormat.format;
    m_extent = createInfo.imageExtent;

    spdlog::info("Swapchain created: {}x{}, Images: {}", m_extent.width, m_extent.height, m_images.size());
}

void Swapchain::createImageViews() {
    m_imageViews.reserve(m_images.size());
    for (VkImage image : m_images) {
        VkImageViewCreateInfo viewInfo = {VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO};
        viewInfo.image = image;
        viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format = m_imageFormat;
        viewInfo.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

        VkImageView view;
        if (vkCreateImageView(m_context->getDevice(), &viewInfo, nullptr, &view) != VK_SUCCESS) {
            throw std::runtime_error("Failed to create swapchain image view!");
        }
        m_imageViews.push_back(view);
    }
}

void Swapchain::destroyImageViews() {
    for (VkImageView view : m_imageViews) {
        vkDestroyImageView(m_context->getDevice(), view, nullptr);
    }
    m_imageViews.clear();
}

} // namespace postfx
