#pragma once

#include "postfx/core/context.hpp"
#include <vk_mem_alloc.h>

namespace postfx {

struct ImageSpecs {
    uint32_t width;
    uint32_t height;
    VkFormat format = VK_FORMAT_R16G16B16A16_SFLOAT;
    VkImageUsageFlags usage = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    VmaMemoryUsage memoryUsage = VMA_MEMORY_USAGE_AUTO;
    VkImageAspectFlags aspectFlags = VK_IMAGE_ASPECT_COLOR_BIT;
};

// A single-mip 2D image with its view.
class Image {
public:
    Image(Context* context, const ImageSpecs& specs);
    ~Image();

    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    VkImage getHandle() const { return m_image; }
    VkImageView getView() const { return m_view; }

    // Blocking. Moves the freshly created image to layout and fills it with clearColor.
    void initialize(VkImageLayout layout, const VkClearColorValue& clearColor);
    // Records a clear; the image must be in VK_IMAGE_LAYOUT_GENERAL.
    void clear(VkCommandBuffer cmd, const VkClearColorValue& color) const;

private:
    Context* m_context;
    ImageSpecs m_specs;
    VkImage m_image;
    VmaAllocation m_allocation;
    VkImageView m_view;

    void createView();
};

} // namespace postfx
