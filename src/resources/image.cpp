#include "postfx/resources/image.hpp"
#include "postfx/core/commands.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace postfx {

namespace {

void recordBarrier(VkCommandBuffer cmd, VkImage image, VkImageAspectFlags aspect,
                   VkPipelineStageFlags2 srcStage, VkAccessFlags2 srcAccess,
                   VkPipelineStageFlags2 dstStage, VkAccessFlags2 dstAccess,
                   VkImageLayout oldLayout, VkImageLayout newLayout) {
    VkImageMemoryBarrier2 barrier = {VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2};
    barrier.srcStageMask = srcStage;
    barrier.srcAccessMask = srcAccess;
    barrier.dstStageMask = dstStage;
    barrier.dstAccessMask = dstAccess;
    barrier.oldLayout = oldLayout;
    barrier.newLayout = newLayout;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange = {aspect, 0, 1, 0, 1};

    VkDependencyInfo depInfo = {VK_STRUCTURE_TYPE_DEPENDENCY_INFO};
    depInfo.imageMemoryBarrierCount = 1;
    depInfo.pImageMemoryBarriers = &barrier;
    vkCmdPipelineBarrier2(cmd, &depInfo);
}

} // namespace

Image::Image(Context* context, const ImageSpecs& specs)
    : m_context(context), m_specs(specs) {

    if (specs.width == 0 || specs.height == 0) {
        throw std::runtime_error("Image extent must be non-zero!");
    }

    VkImageCreateInfo imageInfo = {VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO};
    imageInfo.imageType = VK_IMAGE_TYPE_2D;
    imageInfo.format = specs.format;
    imageInfo.extent = {specs.width, specs.height, 1};
    imageInfo.mipLevels = 1;
    imageInfo.arrayLayers = 1;
    imageInfo.samples = VK_SAMPLE_COUNT_1_BIT;
    imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
    imageInfo.usage = specs.usage;
    imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    VmaAllocationCreateInfo allocInfo = {};
    allocInfo.usage = specs.memoryUsage;
    allocInfo.flags = VMA_ALLOCATION_CREATE_DEDICATED_MEMORY_BIT;

    if (vmaCreateImage(m_context->getAllocator(), &imageInfo, &allocInfo, &m_image, &m_allocation, nullptr) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create image!");
    }

    createView();
    spdlog::debug("Image created: {}x{} (format {})", specs.width, specs.height, static_cast<int>(specs.format));
}

Image::~Image() {
    vkDestroyImageView(m_context->getDevice(), m_view, nullptr);
    vmaDestroyImage(m_context->getAllocator(), m_image, m_allocation);
}

void Image::initialize(VkImageLayout layout, const VkClearColorValue& clearColor) {
    ImmediateCommands cmd(m_context);
    VkCommandBuffer cb = cmd.getBuffer();

    recordBarrier(cb, m_image, m_specs.aspectFlags,
                  VK_PIPELINE_STAGE_2_NONE, 0,
                  VK_PIPELINE_STAGE_2_CLEAR_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                  VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

    VkImageSubresourceRange range = {m_specs.aspectFlags, 0, 1, 0, 1};
    vkCmdClearColorImage(cb, m_image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, &clearColor, 1, &range);

    recordBarrier(cb, m_image, m_specs.aspectFlags,
                  VK_PIPELINE_STAGE_2_CLEAR_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                  VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT,
                  VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, layout);

    cmd.submit();
}

void Image::clear(VkCommandBuffer cmd, const VkClearColorValue& color) const {
    // Whatever touched the image last frame (compute, blit) must finish first.
    recordBarrier(cmd, m_image, m_specs.aspectFlags,
                  VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT,
                  VK_PIPELINE_STAGE_2_CLEAR_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                  VK_IMAGE_LAYOUT_GENERAL, VK_IMAGE_LAYOUT_GENERAL);

    VkImageSubresourceRange range = {m_specs.aspectFlags, 0, 1, 0, 1};
    vkCmdClearColorImage(cmd, m_image, VK_IMAGE_LAYOUT_GENERAL, &color, 1, &range);
}

void Image::createView() {
    VkImageViewCreateInfo viewInfo = {VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO};
    viewInfo.image = m_image;
    viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
    viewInfo.format = m_specs.format;
    viewInfo.subresourceRange = {m_specs.aspectFlags, 0, 1, 0, 1};

    if (vkCreateImageView(m_context->getDevice(), &viewInfo, nullptr, &m_view) != VK_SUCCESS) {
        vmaDestroyImage(m_context->getAllocator(), m_image, m_allocation);
        throw std::runtime_error("Failed to create image view!");
    }
}

} // namespace postfx
