#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>
#include <vulkan/vulkan.h>
#include "postfx/core/commands.hpp"
#include "postfx/core/config.hpp"
#include "postfx/core/context.hpp"
#include "postfx/effect/custom_compute_effect.hpp"
#include "postfx/platform/file_watcher.hpp"
#include "postfx/platform/window.hpp"
#include "postfx/renderer/effect_scheduler.hpp"
#include "postfx/renderer/swapchain.hpp"
#include "postfx/renderer/sync.hpp"
#include "postfx/renderer/ui_manager.hpp"
#include "postfx/renderer/vulkan_backend.hpp"
#include "postfx/resources/image.hpp"

namespace {

const char* DEFAULT_CONFIG = "config/postfx.yaml";

// Every view holds one binding set of the live pipeline.
static_assert(postfx::SandboxSettings::MAX_VIEWS <= postfx::VulkanBackend::MAX_BINDING_SETS,
              "descriptor pool too small for the view limit");

void imageBarrier(VkCommandBuffer cmd, VkImage image,
                  VkPipelineStageFlags2 srcStage, VkAccessFlags2 srcAccess, VkImageLayout oldLayout,
                  VkPipelineStageFlags2 dstStage, VkAccessFlags2 dstAccess, VkImageLayout newLayout) {
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
    barrier.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

    VkDependencyInfo dependencyInfo = {VK_STRUCTURE_TYPE_DEPENDENCY_INFO};
    dependencyInfo.imageMemoryBarrierCount = 1;
    dependencyInfo.pImageMemoryBarriers = &barrier;
    vkCmdPipelineBarrier2(cmd, &dependencyInfo);
}

// Stand-in for the host's opaque pass: a slowly cycling gradient per view.
VkClearColorValue sceneColor(float time, uint32_t view) {
    float phase = time * 0.5f + static_cast<float>(view) * 2.1f;
    return {{0.25f + 0.2f * std::sin(phase), 0.25f + 0.2f * std::sin(phase + 2.094f), 0.25f + 0.2f * std::sin(phase + 4.188f), 1.0f}};
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    try {
        postfx::SandboxSettings settings = postfx::loadSandboxSettings(argc > 1 ? argv[1] : DEFAULT_CONFIG);
        spdlog::set_level(spdlog::level::from_str(settings.logLevel));
        spdlog::info("Starting PostFX Sandbox...");

        postfx::WindowSpecs specs;
        specs.title = settings.title;
        specs.width = settings.width;
        specs.height = settings.height;

        postfx::Window window(specs);

        postfx::Context context(&window);
        postfx::Swapchain swapchain(&context, &window);
        postfx::FrameSync sync(&context, 1, swapchain.getImageCount());
        postfx::CommandPool commandPool(&context, context.getQueueFamilyIndices().graphicsFamily.value());
        auto cmd = commandPool.allocateBuffer();

        postfx::VulkanBackend backend(&context);
        postfx::UIManager uiManager(&context, swapchain.getImageFormat(), swapchain.getImageCount());

        // One color target per view, sized for the configured window and kept in GENERAL.
        std::vector<std::unique_ptr<postfx::Image>> viewImages;
        postfx::RenderBuffers buffers;
        for (uint32_t view = 0; view < settings.viewCount; view++) {
            postfx::ImageSpecs imageSpecs;
            imageSpecs.width = settings.width;
            imageSpecs.height = settings.height;
            auto image = std::make_unique<postfx::Image>(&context, imageSpecs);
            image->initialize(VK_IMAGE_LAYOUT_GENERAL, {{0.0f, 0.0f, 0.0f, 1.0f}});
            buffers.colorImages.push_back(backend.importImage(image->getHandle(), image->getView()));
            viewImages.push_back(std::move(image));
        }

        postfx::CustomComputeEffect effect(&backend);
        postfx::EffectScheduler scheduler;
        scheduler.addEffect(effect.getName(), effect.asCallback());

        // A body file wins over the inline body. A watched file is delivered by the
        // watcher's first poll.
        if (settings.effect.bodyFile.empty()) {
            if (!settings.effect.body.empty()) {
                effect.setBody(settings.effect.body);
            }
        } else if (!settings.effect.watch) {
            effect.setBody(postfx::readTextFile(settings.effect.bodyFile));
        }

        std::unique_ptr<postfx::FileWatcher> watcher;
        if (!settings.effect.bodyFile.empty() && settings.effect.watch) {
            watcher = std::make_unique<postfx::FileWatcher>(
                settings.effect.bodyFile,
                std::chrono::milliseconds(settings.effect.pollIntervalMs),
                [&effect](const std::string& contents) {
                    spdlog::info("Shader body reloaded ({} bytes)", contents.size());
                    effect.setBody(contents);
                });
            watcher->start();
        }

        postfx::EffectState shownState = effect.getState();
        uint32_t currentFrame = 0;
        uint64_t frameIndex = 0;
        auto startTime = std::chrono::high_resolution_clock::now();
        auto lastFrameTime = startTime;

        while (!window.shouldClose()) {
            window.pollEvents();

            auto now = std::chrono::high_resolution_clock::now();
            float time = std::chrono::duration<float>(now - startTime).count();
            float frameMs = std::chrono::duration<float, std::milli>(now - lastFrameTime).count();
            lastFrameTime = now;

            postfx::FrameContext frame;
            frame.frameIndex = frameIndex++;
            frame.buffers = buffers;
            if (!window.isMinimized()) {
                frame.buffers.width = std::min(window.getWidth(), settings.width);
                frame.buffers.height = std::min(window.getHeight(), settings.height);
            }

            if (window.isMinimized()) {
                // Effects still see the frame (with a zero raster) so edits compile while hidden.
                scheduler.execute(frame);
                window.waitEvents();
                continue;
            }

            sync.waitForFrame(currentFrame);

            uint32_t imageIndex;
            VkResult result = vkAcquireNextImageKHR(context.getDevice(), swapchain.getHandle(), UINT64_MAX, sync.getImageAvailableSemaphore(currentFrame), VK_NULL_HANDLE, &imageIndex);

            if (result == VK_ERROR_OUT_OF_DATE_KHR) {
                context.waitIdle();
                swapchain.recreate();
                sync.resizeImageSemaphores(swapchain.getImageCount());
                continue;
            } else if (result != VK_SUCCESS && result != VK_SUBOPTIMAL_KHR) {
                throw std::runtime_error("Failed to acquire swapchain image!");
            }

            sync.resetFence(currentFrame);

            uiManager.beginFrame();
            postfx::FrameStats stats;
            stats.renderWidth = frame.buffers.width;
            stats.renderHeight = frame.buffers.height;
            stats.viewCount = frame.buffers.getViewCount();
            stats.frameMs = frameMs;
            uiManager.drawEffectPanel(effect, stats);
            uiManager.endFrame();

            cmd->reset();
            cmd->begin(VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT);
            VkCommandBuffer cb = cmd->getHandle();
            backend.setCommandBuffer(cb);

            // Opaque stand-in: clear every view.
            for (uint32_t view = 0; view < viewImages.size(); view++) {
                viewImages[view]->clear(cb, sceneColor(time, view));
            }

            frame.stage = postfx::EffectStage::AfterTransparency;
            scheduler.execute(frame);

            postfx::EffectState state = effect.getState();
            if (state != shownState) {
                window.setTitle(settings.title + " [" + postfx::toString(state) + "]");
                shownState = state;
            }

            // Lay the views out side by side across the swapchain image.
            VkImage target = swapchain.getImages()[imageIndex];
            VkExtent2D extent = swapchain.getExtent();
            // Source stage matches the acquire semaphore's wait stage.
            imageBarrier(cb, target,
                         VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT, 0, VK_IMAGE_LAYOUT_UNDEFINED,
                         VK_PIPELINE_STAGE_2_CLEAR_BIT | VK_PIPELINE_STAGE_2_BLIT_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

            VkImageSubresourceRange range = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};
            VkClearColorValue black = {{0.0f, 0.0f, 0.0f, 1.0f}};
            vkCmdClearColorImage(cb, target, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, &black, 1, &range);
            imageBarrier(cb, target,
                         VK_PIPELINE_STAGE_2_CLEAR_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                         VK_PIPELINE_STAGE_2_BLIT_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

            uint32_t viewCount = static_cast<uint32_t>(viewImages.size());
            uint32_t slotWidth = extent.width / viewCount;
            for (uint32_t view = 0; view < viewCount && slotWidth > 0; view++) {
                VkImage source = viewImages[view]->getHandle();
                imageBarrier(cb, source,
                             VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, VK_ACCESS_2_MEMORY_WRITE_BIT, VK_IMAGE_LAYOUT_GENERAL,
                             VK_PIPELINE_STAGE_2_BLIT_BIT, VK_ACCESS_2_TRANSFER_READ_BIT, VK_IMAGE_LAYOUT_GENERAL);

                VkImageBlit2 region = {VK_STRUCTURE_TYPE_IMAGE_BLIT_2};
                region.srcSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
                region.srcOffsets[1] = {static_cast<int32_t>(frame.buffers.width), static_cast<int32_t>(frame.buffers.height), 1};
                region.dstSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
                region.dstOffsets[0] = {static_cast<int32_t>(view * slotWidth), 0, 0};
                region.dstOffsets[1] = {static_cast<int32_t>((view + 1) * slotWidth), static_cast<int32_t>(extent.height), 1};

                VkBlitImageInfo2 blitInfo = {VK_STRUCTURE_TYPE_BLIT_IMAGE_INFO_2};
                blitInfo.srcImage = source;
                blitInfo.srcImageLayout = VK_IMAGE_LAYOUT_GENERAL;
                blitInfo.dstImage = target;
                blitInfo.dstImageLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
                blitInfo.regionCount = 1;
                blitInfo.pRegions = &region;
                blitInfo.filter = VK_FILTER_LINEAR;
                vkCmdBlitImage2(cb, &blitInfo);
            }

            imageBarrier(cb, target,
                         VK_PIPELINE_STAGE_2_BLIT_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                         VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);

            VkRenderingAttachmentInfo colorAttachment = {VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO};
            colorAttachment.imageView = swapchain.getImageViews()[imageIndex];
            colorAttachment.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
            colorAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_LOAD;
            colorAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;

            VkRenderingInfo renderingInfo = {VK_STRUCTURE_TYPE_RENDERING_INFO};
            renderingInfo.renderArea = {{0, 0}, extent};
            renderingInfo.layerCount = 1;
            renderingInfo.colorAttachmentCount = 1;
            renderingInfo.pColorAttachments = &colorAttachment;

            vkCmdBeginRendering(cb, &renderingInfo);
            uiManager.render(cb);
            vkCmdEndRendering(cb);

            imageBarrier(cb, target,
                         VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                         VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT, 0, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);

            cmd->end();

            VkSubmitInfo submitInfo = {};
            submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            VkSemaphore waitSemaphores[] = {sync.getImageAvailableSemaphore(currentFrame)};
            VkPipelineStageFlags waitStages[] = {VK_PIPELINE_STAGE_TRANSFER_BIT};
            submitInfo.waitSemaphoreCount = 1;
            submitInfo.pWaitSemaphores = waitSemaphores;
            submitInfo.pWaitDstStageMask = waitStages;
            submitInfo.commandBufferCount = 1;
            submitInfo.pCommandBuffers = &cb;
            VkSemaphore signalSemaphores[] = {sync.getRenderFinishedSemaphore(imageIndex)};
            submitInfo.signalSemaphoreCount = 1;
            submitInfo.pSignalSemaphores = signalSemaphores;

            if (vkQueueSubmit(context.getGraphicsQueue(), 1, &submitInfo, sync.getInFlightFence(currentFrame)) != VK_SUCCESS) {
                throw std::runtime_error("Failed to submit frame command buffer!");
            }

            VkPresentInfoKHR presentInfo = {};
            presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
            presentInfo.waitSemaphoreCount = 1;
            presentInfo.pWaitSemaphores = signalSemaphores;
            VkSwapchainKHR swapchains[] = {swapchain.getHandle()};
            presentInfo.swapchainCount = 1;
            presentInfo.pSwapchains = swapchains;
            presentInfo.pImageIndices = &imageIndex;

            result = vkQueuePresentKHR(context.getPresentQueue(), &presentInfo);

            if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR || window.consumeResized()) {
                context.waitIdle();
                swapchain.recreate();
                sync.resizeImageSemaphores(swapchain.getImageCount());
            } else if (result != VK_SUCCESS) {
                throw std::runtime_error("Failed to present swapchain image!");
            }

            currentFrame = (currentFrame + 1) % sync.getMaxFramesInFlight();
        }

        if (watcher) {
            watcher->stop();
        }
        context.waitIdle();

        effect.teardown();
        for (postfx::ImageHandle image : buffers.colorImages) {
            backend.forgetImage(image);
        }

    } catch (const std::exception& e) {
        spdlog::error("Critical error: {}", e.what());
        return 1;
    }

    return EXIT_SUCCESS;
}
