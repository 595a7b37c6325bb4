#include "postfx/effect/frame_dispatcher.hpp"
#include <spdlog/spdlog.h>

namespace postfx {

FrameDispatcher::FrameDispatcher(GpuBackend* backend, BindingSetCache* bindingSets)
    : m_backend(backend), m_bindingSets(bindingSets) {}

uint32_t FrameDispatcher::groupsForExtent(uint32_t size) {
    return (size - 1) / GROUP_SIZE + 1;
}

std::optional<WorkGroupCount> FrameDispatcher::computeWorkGroups(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return std::nullopt;
    }
    return WorkGroupCount{groupsForExtent(width), groupsForExtent(height), 1};
}

PushConstants FrameDispatcher::buildPushConstants(uint32_t width, uint32_t height) {
    PushConstants pc;
    pc.rasterSize = glm::vec2(static_cast<float>(width), static_cast<float>(height));
    pc.padding = glm::vec2(0.0f);
    return pc;
}

uint32_t FrameDispatcher::dispatch(PipelineHandle pipeline, const RenderBuffers& buffers) {
    auto groups = computeWorkGroups(buffers.width, buffers.height);
    if (!groups) {
        return 0;
    }

    PushConstants pc = buildPushConstants(buffers.width, buffers.height);

    uint32_t recorded = 0;
    for (uint32_t view = 0; view < buffers.getViewCount(); view++) {
        BindingSetHandle set = m_bindingSets->getOrCreate(pipeline, COLOR_SLOT, {buffers.colorImages[view]});

        auto cmd = m_backend->beginCompute();
        cmd->bindPipeline(pipeline);
        cmd->bindBindingSet(COLOR_SLOT, set);
        cmd->pushConstants(&pc, sizeof(PushConstants));
        cmd->dispatch(groups->x, groups->y, groups->z);
        cmd->end();
        recorded++;
    }

    spdlog::trace("Dispatched {}x{}x{} groups for {} view(s)", groups->x, groups->y, groups->z, recorded);
    return recorded;
}

} // namespace postfx
