#pragma once

#include "postfx/effect/binding_set_cache.hpp"
#include "postfx/effect/frame_context.hpp"
#include "postfx/gpu/backend.hpp"
#include <glm/glm.hpp>
#include <optional>

namespace postfx {

struct alignas(16) PushConstants {
    glm::vec2 rasterSize;
    glm::vec2 padding;
};

static_assert(sizeof(PushConstants) == 16, "PushConstants must match the 16-byte block in the template");

struct WorkGroupCount {
    uint32_t x;
    uint32_t y;
    uint32_t z;
};

class FrameDispatcher {
public:
    static constexpr uint32_t GROUP_SIZE = 8;
    static constexpr uint32_t COLOR_SLOT = 0;

    FrameDispatcher(GpuBackend* backend, BindingSetCache* bindingSets);

    // Number of GROUP_SIZE-wide groups covering size texels; size must be non-zero.
    static uint32_t groupsForExtent(uint32_t size);
    // nullopt when either dimension is zero.
    static std::optional<WorkGroupCount> computeWorkGroups(uint32_t width, uint32_t height);
    static PushConstants buildPushConstants(uint32_t width, uint32_t height);

    // Records one compute sequence per view. Returns the number of sequences recorded.
    uint32_t dispatch(PipelineHandle pipeline, const RenderBuffers& buffers);

private:
    GpuBackend* m_backend;
    BindingSetCache* m_bindingSets;
};

} // namespace postfx
