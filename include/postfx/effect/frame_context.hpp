#pragma once

#include "postfx/gpu/backend.hpp"
#include <cstdint>
#include <vector>

namespace postfx {

enum class EffectStage {
    BeforeTransparency,
    AfterTransparency,
    AfterTonemap
};

const char* toString(EffectStage stage);

// What the host hands an effect every frame. colorImages holds one image per view,
// indexed by view.
struct RenderBuffers {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<ImageHandle> colorImages;

    uint32_t getViewCount() const { return static_cast<uint32_t>(colorImages.size()); }
};

struct FrameContext {
    EffectStage stage = EffectStage::AfterTransparency;
    uint64_t frameIndex = 0;
    RenderBuffers buffers;
};

} // namespace postfx
