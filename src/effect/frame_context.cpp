#include "postfx/effect/frame_context.hpp"

namespace postfx {

const char* toString(EffectStage stage) {
    switch (stage) {
        case EffectStage::BeforeTransparency: return "BeforeTransparency";
        case EffectStage::AfterTransparency: return "AfterTransparency";
        case EffectStage::AfterTonemap: return "AfterTonemap";
    }
    return "Unknown";
}

} // namespace postfx
