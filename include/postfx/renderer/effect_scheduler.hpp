#pragma once

#include "postfx/effect/frame_context.hpp"
#include <functional>
#include <string>
#include <vector>

namespace postfx {

using EffectCallback = std::function<void(const FrameContext&)>;

struct EffectNode {
    std::string name;
    EffectCallback execute;
    bool enabled = true;
};

// Runs registered effect callbacks, in registration order, once per stage per frame.
class EffectScheduler {
public:
    EffectScheduler() = default;

    void addEffect(const std::string& name, EffectCallback execute);
    bool removeEffect(const std::string& name);
    bool setEnabled(const std::string& name, bool enabled);

    // Returns the number of callbacks invoked.
    uint32_t execute(const FrameContext& frame);

    size_t getEffectCount() const { return m_effects.size(); }
    void clear();

private:
    std::vector<EffectNode> m_effects;
};

} // namespace postfx
