#include "postfx/renderer/effect_scheduler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace postfx {

void EffectScheduler::addEffect(const std::string& name, EffectCallback execute) {
    if (!execute) {
        throw std::invalid_argument("Effect callback is empty: " + name);
    }

    auto it = std::find_if(m_effects.begin(), m_effects.end(), [&](const EffectNode& node) { return node.name == name; });
    if (it != m_effects.end()) {
        throw std::invalid_argument("Effect already registered: " + name);
    }

    m_effects.push_back({name, std::move(execute), true});
    spdlog::debug("Effect registered: {}", name);
}

bool EffectScheduler::removeEffect(const std::string& name) {
    auto it = std::find_if(m_effects.begin(), m_effects.end(), [&](const EffectNode& node) { return node.name == name; });
    if (it == m_effects.end()) {
        return false;
    }
    m_effects.erase(it);
    return true;
}

bool EffectScheduler::setEnabled(const std::string& name, bool enabled) {
    for (auto& node : m_effects) {
        if (node.name == name) {
            node.enabled = enabled;
            return true;
        }
    }
    return false;
}

uint32_t EffectScheduler::execute(const FrameContext& frame) {
    uint32_t invoked = 0;
    for (const auto& node : m_effects) {
        if (!node.enabled) {
            continue;
        }
        node.execute(frame);
        invoked++;
    }
    return invoked;
}

void EffectScheduler::clear() {
    m_effects.clear();
}

} // namespace postfx
