#include "postfx/effect/binding_set_cache.hpp"
#include <spdlog/spdlog.h>

namespace postfx {

BindingSetCache::BindingSetCache(GpuBackend* backend) : m_backend(backend) {}

BindingSetHandle BindingSetCache::getOrCreate(PipelineHandle pipeline, uint32_t slot, const std::vector<ImageHandle>& images) {
    Key key{pipeline, slot, images};
    auto it = m_sets.find(key);
    if (it != m_sets.end()) {
        return it->second;
    }

    BindingSetHandle set = m_backend->createBindingSet(pipeline, slot, images);
    m_sets.emplace(std::move(key), set);
    return set;
}

void BindingSetCache::evict(PipelineHandle pipeline) {
    size_t evicted = 0;
    auto it = m_sets.begin();
    while (it != m_sets.end()) {
        if (std::get<0>(it->first) == pipeline) {
            it = m_sets.erase(it);
            evicted++;
        } else {
            ++it;
        }
    }

    if (evicted > 0) {
        spdlog::debug("Evicted {} binding set(s) of pipeline {}", evicted, static_cast<uint64_t>(pipeline));
    }
}

} // namespace postfx
