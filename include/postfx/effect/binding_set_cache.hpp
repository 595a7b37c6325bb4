#pragma once

#include "postfx/gpu/backend.hpp"
#include <map>
#include <tuple>
#include <vector>

namespace postfx {

// Memoizes binding sets by (pipeline, slot, images). The backend owns the sets; the
// cache only forgets them when their pipeline goes away.
class BindingSetCache {
public:
    BindingSetCache(GpuBackend* backend);

    BindingSetHandle getOrCreate(PipelineHandle pipeline, uint32_t slot, const std::vector<ImageHandle>& images);
    void evict(PipelineHandle pipeline);

    size_t size() const { return m_sets.size(); }

private:
    using Key = std::tuple<PipelineHandle, uint32_t, std::vector<ImageHandle>>;

    GpuBackend* m_backend;
    std::map<Key, BindingSetHandle> m_sets;
};

} // namespace postfx
