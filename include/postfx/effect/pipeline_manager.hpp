#pragma once

#include "postfx/effect/binding_set_cache.hpp"
#include "postfx/gpu/backend.hpp"
#include <optional>

namespace postfx {

// Owns the single live shader/pipeline pair. Both handles are set or both are empty.
class PipelineManager {
public:
    PipelineManager(GpuBackend* backend, BindingSetCache* bindingSets);
    ~PipelineManager();

    PipelineManager(const PipelineManager&) = delete;
    PipelineManager& operator=(const PipelineManager&) = delete;

    // Frees the current pair, then builds a pipeline from newShader and takes ownership
    // of both. On failure newShader is freed too and PipelineCreationError is thrown.
    PipelineHandle applyShader(ShaderHandle newShader);

    // Idempotent.
    void teardown();

    bool isValid() const { return m_shader.has_value(); }
    std::optional<ShaderHandle> getShader() const { return m_shader; }
    std::optional<PipelineHandle> getPipeline() const { return m_pipeline; }

private:
    GpuBackend* m_backend;
    BindingSetCache* m_bindingSets;

    std::optional<ShaderHandle> m_shader;
    std::optional<PipelineHandle> m_pipeline;
};

} // namespace postfx
