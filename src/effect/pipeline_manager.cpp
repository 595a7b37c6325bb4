#include "postfx/effect/pipeline_manager.hpp"
#include "postfx/core/error.hpp"
#include <spdlog/spdlog.h>

namespace postfx {

PipelineManager::PipelineManager(GpuBackend* backend, BindingSetCache* bindingSets)
    : m_backend(backend), m_bindingSets(bindingSets) {}

PipelineManager::~PipelineManager() {
    teardown();
}

PipelineHandle PipelineManager::applyShader(ShaderHandle newShader) {
    teardown();

    PipelineHandle pipeline{};
    try {
        pipeline = m_backend->createComputePipeline(newShader);
    } catch (const GpuError& e) {
        m_backend->free(newShader);
        throw PipelineCreationError(e.what());
    }

    m_shader = newShader;
    m_pipeline = pipeline;

    spdlog::debug("Compute pipeline {} created from shader {}", static_cast<uint64_t>(pipeline), static_cast<uint64_t>(newShader));
    return pipeline;
}

void PipelineManager::teardown() {
    if (!m_shader) {
        return;
    }

    // Freeing the shader releases its pipeline and that pipeline's binding sets.
    m_bindingSets->evict(*m_pipeline);
    m_backend->free(*m_shader);

    m_shader.reset();
    m_pipeline.reset();
}

} // namespace postfx
