#include "postfx/effect/custom_compute_effect.hpp"
#include "postfx/core/error.hpp"
#include <spdlog/spdlog.h>

namespace postfx {

const char* toString(EffectState state) {
    switch (state) {
        case EffectState::Uncompiled: return "Uncompiled";
        case EffectState::Dirty: return "Dirty";
        case EffectState::Valid: return "Valid";
        case EffectState::Invalid: return "Invalid";
    }
    return "Unknown";
}

CustomComputeEffect::CustomComputeEffect(GpuBackend* backend, const std::string& name)
    : m_name(name),
      m_bindingSets(backend),
      m_compiler(backend, name),
      m_pipelines(backend, &m_bindingSets),
      m_dispatcher(backend, &m_bindingSets) {}

CustomComputeEffect::~CustomComputeEffect() {
    teardown();
}

void CustomComputeEffect::setBody(std::string text) {
    m_source.setBody(std::move(text));
}

EffectState CustomComputeEffect::getState() const {
    if (m_source.isDirty()) {
        return EffectState::Dirty;
    }
    return m_state;
}

void CustomComputeEffect::render(const FrameContext& frame) {
    if (frame.stage != STAGE) {
        return;
    }

    update();

    if (m_state != EffectState::Valid) {
        return;
    }

    try {
        m_dispatcher.dispatch(*m_pipelines.getPipeline(), frame.buffers);
    } catch (const GpuError& e) {
        // The pair is dropped so the failure is not retried every frame; the next body
        // rebuilds it.
        m_pipelines.teardown();
        m_state = EffectState::Invalid;
        m_lastDiagnostics = e.what();
        spdlog::error("{}: dispatch failed, pass disabled until the next body: {}", m_name, e.what());
    }
}

void CustomComputeEffect::update() {
    auto body = m_source.takeIfDirty();
    if (!body) {
        return;
    }
    rebuild(*body);
}

void CustomComputeEffect::rebuild(const std::string& body) {
    // The old pair goes before the new compile starts, so a failed compile never leaves
    // a stale pipeline behind.
    m_pipelines.teardown();
    m_state = EffectState::Invalid;
    m_compileCount++;

    try {
        ShaderHandle shader = m_compiler.compile(body);
        m_pipelines.applyShader(shader);
    } catch (const CompileError& e) {
        m_lastDiagnostics = e.getDiagnostics();
        spdlog::warn("{}: body rejected, pass disabled until the next successful compile", m_name);
        return;
    } catch (const PipelineCreationError& e) {
        m_lastDiagnostics = e.what();
        spdlog::error("{}: failed to create compute pipeline: {}", m_name, e.what());
        return;
    } catch (const GpuError& e) {
        m_lastDiagnostics = e.what();
        spdlog::error("{}: failed to create shader module: {}", m_name, e.what());
        return;
    }

    m_state = EffectState::Valid;
    m_lastDiagnostics.clear();
    spdlog::info("{}: compute pipeline rebuilt (compile #{})", m_name, m_compileCount);
}

void CustomComputeEffect::teardown() {
    m_pipelines.teardown();
    if (m_state == EffectState::Valid) {
        m_state = EffectState::Invalid;
    }
}

std::function<void(const FrameContext&)> CustomComputeEffect::asCallback() {
    return [this](const FrameContext& frame) { render(frame); };
}

} // namespace postfx
