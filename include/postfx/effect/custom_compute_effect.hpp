#pragma once

#include "postfx/effect/binding_set_cache.hpp"
#include "postfx/effect/frame_context.hpp"
#include "postfx/effect/frame_dispatcher.hpp"
#include "postfx/effect/pipeline_manager.hpp"
#include "postfx/effect/shader_source_store.hpp"
#include "postfx/effect/template_compiler.hpp"
#include "postfx/gpu/backend.hpp"
#include <functional>
#include <string>

namespace postfx {

enum class EffectState {
    Uncompiled,
    Dirty,
    Valid,
    Invalid
};

const char* toString(EffectState state);

// A post-process pass running a user supplied compute body over the frame's color
// image in place.
//
// setBody() may be called from any thread. Everything else, including destruction,
// belongs to the render thread.
class CustomComputeEffect {
public:
    static constexpr EffectStage STAGE = EffectStage::AfterTransparency;

    CustomComputeEffect(GpuBackend* backend, const std::string& name = "CustomComputeEffect");
    ~CustomComputeEffect();

    CustomComputeEffect(const CustomComputeEffect&) = delete;
    CustomComputeEffect& operator=(const CustomComputeEffect&) = delete;

    void setBody(std::string text);
    std::string getBody() const { return m_source.getBody(); }

    // Host frame callback. Ignores every stage except STAGE.
    void render(const FrameContext& frame);

    // Consumes a pending body, if any, and rebuilds the pipeline from it.
    void update();

    void teardown();

    EffectState getState() const;
    const std::string& getLastDiagnostics() const { return m_lastDiagnostics; }
    uint64_t getCompileCount() const { return m_compileCount; }
    const std::string& getName() const { return m_name; }

    std::function<void(const FrameContext&)> asCallback();

private:
    void rebuild(const std::string& body);

    std::string m_name;
    ShaderSourceStore m_source;

    BindingSetCache m_bindingSets;
    TemplateCompiler m_compiler;
    PipelineManager m_pipelines;
    FrameDispatcher m_dispatcher;

    EffectState m_state = EffectState::Uncompiled;
    std::string m_lastDiagnostics;
    uint64_t m_compileCount = 0;
};

} // namespace postfx
