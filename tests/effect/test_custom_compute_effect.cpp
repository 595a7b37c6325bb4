#include <catch2/catch.hpp>
#include "postfx/effect/custom_compute_effect.hpp"
#include "support/recording_backend.hpp"
#include <thread>

using namespace postfx;
using postfx::testing::RecordingBackend;

namespace {

FrameContext makeFrame(uint32_t width, uint32_t height, std::vector<ImageHandle> images) {
    FrameContext frame;
    frame.buffers.width = width;
    frame.buffers.height = height;
    frame.buffers.colorImages = std::move(images);
    return frame;
}

} // namespace

TEST_CASE("A new effect does nothing until a body is set", "[effect][custom]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);

    CHECK(effect.getState() == EffectState::Uncompiled);
    effect.render(makeFrame(64, 64, {ImageHandle{900}}));
    CHECK(backend.m_calls.empty());
    CHECK(effect.getCompileCount() == 0);
}

TEST_CASE("A valid body compiles and dispatches for each view", "[effect][custom]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);

    effect.setBody("color.rgb *= 2.0;");
    CHECK(effect.getState() == EffectState::Dirty);

    effect.render(makeFrame(640, 480, {ImageHandle{900}}));
    CHECK(effect.getState() == EffectState::Valid);
    CHECK(effect.getCompileCount() == 1);
    CHECK(backend.m_lastSource.find("color.rgb *= 2.0;") != std::string::npos);
    CHECK(backend.m_dispatches.size() == 1);

    // A second frame reuses the pipeline without recompiling.
    effect.render(makeFrame(640, 480, {ImageHandle{900}}));
    CHECK(effect.getCompileCount() == 1);
    CHECK(backend.countCalls("compile") == 1);
    CHECK(backend.m_dispatches.size() == 2);
}

TEST_CASE("A rejected body disables the pass until the next good body", "[effect][custom]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);
    FrameContext frame = makeFrame(640, 480, {ImageHandle{900}});

    effect.setBody("color.rgb = undeclared_identifier;");
    effect.render(frame);
    CHECK(effect.getState() == EffectState::Invalid);
    CHECK(effect.getLastDiagnostics().find("undeclared identifier") != std::string::npos);

    for (int i = 0; i < 3; i++) {
        effect.render(frame);
    }
    CHECK(backend.countCalls("begin") == 0);
    CHECK(backend.countCalls("compile") == 1);

    effect.setBody("color.rgb *= 0.5;");
    effect.render(frame);
    CHECK(effect.getState() == EffectState::Valid);
    CHECK(effect.getLastDiagnostics().empty());
    CHECK(backend.m_dispatches.size() == 1);
}

TEST_CASE("A failed recompile drops the previously valid pipeline", "[effect][custom]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);
    FrameContext frame = makeFrame(64, 64, {ImageHandle{900}});

    effect.setBody("color.rgb *= 2.0;");
    effect.render(frame);
    REQUIRE(effect.getState() == EffectState::Valid);

    effect.setBody("color = undeclared_identifier;");
    effect.render(frame);
    CHECK(effect.getState() == EffectState::Invalid);
    CHECK(backend.m_liveShaders.empty());
    CHECK(backend.m_dispatches.size() == 1);
}

TEST_CASE("A pipeline creation failure is absorbed like a compile failure", "[effect][custom]") {
    RecordingBackend backend;
    backend.m_failPipelineCreation = true;
    CustomComputeEffect effect(&backend);

    effect.setBody("color.rgb *= 2.0;");
    REQUIRE_NOTHROW(effect.render(makeFrame(64, 64, {ImageHandle{900}})));
    CHECK(effect.getState() == EffectState::Invalid);
    CHECK_FALSE(effect.getLastDiagnostics().empty());
    CHECK(backend.m_liveShaders.empty());
    CHECK(backend.countCalls("begin") == 0);
}

TEST_CASE("A GPU failure while dispatching disables the pass without throwing", "[effect][custom]") {
    RecordingBackend backend;
    backend.m_failBindingSetCreation = true;
    CustomComputeEffect effect(&backend);
    FrameContext frame = makeFrame(64, 64, {ImageHandle{900}});

    effect.setBody("color.rgb *= 2.0;");
    CHECK_NOTHROW(effect.render(frame));
    CHECK(effect.getState() == EffectState::Invalid);
    CHECK(effect.getLastDiagnostics().find("descriptor set") != std::string::npos);
    CHECK(backend.m_liveShaders.empty());
    CHECK(backend.m_dispatches.empty());

    // Later frames stay passthrough and do not retry.
    backend.clearCalls();
    CHECK_NOTHROW(effect.render(frame));
    CHECK(backend.m_calls.empty());

    backend.m_failBindingSetCreation = false;
    effect.setBody("color.rgb *= 0.5;");
    effect.render(frame);
    CHECK(effect.getState() == EffectState::Valid);
    CHECK(effect.getLastDiagnostics().empty());
    CHECK(backend.m_dispatches.size() == 1);
}

TEST_CASE("A zero raster issues no GPU work", "[effect][custom]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);

    effect.setBody("color.rgb *= 2.0;");
    effect.render(makeFrame(0, 0, {ImageHandle{900}, ImageHandle{901}}));
    CHECK(effect.getState() == EffectState::Valid);

    backend.clearCalls();
    effect.render(makeFrame(0, 0, {ImageHandle{900}, ImageHandle{901}}));
    effect.render(makeFrame(0, 480, {ImageHandle{900}}));
    CHECK(backend.m_calls.empty());
}

TEST_CASE("Two views get one sequence each against their own image", "[effect][custom]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);
    effect.setBody("color.rgb *= 2.0;");
    effect.update();
    backend.clearCalls();

    std::vector<ImageHandle> images = {ImageHandle{900}, ImageHandle{901}};
    effect.render(makeFrame(1280, 720, images));

    CHECK(backend.countCalls("begin") == 2);
    CHECK(backend.countCalls("dispatch") == 2);
    CHECK(backend.countCalls("end") == 2);
    REQUIRE(backend.m_dispatches.size() == 2);
    CHECK(backend.m_bindingSetImages[backend.m_dispatches[0].set] == std::vector<ImageHandle>{images[0]});
    CHECK(backend.m_bindingSetImages[backend.m_dispatches[1].set] == std::vector<ImageHandle>{images[1]});
}

TEST_CASE("Other stages are ignored", "[effect][custom]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);
    effect.setBody("color.rgb *= 2.0;");

    FrameContext frame = makeFrame(64, 64, {ImageHandle{900}});
    frame.stage = EffectStage::BeforeTransparency;
    effect.render(frame);
    frame.stage = EffectStage::AfterTonemap;
    effect.render(frame);

    CHECK(backend.m_calls.empty());
    CHECK(effect.getState() == EffectState::Dirty);
}

TEST_CASE("Only the last of several edits between frames is compiled", "[effect][custom]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);

    effect.setBody("color.r = 1.0;");
    effect.setBody("color.rgb = undeclared_identifier;");
    effect.setBody("color.b = 1.0;");
    effect.update();

    CHECK(effect.getCompileCount() == 1);
    CHECK(effect.getState() == EffectState::Valid);
    CHECK(backend.m_lastSource.find("color.b = 1.0;") != std::string::npos);
    CHECK(backend.m_lastSource.find("color.r = 1.0;") == std::string::npos);
}

TEST_CASE("Bodies set from another thread are picked up on the next frame", "[effect][custom][thread]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);

    std::thread editor([&effect] { effect.setBody("color.rgb = vec3(1.0) - color.rgb;"); });
    editor.join();

    effect.render(makeFrame(8, 8, {ImageHandle{900}}));
    CHECK(effect.getState() == EffectState::Valid);
    CHECK(backend.m_dispatches.size() == 1);
}

TEST_CASE("teardown frees the pair once and tolerates repeats", "[effect][custom]") {
    RecordingBackend backend;
    {
        CustomComputeEffect effect(&backend);
        effect.setBody("color.rgb *= 2.0;");
        effect.update();

        effect.teardown();
        CHECK(effect.getState() == EffectState::Invalid);
        effect.teardown();
    }
    CHECK(backend.countCalls("free") == 1);
    CHECK(backend.m_doubleFrees == 0);
    CHECK(backend.m_liveShaders.empty());
}

TEST_CASE("Destroying a never compiled effect frees nothing", "[effect][custom]") {
    RecordingBackend backend;
    {
        CustomComputeEffect effect(&backend);
    }
    CHECK(backend.m_calls.empty());
}

TEST_CASE("asCallback forwards to render", "[effect][custom]") {
    RecordingBackend backend;
    CustomComputeEffect effect(&backend);
    effect.setBody("color.rgb *= 2.0;");

    auto callback = effect.asCallback();
    callback(makeFrame(16, 16, {ImageHandle{900}}));
    CHECK(effect.getState() == EffectState::Valid);
    CHECK(backend.m_dispatches.size() == 1);
}
