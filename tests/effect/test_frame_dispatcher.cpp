#include <catch2/catch.hpp>
#include "postfx/effect/frame_dispatcher.hpp"
#include "support/recording_backend.hpp"
#include <cstring>

using namespace postfx;
using postfx::testing::RecordingBackend;

TEST_CASE("Work groups cover the raster with ceil division", "[effect][dispatch]") {
    CHECK(FrameDispatcher::groupsForExtent(1) == 1);
    CHECK(FrameDispatcher::groupsForExtent(7) == 1);
    CHECK(FrameDispatcher::groupsForExtent(8) == 1);
    CHECK(FrameDispatcher::groupsForExtent(9) == 2);
    CHECK(FrameDispatcher::groupsForExtent(1024) == 128);
    CHECK(FrameDispatcher::groupsForExtent(578) == 73);

    auto groups = FrameDispatcher::computeWorkGroups(1920, 1080);
    REQUIRE(groups.has_value());
    CHECK(groups->x == 240);
    CHECK(groups->y == 135);
    CHECK(groups->z == 1);
}

TEST_CASE("A zero dimension yields no work groups", "[effect][dispatch]") {
    CHECK_FALSE(FrameDispatcher::computeWorkGroups(0, 0).has_value());
    CHECK_FALSE(FrameDispatcher::computeWorkGroups(0, 720).has_value());
    CHECK_FALSE(FrameDispatcher::computeWorkGroups(1280, 0).has_value());
}

TEST_CASE("Push constants carry the raster size and zero padding", "[effect][dispatch]") {
    PushConstants pc = FrameDispatcher::buildPushConstants(1280, 720);
    CHECK(pc.rasterSize.x == 1280.0f);
    CHECK(pc.rasterSize.y == 720.0f);
    CHECK(pc.padding.x == 0.0f);
    CHECK(pc.padding.y == 0.0f);
}

TEST_CASE("dispatch records one sequence per view", "[effect][dispatch]") {
    RecordingBackend backend;
    BindingSetCache cache(&backend);
    FrameDispatcher dispatcher(&backend, &cache);

    PipelineHandle pipeline{42};
    RenderBuffers buffers;
    buffers.width = 100;
    buffers.height = 50;
    buffers.colorImages = {ImageHandle{1000}, ImageHandle{1001}};

    CHECK(dispatcher.dispatch(pipeline, buffers) == 2);
    REQUIRE(backend.m_dispatches.size() == 2);

    for (uint32_t view = 0; view < 2; view++) {
        const auto& d = backend.m_dispatches[view];
        CHECK(d.pipeline == pipeline);
        CHECK(backend.m_bindingSetImages[d.set] == std::vector<ImageHandle>{buffers.colorImages[view]});
        CHECK(backend.m_bindingSetSlots[d.set] == FrameDispatcher::COLOR_SLOT);
        CHECK(d.x == 13);
        CHECK(d.y == 7);
        CHECK(d.z == 1);

        REQUIRE(d.pushConstants.size() == sizeof(PushConstants));
        PushConstants pc;
        std::memcpy(&pc, d.pushConstants.data(), sizeof(pc));
        CHECK(pc.rasterSize.x == 100.0f);
        CHECK(pc.rasterSize.y == 50.0f);
    }

    std::vector<std::string> expected = {
        "createBindingSet 1", "begin", "bindPipeline", "bindSet", "push", "dispatch", "end",
        "createBindingSet 2", "begin", "bindPipeline", "bindSet", "push", "dispatch", "end",
    };
    CHECK(backend.m_calls == expected);
}

TEST_CASE("dispatch reuses binding sets across frames", "[effect][dispatch]") {
    RecordingBackend backend;
    BindingSetCache cache(&backend);
    FrameDispatcher dispatcher(&backend, &cache);

    RenderBuffers buffers;
    buffers.width = 64;
    buffers.height = 64;
    buffers.colorImages = {ImageHandle{7}};

    dispatcher.dispatch(PipelineHandle{1}, buffers);
    dispatcher.dispatch(PipelineHandle{1}, buffers);
    CHECK(backend.countCalls("createBindingSet") == 1);
    CHECK(backend.m_dispatches.size() == 2);
}

TEST_CASE("dispatch issues nothing for a degenerate raster", "[effect][dispatch]") {
    RecordingBackend backend;
    BindingSetCache cache(&backend);
    FrameDispatcher dispatcher(&backend, &cache);

    RenderBuffers buffers;
    buffers.colorImages = {ImageHandle{7}, ImageHandle{8}};

    CHECK(dispatcher.dispatch(PipelineHandle{1}, buffers) == 0);
    CHECK(backend.m_calls.empty());
}
