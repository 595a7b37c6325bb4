#include <catch2/catch.hpp>
#include "postfx/renderer/effect_scheduler.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace postfx;

TEST_CASE("EffectScheduler runs effects in registration order", "[renderer][scheduler]") {
    EffectScheduler scheduler;
    std::vector<std::string> order;

    scheduler.addEffect("grade", [&](const FrameContext&) { order.push_back("grade"); });
    scheduler.addEffect("vignette", [&](const FrameContext&) { order.push_back("vignette"); });

    FrameContext frame;
    CHECK(scheduler.execute(frame) == 2);
    CHECK(order == std::vector<std::string>{"grade", "vignette"});
}

TEST_CASE("EffectScheduler passes the frame through", "[renderer][scheduler]") {
    EffectScheduler scheduler;
    uint64_t seenIndex = 0;
    EffectStage seenStage = EffectStage::BeforeTransparency;
    scheduler.addEffect("probe", [&](const FrameContext& frame) {
        seenIndex = frame.frameIndex;
        seenStage = frame.stage;
    });

    FrameContext frame;
    frame.frameIndex = 17;
    frame.stage = EffectStage::AfterTonemap;
    scheduler.execute(frame);

    CHECK(seenIndex == 17);
    CHECK(seenStage == EffectStage::AfterTonemap);
}

TEST_CASE("EffectScheduler rejects empty callbacks and duplicate names", "[renderer][scheduler]") {
    EffectScheduler scheduler;
    CHECK_THROWS_AS(scheduler.addEffect("empty", EffectCallback{}), std::invalid_argument);

    scheduler.addEffect("grade", [](const FrameContext&) {});
    CHECK_THROWS_AS(scheduler.addEffect("grade", [](const FrameContext&) {}), std::invalid_argument);
    CHECK(scheduler.getEffectCount() == 1);
}

TEST_CASE("EffectScheduler skips disabled effects", "[renderer][scheduler]") {
    EffectScheduler scheduler;
    int calls = 0;
    scheduler.addEffect("grade", [&](const FrameContext&) { calls++; });

    CHECK(scheduler.setEnabled("grade", false));
    CHECK(scheduler.execute(FrameContext{}) == 0);
    CHECK(calls == 0);

    CHECK(scheduler.setEnabled("grade", true));
    CHECK(scheduler.execute(FrameContext{}) == 1);
    CHECK(calls == 1);

    CHECK_FALSE(scheduler.setEnabled("missing", true));
}

TEST_CASE("EffectScheduler removes effects by name", "[renderer][scheduler]") {
    EffectScheduler scheduler;
    scheduler.addEffect("a", [](const FrameContext&) {});
    scheduler.addEffect("b", [](const FrameContext&) {});

    CHECK(scheduler.removeEffect("a"));
    CHECK_FALSE(scheduler.removeEffect("a"));
    CHECK(scheduler.getEffectCount() == 1);

    scheduler.clear();
    CHECK(scheduler.getEffectCount() == 0);
    CHECK(scheduler.execute(FrameContext{}) == 0);
}

TEST_CASE("Stage names are stable", "[renderer][scheduler]") {
    CHECK(std::string(toString(EffectStage::BeforeTransparency)) == "BeforeTransparency");
    CHECK(std::string(toString(EffectStage::AfterTransparency)) == "AfterTransparency");
    CHECK(std::string(toString(EffectStage::AfterTonemap)) == "AfterTonemap");
}
