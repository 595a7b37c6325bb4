#include <catch2/catch.hpp>
#include "postfx/effect/binding_set_cache.hpp"
#include "support/recording_backend.hpp"

using namespace postfx;
using postfx::testing::RecordingBackend;

TEST_CASE("BindingSetCache memoizes by pipeline, slot and images", "[effect][cache]") {
    RecordingBackend backend;
    BindingSetCache cache(&backend);

    PipelineHandle a{1};
    PipelineHandle b{2};
    std::vector<ImageHandle> left = {ImageHandle{10}};
    std::vector<ImageHandle> right = {ImageHandle{11}};

    BindingSetHandle first = cache.getOrCreate(a, 0, left);
    CHECK(cache.getOrCreate(a, 0, left) == first);
    CHECK(cache.getOrCreate(a, 0, right) != first);
    CHECK(cache.getOrCreate(b, 0, left) != first);
    CHECK(cache.getOrCreate(a, 1, left) != first);

    CHECK(cache.size() == 4);
    CHECK(backend.countCalls("createBindingSet") == 4);
}

TEST_CASE("BindingSetCache evicts only the given pipeline's entries", "[effect][cache]") {
    RecordingBackend backend;
    BindingSetCache cache(&backend);

    PipelineHandle a{1};
    PipelineHandle b{2};
    cache.getOrCreate(a, 0, {ImageHandle{10}});
    cache.getOrCreate(a, 0, {ImageHandle{11}});
    BindingSetHandle kept = cache.getOrCreate(b, 0, {ImageHandle{10}});

    cache.evict(a);
    CHECK(cache.size() == 1);
    CHECK(cache.getOrCreate(b, 0, {ImageHandle{10}}) == kept);

    cache.getOrCreate(a, 0, {ImageHandle{10}});
    CHECK(backend.countCalls("createBindingSet") == 4);

    cache.evict(PipelineHandle{99});
    CHECK(cache.size() == 2);
}
