#include <catch2/catch.hpp>
#include "postfx/effect/shader_source_store.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace postfx;

TEST_CASE("ShaderSourceStore starts clean", "[effect][store]") {
    ShaderSourceStore store;
    REQUIRE_FALSE(store.isDirty());
    REQUIRE_FALSE(store.takeIfDirty().has_value());
    REQUIRE(store.getBody().empty());
}

TEST_CASE("ShaderSourceStore hands a body over exactly once", "[effect][store]") {
    ShaderSourceStore store;
    store.setBody("color.rgb *= 2.0;");
    REQUIRE(store.isDirty());

    auto first = store.takeIfDirty();
    REQUIRE(first.has_value());
    CHECK(*first == "color.rgb *= 2.0;");
    CHECK_FALSE(store.isDirty());

    CHECK_FALSE(store.takeIfDirty().has_value());
    CHECK(store.getBody() == "color.rgb *= 2.0;");
}

TEST_CASE("ShaderSourceStore keeps only the last write", "[effect][store]") {
    ShaderSourceStore store;
    store.setBody("color.r = 1.0;");
    store.setBody("color.g = 1.0;");

    auto taken = store.takeIfDirty();
    REQUIRE(taken.has_value());
    CHECK(*taken == "color.g = 1.0;");
    CHECK_FALSE(store.takeIfDirty().has_value());
}

TEST_CASE("ShaderSourceStore treats an empty body as a real edit", "[effect][store]") {
    ShaderSourceStore store;
    store.setBody("");
    auto taken = store.takeIfDirty();
    REQUIRE(taken.has_value());
    CHECK(taken->empty());
}

TEST_CASE("ShaderSourceStore survives concurrent writers and a reader", "[effect][store][thread]") {
    ShaderSourceStore store;
    constexpr int WRITES = 500;
    std::atomic<bool> done{false};

    std::vector<std::thread> writers;
    for (int w = 0; w < 2; w++) {
        writers.emplace_back([&store, w] {
            for (int i = 0; i < WRITES; i++) {
                store.setBody("writer" + std::to_string(w) + "_" + std::to_string(i));
            }
        });
    }

    std::vector<std::string> seen;
    std::thread reader([&] {
        while (!done.load()) {
            if (auto body = store.takeIfDirty()) {
                seen.push_back(*body);
            }
        }
    });

    for (auto& writer : writers) {
        writer.join();
    }
    done = true;
    reader.join();

    if (auto last = store.takeIfDirty()) {
        seen.push_back(*last);
    }

    REQUIRE_FALSE(seen.empty());
    for (const auto& body : seen) {
        CHECK(body.rfind("writer", 0) == 0);
    }
    std::string latest = store.getBody();
    CHECK((latest == "writer0_499" || latest == "writer1_499"));
    CHECK_FALSE(store.isDirty());
}
