#include <doctest/doctest.h>
#include <genspec/state/StateStore.hpp>

#include <algorithm>
#include <thread>
#include <vector>

using namespace GS;

TEST_SUITE_BEGIN("state.store");

TEST_CASE("StateStore reads and writes") {
    StateStore store{Json::parse(R"({"user": {"name": "Ada"}, "count": 1})")};

    SUBCASE("Get") {
        CHECK(store.get("/user/name") == Json("Ada"));
        CHECK(store.get("/count") == Json(1));
        CHECK_FALSE(store.get("/missing").has_value());
        CHECK(store.get("/") == *store.snapshot());
    }

    SUBCASE("Set creates paths") {
        CHECK(store.set("/form/email", Json("ada@example.com")));
        CHECK(store.get("/form/email") == Json("ada@example.com"));
    }

    SUBCASE("Huge array index is ignored") {
        CHECK(store.set("/list", Json::array()));
        int  notifications = 0;
        auto subscription = store.subscribe([&](auto const&, auto const&) { ++notifications; });
        CHECK_FALSE(store.set("/list/2000000000", Json("x")));
        CHECK(store.update({{"/count", Json(2)}, {"/list/2000000000", Json("x")}}));
        CHECK(store.get("/list") == Json::array());
        CHECK(store.get("/count") == Json(2));
        CHECK(notifications == 1);
    }

    SUBCASE("Removal") {
        CHECK(store.set("/count", std::nullopt));
        CHECK_FALSE(store.get("/count").has_value());
        CHECK_FALSE(store.set("/count", std::nullopt));
    }

    SUBCASE("Root reset") {
        CHECK(store.set("/", std::nullopt));
        CHECK(*store.snapshot() == Json::object());
    }

    SUBCASE("Null initial document becomes an object") {
        StateStore empty{Json{}};
        CHECK(empty.snapshot()->is_object());
    }
}

TEST_CASE("StateStore snapshots are immutable") {
    StateStore store{Json::parse(R"({"items": [1, 2]})")};
    auto       before = store.snapshot();
    CHECK(store.set("/items/-", Json(3)));
    auto after = store.snapshot();

    CHECK((*before)["items"].size() == 2);
    CHECK((*after)["items"].size() == 3);
    CHECK(before.get() != after.get());
}

TEST_CASE("StateStore notifications") {
    StateStore               store;
    std::vector<StateChange> seen;
    int                      calls = 0;
    auto subscription = store.subscribe([&](std::vector<StateChange> const& changes, StateSnapshot const& snapshot) {
        ++calls;
        seen = changes;
        CHECK(snapshot != nullptr);
    });
    CHECK(store.listenerCount() == 1);

    SUBCASE("Single write") {
        store.set("/a", Json(1));
        CHECK(calls == 1);
        REQUIRE(seen.size() == 1);
        CHECK(seen[0].path == "/a");
        CHECK(seen[0].value == Json(1));
    }

    SUBCASE("No-op writes are dropped") {
        store.set("/a", Json(1));
        CHECK_FALSE(store.set("/a", Json(1)));
        CHECK_FALSE(store.set("/b", std::nullopt));
        CHECK(calls == 1);
    }

    SUBCASE("Batched update notifies once with effective changes") {
        store.set("/a", Json(1));
        calls = 0;
        CHECK(store.update({{"/a", Json(1)}, {"/b", Json(2)}, {"/c", Json("x")}}));
        CHECK(calls == 1);
        REQUIRE(seen.size() == 2);
        CHECK(seen[0].path == "/b");
        CHECK(seen[1].path == "/c");
    }

    SUBCASE("Unaddressable write is ignored") {
        store.set("/list", Json::array({1}));
        calls = 0;
        CHECK_FALSE(store.set("/list/name", Json("x")));
        CHECK(calls == 0);
    }

    SUBCASE("Subscription reset detaches") {
        subscription.reset();
        CHECK_FALSE(subscription.active());
        CHECK(store.listenerCount() == 0);
        store.set("/a", Json(1));
        CHECK(calls == 0);
    }

    SUBCASE("Subscription moves") {
        StateStore::Subscription moved = std::move(subscription);
        CHECK(moved.active());
        CHECK_FALSE(subscription.active());
        CHECK(store.listenerCount() == 1);
    }
}

TEST_CASE("StateStore listeners may write back") {
    StateStore store;
    auto       subscription = store.subscribe([&](std::vector<StateChange> const& changes, StateSnapshot const&) {
        for (auto const& change : changes) {
            if (change.path == "/source") {
                store.set("/mirror", change.value);
            }
        }
    });
    store.set("/source", Json("v"));
    CHECK(store.get("/mirror") == Json("v"));
}

TEST_CASE("StateStore subscription outliving the store") {
    StateStore::Subscription subscription;
    {
        StateStore store;
        subscription = store.subscribe([](std::vector<StateChange> const&, StateSnapshot const&) {});
        CHECK(subscription.active());
    }
    CHECK_FALSE(subscription.active());
    subscription.reset();
}

TEST_CASE("StateStore concurrent writers") {
    StateStore               store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 50; ++i) {
                store.set("/t" + std::to_string(t) + "/" + std::to_string(i), Json(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    auto snapshot = store.snapshot();
    for (int t = 0; t < 4; ++t) {
        CHECK((*snapshot)["t" + std::to_string(t)].size() == 50);
    }
}

TEST_CASE("FlattenToPointers") {
    auto changes = FlattenToPointers(Json::parse(R"({"user": {"name": "Ada", "a/b": 1}, "tags": ["x"], "n": null})"));
    REQUIRE(changes.size() == 4);
    std::vector<std::string> paths;
    for (auto const& change : changes) {
        paths.push_back(change.path);
    }
    CHECK(std::find(paths.begin(), paths.end(), "/user/name") != paths.end());
    CHECK(std::find(paths.begin(), paths.end(), "/user/a~1b") != paths.end());
    CHECK(std::find(paths.begin(), paths.end(), "/tags") != paths.end());
    CHECK(std::find(paths.begin(), paths.end(), "/n") != paths.end());

    auto scalar = FlattenToPointers(Json(5), "/count");
    REQUIRE(scalar.size() == 1);
    CHECK(scalar[0].value == Json(5));
    CHECK(FlattenToPointers(Json(5)).empty());
}

TEST_SUITE_END();
