/**
 * @file test_unsubscriber.cpp
 * @brief Unit tests for Unsubscriber and ScopedSubscription.
 */

#include <catch2/catch_test_macros.hpp>
#include <stores/types/cell.h>
#include <stores/types/unsubscriber.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace stores;

TEST_CASE("Unsubscriber - empty handle is inactive and safe to invoke", "[unsubscriber]") {
    Unsubscriber handle;
    CHECK_FALSE(handle.active());
    CHECK_FALSE(static_cast<bool>(handle));
    handle();
    handle.unsubscribe();
}

TEST_CASE("Unsubscriber - removal runs exactly once", "[unsubscriber]") {
    int removals = 0;
    Unsubscriber handle([&removals] { ++removals; });

    CHECK(handle.active());
    handle();
    handle();
    handle.unsubscribe();

    CHECK(removals == 1);
    CHECK_FALSE(handle.active());
}

TEST_CASE("Unsubscriber - copies share the single removal", "[unsubscriber]") {
    int removals = 0;
    Unsubscriber handle([&removals] { ++removals; });
    Unsubscriber copy = handle;

    copy();
    handle();

    CHECK(removals == 1);
    CHECK_FALSE(handle.active());
}

TEST_CASE("Unsubscriber - concurrent invocations remove once", "[unsubscriber][threads]") {
    std::atomic<int> removals{0};
    Unsubscriber handle([&removals] { ++removals; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([handle] { handle(); });
    }
    for (auto &thread : threads) { thread.join(); }

    CHECK(removals.load() == 1);
}

TEST_CASE("ScopedSubscription - unsubscribes on destruction", "[unsubscriber]") {
    auto cell = Cell<int>::create(0);
    int calls = 0;
    {
        ScopedSubscription scoped(cell->listen([&calls] { ++calls; }));
        CHECK(scoped.active());
        cell->set(1);
    }
    cell->set(2);

    CHECK(calls == 1);
    CHECK(cell->callback_count() == 0);
}

TEST_CASE("ScopedSubscription - release detaches without unsubscribing", "[unsubscriber]") {
    auto cell = Cell<int>::create(0);
    int calls = 0;
    Unsubscriber detached;
    {
        ScopedSubscription scoped(cell->listen([&calls] { ++calls; }));
        detached = scoped.release();
        CHECK_FALSE(scoped.active());
    }
    cell->set(1);
    CHECK(calls == 1);

    detached();
    cell->set(2);
    CHECK(calls == 1);
}

TEST_CASE("ScopedSubscription - move transfers ownership", "[unsubscriber]") {
    auto cell = Cell<int>::create(0);
    int calls = 0;

    ScopedSubscription outer;
    {
        ScopedSubscription inner(cell->listen([&calls] { ++calls; }));
        outer = std::move(inner);
    }
    cell->set(1);
    CHECK(calls == 1);

    outer.reset();
    cell->set(2);
    CHECK(calls == 1);
    CHECK_FALSE(outer.active());
}
