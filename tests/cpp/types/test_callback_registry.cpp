/**
 * @file test_callback_registry.cpp
 * @brief Unit tests for CallbackRegistry.
 *
 * Tests id allocation, removal and snapshot-based notification.
 */

#include <catch2/catch_test_macros.hpp>
#include <stores/types/callback_registry.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace stores;

// ============================================================================
// Registration Tests
// ============================================================================

TEST_CASE("CallbackRegistry - default construction creates empty registry", "[registry]") {
    CallbackRegistry<Listener> registry("Test");
    CHECK(registry.empty());
    CHECK(registry.size() == 0);
}

TEST_CASE("CallbackRegistry - add increases size", "[registry]") {
    CallbackRegistry<Listener> registry("Test");

    auto first = registry.add([] {});
    auto second = registry.add([] {});

    CHECK(registry.size() == 2);
    CHECK(first.active());
    CHECK(second.active());
}

TEST_CASE("CallbackRegistry - ids are never reused after removal", "[registry]") {
    CallbackRegistry<Listener> registry("Test");
    int first_calls = 0;
    int second_calls = 0;

    auto first = registry.add([&first_calls] { ++first_calls; });
    first();
    auto second = registry.add([&second_calls] { ++second_calls; });

    // A stale handle must never reach the later registration
    first();
    registry.remove(0);

    registry.notify([](const Listener &listener) { listener(); });
    CHECK(first_calls == 0);
    CHECK(second_calls == 1);
    CHECK(registry.size() == 1);
}

TEST_CASE("CallbackRegistry - remove absent id is a no-op", "[registry]") {
    CallbackRegistry<Listener> registry("Test");
    auto handle = registry.add([] {});

    CHECK_FALSE(registry.remove(42));
    CHECK(registry.size() == 1);
    CHECK(registry.remove(0));
    CHECK_FALSE(registry.remove(0));
    CHECK(registry.empty());
}

TEST_CASE("CallbackRegistry - concurrent registrations get distinct ids", "[registry][threads]") {
    CallbackRegistry<Listener> registry("Test");
    constexpr int thread_count = 8;
    constexpr int per_thread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&registry] {
            for (int i = 0; i < per_thread; ++i) { (void)registry.add([] {}); }
        });
    }
    for (auto &thread : threads) { thread.join(); }

    CHECK(registry.size() == thread_count * per_thread);
}

// ============================================================================
// Notification Tests
// ============================================================================

TEST_CASE("CallbackRegistry - notify invokes every callback once", "[registry]") {
    CallbackRegistry<Listener> registry("Test");
    int a = 0, b = 0, c = 0;
    (void)registry.add([&a] { ++a; });
    (void)registry.add([&b] { ++b; });
    (void)registry.add([&c] { ++c; });

    registry.notify([](const Listener &listener) { listener(); });

    CHECK(a == 1);
    CHECK(b == 1);
    CHECK(c == 1);
}

TEST_CASE("CallbackRegistry - notify on empty registry is safe", "[registry]") {
    CallbackRegistry<Listener> registry("Test");
    int invoked = 0;
    registry.notify([&invoked](const Listener &) { ++invoked; });
    CHECK(invoked == 0);
}

TEST_CASE("CallbackRegistry - callback may unsubscribe itself during notify", "[registry]") {
    CallbackRegistry<Listener> registry("Test");
    int calls = 0;
    Unsubscriber self;
    self = registry.add([&] {
        ++calls;
        self();
    });

    registry.notify([](const Listener &listener) { listener(); });
    registry.notify([](const Listener &listener) { listener(); });

    CHECK(calls == 1);
    CHECK(registry.empty());
}

TEST_CASE("CallbackRegistry - callback registered during notify is kept for later passes", "[registry]") {
    CallbackRegistry<Listener> registry("Test");
    int late_calls = 0;
    bool added = false;
    (void)registry.add([&] {
        if (!added) {
            added = true;
            (void)registry.add([&late_calls] { ++late_calls; });
        }
    });

    registry.notify([](const Listener &listener) { listener(); });
    const int after_first = late_calls;
    registry.notify([](const Listener &listener) { listener(); });

    CHECK(registry.size() == 2);
    CHECK(late_calls == after_first + 1);
}

TEST_CASE("CallbackRegistry - handle outliving registry is harmless", "[registry]") {
    Unsubscriber handle;
    {
        CallbackRegistry<Listener> registry("Test");
        handle = registry.add([] {});
    }
    CHECK(handle.active());
    handle();
    CHECK_FALSE(handle.active());
}

TEST_CASE("CallbackRegistry - write guard is reentrant on the same thread", "[registry]") {
    CallbackRegistry<Listener> registry("Test");
    auto outer = registry.guard();
    auto inner = registry.guard();
    CHECK(outer.owns_lock());
    CHECK(inner.owns_lock());
}
