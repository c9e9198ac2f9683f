#include <catch2/catch_test_macros.hpp>
#include "core/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace kvault;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken: copies share one state", "[cancel]") {
    CancellationToken a;
    CancellationToken b = a;
    CHECK_FALSE(b.is_cancelled());
    a.cancel();
    CHECK(b.is_cancelled());
    CHECK(b.wait_for(10s));
}

TEST_CASE("CancellationWatcher: a raised flag cancels the token", "[cancel][signal]") {
    std::atomic<bool> flag{false};
    CancellationToken token;
    CancellationWatcher watcher(flag, token, 1ms);

    CHECK_FALSE(token.wait_for(20ms));
    flag.store(true);
    CHECK(token.wait_for(5s));
    CHECK(token.is_cancelled());
}

TEST_CASE("CancellationWatcher: destruction without a flag leaves the token live", "[cancel][signal]") {
    std::atomic<bool> flag{false};
    CancellationToken token;
    {
        CancellationWatcher watcher(flag, token, 1ms);
        std::this_thread::sleep_for(5ms);
    }
    flag.store(true);
    std::this_thread::sleep_for(5ms);
    CHECK_FALSE(token.is_cancelled());
}
