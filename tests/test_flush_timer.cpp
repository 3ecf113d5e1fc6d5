#include <catch2/catch.hpp>
#include "flush_timer.hpp"
#include "mock_sink.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>

using namespace decaf;
using namespace std::chrono_literals;

TEST_CASE("FlushTimer: rejects non-positive interval", "[flush_timer]") {
    REQUIRE_THROWS_AS(FlushTimer(0ms, [] {}), std::invalid_argument);
    REQUIRE_THROWS_AS(FlushTimer(-5ms, [] {}), std::invalid_argument);
}

TEST_CASE("FlushTimer: does not tick before start", "[flush_timer]") {
    std::atomic<int> ticks{0};
    FlushTimer timer(5ms, [&] { ticks++; });
    std::this_thread::sleep_for(30ms);
    REQUIRE(ticks.load() == 0);
    REQUIRE_FALSE(timer.running());
}

TEST_CASE("FlushTimer: ticks repeatedly once started", "[flush_timer]") {
    std::atomic<int> ticks{0};
    FlushTimer timer(5ms, [&] { ticks++; });
    timer.start();
    REQUIRE(timer.running());
    REQUIRE(wait_until([&] { return ticks.load() >= 3; }));
    timer.stop();
    REQUIRE_FALSE(timer.running());
    REQUIRE(timer.tick_count() >= 3);
}

TEST_CASE("FlushTimer: first tick waits one interval", "[flush_timer]") {
    std::atomic<int> ticks{0};
    FlushTimer timer(200ms, [&] { ticks++; });
    timer.start();
    std::this_thread::sleep_for(50ms);
    REQUIRE(ticks.load() == 0);
    REQUIRE(wait_until([&] { return ticks.load() >= 1; }));
}

TEST_CASE("FlushTimer: stop wakes a long wait promptly", "[flush_timer]") {
    std::atomic<int> ticks{0};
    FlushTimer timer(std::chrono::hours(1), [&] { ticks++; });
    timer.start();

    auto begin = std::chrono::steady_clock::now();
    timer.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(elapsed < 1s);
    REQUIRE(ticks.load() == 0);
}

TEST_CASE("FlushTimer: no ticks after stop returns", "[flush_timer]") {
    std::atomic<int> ticks{0};
    FlushTimer timer(2ms, [&] { ticks++; });
    timer.start();
    REQUIRE(wait_until([&] { return ticks.load() >= 1; }));
    timer.stop();

    int after_stop = ticks.load();
    std::this_thread::sleep_for(20ms);
    REQUIRE(ticks.load() == after_stop);
}

TEST_CASE("FlushTimer: stop lets an in-flight tick finish", "[flush_timer]") {
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    FlushTimer timer(2ms, [&] {
        if (entered.exchange(true)) return;
        std::this_thread::sleep_for(50ms);
        finished.store(true);
    });
    timer.start();
    REQUIRE(wait_until([&] { return entered.load(); }));
    timer.stop();
    REQUIRE(finished.load());
}

TEST_CASE("FlushTimer: throwing tick ends the thread and reports", "[flush_timer]") {
    std::atomic<int> ticks{0};
    std::atomic<int> reports{0};
    std::string reported;
    std::mutex reported_mutex;

    FlushTimer timer(2ms, [&] {
        ticks++;
        throw TransportError("client: write failed: Broken pipe");
    });
    timer.set_error_handler([&](const std::string& err) {
        std::lock_guard<std::mutex> lock(reported_mutex);
        reported = err;
        reports++;
    });
    timer.start();

    REQUIRE(wait_until([&] { return reports.load() == 1; }));
    REQUIRE(wait_until([&] { return !timer.running(); }));
    std::this_thread::sleep_for(20ms);

    REQUIRE(ticks.load() == 1);
    REQUIRE(reports.load() == 1);
    REQUIRE(timer.error() == "client: write failed: Broken pipe");
    {
        std::lock_guard<std::mutex> lock(reported_mutex);
        REQUIRE(reported == timer.error());
    }
    timer.stop();
}

TEST_CASE("FlushTimer: stop is idempotent", "[flush_timer]") {
    FlushTimer timer(5ms, [] {});
    timer.stop();
    timer.start();
    timer.stop();
    timer.stop();
    REQUIRE_FALSE(timer.running());
}

TEST_CASE("FlushTimer: restarts after a failed tick", "[flush_timer]") {
    std::atomic<int> ticks{0};
    std::atomic<bool> fail_next{true};
    FlushTimer timer(2ms, [&] {
        ticks++;
        if (fail_next.exchange(false)) throw TransportError("client: write failed");
    });
    timer.start();
    REQUIRE(wait_until([&] { return !timer.running() && ticks.load() == 1; }));
    REQUIRE(timer.error() == "client: write failed");

    timer.start();
    REQUIRE(timer.running());
    REQUIRE(timer.error().empty());
    REQUIRE(wait_until([&] { return ticks.load() >= 3; }));
    timer.stop();
    REQUIRE_FALSE(timer.running());
}

TEST_CASE("FlushTimer: non-standard exception is reported as unknown", "[flush_timer]") {
    std::atomic<int> reports{0};
    std::string reported;
    std::mutex reported_mutex;

    FlushTimer timer(2ms, [] { throw 42; });
    timer.set_error_handler([&](const std::string& err) {
        std::lock_guard<std::mutex> lock(reported_mutex);
        reported = err;
        reports++;
    });
    timer.start();

    REQUIRE(wait_until([&] { return reports.load() == 1; }));
    REQUIRE(wait_until([&] { return !timer.running(); }));
    REQUIRE(timer.error() == "unknown error");
    {
        std::lock_guard<std::mutex> lock(reported_mutex);
        REQUIRE(reported == "unknown error");
    }
    timer.stop();
}
