#include "crashrelay/core/RateLimiter.hpp"

#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using crashrelay::RateLimiter;
using Clock = std::chrono::steady_clock;

void test_first_publish_is_immediate() {
    RateLimiter limiter(500ms);
    const auto start = Clock::now();
    auto permit = limiter.acquire("mem://relay-0");
    assert(permit.held());
    assert(Clock::now() - start < 200ms);
    assert(!limiter.last_publish("mem://relay-0"));
}

void test_back_to_back_spacing() {
    constexpr int kPublishes = 4;
    constexpr auto kInterval = 100ms;
    RateLimiter limiter(kInterval);

    const auto start = Clock::now();
    for (int i = 0; i < kPublishes; ++i) {
        auto permit = limiter.acquire("mem://relay-0");
        permit.record();
    }
    const auto elapsed = Clock::now() - start;
    assert(elapsed >= (kPublishes - 1) * kInterval);
}

void test_failed_publish_does_not_delay() {
    RateLimiter limiter(300ms);
    {
        auto permit = limiter.acquire("mem://relay-0");
        // No record(): the attempt failed.
    }
    const auto start = Clock::now();
    auto permit = limiter.acquire("mem://relay-0");
    assert(Clock::now() - start < 200ms);
}

void test_channels_are_independent() {
    constexpr auto kInterval = 400ms;
    RateLimiter limiter(kInterval);
    const auto urls = crashrelay::test::relay_urls(4);
    for (const auto& url : urls) {
        limiter.record(url);
    }

    const auto start = Clock::now();
    std::vector<std::thread> workers;
    for (const auto& url : urls) {
        workers.emplace_back([&limiter, url] {
            auto permit = limiter.acquire(url);
            permit.record();
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    const auto elapsed = Clock::now() - start;
    // Serialized waits would take four intervals.
    assert(elapsed < 2 * kInterval);
}

void test_same_channel_concurrent_callers_take_turns() {
    constexpr auto kInterval = 80ms;
    RateLimiter limiter(kInterval);
    std::atomic<int> done{0};

    const auto start = Clock::now();
    std::vector<std::thread> workers;
    for (int i = 0; i < 3; ++i) {
        workers.emplace_back([&] {
            auto permit = limiter.acquire("mem://shared");
            permit.record();
            done.fetch_add(1);
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    assert(done.load() == 3);
    assert(Clock::now() - start >= 2 * kInterval);
}

void test_intervals() {
    RateLimiter limiter(7500ms, {{"mem://slow", 9000ms}});
    assert(limiter.interval("mem://other") == 7500ms);
    assert(limiter.interval("mem://slow") == 9000ms);
    limiter.set_interval("mem://other", 10ms);
    assert(limiter.interval("mem://other") == 10ms);

    const auto config = crashrelay::test::fast_config(2);
    RateLimiter from_config(config);
    assert(from_config.interval(config.channels[0]) == 0ms);

    auto permit = from_config.acquire(config.channels[0]);
    auto moved = std::move(permit);
    assert(!permit.held());
    assert(moved.held());
    moved.release();
    assert(!moved.held());
}

void test_time_until_ready() {
    RateLimiter limiter(1000ms);
    assert(limiter.time_until_ready("mem://relay-0") == 0ms);
    limiter.record("mem://relay-0");
    const auto remaining = limiter.time_until_ready("mem://relay-0");
    assert(remaining > 500ms);
    assert(remaining <= 1000ms);
    assert(limiter.time_until_ready("mem://relay-1") == 0ms);

    limiter.set_interval("mem://relay-0", 0ms);
    assert(limiter.time_until_ready("mem://relay-0") == 0ms);
}

}  // namespace

int main() {
    test_first_publish_is_immediate();
    test_back_to_back_spacing();
    test_failed_publish_does_not_delay();
    test_channels_are_independent();
    test_same_channel_concurrent_callers_take_turns();
    test_intervals();
    test_time_until_ready();
    return 0;
}
