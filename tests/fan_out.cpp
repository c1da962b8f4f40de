#include "crashrelay/core/FanOut.hpp"

#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

using namespace std::chrono_literals;
using namespace crashrelay;
using Clock = std::chrono::steady_clock;

void test_all_targets_run() {
    const auto targets = test::relay_urls(5);
    auto calls = std::make_shared<std::atomic<int>>(0);

    const auto results = fan_out(
        targets,
        [calls](const std::string& target) {
            calls->fetch_add(1);
            if (target == "mem://relay-2") {
                return Status::failure(ErrorCode::Transport, "refused");
            }
            return Status::success();
        },
        1000ms,
        2);

    assert(calls->load() == 5);
    assert(results.size() == 5);
    for (std::size_t i = 0; i < targets.size(); ++i) {
        assert(results[i].target == targets[i]);
        assert(!results[i].timed_out);
    }
    assert(!results[2].success);
    assert(results[2].error.find("refused") != std::string::npos);
    assert(count_successes(results) == 4);
}

void test_parallelism_is_bounded() {
    auto running = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);

    const auto results = fan_out(
        test::relay_urls(6),
        [running, peak](const std::string&) {
            const auto now = running->fetch_add(1) + 1;
            int observed = peak->load();
            while (now > observed && !peak->compare_exchange_weak(observed, now)) {
            }
            std::this_thread::sleep_for(20ms);
            running->fetch_sub(1);
            return Status::success();
        },
        1000ms,
        3);

    assert(count_successes(results) == 6);
    assert(peak->load() <= 3);
}

void test_exceptions_become_failures() {
    const auto results = fan_out(
        test::relay_urls(2),
        [](const std::string& target) -> Status {
            if (target == "mem://relay-0") {
                throw std::runtime_error("socket closed");
            }
            return Status::success();
        },
        1000ms,
        2);

    assert(!results[0].success);
    assert(!results[0].timed_out);
    assert(results[0].error.find("socket closed") != std::string::npos);
    assert(results[1].success);
}

void test_slow_targets_time_out() {
    test::LogCapture capture;
    const auto start = Clock::now();
    const auto results = fan_out(
        test::relay_urls(3),
        [](const std::string& target) {
            if (target == "mem://relay-1") {
                std::this_thread::sleep_for(400ms);
            }
            return Status::success();
        },
        100ms,
        3);
    const auto elapsed = Clock::now() - start;

    assert(elapsed < 350ms);
    assert(results[0].success);
    assert(!results[1].success);
    assert(results[1].timed_out);
    assert(results[1].error == "timeout");
    assert(results[2].success);
    assert(capture.contains("fan_out.timeout"));

    // Let the abandoned task finish before the capture goes away.
    std::this_thread::sleep_for(500ms);
}

void test_empty_targets() {
    const auto results = fan_out({}, [](const std::string&) { return Status::success(); }, 10ms, 4);
    assert(results.empty());
}

}  // namespace

int main() {
    test_all_targets_run();
    test_parallelism_is_bounded();
    test_exceptions_become_failures();
    test_slow_targets_time_out();
    test_empty_targets();
    return 0;
}
