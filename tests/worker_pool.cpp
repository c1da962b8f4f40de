#include "crashrelay/core/WorkerPool.hpp"

#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using crashrelay::WorkerPool;

void test_runs_in_submission_order() {
    WorkerPool pool(1);
    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 10; ++i) {
        assert(pool.submit("task", [&, i] {
            std::scoped_lock lock(mutex);
            order.push_back(i);
        }));
    }
    pool.wait_idle();
    assert(pool.pending() == 0);
    assert(order.size() == 10);
    for (int i = 0; i < 10; ++i) {
        assert(order[i] == i);
    }
}

void test_exception_is_logged_and_worker_survives() {
    crashrelay::test::LogCapture capture;
    WorkerPool pool(1);
    std::atomic<bool> later_ran{false};

    pool.submit("explode", [] { throw std::runtime_error("boom"); });
    pool.submit("after", [&] { later_ran = true; });
    pool.wait_idle();

    assert(later_ran.load());
    assert(capture.contains("reporter.task_failed"));
    assert(capture.contains("\"task\":\"explode\""));
    assert(capture.contains("boom"));
}

void test_shutdown_drains_queue() {
    std::atomic<int> completed{0};
    WorkerPool pool(2);
    assert(pool.thread_count() == 2);
    for (int i = 0; i < 8; ++i) {
        pool.submit("slow", [&] {
            std::this_thread::sleep_for(10ms);
            completed.fetch_add(1);
        });
    }
    pool.shutdown();
    assert(completed.load() == 8);

    assert(!pool.submit("late", [] {}));
    pool.shutdown();
}

void test_shutdown_for_discards_backlog() {
    crashrelay::test::LogCapture capture;
    std::atomic<bool> slow_finished{false};
    std::atomic<int> quick_ran{0};
    WorkerPool pool(1);
    pool.submit("slow", [&] {
        std::this_thread::sleep_for(300ms);
        slow_finished = true;
    });
    for (int i = 0; i < 3; ++i) {
        pool.submit("quick", [&] { quick_ran.fetch_add(1); });
    }

    const auto discarded = pool.shutdown_for(50ms);
    // The running task is joined; the queued ones never start.
    assert(slow_finished.load());
    assert(discarded == 3);
    assert(quick_ran.load() == 0);
    assert(capture.contains("reporter.task_discarded"));
    assert(!pool.submit("late", [] {}));

    WorkerPool relaxed(1);
    for (int i = 0; i < 3; ++i) {
        relaxed.submit("quick", [&] { quick_ran.fetch_add(1); });
    }
    assert(relaxed.shutdown_for(2000ms) == 0);
    assert(quick_ran.load() == 3);
}

void test_zero_threads_still_works() {
    WorkerPool pool(0);
    assert(pool.thread_count() == 1);
    std::atomic<bool> ran{false};
    pool.submit("one", [&] { ran = true; });
    pool.wait_idle();
    assert(ran.load());
}

}  // namespace

int main() {
    test_runs_in_submission_order();
    test_exception_is_logged_and_worker_survives();
    test_shutdown_drains_queue();
    test_shutdown_for_discards_backlog();
    test_zero_threads_still_works();
    return 0;
}
