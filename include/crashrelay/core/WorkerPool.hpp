#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace crashrelay {

// Fixed set of threads draining a FIFO of labelled tasks. A task that
// throws is logged under its label; the exception never reaches the
// submitter or stops the worker.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // False once shutdown() has begun.
    bool submit(std::string label, Task task);

    // Blocks until the queue is empty and no task is running.
    void wait_idle();

    // Runs every queued task, then joins the workers. Idempotent.
    void shutdown();

    // Like shutdown(), but tasks still queued after `grace` are discarded
    // unrun and counted in the return value. Tasks already running are
    // always joined.
    std::size_t shutdown_for(std::chrono::milliseconds grace);

    std::size_t pending() const;
    std::size_t thread_count() const noexcept { return threads_.size(); }

private:
    struct Job {
        std::string label;
        Task task;
    };

    std::optional<Job> dequeue();
    void worker_loop();
    void join_all();
    static void run_job(Job& job) noexcept;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> queue_;
    std::size_t active_{0};
    bool shutdown_{false};
    std::vector<std::thread> threads_;
};

}  // namespace crashrelay
