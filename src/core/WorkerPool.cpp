#include "crashrelay/core/WorkerPool.hpp"

#include "crashrelay/logging/StructuredLogger.hpp"

#include <algorithm>
#include <exception>

namespace crashrelay {

namespace {

using Level = logging::StructuredLogger::Level;

}  // namespace

WorkerPool::WorkerPool(std::size_t thread_count) {
    const auto count = std::max<std::size_t>(1, thread_count);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(std::string label, Task task) {
    {
        std::scoped_lock lock(mutex_);
        if (shutdown_) {
            return false;
        }
        queue_.push_back(Job{std::move(label), std::move(task)});
    }
    work_cv_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [&] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        shutdown_ = true;
    }
    work_cv_.notify_all();
    join_all();
}

std::size_t WorkerPool::shutdown_for(std::chrono::milliseconds grace) {
    std::deque<Job> discarded;
    {
        std::unique_lock lock(mutex_);
        shutdown_ = true;
        work_cv_.notify_all();
        idle_cv_.wait_for(lock, grace, [&] { return queue_.empty(); });
        discarded.swap(queue_);
    }
    work_cv_.notify_all();

    for (const auto& job : discarded) {
        logging::log_event(Level::Warning, "reporter.task_discarded", {{"task", job.label}});
    }
    join_all();
    return discarded.size();
}

void WorkerPool::join_all() {
    for (auto& thread : threads_) {
        if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
            thread.join();
        }
    }
}

std::size_t WorkerPool::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_.size() + active_;
}

std::optional<WorkerPool::Job> WorkerPool::dequeue() {
    std::unique_lock lock(mutex_);
    work_cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (queue_.empty()) {
        return std::nullopt;
    }

    Job job = std::move(queue_.front());
    queue_.pop_front();
    ++active_;
    return job;
}

void WorkerPool::worker_loop() {
    while (auto job = dequeue()) {
        run_job(*job);
        {
            std::scoped_lock lock(mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

void WorkerPool::run_job(Job& job) noexcept {
    try {
        job.task();
    } catch (const std::exception& ex) {
        logging::log_event(Level::Error, "reporter.task_failed", {{"task", job.label}, {"error", ex.what()}});
    } catch (...) {
        logging::log_event(Level::Error, "reporter.task_failed", {{"task", job.label}, {"error", "unknown exception"}});
    }
}

}  // namespace crashrelay
