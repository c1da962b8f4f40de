#include "crashrelay/core/FanOut.hpp"

#include "crashrelay/logging/StructuredLogger.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>

namespace crashrelay {

namespace {

using Level = logging::StructuredLogger::Level;

struct FanOutState {
    std::mutex mutex;
    std::condition_variable done_cv;
    std::vector<std::string> targets;
    std::vector<FanOutResult> results;
    std::vector<bool> finished;
    std::size_t next{0};
    std::size_t completed{0};
    FanOutTask task;
};

Status run_task(const FanOutTask& task, const std::string& target) noexcept {
    try {
        return task(target);
    } catch (const std::exception& ex) {
        return Status::failure(ErrorCode::Transport, ex.what());
    } catch (...) {
        return Status::failure(ErrorCode::Transport, "unknown exception");
    }
}

void fan_out_worker(std::shared_ptr<FanOutState> state) {
    while (true) {
        std::size_t index = 0;
        {
            std::scoped_lock lock(state->mutex);
            if (state->next >= state->targets.size()) {
                return;
            }
            index = state->next++;
        }

        const auto status = run_task(state->task, state->targets[index]);

        {
            std::scoped_lock lock(state->mutex);
            auto& result = state->results[index];
            result.success = status.ok();
            result.error = status.ok() ? std::string{} : status.describe();
            state->finished[index] = true;
            ++state->completed;
        }
        state->done_cv.notify_all();
    }
}

}  // namespace

std::vector<FanOutResult> fan_out(const std::vector<std::string>& targets,
                                  FanOutTask task,
                                  std::chrono::milliseconds per_target_timeout,
                                  std::size_t max_parallel) {
    if (targets.empty()) {
        return {};
    }

    auto state = std::make_shared<FanOutState>();
    state->targets = targets;
    state->task = std::move(task);
    state->finished.assign(targets.size(), false);
    state->results.reserve(targets.size());
    for (const auto& target : targets) {
        state->results.push_back(FanOutResult{target, false, false, {}});
    }

    const auto parallel = std::clamp<std::size_t>(max_parallel, 1, targets.size());
    const auto waves = (targets.size() + parallel - 1) / parallel;
    const auto deadline = std::chrono::steady_clock::now() + per_target_timeout * static_cast<long long>(waves);

    for (std::size_t i = 0; i < parallel; ++i) {
        std::thread(fan_out_worker, state).detach();
    }

    std::unique_lock lock(state->mutex);
    state->done_cv.wait_until(lock, deadline, [&] { return state->completed == state->targets.size(); });

    // Stop handing out work that has not started yet.
    state->next = state->targets.size();

    auto results = state->results;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (!state->finished[i]) {
            results[i].timed_out = true;
            results[i].error = std::string(to_string(ErrorCode::Timeout));
            logging::log_event(Level::Warning, "fan_out.timeout", {{"target", results[i].target}});
        }
    }
    return results;
}

std::size_t count_successes(const std::vector<FanOutResult>& results) noexcept {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(), [](const FanOutResult& result) {
        return result.success;
    }));
}

}  // namespace crashrelay
