#pragma once

#include "crashrelay/Status.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace crashrelay {

struct FanOutResult {
    std::string target;
    bool success{false};
    bool timed_out{false};
    std::string error;
};

using FanOutTask = std::function<Status(const std::string& target)>;

// Runs `task` once per target on at most `max_parallel` threads and returns
// one result per target, in target order. The call returns no later than
// `per_target_timeout` times the number of waves; tasks still running then
// are reported as timed out and left to finish on their own, so `task`
// must own everything it captures.
std::vector<FanOutResult> fan_out(const std::vector<std::string>& targets,
                                  FanOutTask task,
                                  std::chrono::milliseconds per_target_timeout,
                                  std::size_t max_parallel);

std::size_t count_successes(const std::vector<FanOutResult>& results) noexcept;

}  // namespace crashrelay
