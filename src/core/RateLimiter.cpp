#include "crashrelay/core/RateLimiter.hpp"

#include "crashrelay/logging/StructuredLogger.hpp"

#include <thread>

namespace crashrelay {

namespace {

using Level = logging::StructuredLogger::Level;

}  // namespace

void RateLimiter::Permit::record() {
    if (!gate_) {
        return;
    }
    std::scoped_lock lock(gate_->state);
    gate_->last_publish = Clock::now();
}

void RateLimiter::Permit::release() {
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
    gate_ = nullptr;
}

RateLimiter::RateLimiter(const Config& config)
    : RateLimiter(config.default_rate_interval, config.rate_intervals) {}

RateLimiter::RateLimiter(std::chrono::milliseconds default_interval,
                         std::unordered_map<std::string, std::chrono::milliseconds> overrides)
    : default_interval_(default_interval),
      overrides_(std::move(overrides)) {}

RateLimiter::Permit RateLimiter::acquire(const std::string& channel) {
    auto& gate = gate_for(channel);
    std::unique_lock<std::mutex> turn(gate.turn);

    std::optional<Clock::time_point> ready_at;
    {
        std::scoped_lock lock(gate.state);
        if (gate.last_publish) {
            ready_at = *gate.last_publish + gate.interval;
        }
    }

    if (ready_at) {
        const auto now = Clock::now();
        if (*ready_at > now) {
            const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(*ready_at - now);
            logging::log_event(Level::Debug, "rate_limiter.wait",
                               {{"channel", channel}, {"wait_ms", std::to_string(wait.count())}});
            std::this_thread::sleep_until(*ready_at);
        }
    }

    return Permit(gate, std::move(turn));
}

void RateLimiter::record(const std::string& channel) {
    auto& gate = gate_for(channel);
    std::scoped_lock lock(gate.state);
    gate.last_publish = Clock::now();
}

std::chrono::milliseconds RateLimiter::interval(const std::string& channel) const {
    auto& gate = gate_for(channel);
    std::scoped_lock lock(gate.state);
    return gate.interval;
}

void RateLimiter::set_interval(const std::string& channel, std::chrono::milliseconds interval) {
    auto& gate = gate_for(channel);
    std::scoped_lock lock(gate.state);
    gate.interval = interval;
}

std::optional<RateLimiter::Clock::time_point> RateLimiter::last_publish(const std::string& channel) const {
    auto& gate = gate_for(channel);
    std::scoped_lock lock(gate.state);
    return gate.last_publish;
}

std::chrono::milliseconds RateLimiter::time_until_ready(const std::string& channel) const {
    auto& gate = gate_for(channel);
    std::scoped_lock lock(gate.state);
    if (!gate.last_publish) {
        return std::chrono::milliseconds(0);
    }
    const auto remaining = *gate.last_publish + gate.interval - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::ceil<std::chrono::milliseconds>(remaining);
}

RateLimiter::Gate& RateLimiter::gate_for(const std::string& channel) const {
    std::scoped_lock lock(gates_mutex_);
    auto& slot = gates_[channel];
    if (!slot) {
        slot = std::make_unique<Gate>();
        slot->interval = configured_interval(channel);
    }
    return *slot;
}

std::chrono::milliseconds RateLimiter::configured_interval(const std::string& channel) const {
    const auto it = overrides_.find(channel);
    return it == overrides_.end() ? default_interval_ : it->second;
}

}  // namespace crashrelay
