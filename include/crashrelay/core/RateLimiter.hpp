#pragma once

#include "crashrelay/Config.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace crashrelay {

// Per-channel minimum spacing between successful publishes. Callers on the
// same channel take turns through that channel's gate; different channels
// never contend beyond the short map lookup.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

private:
    struct Gate {
        std::mutex turn;
        mutable std::mutex state;
        std::chrono::milliseconds interval{0};
        std::optional<Clock::time_point> last_publish;
    };

public:
    // Holds the channel's turn until released or destroyed.
    class Permit {
    public:
        Permit() = default;
        Permit(Permit&& other) noexcept
            : gate_(std::exchange(other.gate_, nullptr)), lock_(std::move(other.lock_)) {}
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = std::exchange(other.gate_, nullptr);
                lock_ = std::move(other.lock_);
            }
            return *this;
        }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        // Stamps the current time as the channel's last successful publish.
        void record();
        void release();
        [[nodiscard]] bool held() const noexcept { return lock_.owns_lock(); }

    private:
        friend class RateLimiter;
        Permit(Gate& gate, std::unique_lock<std::mutex> lock) : gate_(&gate), lock_(std::move(lock)) {}

        Gate* gate_{nullptr};
        std::unique_lock<std::mutex> lock_;
    };

    explicit RateLimiter(const Config& config);
    RateLimiter(std::chrono::milliseconds default_interval,
                std::unordered_map<std::string, std::chrono::milliseconds> overrides = {});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks until interval(channel) has elapsed since the last recorded
    // publish on that channel.
    Permit acquire(const std::string& channel);
    void record(const std::string& channel);

    std::chrono::milliseconds interval(const std::string& channel) const;
    void set_interval(const std::string& channel, std::chrono::milliseconds interval);
    std::optional<Clock::time_point> last_publish(const std::string& channel) const;
    // How long acquire(channel) would sleep if called now; zero once ready.
    std::chrono::milliseconds time_until_ready(const std::string& channel) const;

private:
    Gate& gate_for(const std::string& channel) const;
    std::chrono::milliseconds configured_interval(const std::string& channel) const;

    std::chrono::milliseconds default_interval_;
    std::unordered_map<std::string, std::chrono::milliseconds> overrides_;
    mutable std::mutex gates_mutex_;
    mutable std::unordered_map<std::string, std::unique_ptr<Gate>> gates_;
};

}  // namespace crashrelay
