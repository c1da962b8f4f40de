#pragma once

#include "crashrelay/Config.hpp"
#include "crashrelay/core/RateLimiter.hpp"
#include "crashrelay/network/Channel.hpp"
#include "crashrelay/network/SecureEnvelope.hpp"

#include <memory>

namespace crashrelay {

// Everything one reporter shares across sends: configuration, per-channel
// rate state and the two collaborators. Held by shared_ptr so background
// fan-out work can keep it alive.
class DeliveryContext {
public:
    DeliveryContext(Config config,
                    std::shared_ptr<network::ChannelFactory> channels,
                    std::shared_ptr<network::SecureEnvelope> envelope);

    DeliveryContext(const DeliveryContext&) = delete;
    DeliveryContext& operator=(const DeliveryContext&) = delete;

    const Config& config() const noexcept { return config_; }
    RateLimiter& rate_limiter() noexcept { return rate_limiter_; }
    network::ChannelFactory& channels() noexcept { return *channels_; }
    network::SecureEnvelope& envelope() noexcept { return *envelope_; }

private:
    Config config_;
    RateLimiter rate_limiter_;
    std::shared_ptr<network::ChannelFactory> channels_;
    std::shared_ptr<network::SecureEnvelope> envelope_;
};

}  // namespace crashrelay
