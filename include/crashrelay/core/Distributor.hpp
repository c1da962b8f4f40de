#pragma once

#include "crashrelay/Config.hpp"
#include "crashrelay/Status.hpp"
#include "crashrelay/core/RateLimiter.hpp"
#include "crashrelay/network/Channel.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace crashrelay {

struct PublishAttempt {
    std::string channel;
    ErrorCode code{ErrorCode::Ok};
    std::string detail;
};

struct DistributionOutcome {
    // Channel that accepted and confirmed the event; empty when every
    // channel failed.
    std::optional<std::string> channel;
    std::vector<PublishAttempt> attempts;

    [[nodiscard]] bool delivered() const noexcept { return channel.has_value(); }
};

// Publishes one event with rotation across channels: rate-limited publish,
// short settle delay, existence query, and failover to the next channel on
// any failure until every channel has been tried once.
class Distributor {
public:
    Distributor(const Config& config, RateLimiter& limiter, network::ChannelFactory& channels);

    DistributionOutcome publish_with_verify(const network::TransportEvent& event,
                                            const std::vector<std::string>& channels,
                                            std::size_t start_index);

    // Rate-limited publish to a single channel without the existence query.
    Status publish_once(const network::TransportEvent& event, const std::string& channel);

    static std::size_t start_index(std::size_t chunk_index, std::size_t channel_count) noexcept;

private:
    Status publish_locked(RateLimiter::Permit& permit,
                          const network::TransportEvent& event,
                          const std::string& channel);
    Status verify(const network::TransportEvent& event, const std::string& channel);

    const Config& config_;
    RateLimiter& limiter_;
    network::ChannelFactory& channels_;
};

}  // namespace crashrelay
