#include "crashrelay/core/Distributor.hpp"

#include "crashrelay/logging/StructuredLogger.hpp"

#include <exception>
#include <thread>

namespace crashrelay {

namespace {

using Level = logging::StructuredLogger::Level;

}  // namespace

Distributor::Distributor(const Config& config, RateLimiter& limiter, network::ChannelFactory& channels)
    : config_(config),
      limiter_(limiter),
      channels_(channels) {}

std::size_t Distributor::start_index(std::size_t chunk_index, std::size_t channel_count) noexcept {
    return channel_count == 0 ? 0 : chunk_index % channel_count;
}

DistributionOutcome Distributor::publish_with_verify(const network::TransportEvent& event,
                                                     const std::vector<std::string>& channels,
                                                     std::size_t start_index) {
    DistributionOutcome outcome;
    if (channels.empty()) {
        outcome.attempts.push_back(PublishAttempt{{}, ErrorCode::NoChannels, "no channels configured"});
        return outcome;
    }

    const auto count = channels.size();
    for (std::size_t attempt = 0; attempt < count; ++attempt) {
        const auto& channel = channels[(start_index + attempt) % count];

        Status status;
        {
            auto permit = limiter_.acquire(channel);
            status = publish_locked(permit, event, channel);
        }

        if (!status.ok()) {
            logging::log_event(Level::Warning,
                               "distributor.publish_failed",
                               {{"channel", channel},
                                {"event", event.id},
                                {"attempt", std::to_string(attempt + 1)},
                                {"reason", status.describe()}});
            outcome.attempts.push_back(PublishAttempt{channel, status.code, status.message});
            continue;
        }

        // Give the relay time to index the event before asking for it.
        std::this_thread::sleep_for(config_.verify_delay);

        const auto verified = verify(event, channel);
        if (!verified.ok()) {
            logging::log_event(Level::Warning,
                               "distributor.verify_failed",
                               {{"channel", channel},
                                {"event", event.id},
                                {"attempt", std::to_string(attempt + 1)}});
            outcome.attempts.push_back(PublishAttempt{channel, verified.code, verified.message});
            continue;
        }

        outcome.attempts.push_back(PublishAttempt{channel, ErrorCode::Ok, {}});
        outcome.channel = channel;
        logging::log_event(Level::Debug, "distributor.verified", {{"channel", channel}, {"event", event.id}});
        return outcome;
    }

    return outcome;
}

Status Distributor::publish_once(const network::TransportEvent& event, const std::string& channel) {
    auto permit = limiter_.acquire(channel);
    return publish_locked(permit, event, channel);
}

Status Distributor::publish_locked(RateLimiter::Permit& permit,
                                   const network::TransportEvent& event,
                                   const std::string& channel) {
    try {
        auto connection = channels_.open(channel);
        if (!connection) {
            return Status::failure(ErrorCode::Transport, "no transport for " + channel);
        }

        auto status = connection->connect(config_.publish_timeout);
        if (!status.ok()) {
            return status;
        }

        status = connection->publish(event, config_.publish_timeout);
        connection->disconnect();
        if (status.ok()) {
            permit.record();
        }
        return status;
    } catch (const std::exception& ex) {
        return Status::failure(ErrorCode::Transport, ex.what());
    }
}

Status Distributor::verify(const network::TransportEvent& event, const std::string& channel) {
    try {
        auto connection = channels_.open(channel);
        if (!connection) {
            return Status::failure(ErrorCode::Verification, "no transport for " + channel);
        }

        const auto connected = connection->connect(config_.query_timeout);
        if (!connected.ok()) {
            return Status::failure(ErrorCode::Verification, "query connect failed: " + connected.message);
        }

        const bool found = connection->query_by_id(event.id, event.kind, config_.query_timeout);
        connection->disconnect();
        if (!found) {
            return Status::failure(ErrorCode::Verification, "event not found after publish");
        }
        return Status::success();
    } catch (const std::exception& ex) {
        return Status::failure(ErrorCode::Verification, ex.what());
    }
}

}  // namespace crashrelay
