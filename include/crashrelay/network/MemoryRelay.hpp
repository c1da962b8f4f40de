#pragma once

#include "crashrelay/network/Channel.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace crashrelay::network {

// In-process relay store with fault injection. Thread-safe.
class MemoryRelay {
public:
    explicit MemoryRelay(std::string url);

    const std::string& url() const noexcept { return url_; }

    // Connection refused while offline.
    void set_offline(bool offline);
    // publish() reports a transport failure.
    void set_fail_publish(bool fail);
    // publish() reports success but the event is discarded, so it never
    // shows up in queries.
    void set_drop_published(bool drop);
    // Each publish blocks for this long before completing.
    void set_publish_delay(std::chrono::milliseconds delay);

    bool offline() const;

    Status accept(const TransportEvent& event, std::chrono::milliseconds timeout);
    bool contains(const std::string& id, std::uint16_t kind) const;
    std::optional<TransportEvent> find(const std::string& id) const;

    std::vector<TransportEvent> events() const;
    std::vector<TransportEvent> events_of_kind(std::uint16_t kind) const;

    // Publish calls that reported success, dropped ones included.
    std::size_t publish_count() const;
    std::size_t publish_attempts() const;
    std::size_t connect_count() const;

    void note_connect();

private:
    std::string url_;

    mutable std::mutex mutex_;
    bool offline_{false};
    bool fail_publish_{false};
    bool drop_published_{false};
    std::chrono::milliseconds publish_delay_{0};
    std::vector<TransportEvent> events_;
    std::size_t publish_count_{0};
    std::size_t publish_attempts_{0};
    std::size_t connect_count_{0};
};

class MemoryRelayNetwork : public ChannelFactory {
public:
    MemoryRelayNetwork() = default;
    explicit MemoryRelayNetwork(const std::vector<std::string>& urls);

    MemoryRelay& add_relay(const std::string& url);
    // nullptr for unknown URLs.
    MemoryRelay* relay(const std::string& url) const;
    std::vector<std::string> urls() const;

    // Unknown URLs yield a channel whose connect() always fails.
    std::unique_ptr<Channel> open(const std::string& url) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<MemoryRelay>> relays_;
};

}  // namespace crashrelay::network
