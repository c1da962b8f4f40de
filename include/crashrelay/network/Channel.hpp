#pragma once

#include "crashrelay/Status.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace crashrelay::network {

// A signed, publishable unit as produced by a SecureEnvelope.
struct TransportEvent {
    std::string id;
    std::string pubkey;
    std::int64_t created_at{0};
    std::uint16_t kind{0};
    std::vector<std::vector<std::string>> tags;
    std::string content;
    std::string sig;
};

// A short-lived connection to one pub/sub relay. Implementations report
// transport problems through Status and must not throw for them.
class Channel {
public:
    virtual ~Channel() = default;

    virtual const std::string& url() const noexcept = 0;

    virtual Status connect(std::chrono::milliseconds timeout) = 0;
    virtual Status publish(const TransportEvent& event, std::chrono::milliseconds timeout) = 0;
    virtual bool query_by_id(const std::string& id, std::uint16_t kind, std::chrono::milliseconds timeout) = 0;
    virtual void disconnect() noexcept = 0;
};

// Opens channels by URL. open() may be called from several threads at once.
class ChannelFactory {
public:
    virtual ~ChannelFactory() = default;

    virtual std::unique_ptr<Channel> open(const std::string& url) = 0;
};

}  // namespace crashrelay::network
