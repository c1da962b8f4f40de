#pragma once

#include "crashrelay/network/SecureEnvelope.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace crashrelay::network {

// Envelope for simulation and tests. Event ids follow the relay convention
// (SHA-256 over [0,pubkey,created_at,kind,tags,content]) and timestamps are
// randomized, but the inner content is NOT encrypted and events are not
// signed. Never use it for real delivery.
class DigestEnvelope : public SecureEnvelope {
public:
    static constexpr std::uint16_t kWrapKind = 1059;

    struct Unwrapped {
        std::uint16_t kind{0};
        std::string content;
        std::string recipient;
    };

    explicit DigestEnvelope(std::chrono::seconds timestamp_jitter = std::chrono::hours(48));

    TransportEvent seal_and_wrap(const std::string& recipient_key,
                                 std::uint16_t kind,
                                 std::string_view content) override;

    TransportEvent build_public_event(std::uint16_t kind, std::string_view content) override;

    // Recovers the inner kind and content of a sealed event. Throws
    // std::invalid_argument when the event was not produced by seal_and_wrap.
    static Unwrapped unwrap(const TransportEvent& event);

    static std::string compute_event_id(const TransportEvent& event);

private:
    static std::string fresh_pubkey();
    std::int64_t randomized_timestamp();

    std::chrono::seconds timestamp_jitter_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

}  // namespace crashrelay::network
