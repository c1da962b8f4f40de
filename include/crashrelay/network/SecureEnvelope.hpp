#pragma once

#include "crashrelay/network/Channel.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace crashrelay::network {

// Wraps content into publishable events. seal_and_wrap must hide the
// sender, encrypt for the recipient only and randomize created_at within
// a bounded past window; build_public_event signs content that is meant to
// be readable by anyone under a fresh throwaway identity.
class SecureEnvelope {
public:
    virtual ~SecureEnvelope() = default;

    virtual TransportEvent seal_and_wrap(const std::string& recipient_key,
                                         std::uint16_t kind,
                                         std::string_view content) = 0;

    virtual TransportEvent build_public_event(std::uint16_t kind, std::string_view content) = 0;
};

}  // namespace crashrelay::network
