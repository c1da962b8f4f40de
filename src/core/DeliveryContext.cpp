#include "crashrelay/core/DeliveryContext.hpp"

#include <stdexcept>

namespace crashrelay {

DeliveryContext::DeliveryContext(Config config,
                                 std::shared_ptr<network::ChannelFactory> channels,
                                 std::shared_ptr<network::SecureEnvelope> envelope)
    : config_(std::move(config)),
      rate_limiter_(config_),
      channels_(std::move(channels)),
      envelope_(std::move(envelope)) {
    if (!channels_) {
        throw std::invalid_argument("delivery context requires a channel factory");
    }
    if (!envelope_) {
        throw std::invalid_argument("delivery context requires an envelope");
    }
}

}  // namespace crashrelay
