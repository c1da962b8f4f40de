#pragma once

#include "crashrelay/Status.hpp"
#include "crashrelay/core/DeliveryContext.hpp"
#include "crashrelay/core/ProgressReporter.hpp"
#include "crashrelay/protocol/Wire.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crashrelay {

struct SendReport {
    protocol::TransportKind transport{protocol::TransportKind::Direct};
    Status status;
    std::size_t chunk_count{0};
    std::size_t chunks_delivered{0};
    std::optional<protocol::ManifestPayload> manifest;
    // Channels that accepted the direct event or the manifest.
    std::vector<std::string> delivered_channels;
};

// Chooses direct or chunked delivery for already serialized (and, when
// worthwhile, compressed) content and drives it to completion. Every
// failure is reported in the SendReport; send() does not throw.
class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<DeliveryContext> context);

    SendReport send(const std::string& recipient_key,
                    std::string_view content,
                    const ProgressCallback& progress = {});

private:
    SendReport send_direct(const std::string& recipient_key, std::string_view content);
    SendReport send_chunked(const std::string& recipient_key,
                            std::string_view content,
                            const ProgressCallback& progress);

    // First-success in channel order, or every channel in parallel when
    // redundant delivery is configured.
    std::vector<std::string> deliver_private(const network::TransportEvent& event);

    std::shared_ptr<DeliveryContext> context_;
};

}  // namespace crashrelay
