#include "crashrelay/Status.hpp"

namespace crashrelay {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "ok";
        case ErrorCode::Encoding:
            return "encoding";
        case ErrorCode::Transport:
            return "transport";
        case ErrorCode::Verification:
            return "verification";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::ChunkExhausted:
            return "chunk_exhausted";
        case ErrorCode::DirectDelivery:
            return "direct_delivery";
        case ErrorCode::ManifestDelivery:
            return "manifest_delivery";
        case ErrorCode::Dropped:
            return "dropped";
        case ErrorCode::NoChannels:
            return "no_channels";
    }
    return "unknown";
}

std::string Status::describe() const {
    std::string text(to_string(code));
    if (!message.empty()) {
        text.append(": ");
        text.append(message);
    }
    return text;
}

}  // namespace crashrelay
