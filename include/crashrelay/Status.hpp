#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace crashrelay {

enum class ErrorCode {
    Ok,
    Encoding,
    Transport,
    Verification,
    Timeout,
    ChunkExhausted,
    DirectDelivery,
    ManifestDelivery,
    Dropped,
    NoChannels
};

std::string_view to_string(ErrorCode code) noexcept;

struct Status {
    ErrorCode code{ErrorCode::Ok};
    std::string message;

    static Status success() { return Status{}; }
    static Status failure(ErrorCode code, std::string message) {
        return Status{code, std::move(message)};
    }

    [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::Ok; }

    // "<code>: <message>" or just "<code>" when no detail was recorded.
    std::string describe() const;
};

}  // namespace crashrelay
