#pragma once

#include "crashrelay/Types.hpp"

#include <memory>
#include <span>

namespace crashrelay::crypto {

// Incremental SHA-256 over OpenSSL's EVP digest interface.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    // Resets the context, so the hasher may be reused for a new message.
    Digest finalize();

    static Digest digest(std::span<const std::uint8_t> data);

private:
    struct ContextDeleter {
        void operator()(void* context) const noexcept;
    };

    void reset();

    std::unique_ptr<void, ContextDeleter> context_;
};

}  // namespace crashrelay::crypto
